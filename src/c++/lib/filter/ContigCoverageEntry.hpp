//
// AsmQC - Assembly Quality Control Engine
// Copyright (c) 2013-2019 Illumina, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.
//
//

/// \file
///

#pragma once

#include "seqio/SequenceStore.hpp"

#include <iosfwd>
#include <string>
#include <vector>

class ContigCoverageTable;

/// \brief Filterable attributes of one contig
///
/// 'coverage' holds the k-mer coverage parsed from a SPAdes header, or the
/// read coverage from a per-contig coverage table, depending on the builder.
///
struct ContigCoverageEntry {
  std::string contigId;
  unsigned    length   = 0;
  double      coverage = 0;

  unsigned atCount = 0;
  unsigned gcCount = 0;

  /// every base which is not an uppercase A, C, G or T
  unsigned nCount = 0;

  double atProp = 0;
  double gcProp = 0;
  double nProp  = 0;
};

/// fill in the length, base counts and proportions of entry from seq
///
/// throws InputFormatException for an empty sequence
void setSequenceComposition(const std::string& seq, ContigCoverageEntry& entry);

/// \brief k-mer coverage from the last '_' separated token of a SPAdes header
///
/// For example 'NODE_1_length_500_cov_12.5' gives 12.5.
///
/// throws InputFormatException if the token is not a number
double parseHeaderKmerCoverage(const std::string& header);

/// \brief one entry per record of a SPAdes assembly, in store order, with k-mer coverage taken from headers
std::vector<ContigCoverageEntry> buildSpadesContigEntries(const SequenceStore& store);

/// \brief one entry per record of store, in store order, with coverage taken from coverageTable
///
/// throws MissingContigDataException if a record has no coverage entry
std::vector<ContigCoverageEntry> buildMappedContigEntries(
    const SequenceStore& store, const ContigCoverageTable& coverageTable);
