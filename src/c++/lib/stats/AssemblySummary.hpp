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
/// whole-assembly summary statistics
///

#pragma once

#include "seqio/SequenceStore.hpp"

#include <cstdint>
#include <string>
#include <vector>

struct AssemblySummary {
  unsigned contigCount = 0;
  double   avgContigSize = 0;
  unsigned n50 = 0;
  uint64_t totalLength = 0;

  /// mean over contigs of the per-contig uppercase GC proportion
  double   avgGc = 0;
  uint64_t missingData = 0;
};

bool operator==(const AssemblySummary& lhs, const AssemblySummary& rhs);

/// \brief Compute the summary of all records in store
///
/// Throws GeneralException if the store is empty or contains a zero-length record,
/// since the average contig size or a contig GC proportion would be undefined.
AssemblySummary summarizeAssembly(const SequenceStore& store);

/// \brief The length of the shortest contig in the minimal set of longest contigs
/// which covers at least half of the total length
///
/// lengths must be non-empty
unsigned computeN50(const std::vector<unsigned>& lengths);

/// proportion of uppercase 'G' or 'C' in seq, seq must be non-empty
double gcProportion(const std::string& seq);

/// proportion of 'G' or 'C' in either case in [begin, end), begin must be less than end
///
/// this convention is used by the sliding window GC track only
double gcProportionCaseInsensitive(std::string::const_iterator begin, std::string::const_iterator end);

/// count of uppercase 'N' in seq
uint64_t countMissingBases(const std::string& seq);

/// contig lengths in record order
std::vector<unsigned> getContigSizeDistribution(const SequenceStore& store);
