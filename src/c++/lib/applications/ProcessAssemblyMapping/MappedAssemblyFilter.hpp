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
/// coverage filtering of an assembly from the mapping of its own reads
///

#pragma once

#include "filter/ContigCoverageTable.hpp"
#include "filter/ContigFilter.hpp"
#include "filter/CoverageThreshold.hpp"
#include "filter/HealthVerdict.hpp"
#include "seqio/SequenceStore.hpp"

#include <iosfwd>

struct MappedFilterOutcome {
  /// resolved minimum contig coverage
  double minCoverage = 0;

  ContigFilterResult filterResult;

  /// false if filtering would leave the assembly below 80% of the expected genome size, in which
  /// case the assembly is kept unchanged
  bool isFiltered = false;

  /// verdict for the assembly which is kept, filtered or not
  HealthVerdict verdict;
};

/// \brief Filter contigs on 'coverage >= minimum coverage' plus the gc bounds
///
/// An automatic minimum coverage is derived from the totals of coverageTable.
///
/// throws MissingContigDataException if an assembly contig has no row in coverageTable
MappedFilterOutcome filterMappedAssembly(
    const SequenceStore&       store,
    const ContigCoverageTable& coverageTable,
    const CoverageThreshold&   threshold,
    const double               genomeSizeMb,
    const unsigned             maxContigs,
    std::ostream&              logOs);
