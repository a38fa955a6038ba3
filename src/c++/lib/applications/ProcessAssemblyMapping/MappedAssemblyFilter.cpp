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

#include "MappedAssemblyFilter.hpp"

#include "blt_util/string_util.hpp"

#include <iostream>

MappedFilterOutcome filterMappedAssembly(
    const SequenceStore&       store,
    const ContigCoverageTable& coverageTable,
    const CoverageThreshold&   threshold,
    const double               genomeSizeMb,
    const unsigned             maxContigs,
    std::ostream&              logOs)
{
  MappedFilterOutcome outcome;
  outcome.minCoverage =
      resolveMinCoverage(threshold, coverageTable.totalCoverage(), coverageTable.totalLength());

  logOs << "INFO: Minimum contig coverage (" << threshold.describe()
        << "): " << formatRoundTripDouble(outcome.minCoverage) << "\n";

  const std::vector<ContigCoverageEntry> entries(buildMappedContigEntries(store, coverageTable));
  const ContigFilter filter({FilterRule(FILTER_KEY::COVERAGE, COMPARISON::GE, outcome.minCoverage)});
  outcome.filterResult = filter.apply(entries);

  outcome.isFiltered = (outcome.filterResult.keptLength >= minAssemblyLength(genomeSizeMb));

  if (outcome.isFiltered) {
    outcome.verdict = classifyAssemblyHealth(
        outcome.filterResult.keptLength, outcome.filterResult.keptIndices.size(), genomeSizeMb, maxContigs);
  } else {
    logOs << "WARNING: Coverage filtering would reduce the assembly size to "
          << outcome.filterResult.keptLength
          << ", below 80% of the expected genome size. The assembly is kept unfiltered\n";
    outcome.verdict = classifyAssemblyHealth(store.totalLength(), store.size(), genomeSizeMb, maxContigs);
  }

  for (const std::string& message : outcome.verdict.messages) {
    logOs << "WARNING: " << message << "\n";
  }

  return outcome;
}
