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

#include "SpadesAssemblyFilter.hpp"

#include <iostream>

SpadesFilterOutcome filterSpadesAssembly(
    const std::vector<ContigCoverageEntry>& entries, const SpadesFilterOptions& opt, std::ostream& logOs)
{
  const FilterRule lengthRule(FILTER_KEY::LENGTH, COMPARISON::GE, opt.minContigLength, true);

  std::vector<FilterRule> rules = {lengthRule, FilterRule(FILTER_KEY::KMER_COV, COMPARISON::GE, opt.minKmerCoverage)};
  rules.insert(rules.end(), opt.extraRules.begin(), opt.extraRules.end());

  SpadesFilterOutcome outcome;
  outcome.filterResult = ContigFilter(rules, FILTER_MODE::ALL, opt.minGc).apply(entries);

  const double minLength(minAssemblyLength(opt.genomeSizeMb));
  if (outcome.filterResult.keptLength < minLength) {
    logOs << "WARNING: Assembly size (" << outcome.filterResult.keptLength
          << ") smaller than the minimum threshold of 80% of expected genome size. "
          << "Applying contig filters without the k-mer coverage filter\n";

    outcome.filterResult      = ContigFilter({lengthRule}, FILTER_MODE::ALL, opt.minGc).apply(entries);
    outcome.isLengthOnlyRetry = true;
  }

  outcome.verdict = classifyAssemblyHealth(
      outcome.filterResult.keptLength,
      outcome.filterResult.keptIndices.size(),
      opt.genomeSizeMb,
      opt.maxContigs);

  for (const std::string& message : outcome.verdict.messages) {
    logOs << "WARNING: " << message << "\n";
  }

  return outcome;
}
