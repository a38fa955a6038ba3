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
/// apply an ordered rule set to a contig table
///

#pragma once

#include "filter/FilterRule.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace FILTER_MODE {
/// ALL: a contig must pass every rule, ANY: a contig must pass at least one rule
enum index_t { ALL, ANY };

inline const char* label(const index_t i)
{
  switch (i) {
  case ALL:
    return "all";
  case ANY:
    return "any";
  default:
    return "unknown";
  }
}
}  // namespace FILTER_MODE

/// default lower gc proportion bound for contig filtering, the upper bound is 1 - minGc
const double defaultMinGcProportion(0.05);

/// outcome label recorded for a contig which passed the filter
const char* const filterPassLabel("pass");

struct ContigFilterResult {
  /// store indices of kept contigs, in input order
  std::vector<unsigned> keptIndices;

  /// one entry per input contig, either 'pass' or the first failing rule as 'key/observed/threshold'
  std::vector<std::string> outcomes;

  /// total length of kept contigs
  uint64_t keptLength = 0;
};

/// \brief Filter contigs on an ordered rule set
///
/// The gc bound rules 'gc_prop >= minGc' and 'gc_prop <= 1 - minGc' are always
/// appended after the user rules.
///
/// In ALL mode rules are tested in order and the first failure rejects the contig.
/// In ANY mode a contig is rejected only if every rule fails, with the first
/// failing rule recorded as the reason.
///
class ContigFilter {
public:
  explicit ContigFilter(
      const std::vector<FilterRule>& rules,
      const FILTER_MODE::index_t     mode  = FILTER_MODE::ALL,
      const double                   minGc = defaultMinGcProportion);

  ContigFilterResult apply(const std::vector<ContigCoverageEntry>& entries) const;

  /// full rule set including the appended gc bounds
  const std::vector<FilterRule>& getRules() const { return _rules; }

  FILTER_MODE::index_t getMode() const { return _mode; }

private:
  /// return true if entry is kept, otherwise set reason
  bool testEntry(const ContigCoverageEntry& entry, std::string& reason) const;

  std::vector<FilterRule> _rules;
  FILTER_MODE::index_t    _mode;
};
