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

#include "filter/ContigFilter.hpp"

#include "common/Exceptions.hpp"

#include <sstream>

ContigFilter::ContigFilter(
    const std::vector<FilterRule>& rules, const FILTER_MODE::index_t mode, const double minGc)
  : _rules(rules), _mode(mode)
{
  if ((minGc < 0.) || (minGc > 0.5)) {
    std::ostringstream oss;
    oss << "Minimum gc proportion must be in [0,0.5], value given: " << minGc;
    BOOST_THROW_EXCEPTION(asmqc::common::InvalidParameterException(oss.str()));
  }

  _rules.emplace_back(FILTER_KEY::GC_PROP, COMPARISON::GE, minGc);
  _rules.emplace_back(FILTER_KEY::GC_PROP, COMPARISON::LE, 1. - minGc);
}

bool ContigFilter::testEntry(const ContigCoverageEntry& entry, std::string& reason) const
{
  reason.clear();
  for (const FilterRule& rule : _rules) {
    if (rule.test(entry)) {
      if (_mode == FILTER_MODE::ANY) return true;
    } else {
      if (reason.empty()) reason = rule.describeFailure(entry);
      if (_mode == FILTER_MODE::ALL) return false;
    }
  }

  return (_mode == FILTER_MODE::ALL);
}

ContigFilterResult ContigFilter::apply(const std::vector<ContigCoverageEntry>& entries) const
{
  ContigFilterResult result;
  result.outcomes.reserve(entries.size());

  std::string reason;
  const unsigned entryCount(entries.size());
  for (unsigned entryIndex(0); entryIndex < entryCount; ++entryIndex) {
    const ContigCoverageEntry& entry(entries[entryIndex]);
    if (testEntry(entry, reason)) {
      result.keptIndices.push_back(entryIndex);
      result.keptLength += entry.length;
      result.outcomes.push_back(filterPassLabel);
    } else {
      result.outcomes.push_back(reason);
    }
  }

  return result;
}
