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
/// typed contig filter rules
///

#pragma once

#include "filter/ContigCoverageEntry.hpp"

#include <string>

namespace FILTER_KEY {
enum index_t { LENGTH, KMER_COV, COVERAGE, GC_PROP, AT_PROP, N_PROP, SIZE };

inline const char* label(const index_t i)
{
  switch (i) {
  case LENGTH:
    return "length";
  case KMER_COV:
    return "kmer_cov";
  case COVERAGE:
    return "coverage";
  case GC_PROP:
    return "gc_prop";
  case AT_PROP:
    return "at_prop";
  case N_PROP:
    return "n_prop";
  default:
    return "unknown";
  }
}

/// attributes which are reported as integers in failure text
///
/// KMER_COV and COVERAGE read the same entry field, but only mapped coverage is an
/// integer count, so a k-mer coverage failure keeps its fractional value
inline bool isIntegerValued(const index_t i)
{
  return ((i == LENGTH) || (i == COVERAGE));
}

/// return false if text is not a known key label
bool parse(const std::string& text, index_t& key);
}  // namespace FILTER_KEY

namespace COMPARISON {
enum index_t { GT, LT, GE, LE, EQ, NE, SIZE };

inline const char* label(const index_t i)
{
  switch (i) {
  case GT:
    return ">";
  case LT:
    return "<";
  case GE:
    return ">=";
  case LE:
    return "<=";
  case EQ:
    return "==";
  case NE:
    return "!=";
  default:
    return "unknown";
  }
}

/// return false if text is not a known comparison
bool parse(const std::string& text, index_t& op);

bool evaluate(const index_t op, const double lhs, const double rhs);
}  // namespace COMPARISON

/// value of attribute key for entry
double getAttributeValue(const ContigCoverageEntry& entry, const FILTER_KEY::index_t key);

/// \brief A single 'attribute comparison threshold' test on a contig
struct FilterRule {
  FilterRule(
      const FILTER_KEY::index_t  initKey,
      const COMPARISON::index_t initOp,
      const double               initThreshold,
      const bool                 initIsIntegerThreshold = false)
    : key(initKey), op(initOp), threshold(initThreshold), isIntegerThreshold(initIsIntegerThreshold)
  {
  }

  bool test(const ContigCoverageEntry& entry) const
  {
    return COMPARISON::evaluate(op, getAttributeValue(entry, key), threshold);
  }

  /// failure report for entry in the form 'key/observed/threshold'
  std::string describeFailure(const ContigCoverageEntry& entry) const;

  /// rule in the form 'key op threshold'
  std::string describe() const;

  FILTER_KEY::index_t  key;
  COMPARISON::index_t op;
  double               threshold;

  /// report the threshold as an integer, as when the rule was given with an integer value
  bool isIntegerThreshold;
};

/// \brief Parse a rule from 'key op value' (whitespace-separated) or 'key/op/value'
///
/// throws InvalidParameterException for an unknown key or comparison, or a non-numeric value
FilterRule parseFilterRule(const std::string& text);
