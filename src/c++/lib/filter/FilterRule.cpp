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

#include "filter/FilterRule.hpp"

#include "blt_util/parse_util.hpp"
#include "blt_util/string_util.hpp"
#include "common/Exceptions.hpp"

#include <cmath>
#include <sstream>
#include <vector>

namespace FILTER_KEY {
bool parse(const std::string& text, index_t& key)
{
  for (int i(0); i < SIZE; ++i) {
    if (text == label(static_cast<index_t>(i))) {
      key = static_cast<index_t>(i);
      return true;
    }
  }
  return false;
}
}  // namespace FILTER_KEY

namespace COMPARISON {
bool parse(const std::string& text, index_t& op)
{
  for (int i(0); i < SIZE; ++i) {
    if (text == label(static_cast<index_t>(i))) {
      op = static_cast<index_t>(i);
      return true;
    }
  }
  return false;
}

bool evaluate(const index_t op, const double lhs, const double rhs)
{
  switch (op) {
  case GT:
    return (lhs > rhs);
  case LT:
    return (lhs < rhs);
  case GE:
    return (lhs >= rhs);
  case LE:
    return (lhs <= rhs);
  case EQ:
    return (lhs == rhs);
  case NE:
    return (lhs != rhs);
  default:
    BOOST_THROW_EXCEPTION(asmqc::common::GeneralException("Unknown filter comparison"));
  }
}
}  // namespace COMPARISON

double getAttributeValue(const ContigCoverageEntry& entry, const FILTER_KEY::index_t key)
{
  using namespace FILTER_KEY;

  switch (key) {
  case LENGTH:
    return entry.length;
  case KMER_COV:
  case COVERAGE:
    return entry.coverage;
  case GC_PROP:
    return entry.gcProp;
  case AT_PROP:
    return entry.atProp;
  case N_PROP:
    return entry.nProp;
  default:
    BOOST_THROW_EXCEPTION(asmqc::common::GeneralException("Unknown filter attribute"));
  }
}

static std::string formatFilterValue(const double value, const bool isInteger)
{
  if (isInteger) {
    std::ostringstream oss;
    oss << static_cast<long long>(std::llround(value));
    return oss.str();
  }
  return formatRoundTripDouble(value);
}

std::string FilterRule::describeFailure(const ContigCoverageEntry& entry) const
{
  std::ostringstream oss;
  oss << FILTER_KEY::label(key) << '/'
      << formatFilterValue(getAttributeValue(entry, key), FILTER_KEY::isIntegerValued(key)) << '/'
      << formatFilterValue(threshold, isIntegerThreshold);
  return oss.str();
}

std::string FilterRule::describe() const
{
  std::ostringstream oss;
  oss << FILTER_KEY::label(key) << ' ' << COMPARISON::label(op) << ' '
      << formatFilterValue(threshold, isIntegerThreshold);
  return oss.str();
}

FilterRule parseFilterRule(const std::string& text)
{
  using namespace asmqc::common;

  std::vector<std::string> words;
  if (text.find('/') != std::string::npos) {
    split_string(strip_whitespace(text), '/', words);
  } else {
    split_string_whitespace(text, words);
  }

  FILTER_KEY::index_t  key;
  COMPARISON::index_t op;
  if ((words.size() != 3) || (!FILTER_KEY::parse(words[0], key)) || (!COMPARISON::parse(words[1], op))) {
    std::ostringstream oss;
    oss << "Invalid filter rule '" << text << "', expected 'key op value' with key one of "
        << "length, kmer_cov, coverage, gc_prop, at_prop, n_prop and op one of >, <, >=, <=, ==, !=";
    BOOST_THROW_EXCEPTION(InvalidParameterException(oss.str()));
  }

  double threshold(0);
  try {
    threshold = asmqc::blt_util::parse_double_str(words[2]);
  } catch (const InputFormatException&) {
    std::ostringstream oss;
    oss << "Invalid filter rule '" << text << "', threshold is not a number";
    BOOST_THROW_EXCEPTION(InvalidParameterException(oss.str()));
  }

  const bool isIntegerThreshold(words[2].find_first_of(".eE") == std::string::npos);
  return FilterRule(key, op, threshold, isIntegerThreshold);
}
