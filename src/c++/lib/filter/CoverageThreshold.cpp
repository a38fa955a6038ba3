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

#include "filter/CoverageThreshold.hpp"

#include "blt_util/parse_util.hpp"
#include "blt_util/string_util.hpp"
#include "common/Exceptions.hpp"

#include <algorithm>
#include <sstream>

std::string CoverageThreshold::describe() const
{
  if (isAuto) return "auto";
  return formatRoundTripDouble(value);
}

CoverageThreshold parseCoverageThreshold(const std::string& text)
{
  using namespace asmqc::common;

  const std::string word(strip_whitespace(text));
  if (word == "auto") return CoverageThreshold();

  double value(0);
  try {
    value = asmqc::blt_util::parse_double_str(word);
  } catch (const InputFormatException&) {
    std::ostringstream oss;
    oss << "Invalid minimum coverage '" << text << "', expected 'auto' or a number";
    BOOST_THROW_EXCEPTION(InvalidParameterException(oss.str()));
  }

  if (value < 0) {
    std::ostringstream oss;
    oss << "Minimum coverage can't be negative, value given: '" << text << "'";
    BOOST_THROW_EXCEPTION(InvalidParameterException(oss.str()));
  }
  return CoverageThreshold(value);
}

double autoMinCoverage(const uint64_t totalCoverage, const uint64_t totalLength)
{
  if (totalLength == 0) {
    BOOST_THROW_EXCEPTION(asmqc::common::InvalidParameterException(
        "Can't derive minimum coverage for an assembly of zero total length"));
  }

  const double meanCoverage(static_cast<double>(totalCoverage) / static_cast<double>(totalLength));
  return std::max(meanCoverage * autoMinCoverageFactor, autoMinCoverageFloor);
}

double resolveMinCoverage(
    const CoverageThreshold& threshold, const uint64_t totalCoverage, const uint64_t totalLength)
{
  if (threshold.isAuto) return autoMinCoverage(totalCoverage, totalLength);
  return threshold.value;
}
