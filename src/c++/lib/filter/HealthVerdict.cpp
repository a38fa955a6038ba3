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

#include "filter/HealthVerdict.hpp"

#include "blt_util/string_util.hpp"
#include "common/Exceptions.hpp"

#include <sstream>

double minAssemblyLength(const double genomeSizeMb)
{
  return genomeSizeMb * 1e6 * minGenomeSizeFraction;
}

double maxAssemblyLength(const double genomeSizeMb)
{
  return genomeSizeMb * 1e6 * maxGenomeSizeFraction;
}

HealthVerdict classifyAssemblyHealth(
    const uint64_t filteredLength,
    const unsigned filteredContigCount,
    const double   genomeSizeMb,
    const unsigned maxContigs)
{
  if (!(genomeSizeMb > 0)) {
    std::ostringstream oss;
    oss << "Expected genome size must be positive, value given: " << genomeSizeMb;
    BOOST_THROW_EXCEPTION(asmqc::common::InvalidParameterException(oss.str()));
  }

  HealthVerdict verdict;

  const double length(static_cast<double>(filteredLength));
  const double minLength(minAssemblyLength(genomeSizeMb));
  if (length < minLength) {
    verdict.isFail     = true;
    verdict.failReason = assemblyTooSmallLabel;

    std::ostringstream oss;
    oss << "Assembly size (" << filteredLength << ") smaller than the minimum threshold of 80% of "
        << "expected genome size (" << formatRoundTripDouble(minLength) << ")";
    verdict.messages.push_back(oss.str());
  }

  const double maxLength(maxAssemblyLength(genomeSizeMb));
  if (length > maxLength) {
    verdict.warnings.push_back(assemblyTooLargeLabel);

    std::ostringstream oss;
    oss << "Assembly size (" << filteredLength << ") larger than the maximum threshold of 150% of "
        << "expected genome size (" << formatRoundTripDouble(maxLength) << ")";
    verdict.messages.push_back(oss.str());
  }

  const double maxContigCount(static_cast<double>(maxContigs) * genomeSizeMb / 1.5);
  if (static_cast<double>(filteredContigCount) > maxContigCount) {
    verdict.warnings.push_back(excessiveContigsLabel);

    std::ostringstream oss;
    oss << "The number of contigs (" << filteredContigCount << ") exceeds the threshold of " << maxContigs
        << " contigs per 1.5Mb (" << formatRoundTripDouble(maxContigCount) << ")";
    verdict.messages.push_back(oss.str());
  }

  return verdict;
}
