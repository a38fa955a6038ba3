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

#include "reads/CoverageEstimate.hpp"

#include "blt_util/log.hpp"
#include "blt_util/string_util.hpp"
#include "common/Exceptions.hpp"
#include "reads/ReadStreamStats.hpp"
#include "seqio/CompressedInputStream.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <sstream>

void checkGenomeSize(const double genomeSizeMb)
{
  if (!(std::isfinite(genomeSizeMb) && (genomeSizeMb > 0.))) {
    std::ostringstream oss;
    oss << "Genome size must be greater than zero, found: " << genomeSizeMb;
    BOOST_THROW_EXCEPTION(asmqc::common::InvalidParameterException(oss.str()));
  }
}

double computeCoverage(const uint64_t charCount, const double genomeSizeMb)
{
  checkGenomeSize(genomeSizeMb);

  const double coverage(charCount / (genomeSizeMb * 1e6));

  // round to 2 decimal places on the exact binary value:
  char buffer[64];
  snprintf(buffer, sizeof(buffer), "%.2f", coverage);
  return strtod(buffer, nullptr);
}

std::string CoverageEstimate::getEncodingChannel() const
{
  return (isCorrupt ? corruptChannelValue : encodingLabel);
}

std::string CoverageEstimate::getPhredChannel() const
{
  return (isCorrupt ? corruptChannelValue : phredLabel);
}

std::string CoverageEstimate::getCoverageText() const
{
  return formatRoundTripDouble(coverage);
}

std::string CoverageEstimate::getCoverageChannel() const
{
  if (isCorrupt) return corruptChannelValue;
  return (isPass ? getCoverageText() : "fail");
}

std::string CoverageEstimate::getReportChannel(const std::string& sampleId) const
{
  if (isCorrupt) return corruptChannelValue;
  return sampleId + "," + getCoverageText() + "," + (isPass ? "PASS" : "FAIL") + "\n";
}

std::string CoverageEstimate::getMaxLengthChannel() const
{
  if (isCorrupt) return corruptChannelValue;
  return std::to_string(maxReadLength);
}

CoverageEstimate estimateReadCoverage(
    const std::vector<std::string>& readFiles, const ReadCoverageOptions& opt, std::ostream& logOs)
{
  checkGenomeSize(opt.genomeSizeMb);

  CoverageEstimate estimate;
  ReadStreamStats  stats(opt.isSkipEncoding);

  try {
    for (const std::string& readFile : readFiles) {
      CompressedInputStream cis(readFile);
      stats.addStream(cis.getStream(), readFile);
    }
  } catch (const asmqc::common::CorruptStreamException& e) {
    logLine(logOs, LOG_LEVEL::WARNING, e.what());
    estimate.isCorrupt = true;
    return estimate;
  } catch (const std::ios_base::failure& e) {
    std::ostringstream oss;
    oss << "Failed to decompress read stream: " << e.what();
    logLine(logOs, LOG_LEVEL::WARNING, oss.str());
    estimate.isCorrupt = true;
    return estimate;
  }

  estimate.encodingLabel = stats.encoding.getEncodingLabel();
  estimate.phredLabel    = stats.encoding.getPhredLabel();
  estimate.coverage      = computeCoverage(stats.charCount, opt.genomeSizeMb);
  estimate.isPass        = (estimate.coverage >= opt.minCoverage);
  estimate.maxReadLength = stats.maxReadLength;
  return estimate;
}
