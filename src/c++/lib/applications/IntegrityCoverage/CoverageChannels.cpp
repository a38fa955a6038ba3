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

#include "CoverageChannels.hpp"

#include "blt_util/io_util.hpp"

QC_STATUS::index_t getCoverageEstimateStatus(const CoverageEstimate& estimate)
{
  if (estimate.isCorrupt) return QC_STATUS::CORRUPT;
  return (estimate.isPass ? QC_STATUS::PASS : QC_STATUS::FAIL);
}

void writeCoverageChannels(
    const CoverageEstimate& estimate, const std::string& sampleId, const std::string& outputPrefix)
{
  writeTokenFile(outputPrefix + "_encoding", estimate.getEncodingChannel());
  writeTokenFile(outputPrefix + "_phred", estimate.getPhredChannel());
  writeTokenFile(outputPrefix + "_coverage", estimate.getCoverageChannel());
  writeTokenFile(outputPrefix + "_report", estimate.getReportChannel(sampleId));
  writeTokenFile(outputPrefix + "_max_len", estimate.getMaxLengthChannel());
}
