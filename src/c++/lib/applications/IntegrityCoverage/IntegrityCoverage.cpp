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

#include "IntegrityCoverage.hpp"
#include "CoverageChannels.hpp"
#include "ICOptions.hpp"

#include "blt_util/log.hpp"
#include "common/QcStatus.hpp"

#include <iostream>

static void runIC(const ICOptions& opt)
{
  const std::string statusFilename(opt.outputPrefix + ".status");
  registerErrorStatusFile(statusFilename);

  const CoverageEstimate estimate(estimateReadCoverage(opt.readFilenames, opt.coverage, log_os));

  writeCoverageChannels(estimate, opt.sampleId, opt.outputPrefix);
  writeStatusFile(statusFilename, getCoverageEstimateStatus(estimate));
  registerErrorStatusFile("");

  if (!estimate.isCorrupt) {
    log_os << "INFO: Sample '" << opt.sampleId << "' encoding: " << estimate.getEncodingChannel()
           << " coverage: " << estimate.getCoverageText() << "\n";
  }
}

void IntegrityCoverage::runInternal(int argc, char* argv[]) const
{
  ICOptions opt;

  parseICOptions(*this, argc, argv, opt);
  runIC(opt);
}
