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
/// output files of a read coverage estimate
///

#pragma once

#include "common/QcStatus.hpp"
#include "reads/CoverageEstimate.hpp"

#include <string>

/// corrupt if the reads could not be read, otherwise pass or fail on the coverage check
QC_STATUS::index_t getCoverageEstimateStatus(const CoverageEstimate& estimate);

/// \brief Write each channel of estimate to its own file
///
/// The files are outputPrefix + '_encoding', '_phred', '_coverage', '_report' and '_max_len'.
///
void writeCoverageChannels(
    const CoverageEstimate& estimate, const std::string& sampleId, const std::string& outputPrefix);
