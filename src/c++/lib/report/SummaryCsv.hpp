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
/// single row csv assembly summary
///

#pragma once

#include "stats/AssemblySummary.hpp"

#include <iosfwd>
#include <string>

/// \brief Format the summary as 'sample, ncontigs,avg_contig_size,n50,total_len,avg_gc,missing_data'
///
/// The sample id is separated from the values by ", ", values are separated by a bare ','.
/// Real values use the shortest round-trip format, with '.0' kept on integral values.
std::string formatSummaryCsvRow(const std::string& sampleId, const AssemblySummary& summary);

/// write the summary row followed by a newline
void writeSummaryCsvRow(const std::string& sampleId, const AssemblySummary& summary, std::ostream& os);
