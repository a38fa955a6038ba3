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

#include "report/SummaryCsv.hpp"

#include "blt_util/string_util.hpp"

#include <iostream>
#include <sstream>

std::string formatSummaryCsvRow(const std::string& sampleId, const AssemblySummary& summary)
{
  std::ostringstream oss;
  oss << sampleId << ", " << summary.contigCount << ',' << formatRoundTripDouble(summary.avgContigSize)
      << ',' << summary.n50 << ',' << summary.totalLength << ',' << formatRoundTripDouble(summary.avgGc)
      << ',' << summary.missingData;
  return oss.str();
}

void writeSummaryCsvRow(const std::string& sampleId, const AssemblySummary& summary, std::ostream& os)
{
  os << formatSummaryCsvRow(sampleId, summary) << "\n";
}
