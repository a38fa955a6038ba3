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

#include "report/FilterReport.hpp"

#include <iostream>

void writeFilterReport(const std::vector<std::string>& outcomes, std::ostream& os)
{
  const unsigned outcomeCount(outcomes.size());
  for (unsigned contigIndex(0); contigIndex < outcomeCount; ++contigIndex) {
    os << contigIndex << ", " << outcomes[contigIndex] << "\n";
  }
}
