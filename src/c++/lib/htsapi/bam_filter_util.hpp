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

#pragma once

#include <set>
#include <string>

/// \brief Copy mapped reads aligned to any contig in keptContigIds from inputFilename to a BAM file
///
/// Unmapped reads are dropped. The output header is the full input header.
///
/// \return number of reads written
unsigned writeContigFilteredBam(
    const std::string&           inputFilename,
    const std::set<std::string>& keptContigIds,
    const std::string&           outputFilename);
