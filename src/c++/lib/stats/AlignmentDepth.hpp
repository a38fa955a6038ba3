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
/// per-base depth table computed from an alignment of reads onto the assembly
///

#pragma once

#include "stats/DepthTable.hpp"

#include <string>
#include <vector>

/// \brief Fill table with the depth of every position of every contig in the alignment header
///
/// Unmapped, secondary, qc-failed and duplicate reads are skipped. Only aligned bases (cigar M, = and X)
/// add depth, deletions and skips do not. Positions with no aligned bases get depth 0, so each contig's
/// depth list has one entry per contig position.
///
/// \param[in] referenceFilename assembly fasta used to decode CRAM input, may be nullptr for SAM/BAM
///
/// \return contig ids in alignment header order
///
std::vector<std::string> readAlignmentDepth(
    const std::string& alignmentFilename, const char* referenceFilename, DepthTable& table);
