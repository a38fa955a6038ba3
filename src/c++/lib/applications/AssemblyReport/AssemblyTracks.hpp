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
/// sliding window tracks of the assembly report
///

#pragma once

#include "stats/WindowTrack.hpp"

#include <memory>

/// gc and coverage tracks of one assembly, either may be absent
struct AssemblyTracks {
  std::unique_ptr<WindowTrack> gcTrack;
  std::unique_ptr<WindowTrack> coverageTrack;
};

/// \brief Build the tracks written to the assembly report
///
/// The gc track is always built, and the coverage track only if depthTable is not null.
///
/// Throws InputFormatException if a contig header has no '_NODE_<id>_' token, and
/// MissingContigDataException if depthTable lacks a contig of the assembly.
///
void buildAssemblyTracks(
    const SequenceStore& store, const DepthTable* depthTable, const unsigned windowSize, AssemblyTracks& tracks);
