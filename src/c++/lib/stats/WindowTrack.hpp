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
/// sliding window GC and coverage tracks over the concatenated assembly
///

#pragma once

#include "seqio/SequenceStore.hpp"
#include "stats/ContigBoundaryMap.hpp"
#include "stats/DepthTable.hpp"

#include <cstdint>
#include <string>
#include <vector>

/// default window size for both track types
static const unsigned defaultTrackWindowSize(2000);

/// contig marker for track plots: node id and cumulative end position of the contig
struct TrackBoundary {
  unsigned    nodeId = 0;
  uint64_t    end    = 0;
  std::string contigId;
};

/// \brief A sliding window track
///
/// values, labels and positions are parallel lists with one entry per window.
///
struct WindowTrack {
  unsigned size() const { return values.size(); }

  std::vector<double> values;

  /// node id of the contig containing the window start
  std::vector<unsigned> labels;

  /// window start in the concatenated data
  std::vector<uint64_t> positions;

  std::vector<TrackBoundary> boundaries;
};

/// \brief GC proportion track, case-insensitive, over windows of the concatenated contig sequences
///
/// Throws InvalidParameterException if windowSize is zero, and InputFormatException
/// if a contig header has no '_NODE_<id>_' token.
WindowTrack buildGcWindowTrack(const SequenceStore& store, const unsigned windowSize = defaultTrackWindowSize);

/// \brief Mean depth track over windows of the per-base depth lists, concatenated in contig order
///
/// Throws MissingContigDataException if a contig has no entry in depthTable, and
/// InputFormatException if the depth lists extend past the end of the assembly.
WindowTrack buildCoverageWindowTrack(
    const SequenceStore& store,
    const DepthTable&    depthTable,
    const unsigned       windowSize = defaultTrackWindowSize);
