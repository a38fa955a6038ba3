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

#include "stats/WindowTrack.hpp"

#include "common/Exceptions.hpp"
#include "stats/AssemblySummary.hpp"

#include <algorithm>
#include <sstream>

static void checkWindowSize(const unsigned windowSize)
{
  if (windowSize == 0) {
    BOOST_THROW_EXCEPTION(asmqc::common::InvalidParameterException("Window size must be greater than zero"));
  }
}

static std::vector<TrackBoundary> getTrackBoundaries(const ContigBoundaryMap& boundaryMap)
{
  std::vector<TrackBoundary> trackBoundaries;
  for (const ContigBoundary& boundary : boundaryMap.boundaries) {
    TrackBoundary trackBoundary;
    trackBoundary.nodeId   = extractNodeId(boundary.contigId);
    trackBoundary.end      = boundary.end;
    trackBoundary.contigId = boundary.contigId;
    trackBoundaries.push_back(trackBoundary);
  }
  return trackBoundaries;
}

/// add a window starting at pos to track, labeled by the first boundary containing pos
static void addWindow(
    const ContigBoundaryMap& boundaryMap,
    const uint64_t           pos,
    const double             value,
    unsigned&                boundaryIndex,
    WindowTrack&             track)
{
  if (!boundaryMap.findContaining(pos, boundaryIndex)) {
    std::ostringstream oss;
    oss << "Track window at position " << pos << " is past the end of the assembly (length "
        << boundaryMap.totalLength() << ")";
    BOOST_THROW_EXCEPTION(asmqc::common::InputFormatException(oss.str()));
  }
  track.values.push_back(value);
  track.labels.push_back(extractNodeId(boundaryMap.boundaries[boundaryIndex].contigId));
  track.positions.push_back(pos);
}

WindowTrack buildGcWindowTrack(const SequenceStore& store, const unsigned windowSize)
{
  checkWindowSize(windowSize);

  const ContigBoundaryMap boundaryMap(store);

  std::string sequence;
  sequence.reserve(boundaryMap.totalLength());
  for (const SequenceRecord& record : store) sequence.append(record.seq);

  WindowTrack track;
  track.boundaries = getTrackBoundaries(boundaryMap);

  unsigned       boundaryIndex(0);
  const uint64_t dataSize(sequence.size());
  for (uint64_t pos(0); pos < dataSize; pos += windowSize) {
    const uint64_t windowEnd(std::min(pos + windowSize, dataSize));
    const double   gc(gcProportionCaseInsensitive(sequence.begin() + pos, sequence.begin() + windowEnd));
    addWindow(boundaryMap, pos, gc, boundaryIndex, track);
  }
  return track;
}

WindowTrack buildCoverageWindowTrack(
    const SequenceStore& store, const DepthTable& depthTable, const unsigned windowSize)
{
  checkWindowSize(windowSize);

  const ContigBoundaryMap boundaryMap(store);

  std::vector<unsigned> depth;
  for (const ContigBoundary& boundary : boundaryMap.boundaries) {
    const DepthTable::depth_t& contigDepth(depthTable.getDepth(boundary.contigId));
    depth.insert(depth.end(), contigDepth.begin(), contigDepth.end());
  }

  WindowTrack track;
  track.boundaries = getTrackBoundaries(boundaryMap);

  unsigned       boundaryIndex(0);
  const uint64_t dataSize(depth.size());
  for (uint64_t pos(0); pos < dataSize; pos += windowSize) {
    const uint64_t windowEnd(std::min(pos + windowSize, dataSize));
    double         depthSum(0);
    for (uint64_t depthIndex(pos); depthIndex < windowEnd; ++depthIndex) depthSum += depth[depthIndex];
    addWindow(boundaryMap, pos, depthSum / (windowEnd - pos), boundaryIndex, track);
  }
  return track;
}
