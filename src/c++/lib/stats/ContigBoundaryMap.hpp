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

#include "seqio/SequenceStore.hpp"

#include <cstdint>
#include <string>
#include <vector>

/// contig extent in the concatenation of all contigs, as [start, end)
struct ContigBoundary {
  std::string contigId;
  uint64_t    start = 0;
  uint64_t    end   = 0;
};

/// contig boundaries in record order, rebuilt from the store on request
struct ContigBoundaryMap {
  explicit ContigBoundaryMap(const SequenceStore& store);

  /// index of the first boundary containing pos, starting the search from hintIndex
  ///
  /// returns false if no boundary at or after hintIndex contains pos
  bool findContaining(const uint64_t pos, unsigned& hintIndex) const;

  uint64_t totalLength() const { return (boundaries.empty() ? 0 : boundaries.back().end); }

  std::vector<ContigBoundary> boundaries;
};

/// \brief Extract the numeric node id from a SPAdes style contig header
///
/// The node id is taken from the last '_NODE_<digits>_' token in header, so
/// 'sampleA_NODE_12_length_300_cov_4.5' gives 12.
///
/// Throws InputFormatException if no such token exists.
unsigned extractNodeId(const std::string& header);
