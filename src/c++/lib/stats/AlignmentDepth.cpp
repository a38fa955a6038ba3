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

#include "stats/AlignmentDepth.hpp"

#include "htsapi/bam_streamer.hpp"

static bool isDepthRead(const bam_record& bamRead)
{
  return (!(bamRead.is_unmapped() || bamRead.is_secondary() || bamRead.is_filter() || bamRead.is_dup()));
}

/// add one to depth for each aligned reference position of bamRead
static void addReadDepth(const bam_record& bamRead, std::vector<unsigned>& depth)
{
  const uint32_t* cigar(bamRead.raw_cigar());
  const unsigned  n_cigar(bamRead.n_cigar());
  const uint64_t  contigSize(depth.size());

  uint64_t refPos(bamRead.pos() - 1);
  for (unsigned cigarIndex(0); cigarIndex < n_cigar; ++cigarIndex) {
    const int      op(bam_cigar_op(cigar[cigarIndex]));
    const uint32_t length(bam_cigar_oplen(cigar[cigarIndex]));

    if ((op == BAM_CMATCH) || (op == BAM_CEQUAL) || (op == BAM_CDIFF)) {
      for (uint32_t offset(0); offset < length; ++offset) {
        if ((refPos + offset) >= contigSize) break;
        depth[refPos + offset]++;
      }
    }

    // bit 2 of the cigar type marks ops which consume reference
    if (bam_cigar_type(op) & 2) refPos += length;
  }
}

std::vector<std::string> readAlignmentDepth(
    const std::string& alignmentFilename, const char* referenceFilename, DepthTable& table)
{
  bam_streamer     stream(alignmentFilename.c_str(), referenceFilename);
  const bam_hdr_t& header(stream.get_header());

  std::vector<std::vector<unsigned>> contigDepth(header.n_targets);
  for (int32_t tid(0); tid < header.n_targets; ++tid) {
    contigDepth[tid].resize(header.target_len[tid], 0);
  }

  while (stream.next()) {
    const bam_record& bamRead(*(stream.get_record_ptr()));
    if (!isDepthRead(bamRead)) continue;
    if ((bamRead.target_id() < 0) || (bamRead.target_id() >= header.n_targets)) continue;
    addReadDepth(bamRead, contigDepth[bamRead.target_id()]);
  }

  std::vector<std::string> contigOrder;
  for (int32_t tid(0); tid < header.n_targets; ++tid) {
    const std::string contigId(header.target_name[tid]);
    contigOrder.push_back(contigId);
    for (const unsigned depth : contigDepth[tid]) {
      table.addDepth(contigId, depth);
    }
  }
  return contigOrder;
}
