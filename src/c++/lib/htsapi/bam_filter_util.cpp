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

#include "htsapi/bam_filter_util.hpp"

#include "htsapi/bam_dumper.hpp"
#include "htsapi/bam_streamer.hpp"

#include <vector>

unsigned writeContigFilteredBam(
    const std::string&           inputFilename,
    const std::set<std::string>& keptContigIds,
    const std::string&           outputFilename)
{
  bam_streamer     stream(inputFilename.c_str(), nullptr);
  const bam_hdr_t& header(stream.get_header());

  std::vector<bool> isKeptTarget(header.n_targets, false);
  for (int32_t tid(0); tid < header.n_targets; ++tid) {
    isKeptTarget[tid] = (keptContigIds.count(header.target_name[tid]) != 0);
  }

  bam_dumper dumper(outputFilename.c_str(), header);

  unsigned writeCount(0);
  while (stream.next()) {
    const bam_record& bamRead(*(stream.get_record_ptr()));
    if (bamRead.is_unmapped()) continue;
    if ((bamRead.target_id() < 0) || (!isKeptTarget[bamRead.target_id()])) continue;
    dumper.put_record(bamRead.get_data());
    writeCount++;
  }

  dumper.close();
  return writeCount;
}
