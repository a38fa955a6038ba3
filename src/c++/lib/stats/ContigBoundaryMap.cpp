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

#include "stats/ContigBoundaryMap.hpp"

#include "blt_util/parse_util.hpp"
#include "common/Exceptions.hpp"

#include <cctype>
#include <sstream>

ContigBoundaryMap::ContigBoundaryMap(const SequenceStore& store)
{
  uint64_t offset(0);
  for (const SequenceRecord& record : store) {
    ContigBoundary boundary;
    boundary.contigId = record.id;
    boundary.start    = offset;
    offset += record.size();
    boundary.end = offset;
    boundaries.push_back(boundary);
  }
}

bool ContigBoundaryMap::findContaining(const uint64_t pos, unsigned& hintIndex) const
{
  const unsigned boundaryCount(boundaries.size());
  for (; hintIndex < boundaryCount; ++hintIndex) {
    const ContigBoundary& boundary(boundaries[hintIndex]);
    if ((pos >= boundary.start) && (pos < boundary.end)) return true;
  }
  return false;
}

unsigned extractNodeId(const std::string& header)
{
  static const std::string nodeToken("_NODE_");

  size_t searchEnd(std::string::npos);
  while (true) {
    const size_t tokenPos(header.rfind(nodeToken, searchEnd));
    if (tokenPos == std::string::npos) break;

    const size_t digitStart(tokenPos + nodeToken.size());
    size_t       digitEnd(digitStart);
    while ((digitEnd < header.size()) && isdigit(static_cast<unsigned char>(header[digitEnd]))) {
      ++digitEnd;
    }
    if ((digitEnd > digitStart) && (digitEnd < header.size()) && (header[digitEnd] == '_')) {
      return asmqc::blt_util::parse_unsigned_str(header.substr(digitStart, digitEnd - digitStart));
    }

    if (tokenPos == 0) break;
    searchEnd = tokenPos - 1;
  }

  std::ostringstream oss;
  oss << "Can't find a '_NODE_<id>_' token in contig header '" << header << "'";
  BOOST_THROW_EXCEPTION(asmqc::common::InputFormatException(oss.str()));
}
