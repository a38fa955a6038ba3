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

#include "stats/DepthTable.hpp"

#include "blt_util/istream_line_splitter.hpp"
#include "blt_util/parse_util.hpp"
#include "common/Exceptions.hpp"
#include "seqio/CompressedInputStream.hpp"

#include <iostream>
#include <sstream>

const DepthTable::depth_t& DepthTable::getDepth(const std::string& contigId) const
{
  const auto iter(_depth.find(contigId));
  if (iter == _depth.end()) {
    std::ostringstream oss;
    oss << "No per-base depth found for contig '" << contigId << "'";
    BOOST_THROW_EXCEPTION(asmqc::common::MissingContigDataException(oss.str(), contigId));
  }
  return iter->second;
}

void DepthTable::write(const std::vector<std::string>& contigOrder, std::ostream& os) const
{
  for (const std::string& contigId : contigOrder) {
    const auto iter(_depth.find(contigId));
    if (iter == _depth.end()) continue;
    unsigned pos(0);
    for (const unsigned depth : iter->second) {
      os << contigId << '\t' << (++pos) << '\t' << depth << '\n';
    }
  }
}

void parseDepthTable(std::istream& is, const std::string& label, DepthTable& table)
{
  using namespace asmqc::blt_util;

  static const unsigned expectedColumnCount(3);

  istream_line_splitter dparse(is, 8 * 1024, 0, expectedColumnCount + 1);
  while (dparse.parse_line()) {
    if (dparse.n_word() == 0) continue;
    if (dparse.n_word() != expectedColumnCount) {
      std::ostringstream oss;
      oss << "Unexpected depth table row in '" << label << "', expected 'contig position depth':\n";
      dparse.dump(oss);
      BOOST_THROW_EXCEPTION(asmqc::common::InputFormatException(oss.str()));
    }

    const unsigned pos(parse_unsigned_rvalue(dparse.word[1]));
    if (pos == 0) {
      std::ostringstream oss;
      oss << "Depth table positions are 1-based, found position 0 in '" << label << "':\n";
      dparse.dump(oss);
      BOOST_THROW_EXCEPTION(asmqc::common::InputFormatException(oss.str()));
    }
    table.addDepth(dparse.word[0], parse_unsigned_rvalue(dparse.word[2]));
  }
}

void parseDepthTableFile(const std::string& filename, DepthTable& table)
{
  CompressedInputStream cis(filename);
  parseDepthTable(cis.getStream(), filename, table);
}
