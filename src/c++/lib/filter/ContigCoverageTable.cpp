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

#include "filter/ContigCoverageTable.hpp"

#include "blt_util/istream_line_splitter.hpp"
#include "blt_util/parse_util.hpp"
#include "common/Exceptions.hpp"
#include "seqio/CompressedInputStream.hpp"

#include <sstream>

void ContigCoverageTable::addRow(const ContigCoverageRow& row)
{
  const auto iter(_index.find(row.contigId));
  if (iter != _index.end()) {
    _rows[iter->second] = row;
    return;
  }
  _index.insert(std::make_pair(row.contigId, static_cast<unsigned>(_rows.size())));
  _rows.push_back(row);
}

const ContigCoverageRow& ContigCoverageTable::getContig(const std::string& contigId) const
{
  const auto iter(_index.find(contigId));
  if (iter == _index.end()) {
    std::ostringstream oss;
    oss << "No coverage found for contig '" << contigId << "'";
    BOOST_THROW_EXCEPTION(asmqc::common::MissingContigDataException(oss.str(), contigId));
  }
  return _rows[iter->second];
}

uint64_t ContigCoverageTable::totalLength() const
{
  uint64_t sum(0);
  for (const ContigCoverageRow& row : _rows) sum += row.length;
  return sum;
}

uint64_t ContigCoverageTable::totalCoverage() const
{
  uint64_t sum(0);
  for (const ContigCoverageRow& row : _rows) sum += row.coverage;
  return sum;
}

unsigned parseHeaderLength(const std::string& header)
{
  static const std::string lengthToken("length_");

  const size_t tokenPos(header.find(lengthToken));
  if (tokenPos != std::string::npos) {
    const size_t valueStart(tokenPos + lengthToken.size());
    const size_t valueEnd(header.find('_', valueStart));
    if ((valueEnd != std::string::npos) && (valueEnd > valueStart)) {
      return asmqc::blt_util::parse_unsigned_str(header.substr(valueStart, valueEnd - valueStart));
    }
  }

  std::ostringstream oss;
  oss << "Can't find a 'length_<n>_' token in contig header '" << header << "'";
  BOOST_THROW_EXCEPTION(asmqc::common::InputFormatException(oss.str()));
}

void parseContigCoverageTable(std::istream& is, const std::string& label, ContigCoverageTable& table)
{
  using namespace asmqc::blt_util;

  static const unsigned expectedColumnCount(2);

  istream_line_splitter dparse(is, 8 * 1024, 0, expectedColumnCount + 1);
  while (dparse.parse_line()) {
    if (dparse.n_word() == 0) continue;
    if (dparse.n_word() != expectedColumnCount) {
      std::ostringstream oss;
      oss << "Unexpected coverage table row in '" << label << "', expected 'contig coverage':\n";
      dparse.dump(oss);
      BOOST_THROW_EXCEPTION(asmqc::common::InputFormatException(oss.str()));
    }

    ContigCoverageRow row;
    row.contigId = dparse.word[0];
    row.coverage = parse_unsigned_rvalue(dparse.word[1]);
    row.length   = parseHeaderLength(row.contigId);
    table.addRow(row);
  }
}

void parseContigCoverageTableFile(const std::string& filename, ContigCoverageTable& table)
{
  CompressedInputStream cis(filename);
  parseContigCoverageTable(cis.getStream(), filename, table);
}
