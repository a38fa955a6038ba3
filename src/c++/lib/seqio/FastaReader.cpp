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

#include "seqio/FastaReader.hpp"

#include "blt_util/log.hpp"
#include "blt_util/string_util.hpp"
#include "common/Exceptions.hpp"
#include "seqio/CompressedInputStream.hpp"

#include <iostream>
#include <sstream>

void parseFasta(std::istream& is, const std::string& label, std::ostream& logOs, SequenceStore& store)
{
  static const unsigned noRecord(~0u);

  unsigned    currentIndex(noRecord);
  unsigned    lineNo(0);
  std::string line;
  while (std::getline(is, line)) {
    ++lineNo;
    const std::string stripped(strip_whitespace(line));
    if (stripped.empty()) continue;

    // headers are recognized on the raw line, before stripping:
    if ((!line.empty()) && (line[0] == '>')) {
      const std::string id(strip_whitespace(line.substr(1)));
      bool              isRepeat(false);
      currentIndex = store.beginRecord(id, isRepeat);
      if (isRepeat) {
        std::ostringstream oss;
        oss << "Repeated sequence header '" << id << "' at line " << lineNo << " of '" << label
            << "', earlier sequence for this header is replaced";
        logLine(logOs, LOG_LEVEL::WARNING, oss.str());
      }
      continue;
    }

    if (currentIndex == noRecord) {
      std::ostringstream oss;
      oss << "Sequence data with no current record at line " << lineNo << " of '" << label << "'";
      BOOST_THROW_EXCEPTION(asmqc::common::InputFormatException(oss.str()));
    }
    store.appendFragment(currentIndex, stripped);
  }
}

void parseFastaFile(const std::string& filename, std::ostream& logOs, SequenceStore& store)
{
  CompressedInputStream cis(filename);
  parseFasta(cis.getStream(), filename, logOs, store);
}
