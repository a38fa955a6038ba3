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

#include "reads/ReadStreamStats.hpp"

#include "common/Exceptions.hpp"

#include <cctype>
#include <iostream>
#include <sstream>

void ReadStreamStats::addLine(const char* line, const unsigned size)
{
  const unsigned recordLine(lineCount % 4);
  lineCount++;

  if (recordLine == 1) {
    charCount += size;
    if (size > maxReadLength) maxReadLength = size;
  } else if ((recordLine == 3) && (!isSkipEncoding)) {
    encoding.addQualityLine(line, size);
  }
}

void ReadStreamStats::addStream(std::istream& is, const std::string& label)
{
  std::string line;
  while (std::getline(is, line)) {
    const char* begin(line.data());
    const char* end(begin + line.size());
    while ((begin < end) && isspace(static_cast<unsigned char>(*begin))) ++begin;
    while ((end > begin) && isspace(static_cast<unsigned char>(*(end - 1)))) --end;
    addLine(begin, end - begin);
  }

  if ((lineCount % 4) != 0) {
    std::ostringstream oss;
    oss << "Truncated FASTQ record at the end of '" << label << "' (" << lineCount
        << " cumulative lines is not a multiple of 4)";
    BOOST_THROW_EXCEPTION(asmqc::common::CorruptStreamException(oss.str()));
  }
}
