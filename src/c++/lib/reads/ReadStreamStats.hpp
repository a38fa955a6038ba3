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

#include "reads/QualityEncoding.hpp"

#include <cstdint>
#include <iosfwd>
#include <string>

/// \brief Accumulates FASTQ statistics over one or more chained read streams
///
/// The line index continues across streams, so sequence lines are those with
/// index 1 (mod 4) and quality lines those with index 3 (mod 4) over the whole chain.
///
struct ReadStreamStats {
  explicit ReadStreamStats(const bool initIsSkipEncoding = false) : isSkipEncoding(initIsSkipEncoding) {}

  /// add all lines of is
  ///
  /// throws CorruptStreamException if the cumulative line count at the end of the stream is not a
  /// multiple of 4, decompression errors from is propagate as std::ios_base::failure
  void addStream(std::istream& is, const std::string& label);

  /// add one line, with surrounding whitespace already removed
  void addLine(const char* line, const unsigned size);

  bool isSkipEncoding;

  uint64_t lineCount     = 0;
  uint64_t charCount     = 0;
  unsigned maxReadLength = 0;

  EncodingObservation encoding;
};
