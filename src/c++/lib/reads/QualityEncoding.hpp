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
/// FASTQ quality encoding inference from observed quality code-point bounds
///

#pragma once

#include <string>
#include <vector>

/// a known quality encoding standard and the code-point range it can produce
struct QualityEncoding {
  const char* name;
  unsigned    phredOffset;
  unsigned    minCode;
  unsigned    maxCode;
};

/// all known encodings, in reporting order
const std::vector<QualityEncoding>& getQualityEncodingTable();

/// \brief indices of all table encodings whose range contains [minCode, maxCode]
std::vector<unsigned> getEncodingsInRange(const unsigned minCode, const unsigned maxCode);

/// \brief Running quality code-point bounds and the encodings consistent with them
///
/// The candidate set is recomputed only when a quality line widens the bounds.
///
struct EncodingObservation {
  /// add the code points of one quality line, empty lines are ignored
  void addQualityLine(const char* qual, const unsigned size);

  /// comma-joined names of all candidate encodings, or 'None' if there are none
  std::string getEncodingLabel() const;

  /// comma-joined distinct phred offsets of all candidate encodings, or 'None' if there are none
  std::string getPhredLabel() const;

  unsigned minCode = 99;
  unsigned maxCode = 0;

  std::vector<unsigned> candidates;
};
