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

#include "reads/QualityEncoding.hpp"

#include "blt_util/string_util.hpp"

#include <algorithm>

const std::vector<QualityEncoding>& getQualityEncodingTable()
{
  static const std::vector<QualityEncoding> table = {
      {"Sanger", 33, 33, 73},
      {"Illumina-1.8", 33, 33, 74},
      {"Solexa", 64, 59, 104},
      {"Illumina-1.3", 64, 64, 104},
      {"Illumina-1.5", 64, 66, 105},
  };
  return table;
}

std::vector<unsigned> getEncodingsInRange(const unsigned minCode, const unsigned maxCode)
{
  const std::vector<QualityEncoding>& table(getQualityEncodingTable());

  std::vector<unsigned> encodings;
  const unsigned        tableSize(table.size());
  for (unsigned encodingIndex(0); encodingIndex < tableSize; ++encodingIndex) {
    const QualityEncoding& encoding(table[encodingIndex]);
    if ((minCode >= encoding.minCode) && (maxCode <= encoding.maxCode)) {
      encodings.push_back(encodingIndex);
    }
  }
  return encodings;
}

void EncodingObservation::addQualityLine(const char* qual, const unsigned size)
{
  if (size == 0) return;

  unsigned lineMin(static_cast<unsigned char>(qual[0]));
  unsigned lineMax(lineMin);
  for (unsigned i(1); i < size; ++i) {
    const unsigned code(static_cast<unsigned char>(qual[i]));
    lineMin = std::min(lineMin, code);
    lineMax = std::max(lineMax, code);
  }

  if ((lineMin < minCode) || (lineMax > maxCode)) {
    minCode    = std::min(minCode, lineMin);
    maxCode    = std::max(maxCode, lineMax);
    candidates = getEncodingsInRange(minCode, maxCode);
  }
}

std::string EncodingObservation::getEncodingLabel() const
{
  if (candidates.empty()) return "None";

  const std::vector<QualityEncoding>& table(getQualityEncodingTable());
  std::vector<std::string>            names;
  for (const unsigned encodingIndex : candidates) names.push_back(table[encodingIndex].name);
  return join_strings(names, ",");
}

std::string EncodingObservation::getPhredLabel() const
{
  if (candidates.empty()) return "None";

  const std::vector<QualityEncoding>& table(getQualityEncodingTable());
  std::vector<std::string>            offsets;
  for (const unsigned encodingIndex : candidates) {
    const std::string offset(std::to_string(table[encodingIndex].phredOffset));
    if (std::find(offsets.begin(), offsets.end(), offset) == offsets.end()) offsets.push_back(offset);
  }
  return join_strings(offsets, ",");
}
