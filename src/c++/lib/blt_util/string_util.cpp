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

#include "string_util.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>

void split_string(const char* str, const char delimiter, std::vector<std::string>& v)
{
  v.clear();
  while (true) {
    const char* next(strchr(str, delimiter));
    if ((nullptr == next) || (delimiter == '\0')) {
      v.emplace_back(str);
      return;
    }
    v.emplace_back(str, next - str);
    str = next + 1;
  }
}

void split_string(
    const std::string& str, const char delimiter, std::vector<std::string>& v, const bool isSkipEmpty)
{
  v.clear();

  size_t start(0);
  while (true) {
    size_t next(str.find(delimiter, start));
    if (!(isSkipEmpty && ((next == start) || (next == std::string::npos)))) {
      v.emplace_back(str.substr(start, next - start));
    }
    if (next == std::string::npos) return;
    start = next + 1;
  }
}

void split_string_whitespace(const std::string& str, std::vector<std::string>& v)
{
  v.clear();

  const size_t size(str.size());
  size_t       pos(0);
  while (pos < size) {
    while ((pos < size) && isspace(static_cast<unsigned char>(str[pos]))) ++pos;
    if (pos == size) break;
    const size_t start(pos);
    while ((pos < size) && (!isspace(static_cast<unsigned char>(str[pos])))) ++pos;
    v.emplace_back(str.substr(start, pos - start));
  }
}

std::string strip_whitespace(const std::string& str)
{
  size_t begin(0);
  size_t end(str.size());
  while ((begin < end) && isspace(static_cast<unsigned char>(str[begin]))) ++begin;
  while ((end > begin) && isspace(static_cast<unsigned char>(str[end - 1]))) --end;
  return str.substr(begin, end - begin);
}

std::string join_strings(const std::vector<std::string>& words, const char* delimiter)
{
  std::string result;
  bool        isFirst(true);
  for (const std::string& word : words) {
    if (!isFirst) result += delimiter;
    result += word;
    isFirst = false;
  }
  return result;
}

std::string formatRoundTripDouble(const double x)
{
  if (std::isnan(x)) return "nan";
  if (std::isinf(x)) return ((x < 0) ? "-inf" : "inf");

  // find the shortest scientific representation which round-trips:
  char buffer[64];
  for (int precision(1); precision <= 17; ++precision) {
    snprintf(buffer, sizeof(buffer), "%.*e", precision - 1, x);
    if (strtod(buffer, nullptr) == x) break;
  }

  // buffer is now "[-]d[.ddd]e(+|-)XX", pull out the digits and the exponent:
  const char* p(buffer);
  const bool  isNegative(*p == '-');
  if (isNegative) ++p;

  std::string digits;
  for (; (*p != 'e') && (*p != '\0'); ++p) {
    if (*p != '.') digits.push_back(*p);
  }
  const int exponent((*p == 'e') ? atoi(p + 1) : 0);

  while ((digits.size() > 1) && (digits.back() == '0')) digits.pop_back();

  std::string result(isNegative ? "-" : "");
  if ((exponent < -4) || (exponent >= 16)) {
    result += digits[0];
    if (digits.size() > 1) {
      result += '.';
      result.append(digits, 1, std::string::npos);
    }
    char expBuffer[16];
    snprintf(expBuffer, sizeof(expBuffer), "e%c%02d", ((exponent < 0) ? '-' : '+'), std::abs(exponent));
    result += expBuffer;
  } else if (exponent < 0) {
    result += "0.";
    result.append(static_cast<size_t>(-exponent - 1), '0');
    result += digits;
  } else {
    const size_t intSize(static_cast<size_t>(exponent) + 1);
    if (digits.size() <= intSize) {
      result += digits;
      result.append(intSize - digits.size(), '0');
      result += ".0";
    } else {
      result.append(digits, 0, intSize);
      result += '.';
      result.append(digits, intSize, std::string::npos);
    }
  }
  return result;
}
