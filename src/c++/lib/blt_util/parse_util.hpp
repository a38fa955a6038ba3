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
/// numeric parsing of text table fields and command-line values
///

#pragma once

#include <cstdint>
#include <string>

namespace asmqc {
namespace blt_util {

/// parse c-string to TYPE
///
/// tolerates a non-TYPE suffix, but a non-empty prefix must be parsable as a TYPE,
/// on completion the value of s will reflect the extent of the parse
///
/// if available, specify s_end for minor performance improvement (in case of extremely large string)
///
unsigned parse_unsigned(const char*& s);

double parse_double(const char*& s, const char* s_end = nullptr);

/// entire string must be convertible, used for whitespace-split table fields
unsigned parse_unsigned_rvalue(const char* s);

/// parse std::string to TYPE
///
/// entire string must be convertible, no trailing suffix is allowed. Failures throw
/// InputFormatException.
///
unsigned parse_unsigned_str(const std::string& s);

uint64_t parse_uint64_str(const std::string& s);

double parse_double_str(const std::string& s);

}  // namespace blt_util
}  // namespace asmqc
