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

#include <string>
#include <vector>

void split_string(const char* str, const char delimiter, std::vector<std::string>& v);

void split_string(
    const std::string&        str,
    const char                delimiter,
    std::vector<std::string>& v,
    const bool                isSkipEmpty = false);

/// split str on runs of whitespace, leading and trailing whitespace produce no empty words
void split_string_whitespace(const std::string& str, std::vector<std::string>& v);

/// copy of str with leading and trailing whitespace (including '\r') removed
std::string strip_whitespace(const std::string& str);

/// join words with delimiter between each pair
std::string join_strings(const std::vector<std::string>& words, const char* delimiter);

/// \brief Format a double using the fewest significant digits which read back to the same value
///
/// Integral values keep one decimal place ("15.0"), and values with a decimal exponent below -4
/// or of 16 and above switch to scientific notation with a signed two digit exponent ("1e-05").
/// This is the number format of all legacy text reports.
std::string formatRoundTripDouble(const double x);
