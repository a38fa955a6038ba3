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

/// check if input file exists and is usable as
/// input, if so canonicalize the name
///
/// In case of error return true and provide error
/// message
bool checkAndStandardizeRequiredInputFilePath(
    std::string& filename, const char* fileLabel, std::string& errorMsg);

/// as checkAndStandardizeRequiredInputFilePath for each filename, at least one filename is required
bool checkAndStandardizeRequiredInputFilePaths(
    std::vector<std::string>& filenames, const char* fileLabel, std::string& errorMsg);

/// check that the output file prefix is non-empty and its parent directory exists
///
/// In case of error return true and provide error
/// message
bool checkOutputPrefix(const std::string& prefix, const char* prefixLabel, std::string& errorMsg);

/// check that a numeric option value is finite and strictly positive
///
/// In case of error return true and provide error
/// message
bool checkPositiveValue(const double value, const char* valueLabel, std::string& errorMsg);
