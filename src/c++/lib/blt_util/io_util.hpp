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

#include <iosfwd>
#include <memory>
#include <string>

void open_ifstream(std::ifstream& ifs, const char* filename);

/// open filename for writing, throw on failure
void open_ofstream(std::ofstream& ofs, const char* filename);

/// read up to \p maxBytes from the start of \p filename
///
/// the returned string is shorter than maxBytes only if the file is shorter
///
std::string readFilePrefix(const std::string& filename, const unsigned maxBytes);

/// write \p token to \p filename, replacing any existing content
///
/// no trailing newline is added
void writeTokenFile(const std::string& filename, const std::string& token);

/// use this class to set scope specific stream formatting
///
/// see unit test for example usage
///
struct StreamScoper {
  explicit StreamScoper(std::ostream& os);

  ~StreamScoper();

private:
  std::ostream&                  _os;
  std::unique_ptr<std::ofstream> _tmp_os;
};
