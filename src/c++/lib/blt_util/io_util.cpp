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

#include "blt_util/io_util.hpp"

#include "common/Exceptions.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

void open_ifstream(std::ifstream& ifs, const char* filename)
{
  ifs.open(filename);
  if (!ifs) {
    std::ostringstream oss;
    oss << "Can't open file: '" << filename << "'";
    BOOST_THROW_EXCEPTION(asmqc::common::GeneralException(oss.str()));
  }
}

void open_ofstream(std::ofstream& ofs, const char* filename)
{
  ofs.open(filename);
  if (!ofs) {
    std::ostringstream oss;
    oss << "Can't open output file: '" << filename << "'";
    BOOST_THROW_EXCEPTION(asmqc::common::GeneralException(oss.str()));
  }
}

std::string readFilePrefix(const std::string& filename, const unsigned maxBytes)
{
  std::ifstream ifs(filename.c_str(), std::ios::binary);
  if (!ifs) {
    std::ostringstream oss;
    oss << "Can't open file: '" << filename << "'";
    BOOST_THROW_EXCEPTION(asmqc::common::GeneralException(oss.str()));
  }

  std::string prefix(maxBytes, '\0');
  ifs.read(&prefix[0], maxBytes);
  prefix.resize(static_cast<std::string::size_type>(ifs.gcount()));
  return prefix;
}

void writeTokenFile(const std::string& filename, const std::string& token)
{
  std::ofstream ofs;
  open_ofstream(ofs, filename.c_str());
  ofs << token;
  if (!ofs) {
    std::ostringstream oss;
    oss << "Failed to write output file: '" << filename << "'";
    BOOST_THROW_EXCEPTION(asmqc::common::GeneralException(oss.str()));
  }
}

StreamScoper::StreamScoper(std::ostream& os) : _os(os), _tmp_os(new std::ofstream)
{
  _tmp_os->copyfmt(_os);
}

StreamScoper::~StreamScoper()
{
  _os.copyfmt(*_tmp_os);
}
