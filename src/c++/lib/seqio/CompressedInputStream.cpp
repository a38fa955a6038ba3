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

#include "seqio/CompressedInputStream.hpp"

#include "common/Exceptions.hpp"

#include "boost/iostreams/filter/bzip2.hpp"
#include "boost/iostreams/filter/gzip.hpp"
#include "boost/iostreams/filter/zlib.hpp"
#include "boost/iostreams/restrict.hpp"

#include <cstdint>
#include <sstream>

namespace bio = boost::iostreams;

CompressedInputStream::CompressedInputStream(const std::string& filename)
  : _filename(filename), _compression(sniffFileCompression(filename))
{
  _ifs.open(filename.c_str(), std::ios::binary);
  if (!_ifs) {
    std::ostringstream oss;
    oss << "Can't open file: '" << filename << "'";
    BOOST_THROW_EXCEPTION(asmqc::common::GeneralException(oss.str()));
  }

  switch (_compression) {
  case COMPRESSION::GZIP:
    _fis.push(bio::gzip_decompressor());
    _fis.push(_ifs);
    break;
  case COMPRESSION::BZIP2:
    _fis.push(bio::bzip2_decompressor());
    _fis.push(_ifs);
    break;
  case COMPRESSION::ZIP:
    pushZipMember();
    break;
  default:
    _fis.push(_ifs);
    break;
  }

  _fis.exceptions(std::ios::badbit);
}

static uint32_t readLittleEndian(const unsigned char* data, const unsigned byteCount)
{
  uint32_t value(0);
  for (unsigned i(0); i < byteCount; ++i) {
    value |= (static_cast<uint32_t>(data[i]) << (8 * i));
  }
  return value;
}

void CompressedInputStream::pushZipMember()
{
  // fixed-size portion of the zip local file header:
  static const unsigned localHeaderSize(30);
  unsigned char         header[localHeaderSize];
  _ifs.read(reinterpret_cast<char*>(header), localHeaderSize);
  if (_ifs.gcount() != localHeaderSize) {
    std::ostringstream oss;
    oss << "Truncated zip local header in file: '" << _filename << "'";
    BOOST_THROW_EXCEPTION(asmqc::common::CorruptStreamException(oss.str()));
  }

  const uint32_t flags(readLittleEndian(header + 6, 2));
  const uint32_t method(readLittleEndian(header + 8, 2));
  const uint32_t compressedSize(readLittleEndian(header + 18, 4));
  const uint32_t nameSize(readLittleEndian(header + 26, 2));
  const uint32_t extraSize(readLittleEndian(header + 28, 2));

  _ifs.seekg(nameSize + extraSize, std::ios::cur);
  const std::streamoff dataOffset(_ifs.tellg());

  static const uint32_t zipStored(0);
  static const uint32_t zipDeflate(8);
  static const uint32_t zipDataDescriptorFlag(0x08);

  if (method == zipDeflate) {
    bio::zlib_params params;
    params.noheader = true;
    _fis.push(bio::zlib_decompressor(params));
    _fis.push(_ifs);
  } else if ((method == zipStored) && (!(flags & zipDataDescriptorFlag))) {
    std::streambuf& fileBuffer(*_ifs.rdbuf());
    _fis.push(bio::restrict(fileBuffer, dataOffset, compressedSize));
  } else {
    std::ostringstream oss;
    oss << "Unsupported zip member (compression method " << method << ") in file: '" << _filename << "'";
    BOOST_THROW_EXCEPTION(asmqc::common::InputFormatException(oss.str()));
  }
}
