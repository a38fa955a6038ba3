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

#include "testFileMakers.hpp"

#include "test/testUtil.hpp"

#include "boost/crc.hpp"
#include "boost/filesystem.hpp"
#include "boost/iostreams/copy.hpp"
#include "boost/iostreams/filter/bzip2.hpp"
#include "boost/iostreams/filter/gzip.hpp"
#include "boost/iostreams/filter/zlib.hpp"
#include "boost/iostreams/filtering_stream.hpp"

#include <cassert>
#include <cstdint>
#include <fstream>
#include <sstream>

namespace bio = boost::iostreams;

TestFileMakerBase::~TestFileMakerBase()
{
  using namespace boost::filesystem;
  if (exists(_tempFilename)) {
    remove(_tempFilename);
  }
}

TestFilenameMaker::TestFilenameMaker()
{
  _tempFilename = getNewTempFile();
}

TestDirectoryMaker::TestDirectoryMaker()
{
  _tempFilename = getNewTempFile();
  boost::filesystem::create_directory(_tempFilename);
}

TestDirectoryMaker::~TestDirectoryMaker()
{
  using namespace boost::filesystem;
  if (exists(_tempFilename)) {
    remove_all(_tempFilename);
  }
}

TestTextFileMaker::TestTextFileMaker(const std::string& content)
{
  _tempFilename = getNewTempFile();
  std::ofstream os(_tempFilename, std::ios::binary);
  assert(os);
  os << content;
}

/// compress content with the filter type and write it to filename, less truncateBytes
template <typename Compressor>
static void writeCompressedFile(
    const std::string& filename,
    const std::string& content,
    const Compressor&  compressor,
    const unsigned     truncateBytes)
{
  std::ostringstream compressed;
  {
    bio::filtering_ostream fos;
    fos.push(compressor);
    fos.push(compressed);
    fos << content;
  }

  std::string bytes(compressed.str());
  assert(truncateBytes < bytes.size());
  bytes.resize(bytes.size() - truncateBytes);

  std::ofstream os(filename, std::ios::binary);
  assert(os);
  os << bytes;
}

TestGzipFileMaker::TestGzipFileMaker(const std::string& content, const unsigned truncateBytes)
{
  _tempFilename = getNewTempFile() + ".gz";
  writeCompressedFile(_tempFilename, content, bio::gzip_compressor(), truncateBytes);
}

TestBzip2FileMaker::TestBzip2FileMaker(const std::string& content, const unsigned truncateBytes)
{
  _tempFilename = getNewTempFile() + ".bz2";
  writeCompressedFile(_tempFilename, content, bio::bzip2_compressor(), truncateBytes);
}

static void writeLittleEndian(std::ostream& os, const uint32_t value, const unsigned byteCount)
{
  for (unsigned i(0); i < byteCount; ++i) {
    os.put(static_cast<char>((value >> (8 * i)) & 0xff));
  }
}

TestZipFileMaker::TestZipFileMaker(const std::string& content)
{
  _tempFilename = getNewTempFile() + ".zip";

  bio::zlib_params params;
  params.noheader = true;

  std::ostringstream compressed;
  {
    bio::filtering_ostream fos;
    fos.push(bio::zlib_compressor(params));
    fos.push(compressed);
    fos << content;
  }
  const std::string deflated(compressed.str());

  boost::crc_32_type crc;
  crc.process_bytes(content.data(), content.size());

  static const std::string memberName("reads.fastq");

  std::ofstream os(_tempFilename, std::ios::binary);
  assert(os);
  // local file header:
  writeLittleEndian(os, 0x04034b50, 4);
  writeLittleEndian(os, 20, 2);  // version needed
  writeLittleEndian(os, 0, 2);   // flags
  writeLittleEndian(os, 8, 2);   // deflate
  writeLittleEndian(os, 0, 2);   // mod time
  writeLittleEndian(os, 0, 2);   // mod date
  writeLittleEndian(os, crc.checksum(), 4);
  writeLittleEndian(os, deflated.size(), 4);
  writeLittleEndian(os, content.size(), 4);
  writeLittleEndian(os, memberName.size(), 2);
  writeLittleEndian(os, 0, 2);  // extra field length
  os << memberName << deflated;
}
