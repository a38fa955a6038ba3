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

#include "boost/test/unit_test.hpp"

#include "seqio/CompressedInputStream.hpp"
#include "test/testFileMakers.hpp"

#include <iterator>
#include <sstream>

BOOST_AUTO_TEST_SUITE(CompressedInputStream_test_suite)

static std::string makeReads(const unsigned readCount)
{
  std::ostringstream oss;
  for (unsigned readIndex(0); readIndex < readCount; ++readIndex) {
    oss << "@read" << readIndex << "\nACGTTGCAAGGCTTAACCGGTAGCTAGCTAGGCTA\n+\n"
        << "IIIIIIIIIIIIIIIIIIIIIIIIIIIIIIIIII#\n";
  }
  return oss.str();
}

static std::string readAll(CompressedInputStream& cis)
{
  std::istream& is(cis.getStream());
  return std::string((std::istreambuf_iterator<char>(is)), std::istreambuf_iterator<char>());
}

BOOST_AUTO_TEST_CASE(test_CompressedInputStream_formats)
{
  const std::string content(makeReads(50));

  const TestTextFileMaker  textFile(content);
  const TestGzipFileMaker  gzFile(content);
  const TestBzip2FileMaker bzFile(content);
  const TestZipFileMaker   zipFile(content);

  {
    CompressedInputStream cis(textFile.getFilename());
    BOOST_REQUIRE_EQUAL(cis.getCompression(), COMPRESSION::NONE);
    BOOST_REQUIRE_EQUAL(readAll(cis), content);
  }
  {
    CompressedInputStream cis(gzFile.getFilename());
    BOOST_REQUIRE_EQUAL(cis.getCompression(), COMPRESSION::GZIP);
    BOOST_REQUIRE_EQUAL(readAll(cis), content);
  }
  {
    CompressedInputStream cis(bzFile.getFilename());
    BOOST_REQUIRE_EQUAL(cis.getCompression(), COMPRESSION::BZIP2);
    BOOST_REQUIRE_EQUAL(readAll(cis), content);
  }
  {
    CompressedInputStream cis(zipFile.getFilename());
    BOOST_REQUIRE_EQUAL(cis.getCompression(), COMPRESSION::ZIP);
    BOOST_REQUIRE_EQUAL(readAll(cis), content);
  }
}

BOOST_AUTO_TEST_CASE(test_CompressedInputStream_truncated_gzip)
{
  const TestGzipFileMaker gzFile(makeReads(500), 20);

  CompressedInputStream cis(gzFile.getFilename());
  std::string           line;
  BOOST_REQUIRE_THROW(
      while (std::getline(cis.getStream(), line)) {}, std::ios_base::failure);
}

BOOST_AUTO_TEST_CASE(test_CompressedInputStream_truncated_bzip2)
{
  const TestBzip2FileMaker bzFile(makeReads(500), 20);

  CompressedInputStream cis(bzFile.getFilename());
  std::string           line;
  BOOST_REQUIRE_THROW(
      while (std::getline(cis.getStream(), line)) {}, std::ios_base::failure);
}

BOOST_AUTO_TEST_CASE(test_CompressedInputStream_missing_file)
{
  const TestFilenameMaker missing;
  BOOST_REQUIRE_THROW(CompressedInputStream cis(missing.getFilename()), std::exception);
}

BOOST_AUTO_TEST_SUITE_END()
