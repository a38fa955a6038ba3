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

#include "common/Exceptions.hpp"
#include "htsapi/bam_filter_util.hpp"
#include "htsapi/bam_streamer.hpp"
#include "test/testFileMakers.hpp"

#include <sstream>

static const char testSam[] =
    "@HD\tVN:1.6\tSO:coordinate\n"
    "@SQ\tSN:c1\tLN:10\n"
    "@SQ\tSN:c2\tLN:5\n"
    "r1\t0\tc1\t1\t60\t4M\t*\t0\t0\tACGT\tIIII\n"
    "r2\t16\tc1\t3\t60\t2M1D2M\t*\t0\t0\tACGT\tIIII\n"
    "r3\t1024\tc1\t3\t60\t4M\t*\t0\t0\tACGT\tIIII\n"
    "r4\t0\tc2\t2\t60\t1S3M\t*\t0\t0\tAACG\tIIII\n"
    "r5\t4\t*\t0\t0\t*\t*\t0\t0\tACGT\tIIII\n";

BOOST_AUTO_TEST_SUITE(bam_streamer_test_suite)

static void checkStream(bam_streamer& stream, const unsigned expectedTotal, const unsigned expectedMapped)
{
  unsigned total(0);
  unsigned mapped(0);
  while (stream.next()) {
    const bam_record& read(*(stream.get_record_ptr()));
    total++;
    if (!read.is_unmapped()) mapped++;
  }
  BOOST_REQUIRE_EQUAL(total, expectedTotal);
  BOOST_REQUIRE_EQUAL(mapped, expectedMapped);
}

BOOST_AUTO_TEST_CASE(test_bam_streamer_sam_read)
{
  const TestTextFileMaker samFile(testSam);

  bam_streamer stream(samFile.getFilename().c_str(), nullptr);
  BOOST_REQUIRE_EQUAL(stream.get_header().n_targets, 2);
  BOOST_REQUIRE_EQUAL(std::string(stream.target_id_to_name(1)), "c2");
  BOOST_REQUIRE_EQUAL(std::string(stream.target_id_to_name(-1)), "*");

  BOOST_REQUIRE(stream.next());
  const bam_record& read(*(stream.get_record_ptr()));
  BOOST_REQUIRE_EQUAL(std::string(read.qname()), "r1");
  BOOST_REQUIRE_EQUAL(read.pos(), 1);
  BOOST_REQUIRE_EQUAL(read.target_id(), 0);
  BOOST_REQUIRE(read.is_fwd_strand());

  std::ostringstream oss;
  oss << read;
  BOOST_REQUIRE_EQUAL(oss.str(), "r1/1 tid:pos:strand 0:0:+ cigar: 4M");

  checkStream(stream, 4, 3);
  BOOST_REQUIRE_EQUAL(stream.record_no(), 5u);
}

BOOST_AUTO_TEST_CASE(test_bam_streamer_missing_file)
{
  TestFilenameMaker missingFile;
  BOOST_REQUIRE_THROW(bam_streamer(missingFile.getFilename().c_str(), nullptr), asmqc::common::GeneralException);
  BOOST_REQUIRE_THROW(bam_streamer("", nullptr), asmqc::common::GeneralException);
}

BOOST_AUTO_TEST_CASE(test_writeContigFilteredBam)
{
  const TestTextFileMaker samFile(testSam);

  {
    const TestFilenameMaker bamFile;
    const unsigned          writeCount(writeContigFilteredBam(samFile.getFilename(), {"c1"}, bamFile.getFilename()));
    BOOST_REQUIRE_EQUAL(writeCount, 3u);

    bam_streamer stream(bamFile.getFilename().c_str(), nullptr);
    BOOST_REQUIRE_EQUAL(stream.get_header().n_targets, 2);
    checkStream(stream, 3, 3);
  }

  {
    const TestFilenameMaker bamFile;
    const unsigned          writeCount(writeContigFilteredBam(samFile.getFilename(), {"c2"}, bamFile.getFilename()));
    BOOST_REQUIRE_EQUAL(writeCount, 1u);
  }
}

BOOST_AUTO_TEST_SUITE_END()
