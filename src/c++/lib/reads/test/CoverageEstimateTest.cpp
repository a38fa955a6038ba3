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
#include "reads/CoverageEstimate.hpp"
#include "test/testFileMakers.hpp"

#include <sstream>

BOOST_AUTO_TEST_SUITE(CoverageEstimate_test_suite)

BOOST_AUTO_TEST_CASE(test_computeCoverage)
{
  BOOST_REQUIRE_EQUAL(computeCoverage(1000000, 2.0), 0.5);
  BOOST_REQUIRE_EQUAL(computeCoverage(30000000, 2.0), 15.0);
  BOOST_REQUIRE_CLOSE(computeCoverage(1234567, 1.0), 1.23, 0.0001);
  BOOST_REQUIRE_CLOSE(computeCoverage(1236000, 1.0), 1.24, 0.0001);

  BOOST_REQUIRE_THROW(computeCoverage(10, 0.), asmqc::common::InvalidParameterException);
  BOOST_REQUIRE_THROW(computeCoverage(10, -2.), asmqc::common::InvalidParameterException);
}

BOOST_AUTO_TEST_CASE(test_CoverageEstimateChannels_fail)
{
  CoverageEstimate estimate;
  estimate.encodingLabel = "None";
  estimate.phredLabel    = "None";
  estimate.coverage      = computeCoverage(1000000, 2.0);
  estimate.isPass        = (estimate.coverage >= 10);
  estimate.maxReadLength = 151;

  BOOST_REQUIRE_EQUAL(estimate.getCoverageChannel(), "fail");
  BOOST_REQUIRE_EQUAL(estimate.getReportChannel("sampleA"), "sampleA,0.5,FAIL\n");
  BOOST_REQUIRE_EQUAL(estimate.getMaxLengthChannel(), "151");
}

BOOST_AUTO_TEST_CASE(test_CoverageEstimateChannels_pass)
{
  CoverageEstimate estimate;
  estimate.coverage = computeCoverage(30000000, 2.0);
  estimate.isPass   = (estimate.coverage >= 10);

  BOOST_REQUIRE_EQUAL(estimate.getCoverageChannel(), "15.0");
  BOOST_REQUIRE_EQUAL(estimate.getReportChannel("sampleA"), "sampleA,15.0,PASS\n");
}

BOOST_AUTO_TEST_CASE(test_CoverageEstimateChannels_corrupt)
{
  CoverageEstimate estimate;
  estimate.isCorrupt = true;

  BOOST_REQUIRE_EQUAL(estimate.getEncodingChannel(), "corrupt");
  BOOST_REQUIRE_EQUAL(estimate.getPhredChannel(), "corrupt");
  BOOST_REQUIRE_EQUAL(estimate.getCoverageChannel(), "corrupt");
  BOOST_REQUIRE_EQUAL(estimate.getReportChannel("sampleA"), "corrupt");
  BOOST_REQUIRE_EQUAL(estimate.getMaxLengthChannel(), "corrupt");
}

static std::string makeReads(const unsigned readCount, const std::string& qual)
{
  std::ostringstream oss;
  for (unsigned readIndex(0); readIndex < readCount; ++readIndex) {
    oss << "@read" << readIndex << "\n" << std::string(qual.size(), 'A') << "\n+\n" << qual << "\n";
  }
  return oss.str();
}

BOOST_AUTO_TEST_CASE(test_estimateReadCoverage)
{
  // 2 x 100 reads of 10 bases over a 0.001 Mb genome is 2.0x coverage
  const TestGzipFileMaker  reads1(makeReads(100, "!!!!!IIIII"));
  const TestBzip2FileMaker reads2(makeReads(100, "IIIIIIIIII"));

  ReadCoverageOptions opt;
  opt.genomeSizeMb = 0.001;
  opt.minCoverage  = 1;

  std::ostringstream     log;
  const CoverageEstimate estimate(
      estimateReadCoverage({reads1.getFilename(), reads2.getFilename()}, opt, log));

  BOOST_REQUIRE(!estimate.isCorrupt);
  BOOST_REQUIRE_EQUAL(estimate.getEncodingChannel(), "Sanger,Illumina-1.8");
  BOOST_REQUIRE_EQUAL(estimate.getPhredChannel(), "33");
  BOOST_REQUIRE_EQUAL(estimate.getCoverageChannel(), "2.0");
  BOOST_REQUIRE_EQUAL(estimate.getReportChannel("s1"), "s1,2.0,PASS\n");
  BOOST_REQUIRE_EQUAL(estimate.getMaxLengthChannel(), "10");
}

BOOST_AUTO_TEST_CASE(test_estimateReadCoverage_truncated_compressed_pair)
{
  const TestGzipFileMaker reads1(makeReads(2000, "IIIIIIIIIIIIIIIIIIII"));
  const TestGzipFileMaker reads2(makeReads(2000, "IIIIIIIIIIIIIIIIIIII"), 50);

  ReadCoverageOptions opt;
  opt.genomeSizeMb = 1.0;
  opt.minCoverage  = 1;

  std::ostringstream     log;
  const CoverageEstimate estimate(
      estimateReadCoverage({reads1.getFilename(), reads2.getFilename()}, opt, log));

  BOOST_REQUIRE(estimate.isCorrupt);
  BOOST_REQUIRE_EQUAL(estimate.getEncodingChannel(), "corrupt");
  BOOST_REQUIRE_EQUAL(estimate.getPhredChannel(), "corrupt");
  BOOST_REQUIRE_EQUAL(estimate.getCoverageChannel(), "corrupt");
  BOOST_REQUIRE_EQUAL(estimate.getReportChannel("s1"), "corrupt");
  BOOST_REQUIRE_EQUAL(estimate.getMaxLengthChannel(), "corrupt");
  BOOST_REQUIRE(log.str().find("WARNING:") == 0);
}

BOOST_AUTO_TEST_CASE(test_estimateReadCoverage_truncated_plain_record)
{
  const TestTextFileMaker reads1(makeReads(10, "IIII"));
  const TestTextFileMaker reads2(makeReads(10, "IIII") + "@extra\nACGT\n");

  ReadCoverageOptions opt;
  opt.genomeSizeMb = 1.0;

  std::ostringstream     log;
  const CoverageEstimate estimate(
      estimateReadCoverage({reads1.getFilename(), reads2.getFilename()}, opt, log));
  BOOST_REQUIRE(estimate.isCorrupt);
}

BOOST_AUTO_TEST_CASE(test_estimateReadCoverage_bad_genome_size)
{
  const TestTextFileMaker reads1(makeReads(10, "IIII"));

  ReadCoverageOptions opt;
  opt.genomeSizeMb = 0;

  std::ostringstream log;
  BOOST_REQUIRE_THROW(
      estimateReadCoverage({reads1.getFilename()}, opt, log), asmqc::common::InvalidParameterException);
}

BOOST_AUTO_TEST_SUITE_END()
