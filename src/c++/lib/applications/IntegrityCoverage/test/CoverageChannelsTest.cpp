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

#include "applications/IntegrityCoverage/CoverageChannels.hpp"
#include "test/testFileMakers.hpp"
#include "test/testUtil.hpp"

BOOST_AUTO_TEST_SUITE(CoverageChannels_test_suite)

static CoverageEstimate getEstimate(const bool isPass)
{
  CoverageEstimate estimate;
  estimate.encodingLabel = "Sanger,Illumina-1.8";
  estimate.phredLabel    = "33";
  estimate.coverage      = (isPass ? 15.0 : 0.5);
  estimate.isPass        = isPass;
  estimate.maxReadLength = 151;
  return estimate;
}

BOOST_AUTO_TEST_CASE(test_getCoverageEstimateStatus)
{
  BOOST_REQUIRE_EQUAL(getCoverageEstimateStatus(getEstimate(true)), QC_STATUS::PASS);
  BOOST_REQUIRE_EQUAL(getCoverageEstimateStatus(getEstimate(false)), QC_STATUS::FAIL);

  // corruption takes precedence over the coverage check
  CoverageEstimate corrupt(getEstimate(true));
  corrupt.isCorrupt = true;
  BOOST_REQUIRE_EQUAL(getCoverageEstimateStatus(corrupt), QC_STATUS::CORRUPT);
}

BOOST_AUTO_TEST_CASE(test_writeCoverageChannels_pass)
{
  const TestDirectoryMaker outDir;
  const std::string        prefix(outDir.getFilename() + "/sampleA");

  writeCoverageChannels(getEstimate(true), "sampleA", prefix);

  BOOST_REQUIRE_EQUAL(readFileContents(prefix + "_encoding"), "Sanger,Illumina-1.8");
  BOOST_REQUIRE_EQUAL(readFileContents(prefix + "_phred"), "33");
  BOOST_REQUIRE_EQUAL(readFileContents(prefix + "_coverage"), "15.0");
  BOOST_REQUIRE_EQUAL(readFileContents(prefix + "_report"), "sampleA,15.0,PASS\n");
  BOOST_REQUIRE_EQUAL(readFileContents(prefix + "_max_len"), "151");
}

BOOST_AUTO_TEST_CASE(test_writeCoverageChannels_fail)
{
  const TestDirectoryMaker outDir;
  const std::string        prefix(outDir.getFilename() + "/sampleA");

  writeCoverageChannels(getEstimate(false), "sampleA", prefix);

  BOOST_REQUIRE_EQUAL(readFileContents(prefix + "_coverage"), "fail");
  BOOST_REQUIRE_EQUAL(readFileContents(prefix + "_report"), "sampleA,0.5,FAIL\n");
}

BOOST_AUTO_TEST_CASE(test_writeCoverageChannels_corrupt)
{
  const TestDirectoryMaker outDir;
  const std::string        prefix(outDir.getFilename() + "/sampleA");

  CoverageEstimate estimate;
  estimate.isCorrupt = true;
  writeCoverageChannels(estimate, "sampleA", prefix);

  static const char* const suffixes[] = { "_encoding", "_phred", "_coverage", "_report", "_max_len" };
  for (const char* suffix : suffixes) {
    BOOST_REQUIRE_EQUAL(readFileContents(prefix + suffix), "corrupt");
  }
}

BOOST_AUTO_TEST_SUITE_END()
