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

#include "common/QcStatus.hpp"
#include "test/testFileMakers.hpp"
#include "test/testUtil.hpp"

BOOST_AUTO_TEST_SUITE(QcStatus_test_suite)

BOOST_AUTO_TEST_CASE(test_QcStatusLabels)
{
  BOOST_REQUIRE_EQUAL(std::string(QC_STATUS::label(QC_STATUS::PASS)), "pass");
  BOOST_REQUIRE_EQUAL(std::string(QC_STATUS::label(QC_STATUS::FAIL)), "fail");
  BOOST_REQUIRE_EQUAL(std::string(QC_STATUS::label(QC_STATUS::ERROR)), "error");
  BOOST_REQUIRE_EQUAL(std::string(QC_STATUS::label(QC_STATUS::CORRUPT)), "corrupt");
}

BOOST_AUTO_TEST_CASE(test_writeStatusFile)
{
  const TestFilenameMaker statusFile;
  writeStatusFile(statusFile.getFilename(), QC_STATUS::PASS);
  BOOST_REQUIRE_EQUAL(readFileContents(statusFile.getFilename()), "pass");
}

BOOST_AUTO_TEST_CASE(test_writeRegisteredErrorStatus)
{
  const TestFilenameMaker statusFile;
  writeStatusFile(statusFile.getFilename(), QC_STATUS::PASS);

  registerErrorStatusFile(statusFile.getFilename());
  writeRegisteredErrorStatus();
  registerErrorStatusFile("");

  BOOST_REQUIRE_EQUAL(readFileContents(statusFile.getFilename()), "error");

  // no registration, no write:
  writeStatusFile(statusFile.getFilename(), QC_STATUS::FAIL);
  writeRegisteredErrorStatus();
  BOOST_REQUIRE_EQUAL(readFileContents(statusFile.getFilename()), "fail");
}

BOOST_AUTO_TEST_SUITE_END()
