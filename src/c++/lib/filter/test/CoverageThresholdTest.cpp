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
#include "filter/CoverageThreshold.hpp"

BOOST_AUTO_TEST_SUITE(CoverageThreshold_test_suite)

BOOST_AUTO_TEST_CASE(test_autoMinCoverage)
{
  BOOST_REQUIRE_EQUAL(autoMinCoverage(300, 100), 10.);
  BOOST_REQUIRE_CLOSE(autoMinCoverage(10000, 100), 30., 0.0001);
  BOOST_REQUIRE_THROW(autoMinCoverage(100, 0), asmqc::common::InvalidParameterException);
}

BOOST_AUTO_TEST_CASE(test_parseCoverageThreshold)
{
  using asmqc::common::InvalidParameterException;

  const CoverageThreshold autoThreshold(parseCoverageThreshold("auto"));
  BOOST_REQUIRE(autoThreshold.isAuto);
  BOOST_REQUIRE_EQUAL(autoThreshold.describe(), "auto");

  const CoverageThreshold fixedThreshold(parseCoverageThreshold("15"));
  BOOST_REQUIRE(!fixedThreshold.isAuto);
  BOOST_REQUIRE_EQUAL(fixedThreshold.value, 15.);
  BOOST_REQUIRE_EQUAL(fixedThreshold.describe(), "15.0");

  BOOST_REQUIRE_THROW(parseCoverageThreshold("automatic"), InvalidParameterException);
  BOOST_REQUIRE_THROW(parseCoverageThreshold("-1"), InvalidParameterException);
  BOOST_REQUIRE_THROW(parseCoverageThreshold(""), InvalidParameterException);
}

BOOST_AUTO_TEST_CASE(test_resolveMinCoverage)
{
  BOOST_REQUIRE_CLOSE(resolveMinCoverage(CoverageThreshold(), 10000, 100), 30., 0.0001);
  BOOST_REQUIRE_EQUAL(resolveMinCoverage(CoverageThreshold(5), 10000, 100), 5.);

  // a fixed threshold does not need assembly totals
  BOOST_REQUIRE_EQUAL(resolveMinCoverage(CoverageThreshold(5), 0, 0), 5.);
}

BOOST_AUTO_TEST_SUITE_END()
