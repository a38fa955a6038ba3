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
#include "filter/HealthVerdict.hpp"

BOOST_AUTO_TEST_SUITE(HealthVerdict_test_suite)

BOOST_AUTO_TEST_CASE(test_assemblyTooSmall)
{
  const HealthVerdict verdict(classifyAssemblyHealth(1500000, 10, 2.0));
  BOOST_REQUIRE(verdict.isFail);
  BOOST_REQUIRE(!verdict.isPass());
  BOOST_REQUIRE_EQUAL(verdict.failReason, "assembly too small");
  BOOST_REQUIRE(verdict.warnings.empty());

  BOOST_REQUIRE_EQUAL(verdict.messages.size(), 1u);
  BOOST_REQUIRE_EQUAL(
      verdict.messages[0],
      "Assembly size (1500000) smaller than the minimum threshold of 80% of expected genome size (1600000.0)");
}

BOOST_AUTO_TEST_CASE(test_assemblyExpectedSize)
{
  const HealthVerdict verdict(classifyAssemblyHealth(2000000, 10, 2.0));
  BOOST_REQUIRE(verdict.isPass());
  BOOST_REQUIRE(verdict.failReason.empty());
  BOOST_REQUIRE(verdict.warnings.empty());

  // both thresholds are inclusive
  BOOST_REQUIRE(classifyAssemblyHealth(1600000, 10, 2.0).isPass());
  BOOST_REQUIRE(classifyAssemblyHealth(3000000, 10, 2.0).warnings.empty());
}

BOOST_AUTO_TEST_CASE(test_independentChecks)
{
  // 200 contigs per 1.5 Mb for a 3 Mb genome is a 400 contig limit
  const HealthVerdict verdict(classifyAssemblyHealth(5000000, 401, 3.0, 200));
  BOOST_REQUIRE(verdict.isPass());
  BOOST_REQUIRE_EQUAL(verdict.warnings.size(), 2u);
  BOOST_REQUIRE_EQUAL(verdict.warnings[0], "assembly larger than expected");
  BOOST_REQUIRE_EQUAL(verdict.warnings[1], "excessive contig count");
  BOOST_REQUIRE_EQUAL(verdict.messages.size(), 2u);

  const HealthVerdict verdict2(classifyAssemblyHealth(1000, 401, 3.0, 200));
  BOOST_REQUIRE(verdict2.isFail);
  BOOST_REQUIRE_EQUAL(verdict2.warnings.size(), 1u);
  BOOST_REQUIRE_EQUAL(verdict2.warnings[0], "excessive contig count");

  BOOST_REQUIRE(classifyAssemblyHealth(3000000, 400, 3.0, 200).warnings.empty());
}

BOOST_AUTO_TEST_CASE(test_badGenomeSize)
{
  BOOST_REQUIRE_THROW(classifyAssemblyHealth(1000, 1, 0.), asmqc::common::InvalidParameterException);
  BOOST_REQUIRE_THROW(classifyAssemblyHealth(1000, 1, -1.), asmqc::common::InvalidParameterException);
}

BOOST_AUTO_TEST_SUITE_END()
