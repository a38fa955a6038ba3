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
#include "stats/DepthTable.hpp"

#include <sstream>

BOOST_AUTO_TEST_SUITE(DepthTable_test_suite)

BOOST_AUTO_TEST_CASE(test_parseDepthTable)
{
  std::istringstream iss("c1\t1\t5\nc1 2 7\n\nc2\t1\t0\nc1\t4\t9\n");
  DepthTable         table;
  parseDepthTable(iss, "test", table);

  BOOST_REQUIRE_EQUAL(table.contigCount(), 2u);

  // input order is kept, no re-sort by position:
  const std::vector<unsigned> expected = {5, 7, 9};
  const DepthTable::depth_t&  depth(table.getDepth("c1"));
  BOOST_REQUIRE_EQUAL_COLLECTIONS(depth.begin(), depth.end(), expected.begin(), expected.end());

  BOOST_REQUIRE_THROW(table.getDepth("c3"), asmqc::common::MissingContigDataException);
}

BOOST_AUTO_TEST_CASE(test_parseDepthTable_bad_rows)
{
  {
    std::istringstream iss("c1\t1\n");
    DepthTable         table;
    BOOST_REQUIRE_THROW(parseDepthTable(iss, "test", table), asmqc::common::InputFormatException);
  }
  {
    std::istringstream iss("c1\t1\t2.5\n");
    DepthTable         table;
    BOOST_REQUIRE_THROW(parseDepthTable(iss, "test", table), asmqc::common::InputFormatException);
  }
  {
    std::istringstream iss("c1\t0\t2\n");
    DepthTable         table;
    BOOST_REQUIRE_THROW(parseDepthTable(iss, "test", table), asmqc::common::InputFormatException);
  }
}

BOOST_AUTO_TEST_CASE(test_DepthTableWrite)
{
  DepthTable table;
  table.addDepth("c2", 3);
  table.addDepth("c1", 1);
  table.addDepth("c1", 2);

  std::ostringstream oss;
  table.write({"c1", "c2", "c3"}, oss);
  BOOST_REQUIRE_EQUAL(oss.str(), "c1\t1\t1\nc1\t2\t2\nc2\t1\t3\n");
}

BOOST_AUTO_TEST_SUITE_END()
