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

BOOST_AUTO_TEST_SUITE(Exceptions_test_suite)

using namespace asmqc::common;

BOOST_AUTO_TEST_CASE(test_ExceptionContext)
{
  try {
    BOOST_THROW_EXCEPTION(InputFormatException("bad record"));
  } catch (const ExceptionData& e) {
    BOOST_REQUIRE_EQUAL(e.getMessage(), "bad record");
    BOOST_REQUIRE(e.getContext().find("ExceptionsTest.cpp") != std::string::npos);
  }
}

BOOST_AUTO_TEST_CASE(test_ExceptionHierarchy)
{
  BOOST_REQUIRE_THROW(BOOST_THROW_EXCEPTION(CorruptStreamException("eof")), std::ios_base::failure);
  BOOST_REQUIRE_THROW(
      BOOST_THROW_EXCEPTION(MissingContigDataException("no depth", "NODE_1")), std::out_of_range);
  BOOST_REQUIRE_THROW(BOOST_THROW_EXCEPTION(InvalidParameterException("bad size")), std::logic_error);

  try {
    BOOST_THROW_EXCEPTION(MissingContigDataException("no depth", "NODE_1"));
  } catch (const MissingContigDataException& e) {
    BOOST_REQUIRE_EQUAL(e.getContigId(), "NODE_1");
  }
}

BOOST_AUTO_TEST_SUITE_END()
