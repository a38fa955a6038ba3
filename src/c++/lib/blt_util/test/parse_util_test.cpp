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

#include "blt_util/parse_util.hpp"
#include "common/Exceptions.hpp"

#include <cmath>

#include <string>

BOOST_AUTO_TEST_SUITE(parse_util)

using namespace asmqc::blt_util;

//
// check unsigned parsing
//
BOOST_AUTO_TEST_CASE(test_parse_unsigned)
{
  const char*    two = "2";
  const unsigned val(parse_unsigned(two));
  BOOST_REQUIRE_EQUAL(val, 2u);
}

BOOST_AUTO_TEST_CASE(test_parse_unsigned_negative)
{
  const char* neg = "-2";
  BOOST_REQUIRE_THROW(parse_unsigned(neg), std::exception);
}

BOOST_AUTO_TEST_CASE(test_parse_unsigned_empty)
{
  const char* empty = "";
  BOOST_REQUIRE_THROW(parse_unsigned(empty), std::exception);
}

BOOST_AUTO_TEST_CASE(test_parse_unsigned_tolerate_suffix)
{
  const char*    suffix = "123abc";
  const unsigned val(parse_unsigned(suffix));
  BOOST_REQUIRE_EQUAL(val, 123u);
  BOOST_REQUIRE_EQUAL(std::string(suffix), std::string("abc"));
}

BOOST_AUTO_TEST_CASE(test_parse_unsigned_str)
{
  BOOST_REQUIRE_EQUAL(parse_unsigned_str("2000"), 2000u);
  BOOST_REQUIRE_THROW(parse_unsigned_str("2000x"), std::exception);
  BOOST_REQUIRE_THROW(parse_unsigned_str("ABCD"), std::exception);
}

//
// check 64 bit parsing
//
BOOST_AUTO_TEST_CASE(test_parse_uint64_str)
{
  BOOST_REQUIRE_EQUAL(parse_uint64_str("5000000000"), 5000000000ull);
  BOOST_REQUIRE_THROW(parse_uint64_str("-1"), std::exception);
}

//
// check double parsing
//
BOOST_AUTO_TEST_CASE(test_parse_double)
{
  const char*  two = "2.5";
  const double val(parse_double(two));
  BOOST_REQUIRE_CLOSE(val, 2.5, 0.0001);
}

BOOST_AUTO_TEST_CASE(test_parse_double_str)
{
  BOOST_REQUIRE_CLOSE(parse_double_str("10.5"), 10.5, 0.0001);
  BOOST_REQUIRE_CLOSE(parse_double_str("1e-3"), 0.001, 0.0001);
  BOOST_REQUIRE_THROW(parse_double_str("ABCD"), std::exception);
  BOOST_REQUIRE_THROW(parse_double_str("1.5x"), std::exception);
  BOOST_REQUIRE_THROW(parse_double_str(""), std::exception);
}

BOOST_AUTO_TEST_CASE(test_parse_double_tolerate_suffix)
{
  const char*  depth = "12.5\t7";
  const double val(parse_double(depth));
  BOOST_REQUIRE_CLOSE(val, 12.5, 0.0001);
  BOOST_REQUIRE_EQUAL(std::string(depth), std::string("\t7"));
}

BOOST_AUTO_TEST_CASE(test_parse_double_throws_input_format)
{
  BOOST_REQUIRE_THROW(parse_double_str("cov_abc"), asmqc::common::InputFormatException);
}

BOOST_AUTO_TEST_SUITE_END()
