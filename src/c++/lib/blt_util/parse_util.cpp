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

/// \file
///

#include "blt_util/parse_util.hpp"

#include "common/Exceptions.hpp"

#include "boost/spirit/include/qi.hpp"

#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>

#include <limits>
#include <sstream>

static void parse_exception(const char* type_label, const char* parse_str)
{
  std::ostringstream oss;
  oss << "Can't parse " << type_label << " from string: '" << parse_str << "'";
  BOOST_THROW_EXCEPTION(asmqc::common::InputFormatException(oss.str()));
}

namespace asmqc {
namespace blt_util {

static unsigned long long parse_ull_core(const char* s, const char*& s_out, const char* type_label)
{
  static const int base(10);

  // strtoull silently negates a leading minus sign:
  const char* p(s);
  while (isspace(*p)) ++p;
  if (*p == '-') parse_exception(type_label, s);

  errno = 0;

  char*                    endptr;
  const unsigned long long val(strtoull(s, &endptr, base));
  if ((errno == ERANGE && (val == ULLONG_MAX || val == 0)) || (errno != 0 && val == 0) || (endptr == s)) {
    parse_exception(type_label, s);
  }

  s_out = endptr;

  return val;
}

static unsigned parse_unsigned_core(const char* s, const char*& s_out)
{
  const unsigned long long val(parse_ull_core(s, s_out, "unsigned"));
  if (val > std::numeric_limits<unsigned>::max()) {
    parse_exception("unsigned", s);
  }
  return static_cast<unsigned>(val);
}

unsigned parse_unsigned(const char*& s)
{
  return parse_unsigned_core(s, s);
}

unsigned parse_unsigned_rvalue(const char* s)
{
  const char*    s_tmp(0);
  const unsigned val(parse_unsigned_core(s, s_tmp));
  if (*s_tmp != '\0') {
    parse_exception("unsigned", s);
  }
  return val;
}

unsigned parse_unsigned_str(const std::string& s)
{
  return parse_unsigned_rvalue(s.c_str());
}

uint64_t parse_uint64_str(const std::string& s)
{
  const char*    s_tmp(0);
  const uint64_t val(parse_ull_core(s.c_str(), s_tmp, "uint64"));
  if (*s_tmp != '\0') {
    parse_exception("uint64", s.c_str());
  }
  return val;
}

static double parse_double_core(const char* s, const char*& s_out, const char* s_end)
{
  double val;
  s_out = s;
  if (s_end == nullptr) s_end = s + strlen(s);
  bool isPass(boost::spirit::qi::parse(s_out, s_end, boost::spirit::double_, val));
  if (isPass) {
    isPass = (s != s_out);
  }
  if (!isPass) {
    parse_exception("double", s);
  }
  return val;
}

double parse_double(const char*& s, const char* s_end)
{
  return parse_double_core(s, s, s_end);
}

static double parse_double_rvalue(const char* s, const char* s_end)
{
  const char*  s_tmp(0);
  const double val(parse_double_core(s, s_tmp, s_end));
  if (*s_tmp != '\0') {
    parse_exception("double", s);
  }
  return val;
}

double parse_double_str(const std::string& s)
{
  const char*       s2(s.c_str());
  const char* const s2_end(s2 + s.size());
  return parse_double_rvalue(s2, s2_end);
}

}  // namespace blt_util
}  // namespace asmqc
