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
/// an efficient (and slightly unsafe) class for whitespace or tab-delimited text tables
///

#pragma once

#include <iosfwd>

struct istream_line_splitter {
  /// \param word_seperator when zero, any run of blanks or tabs separates words
  istream_line_splitter(
      std::istream&  is,
      const unsigned line_buf_size  = 8 * 1024,
      const char     word_seperator = '\t',
      const unsigned max_word       = 0)
    : _is(is),
      _line_no(0),
      _n_word(0),
      _buf_size(line_buf_size),
      _sep(word_seperator),
      _max_word(max_word),
      _buf(new char[_buf_size])
  {
    if ((0 == _max_word) || (MAX_WORD_COUNT < _max_word)) {
      _max_word = MAX_WORD_COUNT;
    }
  }

  ~istream_line_splitter() { delete[] _buf; }

  istream_line_splitter(const istream_line_splitter&) = delete;
  istream_line_splitter& operator=(const istream_line_splitter&) = delete;

  unsigned n_word() const { return _n_word; }

  unsigned line_no() const { return _line_no; }

  /// returns false for regular end of input
  ///
  /// a trailing '\r' is removed from each line, blank lines produce n_word()==0
  bool parse_line();

  /// recreates the line before parsing
  void write_line(std::ostream& os) const;

  /// debug output, which provides line number and other info before calling write_line
  void dump(std::ostream& os) const;

  enum { MAX_WORD_COUNT = 50 };
  char* word[MAX_WORD_COUNT];

private:
  void increase_buffer_size();

  void split_on_seperator();

  void split_on_whitespace();

  std::istream& _is;
  unsigned      _line_no;
  unsigned      _n_word;
  unsigned      _buf_size;
  char          _sep;
  unsigned      _max_word;
  char*         _buf;
};
