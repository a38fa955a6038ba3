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

#pragma once

#include <iosfwd>
#include <map>
#include <string>
#include <vector>

/// \brief Per-base depth values for each contig, in input order
///
/// Positions are not re-sorted, the depth list of each contig is kept in the order
/// rows were read.
///
class DepthTable {
public:
  typedef std::vector<unsigned> depth_t;

  void addDepth(const std::string& contigId, const unsigned depth) { _depth[contigId].push_back(depth); }

  bool hasContig(const std::string& contigId) const { return (_depth.count(contigId) != 0); }

  /// throws MissingContigDataException if contigId has no depth rows
  const depth_t& getDepth(const std::string& contigId) const;

  unsigned contigCount() const { return _depth.size(); }

  /// write the table as 'contig position depth' rows, using 1-based positions in list order
  ///
  /// contigOrder gives the order of contigs in the output, contigs without depth are skipped
  void write(const std::vector<std::string>& contigOrder, std::ostream& os) const;

private:
  std::map<std::string, depth_t> _depth;
};

/// \brief Parse whitespace-delimited 'contig position depth' rows into table
///
/// \param[in] label name of the input, used in error messages
///
/// throws InputFormatException for rows with the wrong column count or non-integer values
void parseDepthTable(std::istream& is, const std::string& label, DepthTable& table);

/// open filename (plain or compressed) and parse it as with parseDepthTable
void parseDepthTableFile(const std::string& filename, DepthTable& table);
