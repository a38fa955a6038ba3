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

#include <cstdint>
#include <iosfwd>
#include <map>
#include <string>
#include <vector>

/// one row of a per-contig coverage table
struct ContigCoverageRow {
  std::string contigId;
  unsigned    coverage = 0;

  /// contig length from the 'length_<n>_' header token
  unsigned length = 0;
};

/// \brief Per-contig coverage rows in input order, with assembly totals
class ContigCoverageTable {
public:
  /// add row, a repeated contig id replaces the earlier row in place
  void addRow(const ContigCoverageRow& row);

  /// throws MissingContigDataException if contigId has no row
  const ContigCoverageRow& getContig(const std::string& contigId) const;

  const std::vector<ContigCoverageRow>& getRows() const { return _rows; }

  /// sum of row lengths
  uint64_t totalLength() const;

  /// sum of row coverages
  uint64_t totalCoverage() const;

private:
  std::vector<ContigCoverageRow>  _rows;
  std::map<std::string, unsigned> _index;
};

/// \brief contig length from the first 'length_<n>_' token of a SPAdes header
///
/// throws InputFormatException if there is no such token
unsigned parseHeaderLength(const std::string& header);

/// \brief Parse whitespace-delimited 'contig coverage' rows into table
///
/// throws InputFormatException for rows with the wrong column count, non-integer coverage,
/// or a contig id without a length token
void parseContigCoverageTable(std::istream& is, const std::string& label, ContigCoverageTable& table);

/// open filename and parse it as with parseContigCoverageTable
void parseContigCoverageTableFile(const std::string& filename, ContigCoverageTable& table);
