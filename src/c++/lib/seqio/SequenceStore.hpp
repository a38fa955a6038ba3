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
#include <map>
#include <string>
#include <vector>

/// a single FASTA record
struct SequenceRecord {
  SequenceRecord(const std::string& initId) : id(initId) {}

  unsigned size() const { return seq.size(); }

  /// header line without the leading '>' and surrounding whitespace
  std::string id;
  std::string seq;
};

/// \brief Ordered collection of sequence records, unique by identifier
///
/// Insertion order is the canonical record order for every downstream aggregation.
///
class SequenceStore {
public:
  typedef std::vector<SequenceRecord>::const_iterator const_iterator;

  /// add a new empty record for id and return its index
  ///
  /// if id is already present the existing record keeps its position, its sequence is
  /// cleared, and isRepeat is set to true
  unsigned beginRecord(const std::string& id, bool& isRepeat);

  /// append a sequence fragment to the record at index
  void appendFragment(const unsigned index, const std::string& fragment)
  {
    _records[index].seq.append(fragment);
  }

  bool empty() const { return _records.empty(); }

  unsigned size() const { return _records.size(); }

  const SequenceRecord& getRecord(const unsigned index) const { return _records.at(index); }

  /// return true if id is found, and its index in index
  bool findRecord(const std::string& id, unsigned& index) const;

  /// sum of all record lengths
  uint64_t totalLength() const;

  const_iterator begin() const { return _records.begin(); }
  const_iterator end() const { return _records.end(); }

private:
  std::vector<SequenceRecord>     _records;
  std::map<std::string, unsigned> _idIndex;
};
