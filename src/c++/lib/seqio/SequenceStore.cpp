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

#include "seqio/SequenceStore.hpp"

unsigned SequenceStore::beginRecord(const std::string& id, bool& isRepeat)
{
  const auto iter(_idIndex.find(id));
  isRepeat = (iter != _idIndex.end());
  if (isRepeat) {
    _records[iter->second].seq.clear();
    return iter->second;
  }

  const unsigned index(_records.size());
  _records.emplace_back(id);
  _idIndex.insert(std::make_pair(id, index));
  return index;
}

bool SequenceStore::findRecord(const std::string& id, unsigned& index) const
{
  const auto iter(_idIndex.find(id));
  if (iter == _idIndex.end()) return false;
  index = iter->second;
  return true;
}

uint64_t SequenceStore::totalLength() const
{
  uint64_t sum(0);
  for (const SequenceRecord& record : _records) sum += record.size();
  return sum;
}
