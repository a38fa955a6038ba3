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

#include "seqio/FastaWriter.hpp"

#include <iostream>

static void writeFastaRecord(const SequenceRecord& record, const std::string& prefix, std::ostream& os)
{
  os << '>';
  if (!prefix.empty()) os << prefix << '_';
  os << record.id << '\n' << record.seq << '\n';
}

void writeFasta(
    const SequenceStore&         store,
    const std::vector<unsigned>& keptIndices,
    const std::string&           prefix,
    std::ostream&                os)
{
  for (const unsigned index : keptIndices) {
    writeFastaRecord(store.getRecord(index), prefix, os);
  }
}

void writeFasta(const SequenceStore& store, const std::string& prefix, std::ostream& os)
{
  for (const SequenceRecord& record : store) {
    writeFastaRecord(record, prefix, os);
  }
}
