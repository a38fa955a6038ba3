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

#include "seqio/SequenceStore.hpp"

#include <iosfwd>
#include <string>
#include <vector>

/// \brief Write the records at keptIndices to os in FASTA format, in store order
///
/// Each header is written as '>' + prefix + '_' + record id, or '>' + record id if prefix
/// is empty. Sequences are written on a single line.
///
/// keptIndices must be in ascending order.
void writeFasta(
    const SequenceStore&         store,
    const std::vector<unsigned>& keptIndices,
    const std::string&           prefix,
    std::ostream&                os);

/// \brief Write all records of store, as above
void writeFasta(const SequenceStore& store, const std::string& prefix, std::ostream& os);
