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
/// FASTA parsing into a SequenceStore
///

#pragma once

#include "seqio/SequenceStore.hpp"

#include <iosfwd>
#include <string>

/// \brief Parse FASTA records from is and add them to store
///
/// Header lines begin with '>'. Every other non-blank line is a fragment of the
/// most recent record, stripped of surrounding whitespace. Blank lines are skipped.
///
/// A repeated header resets the earlier record's sequence (keeping its position)
/// and writes a warning to logOs.
///
/// \param[in] label name of the input, used in error and warning messages
///
/// throws InputFormatException for a fragment before the first header
void parseFasta(std::istream& is, const std::string& label, std::ostream& logOs, SequenceStore& store);

/// \brief Open filename (plain or compressed) and parse it as with parseFasta
void parseFastaFile(const std::string& filename, std::ostream& logOs, SequenceStore& store);
