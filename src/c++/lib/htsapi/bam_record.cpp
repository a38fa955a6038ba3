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

#include "htsapi/bam_record.hpp"

#include <iostream>

std::ostream& operator<<(std::ostream& os, const bam_record& br)
{
  if (br.empty()) {
    os << "NONE";
  } else {
    os << br.qname() << "/" << br.read_no() << " tid:pos:strand " << br.target_id() << ":" << (br.pos() - 1)
       << ":" << (br.is_fwd_strand() ? '+' : '-');

    os << " cigar: ";
    const uint32_t* cigar(br.raw_cigar());
    const unsigned  n_cigar(br.n_cigar());
    for (unsigned i(0); i < n_cigar; ++i) {
      os << bam_cigar_oplen(cigar[i]) << bam_cigar_opchr(cigar[i]);
    }

    if (br.is_secondary()) {
      os << " issec";
    }
    if (br.is_supplementary()) {
      os << " issupp";
    }
  }
  return os;
}
