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

#include <string>

namespace COMPRESSION {
enum index_t { NONE, GZIP, BZIP2, ZIP };

inline const char* label(const index_t i)
{
  switch (i) {
  case NONE:
    return "none";
  case GZIP:
    return "gz";
  case BZIP2:
    return "bz2";
  case ZIP:
    return "zip";
  default:
    return "unknown";
  }
}
}  // namespace COMPRESSION

/// number of leading file bytes needed to recognize any supported compression signature
static const unsigned compressionSignatureSize(4);

/// identify the compression format from the leading bytes of a file
///
/// signatures are tested in the order gzip (1f 8b 08), bzip2 (42 5a 68), zip (50 4b 03 04),
/// anything else, including a prefix too short to match, is treated as uncompressed
COMPRESSION::index_t sniffCompression(const std::string& prefix);

/// read the leading bytes of filename and identify its compression format
///
/// the filename extension is not consulted
COMPRESSION::index_t sniffFileCompression(const std::string& filename);
