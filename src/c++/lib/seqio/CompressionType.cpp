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

#include "seqio/CompressionType.hpp"

#include "blt_util/io_util.hpp"

#include <cstring>

struct CompressionSignature {
  COMPRESSION::index_t type;
  const char*          magic;
  unsigned             size;
};

static const CompressionSignature signatures[] = {
    {COMPRESSION::GZIP, "\x1f\x8b\x08", 3},
    {COMPRESSION::BZIP2, "\x42\x5a\x68", 3},
    {COMPRESSION::ZIP, "\x50\x4b\x03\x04", 4},
};

COMPRESSION::index_t sniffCompression(const std::string& prefix)
{
  for (const CompressionSignature& sig : signatures) {
    if (prefix.size() < sig.size) continue;
    if (0 == memcmp(prefix.data(), sig.magic, sig.size)) return sig.type;
  }
  return COMPRESSION::NONE;
}

COMPRESSION::index_t sniffFileCompression(const std::string& filename)
{
  return sniffCompression(readFilePrefix(filename, compressionSignatureSize));
}
