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

#include "seqio/CompressionType.hpp"

#include "boost/iostreams/filtering_stream.hpp"

#include <fstream>
#include <string>

/// \brief Text input stream over a plain, gzip, bzip2 or zip compressed file
///
/// The compression format is detected from the file content. For zip archives only
/// the first member is read, and it must be stored or deflated.
///
/// Decompression failures, including a stream which ends prematurely, are raised
/// from the read call as std::ios_base::failure (or a type derived from it).
///
struct CompressedInputStream {
  explicit CompressedInputStream(const std::string& filename);

  CompressedInputStream(const CompressedInputStream&) = delete;
  CompressedInputStream& operator=(const CompressedInputStream&) = delete;

  std::istream& getStream() { return _fis; }

  COMPRESSION::index_t getCompression() const { return _compression; }

  const std::string& getFilename() const { return _filename; }

private:
  /// position the file after the zip local header and push the member decoder
  void pushZipMember();

  std::string                          _filename;
  COMPRESSION::index_t                 _compression;
  std::ifstream                        _ifs;
  boost::iostreams::filtering_istream _fis;
};
