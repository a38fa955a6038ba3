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
/// pipeline status tokens written to the per-sample '.status' file
///

#pragma once

#include <string>

namespace QC_STATUS {
enum index_t { PASS, FAIL, ERROR, CORRUPT };

inline const char* label(const index_t i)
{
  switch (i) {
  case PASS:
    return "pass";
  case FAIL:
    return "fail";
  case ERROR:
    return "error";
  case CORRUPT:
    return "corrupt";
  default:
    return "unknown";
  }
}
}  // namespace QC_STATUS

/// write the status token to filename, replacing any existing content
void writeStatusFile(const std::string& filename, const QC_STATUS::index_t status);

/// register the status file which receives the 'error' token if the program
/// terminates on an exception or signal
///
/// an empty filename clears the registration
void registerErrorStatusFile(const std::string& filename);

/// write 'error' to the registered status file, if any
///
/// uses only low-level file calls so that it can run from a signal handler,
/// and never throws
void writeRegisteredErrorStatus();
