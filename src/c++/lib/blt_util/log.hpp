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
/// process-wide log stream used by the program layer
///
/// core components do not write here directly, they receive the stream
/// they should log to from their caller
///

#pragma once

#include <iosfwd>
#include <string>

extern std::ostream& log_os;

/// standard prefixes for lines written to a log stream
namespace LOG_LEVEL {
enum index_t { INFO, WARNING, ERROR };

inline const char* label(const index_t i)
{
  switch (i) {
  case INFO:
    return "INFO";
  case WARNING:
    return "WARNING";
  case ERROR:
    return "ERROR";
  default:
    return "UNKNOWN";
  }
}
}  // namespace LOG_LEVEL

/// write a single prefixed log line, e.g. "WARNING: msg"
void logLine(std::ostream& os, const LOG_LEVEL::index_t level, const std::string& msg);

/// write msg to log_os the first time this is called, ignore all later calls
void warnOnce(const std::string& msg);
