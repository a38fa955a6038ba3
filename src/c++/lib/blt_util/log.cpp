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

#include "blt_util/log.hpp"

#include <iostream>

std::ostream& log_os(std::cerr);

void logLine(std::ostream& os, const LOG_LEVEL::index_t level, const std::string& msg)
{
  os << LOG_LEVEL::label(level) << ": " << msg << "\n";
}

void warnOnce(const std::string& msg)
{
  static bool once(false);

  if (!once) {
    once = true;
    logLine(log_os, LOG_LEVEL::WARNING, msg);
  }
}
