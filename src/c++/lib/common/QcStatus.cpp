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

#include "common/QcStatus.hpp"

#include "blt_util/io_util.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cstring>

static const unsigned maxStatusPathSize(4096);
static char           errorStatusPath[maxStatusPathSize] = {'\0'};

void writeStatusFile(const std::string& filename, const QC_STATUS::index_t status)
{
  writeTokenFile(filename, QC_STATUS::label(status));
}

void registerErrorStatusFile(const std::string& filename)
{
  errorStatusPath[0] = '\0';
  if (filename.size() >= maxStatusPathSize) return;
  memcpy(errorStatusPath, filename.c_str(), filename.size() + 1);
}

void writeRegisteredErrorStatus()
{
  if (errorStatusPath[0] == '\0') return;

  const int fd(open(errorStatusPath, O_WRONLY | O_CREAT | O_TRUNC, 0644));
  if (fd < 0) return;

  const char*   token(QC_STATUS::label(QC_STATUS::ERROR));
  const ssize_t tokenSize(static_cast<ssize_t>(strlen(token)));
  if (write(fd, token, tokenSize) != tokenSize) {
    // nothing more can be done while shutting down
  }
  close(fd);
}
