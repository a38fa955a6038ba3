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
/// genome coverage and quality encoding estimate for a set of read files
///

#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

/// sentinel written to every output channel of a corrupt estimate
static const char corruptChannelValue[] = "corrupt";

/// throws InvalidParameterException if genomeSizeMb is not a positive finite value
void checkGenomeSize(const double genomeSizeMb);

/// \brief expected genome coverage, chars / (genomeSizeMb * 1e6), rounded to 2 decimal places
double computeCoverage(const uint64_t charCount, const double genomeSizeMb);

struct ReadCoverageOptions {
  /// expected genome size in megabases
  double genomeSizeMb = 0;
  double minCoverage  = 0;
  bool   isSkipEncoding = false;
};

/// \brief Result of read coverage estimation, or the corrupt state
///
/// Each channel accessor gives the exact text of one output file.
///
struct CoverageEstimate {
  bool isCorrupt = false;

  std::string encodingLabel;
  std::string phredLabel;
  double      coverage      = 0;
  bool        isPass        = false;
  unsigned    maxReadLength = 0;

  std::string getEncodingChannel() const;
  std::string getPhredChannel() const;

  /// the coverage value on pass, 'fail' otherwise
  std::string getCoverageChannel() const;

  /// 'sample,coverage,PASS|FAIL' terminated by a newline
  std::string getReportChannel(const std::string& sampleId) const;
  std::string getMaxLengthChannel() const;

  /// coverage formatted as in the text reports
  std::string getCoverageText() const;
};

/// \brief Read all files as one chained FASTQ stream and estimate encoding and coverage
///
/// Any decompression failure or truncated record produces the corrupt estimate, with
/// the cause logged as a warning to logOs.
///
CoverageEstimate estimateReadCoverage(
    const std::vector<std::string>& readFiles, const ReadCoverageOptions& opt, std::ostream& logOs);
