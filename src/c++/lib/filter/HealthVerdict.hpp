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
/// assembly health classification against an expected genome size
///

#pragma once

#include <cstdint>
#include <string>
#include <vector>

/// fraction of the expected genome size below which an assembly fails
const double minGenomeSizeFraction(0.8);

/// fraction of the expected genome size above which an assembly is flagged
const double maxGenomeSizeFraction(1.5);

/// default contig count allowed per 1.5 Mb of expected genome size
const unsigned defaultMaxContigsPerGenomeUnit(100);

const char* const assemblyTooSmallLabel("assembly too small");
const char* const assemblyTooLargeLabel("assembly larger than expected");
const char* const excessiveContigsLabel("excessive contig count");

struct HealthVerdict {
  bool isPass() const { return (!isFail); }

  bool                     isFail = false;
  std::string              failReason;
  std::vector<std::string> warnings;

  /// one human-readable line for the failure and for each warning, with the observed values
  std::vector<std::string> messages;
};

/// G * 1e6 * 0.8
double minAssemblyLength(const double genomeSizeMb);

/// G * 1e6 * 1.5
double maxAssemblyLength(const double genomeSizeMb);

/// \brief Classify a filtered assembly
///
/// The three checks are independent:
/// - length below the minimum fails with 'assembly too small'
/// - length above the maximum warns 'assembly larger than expected'
/// - more than maxContigs * G / 1.5 contigs warns 'excessive contig count'
///
/// throws InvalidParameterException if genomeSizeMb is not positive
HealthVerdict classifyAssemblyHealth(
    const uint64_t filteredLength,
    const unsigned filteredContigCount,
    const double   genomeSizeMb,
    const unsigned maxContigs = defaultMaxContigsPerGenomeUnit);
