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
/// minimum contig coverage setting, either fixed or derived from the assembly
///

#pragma once

#include <cstdint>
#include <string>

/// floor applied to the automatically derived minimum coverage
const double autoMinCoverageFloor(10);

/// share of the mean assembly coverage used as the automatic minimum coverage
const double autoMinCoverageFactor(0.3);

struct CoverageThreshold {
  /// automatic threshold, derived from the assembly by resolveMinCoverage
  CoverageThreshold() : isAuto(true), value(0) {}

  explicit CoverageThreshold(const double fixedValue) : isAuto(false), value(fixedValue) {}

  std::string describe() const;

  bool   isAuto;
  double value;
};

/// \brief Parse 'auto' or a non-negative number
///
/// throws InvalidParameterException for any other text
CoverageThreshold parseCoverageThreshold(const std::string& text);

/// \brief (totalCoverage / totalLength) * 0.3, floored at 10
///
/// throws InvalidParameterException if totalLength is zero
double autoMinCoverage(const uint64_t totalCoverage, const uint64_t totalLength);

/// minimum coverage for threshold given assembly totals
double resolveMinCoverage(
    const CoverageThreshold& threshold, const uint64_t totalCoverage, const uint64_t totalLength);
