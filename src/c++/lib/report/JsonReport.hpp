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
/// json reports consumed by the pipeline reporting front end
///
/// key names are a compatibility surface and must not change
///

#pragma once

#include "filter/HealthVerdict.hpp"
#include "stats/AssemblySummary.hpp"
#include "stats/WindowTrack.hpp"

#include <iosfwd>
#include <string>
#include <vector>

/// \brief Write the assembly report
///
/// The layout is:
///
/// {"tableRow": [{"sample": id, "data": [{"header": "Contigs", "value": n, "table": "assembly"},
///                                       {"header": "Assembled BP", "value": n, "table": "assembly"}]}],
///  "plotData": [{"sample": id, "data": {"size_dist": [...],
///                                       "gcSliding": [values, labels, boundaries],
///                                       "covSliding": [values, labels, boundaries]}}]}
///
/// boundaries are written as [{"nodeId": n, "end": pos}, ...]. gcSliding and covSliding are
/// omitted when the corresponding track is null.
///
void writeAssemblyReportJson(
    const std::string&           sampleId,
    const AssemblySummary&       summary,
    const std::vector<unsigned>& sizeDistribution,
    const WindowTrack*           gcTrack,
    const WindowTrack*           coverageTrack,
    std::ostream&                os);

/// \brief Write the verdict of a filtering step
///
/// {"warnings": {"process": name, "value": [tags]}, "fail": {"process": name, "value": null|reason}}
///
void writeHealthReportJson(const std::string& processName, const HealthVerdict& verdict, std::ostream& os);

/// the reported version of a program
struct ProgramVersion {
  std::string program;
  std::string version;
  std::string build;
};

/// write [{"program": ..., "version": ..., "build": ...}, ...]
void writeVersionsJson(const std::vector<ProgramVersion>& versions, std::ostream& os);

/// write verdict messages to os, one per line
void writeHealthWarnings(const HealthVerdict& verdict, std::ostream& os);
