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

#include "AssemblyReport.hpp"
#include "ARPOptions.hpp"
#include "AssemblyTracks.hpp"

#include "blt_util/io_util.hpp"
#include "blt_util/log.hpp"
#include "common/QcStatus.hpp"
#include "report/JsonReport.hpp"
#include "report/SummaryCsv.hpp"
#include "seqio/FastaReader.hpp"
#include "stats/AlignmentDepth.hpp"

#include <fstream>
#include <iostream>

/// load the depth table from whichever depth source was given, return false if there is none
static bool loadDepthTable(const ARPOptions& opt, DepthTable& depthTable)
{
  if (!opt.depthFilename.empty()) {
    parseDepthTableFile(opt.depthFilename, depthTable);
    return true;
  }

  if (!opt.alignmentFilename.empty()) {
    const char* referenceFilename(opt.referenceFilename.empty() ? nullptr : opt.referenceFilename.c_str());
    readAlignmentDepth(opt.alignmentFilename, referenceFilename, depthTable);
    return true;
  }

  return false;
}

static void runARP(const ARPOptions& opt)
{
  const std::string statusFilename(opt.outputPrefix + ".status");
  registerErrorStatusFile(statusFilename);

  SequenceStore store;
  parseFastaFile(opt.assemblyFilename, log_os, store);

  const AssemblySummary summary(summarizeAssembly(store));
  {
    std::ofstream csvOs;
    open_ofstream(csvOs, (opt.outputPrefix + "_assembly_report.csv").c_str());
    writeSummaryCsvRow(opt.sampleId, summary, csvOs);
  }

  AssemblyTracks tracks;
  if (opt.isSkipTracks) {
    log_os << "INFO: Sliding window tracks are disabled\n";
  } else {
    DepthTable depthTable;
    const bool isDepth(loadDepthTable(opt, depthTable));
    buildAssemblyTracks(store, (isDepth ? &depthTable : nullptr), opt.windowSize, tracks);
  }

  {
    std::ofstream jsonOs;
    open_ofstream(jsonOs, (opt.outputPrefix + ".report.json").c_str());
    writeAssemblyReportJson(
        opt.sampleId,
        summary,
        getContigSizeDistribution(store),
        tracks.gcTrack.get(),
        tracks.coverageTrack.get(),
        jsonOs);
  }

  writeStatusFile(statusFilename, QC_STATUS::PASS);
  registerErrorStatusFile("");

  log_os << "INFO: Assembly '" << opt.assemblyFilename << "' contigs: " << summary.contigCount
         << " length: " << summary.totalLength << " N50: " << summary.n50 << "\n";
}

void AssemblyReport::runInternal(int argc, char* argv[]) const
{
  ARPOptions opt;

  parseARPOptions(*this, argc, argv, opt);
  runARP(opt);
}
