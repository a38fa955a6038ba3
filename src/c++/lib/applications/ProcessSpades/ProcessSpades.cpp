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

#include "ProcessSpades.hpp"
#include "PSOptions.hpp"

#include "blt_util/io_util.hpp"
#include "blt_util/log.hpp"
#include "common/QcStatus.hpp"
#include "report/FilterReport.hpp"
#include "report/JsonReport.hpp"
#include "seqio/FastaReader.hpp"
#include "seqio/FastaWriter.hpp"

#include <fstream>
#include <iostream>

/// process label in the json report
static const char reportProcessName[] = "Spades";

static void runPS(const asmqc::Program& prog, const PSOptions& opt)
{
  const std::string statusFilename(opt.outputPrefix + ".status");
  registerErrorStatusFile(statusFilename);

  {
    ProgramVersion version;
    version.program = prog.name();
    version.version = prog.version();
    version.build   = prog.buildTime();

    std::ofstream versionOs;
    open_ofstream(versionOs, (opt.outputPrefix + ".versions").c_str());
    writeVersionsJson({version}, versionOs);
  }

  SequenceStore store;
  parseFastaFile(opt.assemblyFilename, log_os, store);

  const std::vector<ContigCoverageEntry> entries(buildSpadesContigEntries(store));
  const SpadesFilterOutcome              outcome(filterSpadesAssembly(entries, opt.filter, log_os));

  {
    std::ofstream fastaOs;
    open_ofstream(fastaOs, (opt.outputPrefix + ".assembly.fasta").c_str());
    writeFasta(store, outcome.filterResult.keptIndices, opt.sampleId, fastaOs);
  }
  {
    std::ofstream reportOs;
    open_ofstream(reportOs, (opt.outputPrefix + ".report.csv").c_str());
    writeFilterReport(outcome.filterResult.outcomes, reportOs);
  }
  {
    std::ofstream warningsOs;
    open_ofstream(warningsOs, (opt.outputPrefix + ".warnings").c_str());
    writeHealthWarnings(outcome.verdict, warningsOs);
  }
  {
    std::ofstream jsonOs;
    open_ofstream(jsonOs, (opt.outputPrefix + ".report.json").c_str());
    writeHealthReportJson(reportProcessName, outcome.verdict, jsonOs);
  }

  writeStatusFile(statusFilename, (outcome.verdict.isPass() ? QC_STATUS::PASS : QC_STATUS::FAIL));
  registerErrorStatusFile("");

  log_os << "INFO: Kept " << outcome.filterResult.keptIndices.size() << " of " << store.size()
         << " contigs, assembly length: " << outcome.filterResult.keptLength << "\n";
}

void ProcessSpades::runInternal(int argc, char* argv[]) const
{
  PSOptions opt;

  parsePSOptions(*this, argc, argv, opt);
  runPS(*this, opt);
}
