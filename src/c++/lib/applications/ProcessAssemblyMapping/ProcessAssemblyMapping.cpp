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

#include "ProcessAssemblyMapping.hpp"
#include "MappedAssemblyFilter.hpp"
#include "PAMOptions.hpp"

#include "blt_util/io_util.hpp"
#include "blt_util/log.hpp"
#include "common/QcStatus.hpp"
#include "htsapi/bam_dumper.hpp"
#include "htsapi/bam_filter_util.hpp"
#include "report/JsonReport.hpp"
#include "seqio/FastaReader.hpp"
#include "seqio/FastaWriter.hpp"

#include "boost/filesystem.hpp"

#include <fstream>
#include <iostream>
#include <set>

/// process label in the json report
static const char reportProcessName[] = "AssemblyMapping";

static void copyUnfiltered(const std::string& fromFilename, const std::string& toFilename)
{
  boost::filesystem::copy_file(
      fromFilename, toFilename, boost::filesystem::copy_options::overwrite_existing);
}

static void writeFilteredBam(
    const PAMOptions& opt, const SequenceStore& store, const MappedFilterOutcome& outcome)
{
  const std::string bamFilename(opt.outputPrefix + "_filtered.bam");

  if (!outcome.isFiltered) {
    copyUnfiltered(opt.alignmentFilename, bamFilename);
    return;
  }

  std::set<std::string> keptContigIds;
  for (const unsigned recordIndex : outcome.filterResult.keptIndices) {
    keptContigIds.insert(store.getRecord(recordIndex).id);
  }

  const unsigned readCount(writeContigFilteredBam(opt.alignmentFilename, keptContigIds, bamFilename));
  log_os << "INFO: Wrote " << readCount << " reads to filtered alignment file '" << bamFilename << "'\n";

  if (!buildBamIndex(bamFilename.c_str())) {
    log_os << "WARNING: Can't index filtered alignment file '" << bamFilename
           << "', the input alignment may not be coordinate sorted\n";
  }
}

static void runPAM(const PAMOptions& opt)
{
  const std::string statusFilename(opt.outputPrefix + ".status");
  registerErrorStatusFile(statusFilename);

  SequenceStore store;
  parseFastaFile(opt.assemblyFilename, log_os, store);

  ContigCoverageTable coverageTable;
  parseContigCoverageTableFile(opt.coverageFilename, coverageTable);

  const MappedFilterOutcome outcome(
      filterMappedAssembly(store, coverageTable, opt.minCoverage, opt.genomeSizeMb, opt.maxContigs, log_os));

  const std::string assemblyFilename(opt.outputPrefix + "_filtered.assembly.fasta");
  if (outcome.isFiltered) {
    std::ofstream fastaOs;
    open_ofstream(fastaOs, assemblyFilename.c_str());
    writeFasta(store, outcome.filterResult.keptIndices, "", fastaOs);
  } else {
    copyUnfiltered(opt.assemblyFilename, assemblyFilename);
  }

  if (!opt.alignmentFilename.empty()) {
    writeFilteredBam(opt, store, outcome);
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
}

void ProcessAssemblyMapping::runInternal(int argc, char* argv[]) const
{
  PAMOptions opt;

  parsePAMOptions(*this, argc, argv, opt);
  runPAM(opt);
}
