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

#include "PAMOptions.hpp"

#include "blt_util/log.hpp"
#include "common/Exceptions.hpp"
#include "common/ProgramUtil.hpp"
#include "options/optionsUtil.hpp"

#include "boost/program_options.hpp"

#include <iostream>

static void usage(
    std::ostream&                                      os,
    const asmqc::Program&                              prog,
    const boost::program_options::options_description& visible,
    const char*                                        msg = nullptr)
{
  usage(os, prog, visible, "filter assembly contigs on read coverage", "", msg);
}

/// \return True if an error occurs while parsing options
static bool parseOptions(const std::string& minCoverageText, PAMOptions& opt, std::string& errorMsg)
{
  if (opt.sampleId.empty()) {
    errorMsg = "Must specify sample id";
    return true;
  }

  if (checkAndStandardizeRequiredInputFilePath(opt.assemblyFilename, "assembly", errorMsg)) return true;
  if (checkAndStandardizeRequiredInputFilePath(opt.coverageFilename, "contig coverage", errorMsg)) return true;

  if (!opt.alignmentFilename.empty()) {
    if (checkAndStandardizeRequiredInputFilePath(opt.alignmentFilename, "alignment", errorMsg)) return true;
  }

  if (checkPositiveValue(opt.genomeSizeMb, "expected genome size", errorMsg)) return true;

  try {
    opt.minCoverage = parseCoverageThreshold(minCoverageText);
  } catch (const asmqc::common::InvalidParameterException& e) {
    errorMsg = e.getMessage();
    return true;
  }

  return checkOutputPrefix(opt.outputPrefix, "output prefix", errorMsg);
}

void parsePAMOptions(const asmqc::Program& prog, int argc, char* argv[], PAMOptions& opt)
{
  std::string minCoverageText("auto");

  namespace po = boost::program_options;
  po::options_description req("configuration");
  // clang-format off
  req.add_options()
  ("sample", po::value(&opt.sampleId),
   "sample id (required)")
  ("assembly", po::value(&opt.assemblyFilename),
   "assembly in fasta format, plain or compressed (required)")
  ("coverage-file", po::value(&opt.coverageFilename),
   "per-contig coverage table with 'contig coverage' rows (required)")
  ("align-file", po::value(&opt.alignmentFilename),
   "alignment of reads to the assembly in BAM, CRAM or SAM format. If given, reads on kept contigs are "
   "written to a filtered BAM file")
  ("min-coverage", po::value(&minCoverageText)->default_value(minCoverageText),
   "minimum contig coverage, either a number or 'auto' to use 30% of the mean assembly coverage "
   "with a floor of 10")
  ("genome-size", po::value(&opt.genomeSizeMb),
   "expected genome size in Mb (required)")
  ("max-contigs", po::value(&opt.maxContigs)->default_value(opt.maxContigs),
   "maximum number of contigs per 1.5 Mb of expected genome size before a warning is raised")
  ("output-prefix", po::value(&opt.outputPrefix),
   "prefix of all output files (required)")
  ;
  // clang-format on

  po::options_description help("help");
  help.add_options()("help,h", "print this message");

  po::options_description visible("options");
  visible.add(req).add(help);

  bool              po_parse_fail(false);
  po::variables_map vm;
  try {
    po::store(
        po::parse_command_line(
            argc, argv, visible, po::command_line_style::unix_style ^ po::command_line_style::allow_short),
        vm);
    po::notify(vm);
  } catch (const boost::program_options::error& e) {
    log_os << "\nERROR: Exception thrown by option parser: " << e.what() << "\n";
    po_parse_fail = true;
  }

  if ((argc <= 1) || (vm.count("help")) || po_parse_fail) {
    usage(log_os, prog, visible);
  }

  std::string errorMsg;
  if (parseOptions(minCoverageText, opt, errorMsg)) {
    usage(log_os, prog, visible, errorMsg.c_str());
  }
}
