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

#include "ICOptions.hpp"

#include "blt_util/log.hpp"
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
  usage(os, prog, visible, "check read file integrity, quality encoding and expected coverage", "", msg);
}

/// \return True if an error occurs while parsing options
static bool parseOptions(ICOptions& opt, std::string& errorMsg)
{
  if (opt.sampleId.empty()) {
    errorMsg = "Must specify sample id";
    return true;
  }

  if (checkAndStandardizeRequiredInputFilePaths(opt.readFilenames, "read", errorMsg)) return true;
  if (checkPositiveValue(opt.coverage.genomeSizeMb, "expected genome size", errorMsg)) return true;

  if (opt.coverage.minCoverage < 0) {
    errorMsg = "Minimum coverage can't be negative";
    return true;
  }

  return checkOutputPrefix(opt.outputPrefix, "output prefix", errorMsg);
}

void parseICOptions(const asmqc::Program& prog, int argc, char* argv[], ICOptions& opt)
{
  namespace po = boost::program_options;
  po::options_description req("configuration");
  // clang-format off
  req.add_options()
  ("sample", po::value(&opt.sampleId),
   "sample id used in the coverage report (required)")
  ("reads", po::value(&opt.readFilenames),
   "fastq file, plain or compressed with gzip, bzip2 or zip. May be supplied more than once, "
   "all files are read as one stream in the order given. At least one entry required.")
  ("genome-size", po::value(&opt.coverage.genomeSizeMb),
   "expected genome size in Mb (required)")
  ("min-coverage", po::value(&opt.coverage.minCoverage)->default_value(opt.coverage.minCoverage),
   "minimum expected coverage for the sample to pass")
  ("skip-encoding", po::bool_switch(&opt.coverage.isSkipEncoding),
   "don't infer the quality score encoding")
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
  if (parseOptions(opt, errorMsg)) {
    usage(log_os, prog, visible, errorMsg.c_str());
  }
}
