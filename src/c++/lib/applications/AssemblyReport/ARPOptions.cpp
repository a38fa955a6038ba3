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

#include "ARPOptions.hpp"

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
  usage(os, prog, visible, "summarize an assembly and build its gc and coverage tracks", "", msg);
}

/// \return True if an error occurs while parsing options
static bool parseOptions(ARPOptions& opt, std::string& errorMsg)
{
  if (opt.sampleId.empty()) {
    errorMsg = "Must specify sample id";
    return true;
  }

  if (checkAndStandardizeRequiredInputFilePath(opt.assemblyFilename, "assembly", errorMsg)) return true;

  if (opt.windowSize == 0) {
    errorMsg = "Window size must be greater than zero";
    return true;
  }

  if (opt.isSkipTracks && ((!opt.depthFilename.empty()) || (!opt.alignmentFilename.empty()))) {
    errorMsg = "Depth table or alignment file can't be used with --no-tracks";
    return true;
  }

  if ((!opt.depthFilename.empty()) && (!opt.alignmentFilename.empty())) {
    errorMsg = "Only one of depth table or alignment file may be given";
    return true;
  }

  if (!opt.depthFilename.empty()) {
    if (checkAndStandardizeRequiredInputFilePath(opt.depthFilename, "depth table", errorMsg)) return true;
  }

  if (!opt.alignmentFilename.empty()) {
    if (checkAndStandardizeRequiredInputFilePath(opt.alignmentFilename, "alignment", errorMsg)) return true;
  }

  if (!opt.referenceFilename.empty()) {
    if (checkAndStandardizeRequiredInputFilePath(opt.referenceFilename, "reference fasta", errorMsg))
      return true;
  }

  return checkOutputPrefix(opt.outputPrefix, "output prefix", errorMsg);
}

void parseARPOptions(const asmqc::Program& prog, int argc, char* argv[], ARPOptions& opt)
{
  namespace po = boost::program_options;
  po::options_description req("configuration");
  // clang-format off
  req.add_options()
  ("sample", po::value(&opt.sampleId),
   "sample id used in the reports (required)")
  ("assembly", po::value(&opt.assemblyFilename),
   "assembly in fasta format, plain or compressed (required)")
  ("window-size", po::value(&opt.windowSize)->default_value(opt.windowSize),
   "window size of the gc and coverage tracks")
  ("no-tracks", po::bool_switch(&opt.isSkipTracks),
   "skip the gc and coverage tracks, required if contig headers have no '_NODE_<id>_' token")
  ("depth-file", po::value(&opt.depthFilename),
   "per-base depth table with 'contig position depth' rows, enables the coverage track")
  ("align-file", po::value(&opt.alignmentFilename),
   "alignment of reads to the assembly in BAM, CRAM or SAM format, enables the coverage track")
  ("ref", po::value(&opt.referenceFilename),
   "assembly fasta used to decode a CRAM alignment file")
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
