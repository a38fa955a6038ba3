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

#include "PSOptions.hpp"

#include "blt_util/log.hpp"
#include "common/Exceptions.hpp"
#include "common/ProgramUtil.hpp"
#include "options/optionsUtil.hpp"

#include "boost/program_options.hpp"

#include <iostream>

typedef std::vector<std::string> rules_t;

static void usage(
    std::ostream&                                      os,
    const asmqc::Program&                              prog,
    const boost::program_options::options_description& visible,
    const char*                                        msg = nullptr)
{
  usage(os, prog, visible, "filter the contigs of a SPAdes assembly and check its size", "", msg);
}

/// \return True if an error occurs while parsing options
static bool parseOptions(const boost::program_options::variables_map& vm, PSOptions& opt, std::string& errorMsg)
{
  if (opt.sampleId.empty()) {
    errorMsg = "Must specify sample id";
    return true;
  }

  if (checkAndStandardizeRequiredInputFilePath(opt.assemblyFilename, "assembly", errorMsg)) return true;
  if (checkPositiveValue(opt.filter.genomeSizeMb, "expected genome size", errorMsg)) return true;

  if ((opt.filter.minGc < 0) || (opt.filter.minGc > 0.5)) {
    errorMsg = "Minimum gc proportion must be in [0,0.5]";
    return true;
  }

  if (vm.count("filter-rule")) {
    for (const std::string& ruleText : boost::any_cast<rules_t>(vm["filter-rule"].value())) {
      try {
        opt.filter.extraRules.push_back(parseFilterRule(ruleText));
      } catch (const asmqc::common::InvalidParameterException& e) {
        errorMsg = e.getMessage();
        return true;
      }
    }
  }

  return checkOutputPrefix(opt.outputPrefix, "output prefix", errorMsg);
}

void parsePSOptions(const asmqc::Program& prog, int argc, char* argv[], PSOptions& opt)
{
  namespace po = boost::program_options;
  po::options_description req("configuration");
  // clang-format off
  req.add_options()
  ("sample", po::value(&opt.sampleId),
   "sample id, used as the header prefix of the filtered assembly (required)")
  ("assembly", po::value(&opt.assemblyFilename),
   "SPAdes contigs in fasta format, plain or compressed (required)")
  ("genome-size", po::value(&opt.filter.genomeSizeMb),
   "expected genome size in Mb (required)")
  ("min-contig-length", po::value(&opt.filter.minContigLength)->default_value(opt.filter.minContigLength),
   "minimum contig length")
  ("min-kmer-coverage", po::value(&opt.filter.minKmerCoverage)->default_value(opt.filter.minKmerCoverage),
   "minimum contig k-mer coverage, taken from the SPAdes contig header")
  ("max-contigs", po::value(&opt.filter.maxContigs)->default_value(opt.filter.maxContigs),
   "maximum number of contigs per 1.5 Mb of expected genome size before a warning is raised")
  ("min-gc", po::value(&opt.filter.minGc)->default_value(opt.filter.minGc),
   "contigs with gc proportion below this value or above one minus this value are removed")
  ("filter-rule", po::value<rules_t>(),
   "additional contig filter rule in the form 'key/op/value', for example 'n_prop/<=/0.1'. "
   "Keys: length, kmer_cov, gc_prop, at_prop, n_prop. May be supplied more than once.")
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
  if (parseOptions(vm, opt, errorMsg)) {
    usage(log_os, prog, visible, errorMsg.c_str());
  }
}
