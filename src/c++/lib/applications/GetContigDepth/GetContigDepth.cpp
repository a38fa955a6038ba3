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

#include "GetContigDepth.hpp"
#include "GCDOptions.hpp"

#include "common/OutStream.hpp"
#include "stats/AlignmentDepth.hpp"

static void getContigDepth(const GCDOptions& opt)
{
  // check that we have write permission on the output file early:
  {
    OutStream outs(opt.outputFilename);
  }

  DepthTable                     depthTable;
  const char*                    referenceFilename(opt.referenceFilename.empty() ? nullptr : opt.referenceFilename.c_str());
  const std::vector<std::string> contigOrder(readAlignmentDepth(opt.alignmentFilename, referenceFilename, depthTable));

  OutStream outs(opt.outputFilename);
  depthTable.write(contigOrder, outs.getStream());
}

void GetContigDepth::runInternal(int argc, char* argv[]) const
{
  GCDOptions opt;

  parseGCDOptions(*this, argc, argv, opt);
  getContigDepth(opt);
}
