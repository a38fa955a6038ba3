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
/// contig filtering and health check of a SPAdes assembly, with a relaxed retry for short assemblies
///

#pragma once

#include "filter/ContigFilter.hpp"
#include "filter/HealthVerdict.hpp"

#include <iosfwd>
#include <vector>

struct SpadesFilterOptions {
  unsigned minContigLength = 200;
  double   minKmerCoverage = 2;

  /// contig count allowed per 1.5 Mb of expected genome size
  unsigned maxContigs = defaultMaxContigsPerGenomeUnit;

  double minGc        = defaultMinGcProportion;
  double genomeSizeMb = 0;

  /// additional rules applied after the length and k-mer coverage rules
  std::vector<FilterRule> extraRules;
};

struct SpadesFilterOutcome {
  ContigFilterResult filterResult;

  /// true if the full rule set left the assembly too short and only the length rule was applied
  bool isLengthOnlyRetry = false;

  HealthVerdict verdict;
};

/// \brief Filter the contigs of a SPAdes assembly and classify the result
///
/// Contigs are filtered on 'length >= minContigLength', 'kmer_cov >= minKmerCoverage' and any extra
/// rules. If the kept length falls below 80% of the expected genome size, the contigs are filtered
/// again with the length rule only. The gc bounds are applied in both passes.
///
SpadesFilterOutcome filterSpadesAssembly(
    const std::vector<ContigCoverageEntry>& entries, const SpadesFilterOptions& opt, std::ostream& logOs);
