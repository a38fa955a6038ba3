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

#include "stats/AssemblySummary.hpp"

#include "common/Exceptions.hpp"

#include <algorithm>
#include <cctype>
#include <functional>
#include <sstream>

bool operator==(const AssemblySummary& lhs, const AssemblySummary& rhs)
{
  return ((lhs.contigCount == rhs.contigCount) && (lhs.avgContigSize == rhs.avgContigSize) &&
          (lhs.n50 == rhs.n50) && (lhs.totalLength == rhs.totalLength) && (lhs.avgGc == rhs.avgGc) &&
          (lhs.missingData == rhs.missingData));
}

AssemblySummary summarizeAssembly(const SequenceStore& store)
{
  using namespace asmqc::common;

  if (store.empty()) {
    BOOST_THROW_EXCEPTION(GeneralException("Can't summarize an assembly with no contigs"));
  }

  AssemblySummary summary;
  summary.contigCount = store.size();

  double gcSum(0);
  for (const SequenceRecord& record : store) {
    if (record.seq.empty()) {
      std::ostringstream oss;
      oss << "Can't compute GC proportion of zero-length contig '" << record.id << "'";
      BOOST_THROW_EXCEPTION(GeneralException(oss.str()));
    }
    summary.totalLength += record.size();
    gcSum += gcProportion(record.seq);
    summary.missingData += countMissingBases(record.seq);
  }

  summary.avgContigSize = static_cast<double>(summary.totalLength) / summary.contigCount;
  summary.avgGc         = gcSum / summary.contigCount;
  summary.n50           = computeN50(getContigSizeDistribution(store));
  return summary;
}

unsigned computeN50(const std::vector<unsigned>& lengths)
{
  if (lengths.empty()) {
    BOOST_THROW_EXCEPTION(asmqc::common::GeneralException("Can't compute N50 of an empty length list"));
  }

  std::vector<unsigned> sorted(lengths);
  std::sort(sorted.begin(), sorted.end(), std::greater<unsigned>());

  uint64_t totalLength(0);
  for (const unsigned length : sorted) totalLength += length;
  const double halfLength(totalLength / 2.);

  uint64_t cumulativeLength(0);
  for (const unsigned length : sorted) {
    cumulativeLength += length;
    if (cumulativeLength >= halfLength) return length;
  }
  return sorted.back();
}

double gcProportion(const std::string& seq)
{
  const auto gcCount(std::count(seq.begin(), seq.end(), 'G') + std::count(seq.begin(), seq.end(), 'C'));
  return static_cast<double>(gcCount) / seq.size();
}

double gcProportionCaseInsensitive(std::string::const_iterator begin, std::string::const_iterator end)
{
  unsigned gcCount(0);
  for (auto iter(begin); iter != end; ++iter) {
    const char c(tolower(*iter));
    if ((c == 'g') || (c == 'c')) gcCount++;
  }
  return static_cast<double>(gcCount) / std::distance(begin, end);
}

uint64_t countMissingBases(const std::string& seq)
{
  return std::count(seq.begin(), seq.end(), 'N');
}

std::vector<unsigned> getContigSizeDistribution(const SequenceStore& store)
{
  std::vector<unsigned> sizes;
  sizes.reserve(store.size());
  for (const SequenceRecord& record : store) sizes.push_back(record.size());
  return sizes;
}
