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

#include "filter/ContigCoverageEntry.hpp"

#include "blt_util/parse_util.hpp"
#include "common/Exceptions.hpp"
#include "filter/ContigCoverageTable.hpp"

#include <sstream>

void setSequenceComposition(const std::string& seq, ContigCoverageEntry& entry)
{
  if (seq.empty()) {
    std::ostringstream oss;
    oss << "Can't compute base composition of zero-length contig '" << entry.contigId << "'";
    BOOST_THROW_EXCEPTION(asmqc::common::InputFormatException(oss.str()));
  }

  entry.length  = seq.size();
  entry.atCount = 0;
  entry.gcCount = 0;
  for (const char base : seq) {
    switch (base) {
    case 'A':
    case 'T':
      entry.atCount++;
      break;
    case 'G':
    case 'C':
      entry.gcCount++;
      break;
    default:
      break;
    }
  }
  entry.nCount = entry.length - (entry.atCount + entry.gcCount);

  entry.atProp = static_cast<double>(entry.atCount) / entry.length;
  entry.gcProp = static_cast<double>(entry.gcCount) / entry.length;
  entry.nProp  = static_cast<double>(entry.nCount) / entry.length;
}

double parseHeaderKmerCoverage(const std::string& header)
{
  const size_t lastSep(header.rfind('_'));
  const std::string token((lastSep == std::string::npos) ? header : header.substr(lastSep + 1));
  try {
    return asmqc::blt_util::parse_double_str(token);
  } catch (const asmqc::common::InputFormatException&) {
    std::ostringstream oss;
    oss << "Can't parse k-mer coverage from the last '_' token of contig header '" << header << "'";
    BOOST_THROW_EXCEPTION(asmqc::common::InputFormatException(oss.str()));
  }
}

std::vector<ContigCoverageEntry> buildSpadesContigEntries(const SequenceStore& store)
{
  std::vector<ContigCoverageEntry> entries;
  entries.reserve(store.size());
  for (const SequenceRecord& record : store) {
    ContigCoverageEntry entry;
    entry.contigId = record.id;
    entry.coverage = parseHeaderKmerCoverage(record.id);
    setSequenceComposition(record.seq, entry);
    entries.push_back(entry);
  }
  return entries;
}

std::vector<ContigCoverageEntry> buildMappedContigEntries(
    const SequenceStore& store, const ContigCoverageTable& coverageTable)
{
  std::vector<ContigCoverageEntry> entries;
  entries.reserve(store.size());
  for (const SequenceRecord& record : store) {
    ContigCoverageEntry entry;
    entry.contigId = record.id;
    entry.coverage = coverageTable.getContig(record.id).coverage;
    setSequenceComposition(record.seq, entry);
    entries.push_back(entry);
  }
  return entries;
}
