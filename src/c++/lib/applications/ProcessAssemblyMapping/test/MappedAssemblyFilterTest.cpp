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

#include "boost/test/unit_test.hpp"

#include "applications/ProcessAssemblyMapping/MappedAssemblyFilter.hpp"
#include "common/Exceptions.hpp"

#include <sstream>

static void addContig(const std::string& id, const unsigned length, SequenceStore& store)
{
  std::string seq;
  while (seq.size() < length) seq += "ACGT";
  seq.resize(length);

  bool isRepeat(false);
  store.appendFragment(store.beginRecord(id, isRepeat), seq);
}

static void addRow(const std::string& id, const unsigned coverage, ContigCoverageTable& table)
{
  ContigCoverageRow row;
  row.contigId = id;
  row.coverage = coverage;
  row.length   = parseHeaderLength(id);
  table.addRow(row);
}

struct MappedAssemblyFixture {
  MappedAssemblyFixture()
  {
    addContig("NODE_1_length_60_cov_5.0", 60, store);
    addContig("NODE_2_length_40_cov_5.0", 40, store);
    addContig("NODE_3_length_20_cov_1.0", 20, store);

    addRow("NODE_1_length_60_cov_5.0", 50, table);
    addRow("NODE_2_length_40_cov_5.0", 40, table);
    addRow("NODE_3_length_20_cov_1.0", 3, table);
  }

  SequenceStore       store;
  ContigCoverageTable table;

  /// 100 bp expected genome, so 80 bp is the minimum assembly length
  const double genomeSizeMb = 0.0001;
};

BOOST_FIXTURE_TEST_SUITE(MappedAssemblyFilter_test_suite, MappedAssemblyFixture)

BOOST_AUTO_TEST_CASE(test_autoThresholdFiltered)
{
  std::ostringstream        logOs;
  const MappedFilterOutcome outcome(
      filterMappedAssembly(store, table, CoverageThreshold(), genomeSizeMb, 100000, logOs));

  // mean coverage is 93/120, so the floor of 10 applies
  BOOST_REQUIRE_EQUAL(outcome.minCoverage, 10.);
  BOOST_REQUIRE(outcome.isFiltered);

  const std::vector<unsigned> expectedKept = {0, 1};
  BOOST_REQUIRE_EQUAL_COLLECTIONS(
      outcome.filterResult.keptIndices.begin(),
      outcome.filterResult.keptIndices.end(),
      expectedKept.begin(),
      expectedKept.end());
  BOOST_REQUIRE_EQUAL(outcome.filterResult.keptLength, 100u);
  BOOST_REQUIRE(outcome.verdict.isPass());
}

BOOST_AUTO_TEST_CASE(test_fixedThresholdKeepsUnfiltered)
{
  std::ostringstream        logOs;
  const MappedFilterOutcome outcome(
      filterMappedAssembly(store, table, CoverageThreshold(45), genomeSizeMb, 100000, logOs));

  BOOST_REQUIRE_EQUAL(outcome.minCoverage, 45.);
  BOOST_REQUIRE(!outcome.isFiltered);
  BOOST_REQUIRE_EQUAL(outcome.filterResult.keptLength, 60u);

  // the unfiltered assembly of 120 bp is classified
  BOOST_REQUIRE(outcome.verdict.isPass());
  BOOST_REQUIRE(logOs.str().find("kept unfiltered") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(test_missingCoverageRow)
{
  addContig("NODE_4_length_20_cov_1.0", 20, store);

  std::ostringstream logOs;
  BOOST_REQUIRE_THROW(
      filterMappedAssembly(store, table, CoverageThreshold(), genomeSizeMb, 100000, logOs),
      asmqc::common::MissingContigDataException);
}

BOOST_AUTO_TEST_SUITE_END()
