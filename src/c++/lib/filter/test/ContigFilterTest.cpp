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

#include "common/Exceptions.hpp"
#include "filter/ContigFilter.hpp"

static ContigCoverageEntry makeEntry(const std::string& id, const std::string& seq, const double coverage)
{
  ContigCoverageEntry entry;
  entry.contigId = id;
  entry.coverage = coverage;
  setSequenceComposition(seq, entry);
  return entry;
}

static std::vector<ContigCoverageEntry> getTestEntries()
{
  std::vector<ContigCoverageEntry> entries;
  entries.push_back(makeEntry("c0", "ACGTACGTAC", 10));
  entries.push_back(makeEntry("c1", "ACGT", 10));
  entries.push_back(makeEntry("c2", "ACGTACGTAC", 1));
  entries.push_back(makeEntry("c3", "ACG", 1));
  entries.push_back(makeEntry("c4", "AAAAATTTTT", 10));
  return entries;
}

BOOST_AUTO_TEST_SUITE(ContigFilter_test_suite)

BOOST_AUTO_TEST_CASE(test_gcBoundsAppended)
{
  const ContigFilter filter({parseFilterRule("length >= 5")});
  BOOST_REQUIRE_EQUAL(filter.getRules().size(), 3u);
  BOOST_REQUIRE_EQUAL(filter.getRules()[1].describe(), "gc_prop >= 0.05");
  BOOST_REQUIRE_EQUAL(filter.getRules()[2].describe(), "gc_prop <= 0.95");

  const ContigFilter filter2({}, FILTER_MODE::ALL, 0.1);
  BOOST_REQUIRE_EQUAL(filter2.getRules().size(), 2u);
  BOOST_REQUIRE_EQUAL(filter2.getRules()[1].describe(), "gc_prop <= 0.9");

  BOOST_REQUIRE_THROW(ContigFilter({}, FILTER_MODE::ALL, 0.6), asmqc::common::InvalidParameterException);
}

BOOST_AUTO_TEST_CASE(test_allMode)
{
  const ContigFilter filter({parseFilterRule("length >= 5"), parseFilterRule("kmer_cov >= 2")});
  const ContigFilterResult result(filter.apply(getTestEntries()));

  const std::vector<unsigned> expectedKept = {0};
  BOOST_REQUIRE_EQUAL_COLLECTIONS(
      result.keptIndices.begin(), result.keptIndices.end(), expectedKept.begin(), expectedKept.end());
  BOOST_REQUIRE_EQUAL(result.keptLength, 10u);

  BOOST_REQUIRE_EQUAL(result.outcomes.size(), 5u);
  BOOST_REQUIRE_EQUAL(result.outcomes[0], "pass");
  BOOST_REQUIRE_EQUAL(result.outcomes[1], "length/4/5");
  BOOST_REQUIRE_EQUAL(result.outcomes[2], "kmer_cov/1.0/2");

  // first failing rule is reported:
  BOOST_REQUIRE_EQUAL(result.outcomes[3], "length/3/5");
  BOOST_REQUIRE_EQUAL(result.outcomes[4], "gc_prop/0.0/0.05");
}

BOOST_AUTO_TEST_CASE(test_anyMode)
{
  const ContigFilter filter({parseFilterRule("length >= 5"), parseFilterRule("kmer_cov >= 2")}, FILTER_MODE::ANY);
  const ContigFilterResult result(filter.apply(getTestEntries()));

  // the two gc bounds can't fail together, so every contig passes at least one rule
  BOOST_REQUIRE_EQUAL(result.keptIndices.size(), 5u);
  BOOST_REQUIRE_EQUAL(result.keptLength, 37u);
  for (const std::string& outcome : result.outcomes) {
    BOOST_REQUIRE_EQUAL(outcome, "pass");
  }
}

BOOST_AUTO_TEST_CASE(test_emptyInput)
{
  const ContigFilter       filter({parseFilterRule("length >= 5")});
  const ContigFilterResult result(filter.apply(std::vector<ContigCoverageEntry>()));
  BOOST_REQUIRE(result.keptIndices.empty());
  BOOST_REQUIRE(result.outcomes.empty());
}

BOOST_AUTO_TEST_SUITE_END()
