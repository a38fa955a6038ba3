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

#include "seqio/SequenceStore.hpp"

BOOST_AUTO_TEST_SUITE(SequenceStore_test_suite)

BOOST_AUTO_TEST_CASE(test_SequenceStoreOrder)
{
  SequenceStore store;
  bool          isRepeat(false);

  const unsigned index2(store.beginRecord("c2", isRepeat));
  BOOST_REQUIRE(!isRepeat);
  store.appendFragment(index2, "AC");
  store.appendFragment(index2, "GT");

  const unsigned index1(store.beginRecord("c1", isRepeat));
  store.appendFragment(index1, "A");

  BOOST_REQUIRE_EQUAL(store.size(), 2u);
  BOOST_REQUIRE_EQUAL(store.getRecord(0).id, "c2");
  BOOST_REQUIRE_EQUAL(store.getRecord(0).seq, "ACGT");
  BOOST_REQUIRE_EQUAL(store.getRecord(1).id, "c1");
  BOOST_REQUIRE_EQUAL(store.totalLength(), 5u);

  unsigned foundIndex(0);
  BOOST_REQUIRE(store.findRecord("c1", foundIndex));
  BOOST_REQUIRE_EQUAL(foundIndex, 1u);
  BOOST_REQUIRE(!store.findRecord("c3", foundIndex));
}

BOOST_AUTO_TEST_CASE(test_SequenceStoreRepeatedId)
{
  SequenceStore store;
  bool          isRepeat(false);

  store.appendFragment(store.beginRecord("c1", isRepeat), "AAAA");
  store.appendFragment(store.beginRecord("c2", isRepeat), "CC");

  const unsigned repeatIndex(store.beginRecord("c1", isRepeat));
  BOOST_REQUIRE(isRepeat);
  BOOST_REQUIRE_EQUAL(repeatIndex, 0u);
  store.appendFragment(repeatIndex, "GG");

  BOOST_REQUIRE_EQUAL(store.size(), 2u);
  BOOST_REQUIRE_EQUAL(store.getRecord(0).seq, "GG");
  BOOST_REQUIRE_EQUAL(store.getRecord(1).id, "c2");
}

BOOST_AUTO_TEST_SUITE_END()
