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

#include "seqio/FastaWriter.hpp"

#include <sstream>

BOOST_AUTO_TEST_SUITE(FastaWriter_test_suite)

static void addRecord(const std::string& id, const std::string& seq, SequenceStore& store)
{
  bool isRepeat(false);
  store.appendFragment(store.beginRecord(id, isRepeat), seq);
}

BOOST_AUTO_TEST_CASE(test_writeFasta)
{
  SequenceStore store;
  addRecord("NODE_1", "ACGT", store);
  addRecord("NODE_2", "GG", store);
  addRecord("NODE_3", "TTT", store);

  std::ostringstream oss;
  writeFasta(store, {0, 2}, "sampleA", oss);
  BOOST_REQUIRE_EQUAL(oss.str(), ">sampleA_NODE_1\nACGT\n>sampleA_NODE_3\nTTT\n");

  std::ostringstream oss2;
  writeFasta(store, "", oss2);
  BOOST_REQUIRE_EQUAL(oss2.str(), ">NODE_1\nACGT\n>NODE_2\nGG\n>NODE_3\nTTT\n");
}

BOOST_AUTO_TEST_SUITE_END()
