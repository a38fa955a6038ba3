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
#include "stats/WindowTrack.hpp"

BOOST_AUTO_TEST_SUITE(WindowTrack_test_suite)

static void addRecord(const std::string& id, const std::string& seq, SequenceStore& store)
{
  bool isRepeat(false);
  store.appendFragment(store.beginRecord(id, isRepeat), seq);
}

static SequenceStore getTestStore()
{
  SequenceStore store;
  addRecord("s_NODE_1_length_6_cov_2.0", "GGccAA", store);
  addRecord("s_NODE_2_length_4_cov_2.0", "ATAT", store);
  return store;
}

BOOST_AUTO_TEST_CASE(test_buildGcWindowTrack)
{
  const WindowTrack track(buildGcWindowTrack(getTestStore(), 4));

  // windows [0,4) [4,8) [8,10)
  BOOST_REQUIRE_EQUAL(track.size(), 3u);
  BOOST_REQUIRE_CLOSE(track.values[0], 1.0, 0.0001);
  BOOST_REQUIRE_CLOSE(track.values[1], 0.0, 0.0001);
  BOOST_REQUIRE_CLOSE(track.values[2], 0.0, 0.0001);

  BOOST_REQUIRE_EQUAL(track.labels[0], 1u);
  BOOST_REQUIRE_EQUAL(track.labels[1], 1u);
  BOOST_REQUIRE_EQUAL(track.labels[2], 2u);

  BOOST_REQUIRE_EQUAL(track.positions[2], 8u);

  BOOST_REQUIRE_EQUAL(track.boundaries.size(), 2u);
  BOOST_REQUIRE_EQUAL(track.boundaries[0].nodeId, 1u);
  BOOST_REQUIRE_EQUAL(track.boundaries[0].end, 6u);
  BOOST_REQUIRE_EQUAL(track.boundaries[1].end, 10u);
}

BOOST_AUTO_TEST_CASE(test_buildGcWindowTrack_errors)
{
  BOOST_REQUIRE_THROW(buildGcWindowTrack(getTestStore(), 0), asmqc::common::InvalidParameterException);

  SequenceStore store;
  addRecord("contig1", "ACGT", store);
  BOOST_REQUIRE_THROW(buildGcWindowTrack(store, 2), asmqc::common::InputFormatException);
}

BOOST_AUTO_TEST_CASE(test_buildCoverageWindowTrack)
{
  DepthTable depthTable;
  for (unsigned i(0); i < 6; ++i) depthTable.addDepth("s_NODE_1_length_6_cov_2.0", 2);
  for (unsigned i(0); i < 4; ++i) depthTable.addDepth("s_NODE_2_length_4_cov_2.0", 5);

  const WindowTrack track(buildCoverageWindowTrack(getTestStore(), depthTable, 5));
  BOOST_REQUIRE_EQUAL(track.size(), 2u);
  BOOST_REQUIRE_CLOSE(track.values[0], 2.0, 0.0001);
  BOOST_REQUIRE_CLOSE(track.values[1], (2. + 4 * 5.) / 5., 0.0001);
  BOOST_REQUIRE_EQUAL(track.labels[1], 1u);
}

BOOST_AUTO_TEST_CASE(test_buildCoverageWindowTrack_missing_contig)
{
  DepthTable depthTable;
  depthTable.addDepth("s_NODE_1_length_6_cov_2.0", 2);

  BOOST_REQUIRE_THROW(
      buildCoverageWindowTrack(getTestStore(), depthTable, 5), asmqc::common::MissingContigDataException);
}

BOOST_AUTO_TEST_CASE(test_buildCoverageWindowTrack_depth_past_assembly_end)
{
  DepthTable depthTable;
  for (unsigned i(0); i < 12; ++i) depthTable.addDepth("s_NODE_1_length_6_cov_2.0", 1);
  depthTable.addDepth("s_NODE_2_length_4_cov_2.0", 1);

  BOOST_REQUIRE_THROW(
      buildCoverageWindowTrack(getTestStore(), depthTable, 4), asmqc::common::InputFormatException);
}

BOOST_AUTO_TEST_SUITE_END()
