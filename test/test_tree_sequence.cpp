/*
  This file is part of the tree-seq-lib coalescent tree sequence
  analysis software.
  Copyright (C) 2024 tree-seq-lib Developers.

  This program is free software: you can redistribute it and/or modify
  it under the terms of the GNU General Public License as published by
  the Free Software Foundation, either version 3 of the License, or
  (at your option) any later version.

  This program is distributed in the hope that it will be useful,
  but WITHOUT ANY WARRANTY; without even the implied warranty of
  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
  GNU General Public License for more details.

  You should have received a copy of the GNU General Public License
  along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#include "errors.hpp"
#include "test_data.hpp"
#include "tree_sequence.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <sstream>
#include <vector>

using std::vector;

TEST_CASE("Tree sequence construction")
{
  SECTION("Getters")
  {
    TreeSequence ts = test_data::three_samples();
    CHECK(ts.get_sample_size() == 3);
    CHECK(ts.get_num_loci() == 10);
    CHECK(ts.get_num_records() == 3);
    CHECK(ts.get_max_node_id() == 6);
    CHECK(ts.get_breakpoints() == vector<locus_t>{0, 2, 5, 7, 10});
    CHECK(ts.get_left() == vector<locus_t>{0, 0, 5});
    CHECK(ts.get_right() == vector<locus_t>{10, 5, 10});

    CoalescenceRecord record = ts.record(2);
    CHECK(record.left == 5);
    CHECK(record.right == 10);
    CHECK(record.children == std::array<node_id_t, 2>{3, 4});
    CHECK(record.parent == 6);
    CHECK(record.time == 2.0);
  }

  SECTION("Records are sorted by left, keeping the input order of ties")
  {
    TreeSequence ts = test_data::make_tree_sequence(3, 10, {0, 5, 10},
                                                    {CoalescenceRecord(5, 10, {3, 4}, 6, 2.0),
                                                     CoalescenceRecord(0, 10, {1, 2}, 4, 0.5),
                                                     CoalescenceRecord(0, 5, {3, 4}, 5, 1.0)});
    CHECK(ts.get_left() == vector<locus_t>{0, 0, 5});
    CHECK(ts.get_parent() == vector<node_id_t>{4, 5, 6});
    CHECK(ts.get_time() == vector<ts_real_t>{0.5, 1.0, 2.0});
  }

  SECTION("Print state")
  {
    TreeSequence ts = test_data::three_samples();
    std::ostringstream oss;
    ts.print_state(oss);
    CHECK_THAT(oss.str(), Catch::Matchers::ContainsSubstring("\"sample_size\": 3"));
    CHECK_THAT(oss.str(), Catch::Matchers::ContainsSubstring("5\t10\t(3, 4)\t6\t2"));
  }
}

TEST_CASE("Malformed tree sequences")
{
  using test_data::make_tree_sequence;

  SECTION("Sample size below two")
  {
    CHECK_THROWS_AS(make_tree_sequence(1, 1, {0, 1}, {CoalescenceRecord(0, 1, {1, 2}, 3, 1.0)}),
                    MalformedInputError);
  }

  SECTION("Breakpoints not covering the loci")
  {
    CHECK_THROWS_AS(make_tree_sequence(2, 10, {0, 5}, {CoalescenceRecord(0, 10, {1, 2}, 3, 1.0)}),
                    MalformedInputError);
    CHECK_THROWS_AS(make_tree_sequence(2, 10, {0, 5, 5, 10},
                                       {CoalescenceRecord(0, 10, {1, 2}, 3, 1.0)}),
                    MalformedInputError);
  }

  SECTION("No records")
  {
    CHECK_THROWS_AS(make_tree_sequence(2, 10, {0, 10}, {}), MalformedInputError);
  }

  SECTION("Empty or out of range interval")
  {
    CHECK_THROWS_AS(make_tree_sequence(2, 10, {0, 10}, {CoalescenceRecord(0, 0, {1, 2}, 3, 1.0)}),
                    MalformedInputError);
    CHECK_THROWS_AS(make_tree_sequence(2, 10, {0, 10}, {CoalescenceRecord(0, 11, {1, 2}, 3, 1.0)}),
                    MalformedInputError);
  }

  SECTION("First record does not start at 0")
  {
    CHECK_THROWS_AS(make_tree_sequence(2, 10, {0, 10}, {CoalescenceRecord(2, 10, {1, 2}, 3, 1.0)}),
                    MalformedInputError);
  }

  SECTION("Bad node IDs")
  {
    CHECK_THROWS_AS(make_tree_sequence(2, 10, {0, 10}, {CoalescenceRecord(0, 10, {0, 2}, 3, 1.0)}),
                    MalformedInputError);
    CHECK_THROWS_AS(make_tree_sequence(2, 10, {0, 10}, {CoalescenceRecord(0, 10, {1, 2}, 2, 1.0)}),
                    MalformedInputError);
  }

  SECTION("Columns of different lengths")
  {
    CHECK_THROWS_AS(TreeSequence({0, 10}, {0}, {10, 10}, {{1, 2}}, {3}, {1.0},
                                 test_data::make_parameters(2, 10)),
                    MalformedInputError);
  }
}
