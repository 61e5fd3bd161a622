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
#include "newick_generator.hpp"
#include "sparse_tree_iterator.hpp"
#include "test_data.hpp"
#include "tree_sequence.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cctype>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using std::string;
using std::vector;

namespace {

vector<std::pair<locus_t, string>> collect(NewickGenerator trees) {
  vector<std::pair<locus_t, string>> result;
  while (auto tree = trees.next()) {
    result.push_back(*tree);
  }
  return result;
}

// Leaf labels are the numbers that directly follow '(' or ','
vector<int> leaf_labels(const string& newick) {
  vector<int> labels;
  for (std::size_t i = 0; i < newick.size(); ++i) {
    if ((newick[i] == '(' || newick[i] == ',') && i + 1 < newick.size() &&
        std::isdigit(static_cast<unsigned char>(newick[i + 1]))) {
      labels.push_back(std::stoi(newick.substr(i + 1)));
    }
  }
  std::sort(labels.begin(), labels.end());
  return labels;
}

int nesting_depth(const string& newick) {
  int depth = 0;
  int max_depth = 0;
  for (char c : newick) {
    if (c == '(') {
      max_depth = std::max(max_depth, ++depth);
    }
    else if (c == ')') {
      --depth;
    }
  }
  return max_depth;
}

// Number of edges on the longest path from a sample up to the root
int tree_height(const SparseTree& tree, node_id_t sample_size) {
  int height = 0;
  for (node_id_t sample = 1; sample <= sample_size; ++sample) {
    int edges = 0;
    for (auto it = tree.parent.find(sample); it != tree.parent.end();
         it = tree.parent.find(it->second)) {
      ++edges;
    }
    height = std::max(height, edges);
  }
  return height;
}

} // namespace

TEST_CASE("Newick trees")
{
  SECTION("Three samples")
  {
    TreeSequence ts = test_data::three_samples();
    auto trees = collect(ts.newick_trees());
    REQUIRE(trees.size() == 2);
    CHECK(trees[0].first == 5);
    CHECK(trees[0].second == "(3:1.000,(1:0.500,2:0.500):0.500);");
    CHECK(trees[1].first == 5);
    CHECK(trees[1].second == "(3:2.000,(1:0.500,2:0.500):1.500);");
  }

  SECTION("Four samples with a changing root")
  {
    TreeSequence ts = test_data::four_samples();
    auto trees = collect(ts.newick_trees());
    REQUIRE(trees.size() == 3);
    CHECK(trees[0] == std::make_pair(locus_t(40),
                                     string("((1:0.200,2:0.200):1.300,(3:0.400,4:0.400):1.100);")));
    CHECK(trees[1] == std::make_pair(locus_t(30),
                                     string("(4:1.200,(3:0.900,(1:0.200,2:0.200):0.700):0.300);")));
    CHECK(trees[2] == std::make_pair(locus_t(30),
                                     string("(4:2.500,(3:0.900,(1:0.200,2:0.200):0.700):1.600);")));
  }

  SECTION("Caterpillar at a single locus")
  {
    TreeSequence ts = test_data::caterpillar();
    auto trees = collect(ts.newick_trees());
    REQUIRE(trees.size() == 1);
    CHECK(trees[0].first == 1);
    CHECK(trees[0].second == "(((1:1.000,2:1.000):1.000,3:2.000):1.000,4:3.000);");
  }

  SECTION("Precision")
  {
    TreeSequence ts = test_data::three_samples();
    auto trees = collect(ts.newick_trees(1));
    REQUIRE(trees.size() == 2);
    CHECK(trees[0].second == "(3:1.0,(1:0.5,2:0.5):0.5);");
    CHECK(collect(test_data::caterpillar().newick_trees(0))[0].second ==
          "(((1:1,2:1):1,3:2):1,4:3);");
    CHECK_THROWS_AS(ts.newick_trees(-1), std::invalid_argument);
  }

  SECTION("Every breakpoint")
  {
    TreeSequence ts = test_data::three_samples();
    auto trees = collect(ts.newick_trees(3, true));
    REQUIRE(trees.size() == 4);
    CHECK(trees[0].first == 2);
    CHECK(trees[1].first == 3);
    CHECK(trees[2].first == 2);
    CHECK(trees[3].first == 3);
    CHECK(trees[0].second == trees[1].second);
    CHECK(trees[1].second == "(3:1.000,(1:0.500,2:0.500):0.500);");
    CHECK(trees[2].second == trees[3].second);
    CHECK(trees[3].second == "(3:2.000,(1:0.500,2:0.500):1.500);");
  }
}

TEST_CASE("Each sample appears once in every Newick tree")
{
  for (const TreeSequence& ts :
       {test_data::three_samples(), test_data::four_samples(), test_data::caterpillar()}) {
    vector<int> expected;
    for (int sample = 1; sample <= static_cast<int>(ts.get_sample_size()); ++sample) {
      expected.push_back(sample);
    }
    locus_t total = 0;
    for (const auto& tree : collect(ts.newick_trees())) {
      CHECK(leaf_labels(tree.second) == expected);
      CHECK(tree.second.back() == ';');
      CHECK(std::count(tree.second.begin(), tree.second.end(), '(') ==
            std::count(tree.second.begin(), tree.second.end(), ')'));
      total += tree.first;
    }
    CHECK(total == ts.get_num_loci());
  }
}

TEST_CASE("Newick nesting depth matches the tree height")
{
  for (const TreeSequence& ts :
       {test_data::three_samples(), test_data::four_samples(), test_data::caterpillar()}) {
    auto newick = collect(ts.newick_trees());
    SparseTreeIterator sparse = ts.sparse_trees();
    for (const auto& tree : newick) {
      std::optional<SparseTree> expected = sparse.next();
      REQUIRE(expected.has_value());
      CHECK(tree.first == expected->length);
      CHECK(nesting_depth(tree.second) == tree_height(*expected, ts.get_sample_size()));
    }
    CHECK_FALSE(sparse.next().has_value());
  }

  CHECK(nesting_depth(collect(test_data::caterpillar().newick_trees())[0].second) == 3);
  CHECK(nesting_depth(collect(test_data::four_samples().newick_trees())[1].second) == 3);
}

TEST_CASE("Newick trees of an incompletely coalesced sequence")
{
  TreeSequence ts = test_data::make_tree_sequence(3, 1, {0, 1},
                                                  {CoalescenceRecord(0, 1, {1, 2}, 4, 1.0)});
  NewickGenerator trees = ts.newick_trees();
  CHECK_THROWS_AS(trees.next(), IncompleteCoalescenceError);
  CHECK_FALSE(trees.next().has_value());
}

TEST_CASE("No Newick tree follows an incomplete interval")
{
  // Sample 3 is missing on [0, 5) but joined on [5, 10)
  TreeSequence ts = test_data::make_tree_sequence(3, 10, {0, 5, 10},
                                                  {CoalescenceRecord(0, 10, {1, 2}, 4, 1.0),
                                                   CoalescenceRecord(5, 10, {3, 4}, 5, 2.0)});
  NewickGenerator trees = ts.newick_trees();
  CHECK_THROWS_AS(trees.next(), IncompleteCoalescenceError);
  CHECK_FALSE(trees.next().has_value());
  CHECK_FALSE(trees.next().has_value());
}
