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

#ifndef TREE_SEQ_LIB_NEWICK_GENERATOR_H
#define TREE_SEQ_LIB_NEWICK_GENERATOR_H

#include "coalescence_record.hpp"
#include "diff_iterator.hpp"
#include "node_arena.hpp"
#include "tree_sequence.hpp"
#include "types.hpp"

#include <boost/dynamic_bitset.hpp>

#include <optional>
#include <string>
#include <utility>
#include <vector>

/**
 * @class NewickGenerator
 * @brief Forward-only sequence of (interval length, Newick string) pairs.
 *
 * The text of every subtree is cached and reused until one of the edges below it changes, so
 * each step only rebuilds the part of the tree touched by the current diff.
 */
class NewickGenerator {
private:
  DiffIterator diffs;
  node_id_t sample_size;
  int precision;
  NodeArena arena;

  // Formatted length of the branch above each node
  std::vector<std::string> branch_length;
  boost::dynamic_bitset<> branch_length_live;

  // Newick text of the subtree below each node
  std::vector<std::string> subtree;
  boost::dynamic_bitset<> subtree_valid;

  bool exhausted = false;

  void invalidate_subtree(node_id_t node);
  void remove_edge(const EdgeRecord& edge);
  void insert_edge(const EdgeRecord& edge);
  node_id_t find_root() const;
  void check_coalesced() const;
  void update_subtrees(node_id_t root);
  std::optional<std::pair<locus_t, std::string>> advance();

public:
  /**
   * @brief Set up a generator over the given tree sequence.
   *
   * @param ts the tree sequence; must outlive the generator
   * @param _precision number of decimal places for branch lengths
   * @param all_breaks emit one tree per breakpoint interval instead of one per change
   * @throws std::invalid_argument if the precision is negative
   */
  NewickGenerator(const TreeSequence& ts, int _precision, bool all_breaks = false);

  /**
   * @brief Advance to the next interval.
   *
   * @return the interval length and its tree, or std::nullopt after the last interval
   * @throws IncompleteCoalescenceError if the tree for the interval is not fully coalesced;
   * the generator yields nothing further after any exception
   */
  std::optional<std::pair<locus_t, std::string>> next();
};

#endif // TREE_SEQ_LIB_NEWICK_GENERATOR_H
