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

#ifndef TREE_SEQ_LIB_SPARSE_TREE_ITERATOR_H
#define TREE_SEQ_LIB_SPARSE_TREE_ITERATOR_H

#include "node_arena.hpp"
#include "tree_sequence.hpp"
#include "types.hpp"

#include <array>
#include <cstddef>
#include <functional>
#include <iostream>
#include <map>
#include <optional>
#include <queue>
#include <vector>

/**
 * @class SparseTree
 * @brief The genealogy of one interval, as maps from node to parent and from node to time.
 *
 * Every sample has a time of zero. The root has no entry in the parent map.
 */
class SparseTree {
public:
  locus_t length = 0;
  std::map<node_id_t, node_id_t> parent;
  std::map<node_id_t, ts_real_t> time;

  /**
   * @brief The node reached by following parents upwards from sample 1.
   */
  node_id_t root() const;

  /**
   * @brief Most recent common ancestor of two nodes of the tree.
   *
   * @throws MalformedInputError if either node is not part of the tree
   * @throws IncompleteCoalescenceError if the nodes have no common ancestor
   */
  node_id_t mrca(node_id_t u, node_id_t v) const;

  /**
   * @brief Time of the most recent common ancestor of two nodes.
   */
  ts_real_t tmrca(node_id_t u, node_id_t v) const;

  friend std::ostream& operator<<(std::ostream& os, const SparseTree& tree);
};

/**
 * @class SparseTreeIterator
 * @brief Forward-only sequence of SparseTree snapshots, one per run of records sharing a left
 * locus.
 *
 * Edges stay live until the first run starting at or after their right locus. Each yielded
 * SparseTree is an independent copy, so it stays valid after the iterator advances.
 */
class SparseTreeIterator {
private:
  struct LiveSegment {
    locus_t right;
    std::array<node_id_t, 2> children;
    node_id_t parent;

    bool operator>(const LiveSegment& other) const {
      return right > other.right;
    }
  };

  const TreeSequence* ts;
  NodeArena arena;
  std::priority_queue<LiveSegment, std::vector<LiveSegment>, std::greater<LiveSegment>>
      live_segments;
  std::size_t next_record = 0;
  locus_t last_left = 0;
  bool finished = false;

  SparseTree snapshot(locus_t length) const;
  void evict_until(locus_t locus);
  void apply_record(std::size_t index);
  std::optional<SparseTree> advance();

public:
  explicit SparseTreeIterator(const TreeSequence& _ts);

  /**
   * @brief Advance to the next interval.
   *
   * @return a snapshot of the next tree, or std::nullopt after the final one
   * @throws UnterminatedAncestryError if an edge ends before num_loci once records run out
   * @throws MalformedInputError if the records disagree with each other; the iterator yields
   * nothing further after any exception
   */
  std::optional<SparseTree> next();
};

#endif // TREE_SEQ_LIB_SPARSE_TREE_ITERATOR_H
