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

#ifndef TREE_SEQ_LIB_NODE_ARENA_H
#define TREE_SEQ_LIB_NODE_ARENA_H

#include "types.hpp"

#include <boost/dynamic_bitset.hpp>

#include <array>
#include <cstddef>
#include <vector>

/**
 * @class NodeArena
 * @brief Per-node forest state for one interval, stored in slots indexed by node ID.
 *
 * Each slot holds a parent, a pair of children and a time, and each of these is guarded by a
 * liveness bit: an entry exists only while its bit is set. The samples 1..sample_size start with
 * a live time of 0 and no parent or children. Slot 0 is never used.
 *
 * Reading or removing an entry that is not live, or using an ID outside [1, capacity), throws
 * MalformedInputError, since it can only happen when the records disagree with each other.
 */
class NodeArena {
private:
  node_id_t sample_size;
  std::vector<node_id_t> parents;
  std::vector<std::array<node_id_t, 2>> children_pairs;
  std::vector<ts_real_t> times;
  boost::dynamic_bitset<> parent_live;
  boost::dynamic_bitset<> children_live;
  boost::dynamic_bitset<> time_live;

  void check_id(node_id_t node) const;

public:
  NodeArena(std::size_t capacity, node_id_t sample_size);

  std::size_t capacity() const;
  node_id_t get_sample_size() const;
  bool is_sample(node_id_t node) const;

  bool has_parent(node_id_t node) const;
  bool has_children(node_id_t node) const;
  bool has_time(node_id_t node) const;

  node_id_t parent(node_id_t node) const;
  const std::array<node_id_t, 2>& children(node_id_t node) const;
  ts_real_t time(node_id_t node) const;

  // Setting a live entry overwrites it
  void set_parent(node_id_t node, node_id_t parent);
  void set_children(node_id_t node, const std::array<node_id_t, 2>& children);
  void set_time(node_id_t node, ts_real_t time);

  void remove_parent(node_id_t node);
  void remove_children(node_id_t node);
  void remove_time(node_id_t node);

  // Number of live entries of each kind
  std::size_t num_parents() const;
  std::size_t num_children() const;
  std::size_t num_times() const;

  /**
   * @brief Follow parent links from a node until reaching a node without a parent.
   *
   * @param node the node to start from
   * @return the root of the tree containing node
   */
  node_id_t root_of(node_id_t node) const;

  // Visit live entries in increasing node ID order, calling visit(node, value)
  template <typename Visitor> void for_each_parent(Visitor&& visit) const {
    for (std::size_t node = parent_live.find_first(); node != boost::dynamic_bitset<>::npos;
         node = parent_live.find_next(node)) {
      visit(static_cast<node_id_t>(node), parents[node]);
    }
  }

  template <typename Visitor> void for_each_time(Visitor&& visit) const {
    for (std::size_t node = time_live.find_first(); node != boost::dynamic_bitset<>::npos;
         node = time_live.find_next(node)) {
      visit(static_cast<node_id_t>(node), times[node]);
    }
  }
};

#endif // TREE_SEQ_LIB_NODE_ARENA_H
