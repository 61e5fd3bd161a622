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

#include "node_arena.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <string>

NodeArena::NodeArena(std::size_t capacity, node_id_t _sample_size)
    : sample_size(_sample_size), parents(capacity, 0),
      children_pairs(capacity, std::array<node_id_t, 2>{0, 0}), times(capacity, 0),
      parent_live(capacity), children_live(capacity), time_live(capacity) {
  if (capacity <= static_cast<std::size_t>(sample_size)) {
    throw MalformedInputError(THROW_LINE("Node arena must have room for every sample."));
  }
  for (node_id_t sample = 1; sample <= sample_size; ++sample) {
    time_live.set(sample);
  }
}

void NodeArena::check_id(node_id_t node) const {
  if (node == 0 || node >= parents.size()) {
    throw MalformedInputError(THROW_LINE("Node ID " + std::to_string(node) + " is out of range."));
  }
}

std::size_t NodeArena::capacity() const {
  return parents.size();
}

node_id_t NodeArena::get_sample_size() const {
  return sample_size;
}

bool NodeArena::is_sample(node_id_t node) const {
  return node >= 1 && node <= sample_size;
}

bool NodeArena::has_parent(node_id_t node) const {
  check_id(node);
  return parent_live.test(node);
}

bool NodeArena::has_children(node_id_t node) const {
  check_id(node);
  return children_live.test(node);
}

bool NodeArena::has_time(node_id_t node) const {
  check_id(node);
  return time_live.test(node);
}

node_id_t NodeArena::parent(node_id_t node) const {
  if (!has_parent(node)) {
    throw MalformedInputError(THROW_LINE("Node " + std::to_string(node) + " has no parent."));
  }
  return parents[node];
}

const std::array<node_id_t, 2>& NodeArena::children(node_id_t node) const {
  if (!has_children(node)) {
    throw MalformedInputError(THROW_LINE("Node " + std::to_string(node) + " has no children."));
  }
  return children_pairs[node];
}

ts_real_t NodeArena::time(node_id_t node) const {
  if (!has_time(node)) {
    throw MalformedInputError(THROW_LINE("Node " + std::to_string(node) + " has no time."));
  }
  return times[node];
}

void NodeArena::set_parent(node_id_t node, node_id_t parent) {
  check_id(node);
  check_id(parent);
  parents[node] = parent;
  parent_live.set(node);
}

void NodeArena::set_children(node_id_t node, const std::array<node_id_t, 2>& children) {
  check_id(node);
  check_id(children[0]);
  check_id(children[1]);
  children_pairs[node] = children;
  children_live.set(node);
}

void NodeArena::set_time(node_id_t node, ts_real_t time) {
  check_id(node);
  times[node] = time;
  time_live.set(node);
}

void NodeArena::remove_parent(node_id_t node) {
  if (!has_parent(node)) {
    throw MalformedInputError(THROW_LINE("Removing missing parent of node " + std::to_string(node)));
  }
  parent_live.reset(node);
}

void NodeArena::remove_children(node_id_t node) {
  if (!has_children(node)) {
    throw MalformedInputError(THROW_LINE("Removing missing children of node " + std::to_string(node)));
  }
  children_live.reset(node);
}

void NodeArena::remove_time(node_id_t node) {
  if (!has_time(node)) {
    throw MalformedInputError(THROW_LINE("Removing missing time of node " + std::to_string(node)));
  }
  time_live.reset(node);
}

std::size_t NodeArena::num_parents() const {
  return parent_live.count();
}

std::size_t NodeArena::num_children() const {
  return children_live.count();
}

std::size_t NodeArena::num_times() const {
  return time_live.count();
}

node_id_t NodeArena::root_of(node_id_t node) const {
  // A cycle would need more steps than there are slots
  std::size_t steps = 0;
  while (has_parent(node)) {
    node = parents[node];
    if (++steps > parents.size()) {
      throw MalformedInputError(THROW_LINE("Parent links contain a cycle."));
    }
  }
  return node;
}
