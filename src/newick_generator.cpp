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

#include "newick_generator.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <cstddef>
#include <stdexcept>

using std::string;
using std::to_string;

NewickGenerator::NewickGenerator(const TreeSequence& ts, int _precision, bool all_breaks)
    : diffs(ts, all_breaks), sample_size(ts.get_sample_size()), precision(_precision),
      arena(static_cast<std::size_t>(ts.get_max_node_id()) + 1, ts.get_sample_size()) {
  if (precision < 0) {
    throw std::invalid_argument(THROW_LINE("Newick precision must be non-negative."));
  }
  std::size_t capacity = arena.capacity();
  branch_length.resize(capacity);
  branch_length_live.resize(capacity);
  subtree.resize(capacity);
  subtree_valid.resize(capacity);
}

// Climb from the node until reaching one whose text is already stale. Every ancestor of a
// stale node is stale too, so the climb can stop there.
void NewickGenerator::invalidate_subtree(node_id_t node) {
  while (subtree_valid.test(node)) {
    subtree_valid.reset(node);
    subtree[node].clear();
    if (!arena.has_parent(node)) {
      break;
    }
    node = arena.parent(node);
  }
}

void NewickGenerator::remove_edge(const EdgeRecord& edge) {
  arena.remove_children(edge.parent);
  arena.remove_time(edge.parent);
  for (node_id_t child : edge.children) {
    invalidate_subtree(child);
    arena.remove_parent(child);
    if (!branch_length_live.test(child)) {
      throw MalformedInputError(THROW_LINE("Node " + to_string(child) + " has no branch length."));
    }
    branch_length_live.reset(child);
  }
}

void NewickGenerator::insert_edge(const EdgeRecord& edge) {
  arena.set_children(edge.parent, edge.children);
  for (node_id_t child : edge.children) {
    arena.set_parent(child, edge.parent);
    invalidate_subtree(child);
  }
  arena.set_time(edge.parent, edge.time);
}

node_id_t NewickGenerator::find_root() const {
  return arena.root_of(1);
}

void NewickGenerator::check_coalesced() const {
  std::size_t num_nodes = 2 * static_cast<std::size_t>(sample_size) - 1;
  std::size_t num_edges = num_nodes - 1;
  if (arena.num_times() != num_nodes || arena.num_parents() != num_edges ||
      branch_length_live.count() != num_edges) {
    throw IncompleteCoalescenceError(
        THROW_LINE("Expected " + to_string(num_nodes) + " nodes and " + to_string(num_edges) +
                   " branches, found " + to_string(arena.num_times()) + " nodes and " +
                   to_string(arena.num_parents()) + " branches."));
  }
}

void NewickGenerator::update_subtrees(node_id_t root) {
  // Two-stack post-order: collect the stale nodes top-down, then build them bottom-up
  std::vector<node_id_t> stack{root};
  std::vector<node_id_t> stale;
  stale.reserve(2 * static_cast<std::size_t>(sample_size));
  while (!stack.empty()) {
    node_id_t node = stack.back();
    stack.pop_back();
    if (!subtree_valid.test(node)) {
      stale.push_back(node);
      if (arena.has_children(node)) {
        for (node_id_t child : arena.children(node)) {
          stack.push_back(child);
        }
      }
    }
  }

  for (auto it = stale.rbegin(); it != stale.rend(); ++it) {
    node_id_t node = *it;
    string text;
    if (arena.has_children(node)) {
      const auto& children = arena.children(node);
      text.reserve(subtree[children[0]].size() + subtree[children[1]].size() +
                   branch_length[node].size() + 4);
      text += '(';
      text += subtree[children[0]];
      text += ',';
      text += subtree[children[1]];
      text += ')';
      if (node == root) {
        text += ';';
      }
      else {
        text += ':';
        text += branch_length[node];
      }
    }
    else {
      text = to_string(node) + ":" + branch_length[node];
    }
    subtree[node] = std::move(text);
    subtree_valid.set(node);
  }
}

std::optional<std::pair<locus_t, string>> NewickGenerator::next() {
  if (exhausted) {
    return std::nullopt;
  }
  try {
    return advance();
  }
  catch (const std::exception&) {
    exhausted = true;
    throw;
  }
}

std::optional<std::pair<locus_t, string>> NewickGenerator::advance() {
  std::optional<TreeDiff> diff = diffs.next();
  if (!diff) {
    return std::nullopt;
  }
  for (const EdgeRecord& edge : diff->records_out) {
    remove_edge(edge);
  }
  for (const EdgeRecord& edge : diff->records_in) {
    insert_edge(edge);
  }
  for (const EdgeRecord& edge : diff->records_in) {
    for (node_id_t child : edge.children) {
      branch_length[child] = utils::format_fixed(edge.time - arena.time(child), precision);
      branch_length_live.set(child);
    }
  }

  node_id_t root = find_root();
  check_coalesced();
  if (!arena.has_children(root)) {
    throw IncompleteCoalescenceError(THROW_LINE("Sample 1 is not joined to any other sample."));
  }
  update_subtrees(root);
  return std::make_pair(diff->length, subtree[root]);
}
