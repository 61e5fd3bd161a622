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

#include "sparse_tree_iterator.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <set>
#include <stdexcept>
#include <string>

using std::to_string;

node_id_t SparseTree::root() const {
  node_id_t node = 1;
  auto it = parent.find(node);
  std::size_t steps = 0;
  while (it != parent.end()) {
    node = it->second;
    it = parent.find(node);
    if (++steps > parent.size()) {
      throw MalformedInputError(THROW_LINE("Parent links contain a cycle."));
    }
  }
  return node;
}

node_id_t SparseTree::mrca(node_id_t u, node_id_t v) const {
  if (time.find(u) == time.end() || time.find(v) == time.end()) {
    throw MalformedInputError(THROW_LINE("Nodes " + to_string(u) + " and " + to_string(v) +
                                         " are not both in the tree."));
  }
  std::set<node_id_t> ancestors_of_u;
  ancestors_of_u.insert(u);
  for (auto it = parent.find(u); it != parent.end(); it = parent.find(it->second)) {
    if (!ancestors_of_u.insert(it->second).second) {
      throw MalformedInputError(THROW_LINE("Parent links contain a cycle."));
    }
  }
  node_id_t node = v;
  std::size_t steps = 0;
  while (ancestors_of_u.find(node) == ancestors_of_u.end()) {
    auto it = parent.find(node);
    if (it == parent.end()) {
      throw IncompleteCoalescenceError(THROW_LINE("Nodes " + to_string(u) + " and " +
                                                  to_string(v) + " have no common ancestor."));
    }
    node = it->second;
    if (++steps > parent.size()) {
      throw MalformedInputError(THROW_LINE("Parent links contain a cycle."));
    }
  }
  return node;
}

ts_real_t SparseTree::tmrca(node_id_t u, node_id_t v) const {
  node_id_t ancestor = mrca(u, v);
  auto it = time.find(ancestor);
  if (it == time.end()) {
    throw MalformedInputError(THROW_LINE("Node " + to_string(ancestor) + " has no time."));
  }
  return it->second;
}

std::ostream& operator<<(std::ostream& os, const SparseTree& tree) {
  os << "length " << tree.length << "\n";
  os << "node\tparent\ttime\n";
  for (const auto& node_time : tree.time) {
    os << node_time.first << "\t";
    auto it = tree.parent.find(node_time.first);
    if (it != tree.parent.end()) {
      os << it->second;
    }
    else {
      os << "-";
    }
    os << "\t" << node_time.second << "\n";
  }
  return os;
}

SparseTreeIterator::SparseTreeIterator(const TreeSequence& _ts)
    : ts(&_ts), arena(static_cast<std::size_t>(_ts.get_max_node_id()) + 1, _ts.get_sample_size()) {
}

SparseTree SparseTreeIterator::snapshot(locus_t length) const {
  SparseTree tree;
  tree.length = length;
  arena.for_each_parent([&tree](node_id_t node, node_id_t parent) {
    tree.parent.emplace_hint(tree.parent.end(), node, parent);
  });
  arena.for_each_time([&tree](node_id_t node, ts_real_t time) {
    tree.time.emplace_hint(tree.time.end(), node, time);
  });
  return tree;
}

void SparseTreeIterator::evict_until(locus_t locus) {
  while (!live_segments.empty() && live_segments.top().right <= locus) {
    const LiveSegment& segment = live_segments.top();
    arena.remove_parent(segment.children[0]);
    arena.remove_parent(segment.children[1]);
    arena.remove_time(segment.parent);
    live_segments.pop();
  }
}

void SparseTreeIterator::apply_record(std::size_t index) {
  const CoalescenceRecord record = ts->record(index);
  arena.set_parent(record.children[0], record.parent);
  arena.set_parent(record.children[1], record.parent);
  arena.set_time(record.parent, record.time);
  live_segments.push(LiveSegment{record.right, record.children, record.parent});
}

std::optional<SparseTree> SparseTreeIterator::next() {
  if (finished) {
    return std::nullopt;
  }
  try {
    return advance();
  }
  catch (const std::exception&) {
    finished = true;
    throw;
  }
}

std::optional<SparseTree> SparseTreeIterator::advance() {
  const auto& lefts = ts->get_left();
  while (next_record < ts->get_num_records()) {
    locus_t left = lefts[next_record];
    if (left != last_left) {
      if (left < last_left) {
        finished = true;
        throw MalformedInputError(THROW_LINE("Records are not sorted by left locus."));
      }
      SparseTree tree = snapshot(left - last_left);
      evict_until(left);
      last_left = left;
      return tree;
    }
    apply_record(next_record);
    ++next_record;
  }

  finished = true;
  if (!live_segments.empty() && live_segments.top().right != ts->get_num_loci()) {
    throw UnterminatedAncestryError(THROW_LINE("An edge ending at locus " +
                                               to_string(live_segments.top().right) +
                                               " is still live after the last record."));
  }
  return snapshot(ts->get_num_loci() - last_left);
}
