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

#include "tree_sequence.hpp"
#include "diff_iterator.hpp"
#include "errors.hpp"
#include "newick_generator.hpp"
#include "sparse_tree_iterator.hpp"
#include "utils.hpp"

#include <algorithm>
#include <iostream>
#include <numeric>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

using std::string;
using std::to_string;
using std::vector;

TreeSequence::TreeSequence(vector<locus_t> _breakpoints, vector<locus_t> _left,
                           vector<locus_t> _right, vector<std::array<node_id_t, 2>> _children,
                           vector<node_id_t> _parent, vector<ts_real_t> _time,
                           SimulationParameters _parameters, nlohmann::json _environment)
    : breakpoints(std::move(_breakpoints)), left(std::move(_left)), right(std::move(_right)),
      children(std::move(_children)), parent(std::move(_parent)), time(std::move(_time)),
      parameters(std::move(_parameters)), environment(std::move(_environment)) {
  check_parameters();
  check_breakpoints();
  check_records();
  sort_records();
  if (left.front() != 0) {
    throw MalformedInputError(THROW_LINE("The first record must start at locus 0, not " +
                                         to_string(left.front())));
  }
}

void TreeSequence::check_parameters() const {
  if (parameters.sample_size < 2) {
    throw MalformedInputError(THROW_LINE("Sample size must be at least 2."));
  }
  if (parameters.num_loci < 1) {
    throw MalformedInputError(THROW_LINE("Number of loci must be at least 1."));
  }
}

void TreeSequence::check_breakpoints() const {
  if (breakpoints.size() < 2) {
    throw MalformedInputError(THROW_LINE("Need at least two breakpoints."));
  }
  if (breakpoints.front() != 0 || breakpoints.back() != parameters.num_loci) {
    throw MalformedInputError(THROW_LINE("Breakpoints must start at 0 and end at num_loci."));
  }
  for (std::size_t i = 1; i < breakpoints.size(); ++i) {
    if (breakpoints[i] <= breakpoints[i - 1]) {
      throw MalformedInputError(THROW_LINE("Breakpoints must be strictly increasing."));
    }
  }
}

void TreeSequence::check_records() {
  const std::size_t num_records = left.size();
  if (num_records == 0) {
    throw MalformedInputError(THROW_LINE("Need at least one coalescence record."));
  }
  if (right.size() != num_records || children.size() != num_records ||
      parent.size() != num_records || time.size() != num_records) {
    throw MalformedInputError(THROW_LINE("Record columns must all have the same length."));
  }
  for (std::size_t i = 0; i < num_records; ++i) {
    if (left[i] >= right[i]) {
      throw MalformedInputError(THROW_LINE("Record " + to_string(i) + " has left >= right."));
    }
    if (right[i] > parameters.num_loci) {
      throw MalformedInputError(THROW_LINE("Record " + to_string(i) + " ends after num_loci."));
    }
    if (parent[i] == 0 || children[i][0] == 0 || children[i][1] == 0) {
      throw MalformedInputError(THROW_LINE("Record " + to_string(i) + " uses node ID 0."));
    }
    if (parent[i] <= parameters.sample_size) {
      throw MalformedInputError(THROW_LINE("Record " + to_string(i) + " has a sample as parent."));
    }
    max_node_id = std::max({max_node_id, parent[i], children[i][0], children[i][1]});
  }
}

void TreeSequence::sort_records() {
  if (std::is_sorted(left.begin(), left.end())) {
    return;
  }
  vector<std::size_t> order(left.size());
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(),
                   [this](std::size_t a, std::size_t b) { return left[a] < left[b]; });

  auto permute = [&order](auto& column) {
    std::remove_reference_t<decltype(column)> sorted;
    sorted.reserve(column.size());
    for (std::size_t index : order) {
      sorted.push_back(column[index]);
    }
    column = std::move(sorted);
  };
  permute(left);
  permute(right);
  permute(children);
  permute(parent);
  permute(time);
}

node_id_t TreeSequence::get_sample_size() const {
  return parameters.sample_size;
}

locus_t TreeSequence::get_num_loci() const {
  return parameters.num_loci;
}

std::size_t TreeSequence::get_num_records() const {
  return left.size();
}

node_id_t TreeSequence::get_max_node_id() const {
  return max_node_id;
}

const SimulationParameters& TreeSequence::get_parameters() const {
  return parameters;
}

const nlohmann::json& TreeSequence::get_environment() const {
  return environment;
}

const vector<locus_t>& TreeSequence::get_breakpoints() const {
  return breakpoints;
}

const vector<locus_t>& TreeSequence::get_left() const {
  return left;
}

const vector<locus_t>& TreeSequence::get_right() const {
  return right;
}

const vector<std::array<node_id_t, 2>>& TreeSequence::get_children() const {
  return children;
}

const vector<node_id_t>& TreeSequence::get_parent() const {
  return parent;
}

const vector<ts_real_t>& TreeSequence::get_time() const {
  return time;
}

CoalescenceRecord TreeSequence::record(std::size_t index) const {
  return CoalescenceRecord(left.at(index), right.at(index), children.at(index),
                           parent.at(index), time.at(index));
}

void TreeSequence::print_state(std::ostream& os) const {
  os << "parameters = " << std::endl;
  os << nlohmann::json(parameters).dump(4) << std::endl;
  os << "environment = " << std::endl;
  os << environment.dump(4) << std::endl;
  for (std::size_t i = 0; i < left.size(); ++i) {
    os << record(i) << std::endl;
  }
}

DiffIterator TreeSequence::diffs(bool all_breaks) const {
  return DiffIterator(*this, all_breaks);
}

SparseTreeIterator TreeSequence::sparse_trees() const {
  return SparseTreeIterator(*this);
}

NewickGenerator TreeSequence::newick_trees(int precision, bool all_breaks) const {
  return NewickGenerator(*this, precision, all_breaks);
}
