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

// Small tree sequences shared by the tests

#ifndef TREE_SEQ_LIB_TEST_DATA_H
#define TREE_SEQ_LIB_TEST_DATA_H

#include "coalescence_record.hpp"
#include "simulation_parameters.hpp"
#include "tree_sequence.hpp"
#include "types.hpp"

#include <array>
#include <utility>
#include <vector>

namespace test_data {

inline SimulationParameters make_parameters(std::uint32_t sample_size, locus_t num_loci) {
  SimulationParameters parameters;
  parameters.sample_size = sample_size;
  parameters.num_loci = num_loci;
  return parameters;
}

inline TreeSequence make_tree_sequence(std::uint32_t sample_size, locus_t num_loci,
                                       std::vector<locus_t> breakpoints,
                                       std::vector<CoalescenceRecord> records) {
  std::vector<locus_t> left, right;
  std::vector<std::array<node_id_t, 2>> children;
  std::vector<node_id_t> parent;
  std::vector<ts_real_t> time;
  for (const auto& record : records) {
    left.push_back(record.left);
    right.push_back(record.right);
    children.push_back(record.children);
    parent.push_back(record.parent);
    time.push_back(record.time);
  }
  return TreeSequence(std::move(breakpoints), std::move(left), std::move(right),
                      std::move(children), std::move(parent), std::move(time),
                      make_parameters(sample_size, num_loci));
}

// 3 samples over 10 loci; sample 3 joins above node 4 at time 1 on [0, 5) and time 2 on [5, 10)
inline TreeSequence three_samples() {
  return make_tree_sequence(3, 10, {0, 2, 5, 7, 10},
                            {CoalescenceRecord(0, 10, {1, 2}, 4, 0.5),
                             CoalescenceRecord(0, 5, {3, 4}, 5, 1.0),
                             CoalescenceRecord(5, 10, {3, 4}, 6, 2.0)});
}

// 4 samples over 100 loci with three distinct trees; node 5 = (1, 2) spans every interval
inline TreeSequence four_samples() {
  return make_tree_sequence(4, 100, {0, 40, 70, 100},
                            {CoalescenceRecord(0, 100, {1, 2}, 5, 0.2),
                             CoalescenceRecord(0, 40, {3, 4}, 6, 0.4),
                             CoalescenceRecord(0, 40, {5, 6}, 7, 1.5),
                             CoalescenceRecord(40, 100, {3, 5}, 8, 0.9),
                             CoalescenceRecord(40, 70, {4, 8}, 9, 1.2),
                             CoalescenceRecord(70, 100, {4, 8}, 10, 2.5)});
}

// 4 samples at a single locus, joined one at a time: (((1, 2), 3), 4)
inline TreeSequence caterpillar() {
  return make_tree_sequence(4, 1, {0, 1},
                            {CoalescenceRecord(0, 1, {1, 2}, 5, 1.0),
                             CoalescenceRecord(0, 1, {5, 3}, 6, 2.0),
                             CoalescenceRecord(0, 1, {6, 4}, 7, 3.0)});
}

} // namespace test_data

#endif // TREE_SEQ_LIB_TEST_DATA_H
