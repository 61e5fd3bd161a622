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

#ifndef TREE_SEQ_LIB_RANDOM_UTILS_H
#define TREE_SEQ_LIB_RANDOM_UTILS_H

#include "types.hpp"

#include <cstddef>
#include <random>
#include <vector>

namespace random_utils {

// Seed from the clock, for callers that pass random_seed = 0
unsigned clock_seed();

// Returns 0 without drawing when the mean is not positive
unsigned generate_poisson_rv(std::mt19937& generator, ts_real_t mean);

ts_real_t generate_uniform_rv(std::mt19937& generator, ts_real_t from, ts_real_t to);

/**
 * @brief Draw an index with probability proportional to its weight.
 *
 * @param generator the random engine
 * @param cumulative running sums of the weights; must be non-empty and non-decreasing with a
 *     positive last entry
 * @return the first index whose cumulative weight exceeds a uniform draw on [0, total)
 */
std::size_t sample_cumulative_index(std::mt19937& generator, const std::vector<ts_real_t>& cumulative);

} // namespace random_utils

#endif // TREE_SEQ_LIB_RANDOM_UTILS_H
