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

#include "random_utils.hpp"
#include "utils.hpp"

#include <algorithm>
#include <chrono>
#include <random>
#include <stdexcept>

namespace random_utils {

unsigned clock_seed() {
  unsigned seed = static_cast<unsigned>(std::chrono::system_clock::now().time_since_epoch().count());
  // 0 is reserved for "choose a seed"
  return seed == 0 ? 1 : seed;
}

unsigned generate_poisson_rv(std::mt19937& generator, ts_real_t mean) {
  if (!(mean > 0)) {
    return 0;
  }
  std::poisson_distribution<unsigned> distribution(mean);
  return distribution(generator);
}

ts_real_t generate_uniform_rv(std::mt19937& generator, ts_real_t from, ts_real_t to) {
  std::uniform_real_distribution<ts_real_t> distribution(from, to);
  return distribution(generator);
}

std::size_t sample_cumulative_index(std::mt19937& generator, const std::vector<ts_real_t>& cumulative) {
  if (cumulative.empty() || !(cumulative.back() > 0)) {
    throw std::invalid_argument(THROW_LINE("Need a positive total weight to sample from."));
  }
  ts_real_t draw = generate_uniform_rv(generator, 0, cumulative.back());
  auto it = std::upper_bound(cumulative.begin(), cumulative.end(), draw);
  std::size_t index = static_cast<std::size_t>(it - cumulative.begin());
  // Rounding can put the draw on the total itself
  return std::min(index, cumulative.size() - 1);
}

} // namespace random_utils
