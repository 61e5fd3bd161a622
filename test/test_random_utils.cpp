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

#include <catch2/catch_test_macros.hpp>

#include <random>
#include <stdexcept>
#include <vector>

TEST_CASE("Random utilities")
{
  std::mt19937 generator(2024);

  SECTION("No Poisson draw without a positive mean")
  {
    CHECK(random_utils::generate_poisson_rv(generator, 0.0) == 0);
    CHECK(random_utils::generate_poisson_rv(generator, -3.0) == 0);
  }

  SECTION("Uniform draws stay in range")
  {
    for (int i = 0; i < 1000; ++i) {
      ts_real_t value = random_utils::generate_uniform_rv(generator, 2.0, 3.0);
      CHECK(value >= 2.0);
      CHECK(value < 3.0);
    }
  }

  SECTION("Cumulative sampling never picks a zero weight")
  {
    // weights 0, 0, 1, 0
    const std::vector<ts_real_t> cumulative = {0.0, 0.0, 1.0, 1.0};
    for (int i = 0; i < 1000; ++i) {
      CHECK(random_utils::sample_cumulative_index(generator, cumulative) == 2);
    }
  }

  SECTION("Cumulative sampling reaches every positive weight")
  {
    const std::vector<ts_real_t> cumulative = {1.0, 3.0, 6.0};
    std::vector<int> counts(3, 0);
    for (int i = 0; i < 6000; ++i) {
      std::size_t index = random_utils::sample_cumulative_index(generator, cumulative);
      REQUIRE(index < 3);
      ++counts[index];
    }
    CHECK(counts[0] > 0);
    CHECK(counts[0] < counts[2]);
    CHECK(counts[1] > 0);
  }

  SECTION("Cumulative sampling needs a positive total")
  {
    CHECK_THROWS_AS(random_utils::sample_cumulative_index(generator, {}), std::invalid_argument);
    CHECK_THROWS_AS(random_utils::sample_cumulative_index(generator, {0.0, 0.0}),
                    std::invalid_argument);
  }

  SECTION("Clock seeds are never zero")
  {
    CHECK(random_utils::clock_seed() != 0);
  }
}
