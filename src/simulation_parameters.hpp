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

#ifndef TREE_SEQ_LIB_SIMULATION_PARAMETERS_H
#define TREE_SEQ_LIB_SIMULATION_PARAMETERS_H

#include "population_model.hpp"
#include "types.hpp"

#include <nlohmann/json.hpp>

#include <vector>

/**
 * @class SimulationParameters
 * @brief The parameters needed to deterministically recreate a simulated tree sequence.
 *
 * Only sample_size and num_loci are used by the traversals; the rest is carried so that it
 * survives a dump/load round trip.
 */
class SimulationParameters {
public:
  std::uint32_t sample_size = 0;
  locus_t num_loci = 1;
  ts_real_t scaled_recombination_rate = 0;
  std::vector<PopulationModel> population_models;
  unsigned long random_seed = 0;

  bool operator==(const SimulationParameters& other) const;
};

void to_json(nlohmann::json& j, const SimulationParameters& parameters);
void from_json(const nlohmann::json& j, SimulationParameters& parameters);

namespace ts_utils {

/**
 * @brief Information about the build and platform that is relevant for reproducing a result.
 *
 * @return a JSON object mapping fingerprint keys to strings
 */
nlohmann::json current_environment();

} // namespace ts_utils

#endif // TREE_SEQ_LIB_SIMULATION_PARAMETERS_H
