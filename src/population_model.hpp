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

#ifndef TREE_SEQ_LIB_POPULATION_MODEL_H
#define TREE_SEQ_LIB_POPULATION_MODEL_H

#include "types.hpp"

#include <nlohmann/json.hpp>

#include <iostream>

/**
 * Discriminant of a population model. The integer values are the ones stored in the
 * `type` field of the serialized parameters.
 */
enum class PopulationModelType : int { constant = 0, exponential = 1 };

/**
 * @class PopulationModel
 * @brief One epoch of the population size history, starting at start_time.
 *
 * A constant model uses `size` (relative to the size at sampling time); an exponential model
 * uses the growth rate `alpha`. The field belonging to the other variant is unused.
 */
class PopulationModel {
public:
  PopulationModelType type = PopulationModelType::constant;
  ts_real_t start_time = 0;
  ts_real_t size = 1;
  ts_real_t alpha = 0;

  static PopulationModel constant(ts_real_t start_time, ts_real_t size);
  static PopulationModel exponential(ts_real_t start_time, ts_real_t alpha);

  bool operator==(const PopulationModel& other) const;
  friend std::ostream& operator<<(std::ostream& os, const PopulationModel& model);
};

// Low-level form handed to the simulator and stored in tree files: start_time, type and the
// field of the model's own variant
void to_json(nlohmann::json& j, const PopulationModel& model);
void from_json(const nlohmann::json& j, PopulationModel& model);

#endif // TREE_SEQ_LIB_POPULATION_MODEL_H
