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

#include "population_model.hpp"
#include "utils.hpp"

#include <stdexcept>
#include <string>

PopulationModel PopulationModel::constant(ts_real_t start_time, ts_real_t size) {
  PopulationModel model;
  model.type = PopulationModelType::constant;
  model.start_time = start_time;
  model.size = size;
  return model;
}

PopulationModel PopulationModel::exponential(ts_real_t start_time, ts_real_t alpha) {
  PopulationModel model;
  model.type = PopulationModelType::exponential;
  model.start_time = start_time;
  model.alpha = alpha;
  return model;
}

bool PopulationModel::operator==(const PopulationModel& other) const {
  if (type != other.type || start_time != other.start_time) {
    return false;
  }
  if (type == PopulationModelType::constant) {
    return size == other.size;
  }
  return alpha == other.alpha;
}

std::ostream& operator<<(std::ostream& os, const PopulationModel& model) {
  if (model.type == PopulationModelType::constant) {
    os << "Constant population model: start_time " << model.start_time << ", size "
       << model.size;
  }
  else {
    os << "Exponential population model: start_time " << model.start_time << ", alpha "
       << model.alpha;
  }
  return os;
}

void to_json(nlohmann::json& j, const PopulationModel& model) {
  j = nlohmann::json{{"start_time", model.start_time}, {"type", static_cast<int>(model.type)}};
  switch (model.type) {
  case PopulationModelType::constant:
    j["size"] = model.size;
    break;
  case PopulationModelType::exponential:
    j["alpha"] = model.alpha;
    break;
  }
}

void from_json(const nlohmann::json& j, PopulationModel& model) {
  if (!j.is_object() || !j.contains("type") || !j.contains("start_time")) {
    throw std::invalid_argument(THROW_LINE("Population model needs `type` and `start_time`."));
  }
  const int type = j.at("type").get<int>();
  const ts_real_t start_time = j.at("start_time").get<ts_real_t>();
  if (type == static_cast<int>(PopulationModelType::constant)) {
    if (!j.contains("size")) {
      throw std::invalid_argument(THROW_LINE("Constant population model needs `size`."));
    }
    model = PopulationModel::constant(start_time, j.at("size").get<ts_real_t>());
  }
  else if (type == static_cast<int>(PopulationModelType::exponential)) {
    if (!j.contains("alpha")) {
      throw std::invalid_argument(THROW_LINE("Exponential population model needs `alpha`."));
    }
    model = PopulationModel::exponential(start_time, j.at("alpha").get<ts_real_t>());
  }
  else {
    throw std::invalid_argument(THROW_LINE("Unknown population model type " + std::to_string(type)));
  }
}
