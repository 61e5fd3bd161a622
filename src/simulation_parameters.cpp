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

#include "simulation_parameters.hpp"
#include "constants.hpp"
#include "utils.hpp"

#include "H5Cpp.h"

#include <boost/endian/conversion.hpp>
#include <boost/version.hpp>

#include <climits>
#include <stdexcept>
#include <string>

bool SimulationParameters::operator==(const SimulationParameters& other) const {
  return sample_size == other.sample_size && num_loci == other.num_loci &&
         scaled_recombination_rate == other.scaled_recombination_rate &&
         population_models == other.population_models && random_seed == other.random_seed;
}

void to_json(nlohmann::json& j, const SimulationParameters& parameters) {
  j = nlohmann::json{{"sample_size", parameters.sample_size},
                     {"num_loci", parameters.num_loci},
                     {"scaled_recombination_rate", parameters.scaled_recombination_rate},
                     {"population_models", parameters.population_models},
                     {"random_seed", parameters.random_seed}};
}

void from_json(const nlohmann::json& j, SimulationParameters& parameters) {
  for (const char* key : {"sample_size", "num_loci"}) {
    if (!j.contains(key)) {
      throw std::invalid_argument(THROW_LINE("Simulation parameters need `" + std::string(key) + "`."));
    }
  }
  parameters.sample_size = j.at("sample_size").get<std::uint32_t>();
  parameters.num_loci = j.at("num_loci").get<locus_t>();
  parameters.scaled_recombination_rate = j.value("scaled_recombination_rate", ts_real_t{0});
  parameters.population_models.clear();
  if (j.contains("population_models")) {
    parameters.population_models = j.at("population_models").get<std::vector<PopulationModel>>();
  }
  // Files written without a recorded seed store null here
  if (j.contains("random_seed") && !j.at("random_seed").is_null()) {
    parameters.random_seed = j.at("random_seed").get<unsigned long>();
  }
  else {
    parameters.random_seed = 0;
  }
}

namespace ts_utils {

nlohmann::json current_environment() {
  unsigned hdf5_major = 0, hdf5_minor = 0, hdf5_release = 0;
  H5::H5Library::getLibVersion(hdf5_major, hdf5_minor, hdf5_release);

  std::string platform = "unknown";
#if defined(__linux__)
  platform = "linux";
#elif defined(__APPLE__)
  platform = "darwin";
#elif defined(_WIN32)
  platform = "win32";
#endif

  std::string compiler = "unknown";
#if defined(__clang__)
  compiler = "clang " __clang_version__;
#elif defined(__GNUC__)
  compiler = "gcc " __VERSION__;
#endif

  const bool little_endian = boost::endian::order::native == boost::endian::order::little;

  return nlohmann::json{
      {"library_version", tsl::library_version},
      {"compiler", compiler},
      {"cxx_standard", std::to_string(__cplusplus)},
      {"byteorder", little_endian ? "little" : "big"},
      {"platform", platform},
      {"word_size", std::to_string(sizeof(void*) * CHAR_BIT)},
      {"hdf5_version", std::to_string(hdf5_major) + "." + std::to_string(hdf5_minor) + "." +
                           std::to_string(hdf5_release)},
      {"boost_version", BOOST_LIB_VERSION},
      {"eigen_version", std::to_string(EIGEN_WORLD_VERSION) + "." +
                            std::to_string(EIGEN_MAJOR_VERSION) + "." +
                            std::to_string(EIGEN_MINOR_VERSION)}};
}

} // namespace ts_utils
