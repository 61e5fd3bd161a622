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

#include "serialize_tree_sequence.hpp"
#include "constants.hpp"
#include "simulation_parameters.hpp"
#include "utils.hpp"

#include "H5Cpp.h"

#include <nlohmann/json.hpp>

#include <array>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

namespace
{

const std::vector<std::string> expected_attrs = {"file_version", "library_version", "parameters",
    "environment"};
const std::vector<std::string> expected_dsets = {"breakpoints", "records/left", "records/right",
    "records/children", "records/parent", "records/time"};

bool check_attribute(const H5::H5File& h5_file, const std::string& expected_attr)
{
  if (!h5_file.attrExists(expected_attr)) {
    std::cout << "Expected file " << h5_file.getFileName() << " to include attribute `" << expected_attr << "`"
              << std::endl;
    return false;
  }
  return true;
}

bool check_dataset(const H5::H5File& h5_file, const std::string& expected_dset)
{
  try {
    auto dset = h5_file.openDataSet(expected_dset);
    return true;
  } catch (const H5::Exception&) {
    std::cout << "Expected file " << h5_file.getFileName() << " to include dataset `" << expected_dset << "`"
              << std::endl;
    return false;
  }
}

template <class T> struct dependent_false : std::false_type {
};

template <class T> inline constexpr bool dependent_false_v = dependent_false<T>::value;

template <typename T> H5::PredType getPredType()
{
  if constexpr (std::is_same_v<T, double>) {
    return H5::PredType::NATIVE_DOUBLE;
  } else if constexpr (std::is_same_v<T, std::uint32_t>) {
    return H5::PredType::NATIVE_UINT32;
  } else {
    static_assert(dependent_false_v<T>, "Unsupported type");
  }
}

void write_string_attribute(H5::H5File& h5_file, const std::string& name, const std::string& value)
{
  H5::StrType str_type(H5::PredType::C_S1, H5T_VARIABLE);
  H5::DataSpace scalar(H5S_SCALAR);
  H5::Attribute attribute = h5_file.createAttribute(name, str_type, scalar);
  attribute.write(str_type, value);
}

std::string read_string_attribute(const H5::H5File& h5_file, const std::string& name)
{
  std::string value;
  try {
    H5::Attribute attribute = h5_file.openAttribute(name);
    H5::StrType str_type = attribute.getStrType();
    attribute.read(str_type, value);
  } catch (const H5::Exception& e) {
    throw std::runtime_error("Failed to read attribute `" + name + "`: " + e.getDetailMsg());
  }
  return value;
}

template <typename T>
void write_dataset_1d(H5::H5File& h5_file, const std::string& dset_name, const std::vector<T>& data)
{
  hsize_t dims[1] = {static_cast<hsize_t>(data.size())};
  H5::DataSpace dataspace(1, dims);
  H5::DataSet dataset = h5_file.createDataSet(dset_name, getPredType<T>(), dataspace);
  dataset.write(data.data(), getPredType<T>());
}

template <typename T>
void write_dataset_2d(
    H5::H5File& h5_file, const std::string& dset_name, const std::vector<std::array<T, 2>>& data)
{
  hsize_t dims[2] = {static_cast<hsize_t>(data.size()), 2};
  H5::DataSpace dataspace(2, dims);
  H5::DataSet dataset = h5_file.createDataSet(dset_name, getPredType<T>(), dataspace);
  dataset.write(data.data(), getPredType<T>());
}

// Templated function to read a whole dataset into a std::vector<T>
template <typename T>
std::vector<T> read_dataset_to_vector_1d(const H5::H5File& h5_file, const std::string& dset_name)
{
  std::vector<T> data;

  try {
    H5::DataSet dataset = h5_file.openDataSet(dset_name);
    H5::DataSpace dataspace = dataset.getSpace();

    if (dataspace.getSimpleExtentNdims() != 1) {
      throw std::runtime_error("Dataset `" + dset_name + "` must be 1-dimensional");
    }

    hsize_t dims[1];
    dataspace.getSimpleExtentDims(dims);
    data.resize(dims[0]);
    if (dims[0] > 0) {
      dataset.read(data.data(), getPredType<T>());
    }
  } catch (const H5::Exception& e) {
    throw std::runtime_error("Failed to read dataset `" + dset_name + "`: " + e.getDetailMsg());
  }

  return data;
}

template <typename T>
std::vector<std::array<T, 2>> read_dataset_to_vector_2d(const H5::H5File& h5_file, const std::string& dset_name)
{
  std::vector<std::array<T, 2>> data;

  try {
    H5::DataSet dataset = h5_file.openDataSet(dset_name);
    H5::DataSpace dataspace = dataset.getSpace();

    if (dataspace.getSimpleExtentNdims() != 2) {
      throw std::runtime_error("Dataset `" + dset_name + "` must be 2-dimensional");
    }

    hsize_t dims[2];
    dataspace.getSimpleExtentDims(dims);
    if (dims[1] != 2) {
      throw std::runtime_error("Second dimension of dataset `" + dset_name + "` must be 2");
    }

    data.resize(dims[0]);
    if (dims[0] > 0) {
      dataset.read(data.data(), getPredType<T>());
    }
  } catch (const H5::Exception& e) {
    throw std::runtime_error("Failed to read dataset `" + dset_name + "`: " + e.getDetailMsg());
  }

  return data;
}

nlohmann::json parse_json_attribute(const H5::H5File& h5_file, const std::string& name)
{
  const std::string text = read_string_attribute(h5_file, name);
  try {
    return nlohmann::json::parse(text);
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error("Attribute `" + name + "` is not valid JSON: " + e.what());
  }
}

} // namespace

void ts_utils::dump_tree_sequence(const TreeSequence& ts, const std::string& file_name)
{
  try {
    H5::H5File h5_file(file_name, H5F_ACC_TRUNC);

    write_string_attribute(h5_file, "file_version", tsl::tree_file_version);
    write_string_attribute(h5_file, "library_version", tsl::library_version);
    write_string_attribute(h5_file, "datetime_created", utils::current_time_string());
    write_string_attribute(h5_file, "parameters", nlohmann::json(ts.get_parameters()).dump());
    write_string_attribute(h5_file, "environment", ts.get_environment().dump());

    write_dataset_1d<std::uint32_t>(h5_file, "breakpoints", ts.get_breakpoints());

    h5_file.createGroup("records");
    write_dataset_1d<std::uint32_t>(h5_file, "records/left", ts.get_left());
    write_dataset_1d<std::uint32_t>(h5_file, "records/right", ts.get_right());
    write_dataset_2d<std::uint32_t>(h5_file, "records/children", ts.get_children());
    write_dataset_1d<std::uint32_t>(h5_file, "records/parent", ts.get_parent());
    write_dataset_1d<double>(h5_file, "records/time", ts.get_time());
  } catch (const H5::Exception& e) {
    std::cerr << "HDF5 error on file: " << file_name << std::endl;
    std::cerr << e.getDetailMsg() << std::endl;
    throw std::runtime_error("Unable to write tree file: " + file_name);
  }
}

bool ts_utils::validate_tree_sequence_file(const std::string& file_name)
{
  // Check if file exists
  if (!std::filesystem::exists(file_name)) {
    std::cout << "File: " << file_name << " is not a valid file" << std::endl;
    return false;
  }

  if (H5Fis_hdf5(file_name.c_str()) <= 0)
  {
    std::cout << "File: " << file_name << " is not a valid HDF5 file" << std::endl;
    return false;
  }

  try {
    H5::H5File h5_file(file_name, H5F_ACC_RDONLY);

    if (!check_attribute(h5_file, "file_version")) {
      std::cout << "File: " << file_name
                << " is not a valid tree file because it does not contain `file_version` attribute" << std::endl;
      return false;
    }

    const std::string file_version = read_string_attribute(h5_file, "file_version");
    if (file_version != tsl::tree_file_version) {
      std::cout << "Tree file version (" << file_version << ") is not supported; valid versions are "
                << tsl::tree_file_version << "." << std::endl;
      return false;
    }

    bool is_valid = true;
    for (const auto& attr : expected_attrs) {
      is_valid = check_attribute(h5_file, attr) && is_valid;
    }
    for (const auto& dset : expected_dsets) {
      is_valid = check_dataset(h5_file, dset) && is_valid;
    }
    return is_valid;

  } catch (const H5::Exception& e) {
    std::cerr << "HDF5 error on file: " << file_name << std::endl;
    std::cerr << e.getDetailMsg() << std::endl;
    return false;
  } catch (const std::runtime_error& e) {
    std::cout << "File: " << file_name << " could not be read: " << e.what() << std::endl;
    return false;
  }
}

TreeSequence ts_utils::load_tree_sequence(const std::string& file_name)
{
  if (!validate_tree_sequence_file(file_name)) {
    throw std::runtime_error("Invalid tree file: " + file_name);
  }

  try {
    H5::H5File h5_file(file_name, H5F_ACC_RDONLY);

    const std::string written_by = read_string_attribute(h5_file, "library_version");
    if (written_by != tsl::library_version) {
      std::cout << "Warning: " << file_name << " was written by tree-seq-lib " << written_by
                << ", reading with " << tsl::library_version << std::endl;
    }

    SimulationParameters parameters;
    try {
      parameters = parse_json_attribute(h5_file, "parameters").get<SimulationParameters>();
    } catch (const std::invalid_argument& e) {
      throw std::runtime_error("Attribute `parameters` of " + file_name + " is incomplete: " + e.what());
    } catch (const nlohmann::json::exception& e) {
      throw std::runtime_error("Attribute `parameters` of " + file_name + " is incomplete: " + e.what());
    }
    nlohmann::json environment = parse_json_attribute(h5_file, "environment");

    auto breakpoints = read_dataset_to_vector_1d<std::uint32_t>(h5_file, "breakpoints");
    auto left = read_dataset_to_vector_1d<std::uint32_t>(h5_file, "records/left");
    auto right = read_dataset_to_vector_1d<std::uint32_t>(h5_file, "records/right");
    auto children = read_dataset_to_vector_2d<std::uint32_t>(h5_file, "records/children");
    auto parent = read_dataset_to_vector_1d<std::uint32_t>(h5_file, "records/parent");
    auto time = read_dataset_to_vector_1d<double>(h5_file, "records/time");

    return TreeSequence(std::move(breakpoints), std::move(left), std::move(right), std::move(children),
        std::move(parent), std::move(time), std::move(parameters), std::move(environment));

  } catch (const H5::Exception& e) {
    std::cerr << "HDF5 error on file: " << file_name << std::endl;
    std::cerr << e.getDetailMsg() << std::endl;
    throw std::runtime_error("Unable to load tree file: " + file_name);
  }
}
