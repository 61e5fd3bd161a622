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

#include "errors.hpp"
#include "haplotype_generator.hpp"
#include "newick_generator.hpp"
#include "serialize_tree_sequence.hpp"
#include "simulation_parameters.hpp"
#include "test_data.hpp"
#include "tree_sequence.hpp"

#include "H5Cpp.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

std::string temp_path(const std::string& name)
{
  return (std::filesystem::temp_directory_path() / name).string();
}

std::vector<std::string> newick_strings(const TreeSequence& ts)
{
  std::vector<std::string> result;
  NewickGenerator trees = ts.newick_trees();
  while (auto tree = trees.next()) {
    result.push_back(std::to_string(tree->first) + tree->second);
  }
  return result;
}

} // namespace

TEST_CASE("Dump and load tree files")
{
  SimulationParameters parameters = test_data::make_parameters(4, 100);
  parameters.scaled_recombination_rate = 0.25;
  parameters.random_seed = 5;
  parameters.population_models = {PopulationModel::constant(0, 1),
      PopulationModel::exponential(0.5, 2.0)};

  TreeSequence original = test_data::four_samples();
  TreeSequence ts(original.get_breakpoints(), original.get_left(), original.get_right(),
      original.get_children(), original.get_parent(), original.get_time(), parameters,
      ts_utils::current_environment());

  const std::string file_name = temp_path("tree_seq_lib_test_round_trip.h5");
  ts_utils::dump_tree_sequence(ts, file_name);

  SECTION("Written file validates")
  {
    CHECK(ts_utils::validate_tree_sequence_file(file_name) == true);
  }

  SECTION("Records and metadata survive")
  {
    TreeSequence loaded = ts_utils::load_tree_sequence(file_name);
    CHECK(loaded.get_breakpoints() == ts.get_breakpoints());
    CHECK(loaded.get_left() == ts.get_left());
    CHECK(loaded.get_right() == ts.get_right());
    CHECK(loaded.get_children() == ts.get_children());
    CHECK(loaded.get_parent() == ts.get_parent());
    CHECK(loaded.get_time() == ts.get_time());
    CHECK(loaded.get_parameters() == parameters);
    CHECK(loaded.get_environment() == ts.get_environment());
  }

  SECTION("Traversals of the loaded file give identical output")
  {
    TreeSequence loaded = ts_utils::load_tree_sequence(file_name);
    CHECK(newick_strings(loaded) == newick_strings(ts));
    HaplotypeGenerator from_memory(ts, 3.0, 99);
    HaplotypeGenerator from_file(loaded, 3.0, 99);
    CHECK(from_file.haplotype_strings() == from_memory.haplotype_strings());
  }

  std::filesystem::remove(file_name);
}

TEST_CASE("Validate tree files")
{
  SECTION("File that does not exist")
  {
    // Redirect std::cout to a stringstream, so we can test the warnings generated
    std::stringstream buffer;
    std::streambuf* prevCoutBuffer = std::cout.rdbuf(buffer.rdbuf());

    CHECK(ts_utils::validate_tree_sequence_file("file_that_does_not_exist") == false);

    CHECK(buffer.str() == "File: file_that_does_not_exist is not a valid file\n");
    std::cout.rdbuf(prevCoutBuffer); // Restore original buffer
  }

  SECTION("Valid file, invalid HDF5")
  {
    const std::string file_name = temp_path("tree_seq_lib_test_not_hdf5.h5");
    {
      std::ofstream out(file_name);
      out << "not an HDF5 file" << std::endl;
    }

    std::stringstream buffer;
    std::streambuf* prevCoutBuffer = std::cout.rdbuf(buffer.rdbuf());

    CHECK(ts_utils::validate_tree_sequence_file(file_name) == false);
    CHECK_THAT(buffer.str(), Catch::Matchers::ContainsSubstring("is not a valid HDF5 file"));

    std::cout.rdbuf(prevCoutBuffer);
    CHECK_THROWS_AS(ts_utils::load_tree_sequence(file_name), std::runtime_error);
    std::filesystem::remove(file_name);
  }

  SECTION("Valid HDF5 file, missing version")
  {
    const std::string file_name = temp_path("tree_seq_lib_test_no_version.h5");
    {
      H5::H5File h5_file(file_name, H5F_ACC_TRUNC);
    }

    std::stringstream buffer;
    std::streambuf* prevCoutBuffer = std::cout.rdbuf(buffer.rdbuf());

    CHECK(ts_utils::validate_tree_sequence_file(file_name) == false);
    CHECK_THAT(buffer.str(), Catch::Matchers::ContainsSubstring("does not contain `file_version` attribute"));

    std::cout.rdbuf(prevCoutBuffer);
    std::filesystem::remove(file_name);
  }
}
