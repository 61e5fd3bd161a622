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

#include "haplotype_generator.hpp"
#include "test_data.hpp"
#include "tree_seq_utils.hpp"
#include "tree_sequence.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filtering_stream.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

std::vector<std::string> read_lines(const std::string& file_name)
{
  std::ifstream file(file_name, std::ios::binary);
  boost::iostreams::filtering_istream in;
  if (file_name.size() > 3 && file_name.substr(file_name.size() - 3) == ".gz") {
    in.push(boost::iostreams::gzip_decompressor());
  }
  in.push(file);
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(in, line)) {
    lines.push_back(line);
  }
  return lines;
}

} // namespace

TEST_CASE("Write Newick trees")
{
  TreeSequence ts = test_data::three_samples();
  const std::vector<std::string> expected = {"[5](3:1.000,(1:0.500,2:0.500):0.500);",
                                             "[5](3:2.000,(1:0.500,2:0.500):1.500);"};

  SECTION("Plain text")
  {
    const std::string file_name =
        (std::filesystem::temp_directory_path() / "tree_seq_lib_test_trees.txt").string();
    ts_utils::write_newick_trees(ts, file_name);
    CHECK(read_lines(file_name) == expected);
    std::filesystem::remove(file_name);
  }

  SECTION("Gzip compressed")
  {
    const std::string file_name =
        (std::filesystem::temp_directory_path() / "tree_seq_lib_test_trees.txt.gz").string();
    ts_utils::write_newick_trees(ts, file_name);
    CHECK(read_lines(file_name) == expected);
    std::filesystem::remove(file_name);
  }

  SECTION("Standard output")
  {
    std::stringstream buffer;
    std::streambuf* prevCoutBuffer = std::cout.rdbuf(buffer.rdbuf());
    ts_utils::write_newick_trees(ts, "", 1, true);
    std::cout.rdbuf(prevCoutBuffer);
    CHECK_THAT(buffer.str(), Catch::Matchers::StartsWith("[2](3:1.0,(1:0.5,2:0.5):0.5);\n"));
  }

  SECTION("Unwritable path")
  {
    CHECK_THROWS_AS(ts_utils::write_newick_trees(ts, "/nonexistent_directory/trees.txt"),
                    std::runtime_error);
  }
}

TEST_CASE("Write haplotypes")
{
  TreeSequence ts = test_data::caterpillar();

  SECTION("No segregating sites")
  {
    HaplotypeGenerator generator(ts, 0.0, 1);
    std::stringstream buffer;
    std::streambuf* prevCoutBuffer = std::cout.rdbuf(buffer.rdbuf());
    ts_utils::write_haplotypes(generator, ts.get_num_loci(), "");
    std::cout.rdbuf(prevCoutBuffer);
    CHECK(buffer.str() == "segsites: 0\npositions:\n\n\n\n\n");
  }

  SECTION("Rows match the generated haplotypes")
  {
    HaplotypeGenerator generator(ts, 1.0, 3);
    const std::string file_name =
        (std::filesystem::temp_directory_path() / "tree_seq_lib_test_haplotypes.txt").string();
    ts_utils::write_haplotypes(generator, ts.get_num_loci(), file_name);
    std::vector<std::string> lines = read_lines(file_name);
    REQUIRE(lines.size() == 6);
    CHECK(lines[0] == "segsites: " + std::to_string(generator.get_num_segregating_sites()));
    CHECK_THAT(lines[1], Catch::Matchers::StartsWith("positions:"));
    std::vector<std::string> haplotypes = generator.haplotype_strings();
    for (std::size_t i = 0; i < 4; ++i) {
      CHECK(lines[i + 2] == haplotypes[i]);
    }
    std::filesystem::remove(file_name);
  }
}
