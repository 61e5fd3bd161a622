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

// Write a tree file, read it back and print the tree of every interval

#include "serialize_tree_sequence.hpp"
#include "simulation_parameters.hpp"
#include "sparse_tree_iterator.hpp"
#include "tree_sequence.hpp"
#include "types.hpp"

#include <iostream>
#include <string>
#include <vector>

using std::cout;
using std::endl;
using std::string;
using std::vector;

int main(int argc, char* argv[]) {
  string file_name = "example_trees.h5";
  if (argc > 1) {
    file_name = (string) argv[1];
  }

  SimulationParameters parameters;
  parameters.sample_size = 3;
  parameters.num_loci = 10;
  parameters.random_seed = 42;
  parameters.population_models.push_back(PopulationModel::constant(0, 1));
  parameters.population_models.push_back(PopulationModel::exponential(0.5, 2));

  TreeSequence ts(vector<locus_t>{0, 2, 5, 7, 10}, vector<locus_t>{0, 0, 5},
                  vector<locus_t>{10, 5, 10}, {{1, 2}, {3, 4}, {3, 4}},
                  vector<node_id_t>{4, 5, 6}, vector<ts_real_t>{0.5, 1.0, 2.0}, parameters,
                  ts_utils::current_environment());
  ts_utils::dump_tree_sequence(ts, file_name);
  cout << "Wrote " << file_name << endl;

  TreeSequence loaded = ts_utils::load_tree_sequence(file_name);
  SparseTreeIterator trees = loaded.sparse_trees();
  while (auto tree = trees.next()) {
    cout << *tree;
    cout << "root " << tree->root() << ", tmrca(1, 3) = " << tree->tmrca(1, 3) << endl << endl;
  }
  return 0;
}
