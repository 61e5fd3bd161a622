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

// Build a small tree sequence and output its Newick trees

#include "constants.hpp"
#include "diff_iterator.hpp"
#include "newick_generator.hpp"
#include "simulation_parameters.hpp"
#include "tree_seq_utils.hpp"
#include "tree_sequence.hpp"
#include "types.hpp"
#include "utils.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <vector>

using std::cout;
using std::endl;
using std::string;
using std::vector;

int main(int argc, char* argv[]) {
  int precision = tsl::default_newick_precision;
  if (argc > 1) {
    precision = utils::arg_to_int(argv[1]);
  }
  string file_name = "";
  if (argc > 2) {
    file_name = (string) argv[2];
  }

  SimulationParameters parameters;
  parameters.sample_size = 4;
  parameters.num_loci = 100;
  parameters.scaled_recombination_rate = 0.5;
  parameters.population_models.push_back(PopulationModel::constant(0, 1));

  TreeSequence ts(vector<locus_t>{0, 20, 40, 55, 70, 100}, vector<locus_t>{0, 0, 0, 40, 40, 70},
                  vector<locus_t>{100, 40, 40, 100, 70, 100},
                  {{1, 2}, {3, 4}, {5, 6}, {3, 5}, {4, 8}, {4, 8}},
                  vector<node_id_t>{5, 6, 7, 8, 9, 10},
                  vector<ts_real_t>{0.2, 0.4, 1.5, 0.9, 1.2, 2.5}, parameters,
                  ts_utils::current_environment());
  ts.print_state(cout);
  cout << endl;

  cout << "Diffs:" << endl;
  DiffIterator diffs = ts.diffs();
  while (auto diff = diffs.next()) {
    cout << "length " << diff->length << ", " << diff->records_out.size() << " out, "
         << diff->records_in.size() << " in" << endl;
  }
  cout << endl;

  cout << "Newick trees (" << utils::current_time_string() << "):" << endl;
  ts_utils::write_newick_trees(ts, file_name, precision);
  if (file_name == "") {
    cout << endl << "Newick trees at every breakpoint:" << endl;
    NewickGenerator trees = ts.newick_trees(precision, true);
    while (auto tree = trees.next()) {
      cout << "[" << tree->first << "]" << tree->second << endl;
    }
  }
  else {
    cout << "Wrote trees to " << file_name << endl;
  }

  return 0;
}
