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

// Time haplotype generation on a tree file and write the result in ms format

#include "haplotype_generator.hpp"
#include "serialize_tree_sequence.hpp"
#include "tree_seq_utils.hpp"
#include "tree_sequence.hpp"
#include "types.hpp"
#include "utils.hpp"

#include <chrono>
#include <iostream>
#include <string>

using std::cout;
using std::endl;
using std::string;
using Clock = std::chrono::high_resolution_clock;

int main(int argc, char* argv[]) {
  if (argc < 3) {
    std::cerr << "Usage: " << argv[0]
              << " <tree file> <scaled mutation rate> [random seed] [output file]" << endl;
    return 1;
  }
  string tree_file = (string) argv[1];
  ts_real_t rate = utils::arg_to_real(argv[2]);
  unsigned seed = 0;
  if (argc > 3) {
    seed = static_cast<unsigned>(utils::arg_to_int(argv[3]));
  }
  string output_file = "";
  if (argc > 4) {
    output_file = (string) argv[4];
  }

  std::chrono::time_point<Clock> last_time, curr_time;
  last_time = Clock::now();
  TreeSequence ts = ts_utils::load_tree_sequence(tree_file);
  curr_time = Clock::now();
  auto split_time =
      std::chrono::duration_cast<std::chrono::milliseconds>(curr_time - last_time).count();
  cout << ts.get_num_records() << " records over " << ts.get_num_loci() << " loci (loaded in "
       << split_time << " milliseconds)" << endl;

  last_time = Clock::now();
  HaplotypeGenerator generator(ts, rate, seed);
  curr_time = Clock::now();
  split_time = std::chrono::duration_cast<std::chrono::milliseconds>(curr_time - last_time).count();
  cout << generator.get_num_segregating_sites() << " segregating sites with seed "
       << generator.get_random_seed() << " (generated in " << split_time << " milliseconds)"
       << endl;

  ts_utils::write_haplotypes(generator, ts.get_num_loci(), output_file);
  return 0;
}
