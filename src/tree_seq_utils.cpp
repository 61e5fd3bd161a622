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

#include "tree_seq_utils.hpp"
#include "file_utils.hpp"
#include "newick_generator.hpp"
#include "utils.hpp"

#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <utility>

using std::cout;
using std::endl;
using std::string;

namespace {

template <class Out>
void stream_newick_trees(Out& out, const TreeSequence& ts, int precision, bool all_breaks) {
  NewickGenerator generator = ts.newick_trees(precision, all_breaks);
  while (std::optional<std::pair<locus_t, string>> tree = generator.next()) {
    out << "[" << tree->first << "]" << tree->second << endl;
  }
}

template <class Out>
void stream_haplotypes(Out& out, const HaplotypeGenerator& generator, locus_t num_loci) {
  out << "segsites: " << generator.get_num_segregating_sites() << endl;
  std::ostringstream positions;
  positions << "positions:" << std::fixed << std::setprecision(4);
  for (locus_t locus : generator.get_site_loci()) {
    positions << " " << static_cast<ts_real_t>(locus) / num_loci;
  }
  out << positions.str() << endl;
  for (const string& haplotype : generator.haplotype_strings()) {
    out << haplotype << endl;
  }
}

} // namespace

namespace ts_utils {

void write_newick_trees(const TreeSequence& ts, const string& file_name, int precision,
                        bool all_breaks) {
  if (file_name == "") {
    stream_newick_trees(cout, ts, precision, all_breaks);
    return;
  }
  file_utils::AutoGzOfstream out;
  out.open(file_name);
  stream_newick_trees(out, ts, precision, all_breaks);
  out.close();
}

void write_haplotypes(const HaplotypeGenerator& generator, locus_t num_loci,
                      const string& file_name) {
  if (num_loci == 0) {
    throw std::invalid_argument(THROW_LINE("num_loci must be positive."));
  }
  if (file_name == "") {
    stream_haplotypes(cout, generator, num_loci);
    return;
  }
  file_utils::AutoGzOfstream out;
  out.open(file_name);
  stream_haplotypes(out, generator, num_loci);
  out.close();
}

} // namespace ts_utils
