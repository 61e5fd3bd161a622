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

/* Text output of tree sequences and haplotypes in the formats of the ms simulator
 */

#ifndef TREE_SEQ_LIB_TREE_SEQ_UTILS_H
#define TREE_SEQ_LIB_TREE_SEQ_UTILS_H

#include "constants.hpp"
#include "haplotype_generator.hpp"
#include "tree_sequence.hpp"
#include "types.hpp"

#include <string>

namespace ts_utils {

/**
 * Writes one "[length]newick" line per interval.
 *
 * @param ts the tree sequence to write
 * @param file_name output path, gzip-compressed if it ends in ".gz"; when empty, we output to
 *                  stdout instead of writing to file
 * @param precision decimal places of the branch lengths
 * @param all_breaks one line per breakpoint interval instead of one per change of tree
 */
void write_newick_trees(const TreeSequence& ts, const std::string& file_name,
                        int precision = tsl::default_newick_precision, bool all_breaks = false);

/**
 * Writes the "segsites:" and "positions:" lines followed by one haplotype per sample.
 * Positions are the site loci divided by num_loci.
 */
void write_haplotypes(const HaplotypeGenerator& generator, locus_t num_loci,
                      const std::string& file_name);

} // namespace ts_utils

#endif // TREE_SEQ_LIB_TREE_SEQ_UTILS_H
