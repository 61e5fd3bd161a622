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

#ifndef TREE_SEQ_LIB_HAPLOTYPE_GENERATOR_H
#define TREE_SEQ_LIB_HAPLOTYPE_GENERATOR_H

#include "coalescence_record.hpp"
#include "node_arena.hpp"
#include "tree_sequence.hpp"
#include "types.hpp"

#include <boost/dynamic_bitset.hpp>

#include <cstddef>
#include <random>
#include <string>
#include <vector>

/**
 * @class HaplotypeGenerator
 * @brief Drops mutations on the trees of a tree sequence and records the resulting haplotypes.
 *
 * For each interval of length L, the number of mutations is Poisson with mean
 * total_branch_length * scaled_mutation_rate * L / num_loci. Each mutation is placed on a branch
 * chosen with probability proportional to its length and adds one segregating site, carried by
 * every sample below that branch.
 *
 * All work happens in the constructor; the tree sequence is not referenced afterwards.
 */
class HaplotypeGenerator {
private:
  ts_real_t scaled_mutation_rate;
  unsigned random_seed;
  std::size_t max_segregating_sites;
  std::mt19937 generator;
  node_id_t sample_size;
  locus_t num_loci;
  NodeArena arena;

  std::vector<ts_real_t> branch_length;
  boost::dynamic_bitset<> branch_live;
  ts_real_t total_branch_length = 0;

  // Columns past num_segregating_sites are spare capacity, filled with '0'
  HaplotypeMatrix haplotypes;
  std::size_t num_segregating_sites = 0;
  std::vector<node_id_t> mutation_nodes;
  std::vector<locus_t> site_loci;

  void generate_haplotypes(const TreeSequence& ts);
  void remove_edge(const EdgeRecord& edge);
  void insert_edge(const EdgeRecord& edge);
  void reserve_sites(std::size_t needed);
  void apply_mutation(node_id_t node, locus_t locus);

public:
  /**
   * @brief Generate haplotypes for every sample of a tree sequence.
   *
   * @param ts the tree sequence
   * @param _scaled_mutation_rate mutation rate scaled to the whole locus range
   * @param _random_seed seed of the random engine, or 0 to seed from the clock
   * @param _max_segregating_sites upper bound on the number of sites, or 0 for no bound
   * @throws std::invalid_argument if the mutation rate is negative
   * @throws CapacityExceededError if more sites are needed than the bound allows
   */
  HaplotypeGenerator(const TreeSequence& ts, ts_real_t _scaled_mutation_rate,
                     unsigned _random_seed = 0, std::size_t _max_segregating_sites = 0);

  unsigned get_random_seed() const;
  ts_real_t get_scaled_mutation_rate() const;
  std::size_t get_num_segregating_sites() const;

  // Samples by rows, sites by columns
  HaplotypeMatrix get_haplotypes() const;

  // One string of '0' and '1' per sample
  std::vector<std::string> haplotype_strings() const;

  // The node below the mutated branch of each site
  const std::vector<node_id_t>& get_mutation_nodes() const;

  // The first locus of the interval each site was placed in
  const std::vector<locus_t>& get_site_loci() const;
};

#endif // TREE_SEQ_LIB_HAPLOTYPE_GENERATOR_H
