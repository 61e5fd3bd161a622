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
#include "diff_iterator.hpp"
#include "errors.hpp"
#include "random_utils.hpp"
#include "utils.hpp"

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <utility>

using std::string;
using std::to_string;
using std::vector;

HaplotypeGenerator::HaplotypeGenerator(const TreeSequence& ts, ts_real_t _scaled_mutation_rate,
                                       unsigned _random_seed, std::size_t _max_segregating_sites)
    : scaled_mutation_rate(_scaled_mutation_rate), random_seed(_random_seed),
      max_segregating_sites(_max_segregating_sites), sample_size(ts.get_sample_size()),
      num_loci(ts.get_num_loci()),
      arena(static_cast<std::size_t>(ts.get_max_node_id()) + 1, ts.get_sample_size()) {
  if (!(scaled_mutation_rate >= 0)) {
    throw std::invalid_argument(THROW_LINE("Mutation rate must be non-negative."));
  }
  if (random_seed == 0) {
    random_seed = random_utils::clock_seed();
  }
  generator.seed(random_seed);

  branch_length.assign(arena.capacity(), 0);
  branch_live.resize(arena.capacity());

  std::size_t initial_sites = num_loci;
  if (max_segregating_sites > 0) {
    initial_sites = std::min(initial_sites, max_segregating_sites);
  }
  haplotypes.resize(sample_size, initial_sites);
  haplotypes.setConstant('0');

  generate_haplotypes(ts);
}

void HaplotypeGenerator::remove_edge(const EdgeRecord& edge) {
  arena.remove_children(edge.parent);
  arena.remove_time(edge.parent);
  for (node_id_t child : edge.children) {
    if (!branch_live.test(child)) {
      throw MalformedInputError(THROW_LINE("Node " + to_string(child) + " has no branch."));
    }
    total_branch_length -= branch_length[child];
    branch_live.reset(child);
  }
}

void HaplotypeGenerator::insert_edge(const EdgeRecord& edge) {
  arena.set_children(edge.parent, edge.children);
  arena.set_time(edge.parent, edge.time);
}

void HaplotypeGenerator::generate_haplotypes(const TreeSequence& ts) {
  DiffIterator diffs(ts);
  vector<node_id_t> branches;
  vector<ts_real_t> cumulative;
  vector<node_id_t> chosen;
  locus_t position = 0;

  while (std::optional<TreeDiff> diff = diffs.next()) {
    for (const EdgeRecord& edge : diff->records_out) {
      remove_edge(edge);
    }
    for (const EdgeRecord& edge : diff->records_in) {
      insert_edge(edge);
    }
    for (const EdgeRecord& edge : diff->records_in) {
      for (node_id_t child : edge.children) {
        ts_real_t length = edge.time - arena.time(child);
        branch_length[child] = length;
        branch_live.set(child);
        total_branch_length += length;
      }
    }

    ts_real_t mean = total_branch_length * scaled_mutation_rate * diff->length / num_loci;
    unsigned num_mutations = random_utils::generate_poisson_rv(generator, mean);
    if (num_mutations > 0) {
      // Cumulative weights over the live branches, in node order
      branches.clear();
      cumulative.clear();
      ts_real_t running = 0;
      for (std::size_t node = branch_live.find_first(); node != boost::dynamic_bitset<>::npos;
           node = branch_live.find_next(node)) {
        running += branch_length[node];
        branches.push_back(static_cast<node_id_t>(node));
        cumulative.push_back(running);
      }
      chosen.clear();
      for (unsigned i = 0; i < num_mutations; ++i) {
        chosen.push_back(branches[random_utils::sample_cumulative_index(generator, cumulative)]);
      }
      reserve_sites(num_segregating_sites + chosen.size());
      for (node_id_t node : chosen) {
        apply_mutation(node, position);
      }
    }
    position += diff->length;
  }
}

void HaplotypeGenerator::reserve_sites(std::size_t needed) {
  if (max_segregating_sites > 0 && needed > max_segregating_sites) {
    throw CapacityExceededError(THROW_LINE("Need " + to_string(needed) +
                                           " segregating sites but at most " +
                                           to_string(max_segregating_sites) + " are allowed."));
  }
  std::size_t capacity = static_cast<std::size_t>(haplotypes.cols());
  if (needed <= capacity) {
    return;
  }
  std::size_t new_capacity = std::max(2 * capacity, needed);
  if (max_segregating_sites > 0) {
    new_capacity = std::min(new_capacity, max_segregating_sites);
  }
  haplotypes.conservativeResize(Eigen::NoChange, new_capacity);
  haplotypes.rightCols(new_capacity - capacity).setConstant('0');
}

void HaplotypeGenerator::apply_mutation(node_id_t node, locus_t locus) {
  vector<node_id_t> stack{node};
  while (!stack.empty()) {
    node_id_t u = stack.back();
    stack.pop_back();
    if (arena.is_sample(u)) {
      haplotypes(u - 1, num_segregating_sites) = '1';
    }
    else {
      for (node_id_t child : arena.children(u)) {
        stack.push_back(child);
      }
    }
  }
  mutation_nodes.push_back(node);
  site_loci.push_back(locus);
  ++num_segregating_sites;
}

unsigned HaplotypeGenerator::get_random_seed() const {
  return random_seed;
}

ts_real_t HaplotypeGenerator::get_scaled_mutation_rate() const {
  return scaled_mutation_rate;
}

std::size_t HaplotypeGenerator::get_num_segregating_sites() const {
  return num_segregating_sites;
}

HaplotypeMatrix HaplotypeGenerator::get_haplotypes() const {
  return haplotypes.leftCols(num_segregating_sites);
}

vector<string> HaplotypeGenerator::haplotype_strings() const {
  vector<string> result;
  result.reserve(sample_size);
  for (Eigen::Index row = 0; row < haplotypes.rows(); ++row) {
    string haplotype(num_segregating_sites, '0');
    for (std::size_t site = 0; site < num_segregating_sites; ++site) {
      haplotype[site] = haplotypes(row, site);
    }
    result.push_back(std::move(haplotype));
  }
  return result;
}

const vector<node_id_t>& HaplotypeGenerator::get_mutation_nodes() const {
  return mutation_nodes;
}

const vector<locus_t>& HaplotypeGenerator::get_site_loci() const {
  return site_loci;
}
