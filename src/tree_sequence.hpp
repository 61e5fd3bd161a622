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

#ifndef TREE_SEQ_LIB_TREE_SEQUENCE_H
#define TREE_SEQ_LIB_TREE_SEQUENCE_H

#include "coalescence_record.hpp"
#include "constants.hpp"
#include "simulation_parameters.hpp"
#include "types.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <iostream>
#include <vector>

class DiffIterator;
class NewickGenerator;
class SparseTreeIterator;

/**
 * @class TreeSequence
 * @brief The coalescence records produced by one simulation, sorted by left locus.
 *
 * The records are stored as aligned columns, the way they are laid out in tree files. The
 * store is immutable after construction; the traversals (diffs(), sparse_trees(),
 * newick_trees(), and HaplotypeGenerator) keep a reference to it, so it must outlive them.
 */
class TreeSequence {
private:
  std::vector<locus_t> breakpoints;
  std::vector<locus_t> left;
  std::vector<locus_t> right;
  std::vector<std::array<node_id_t, 2>> children;
  std::vector<node_id_t> parent;
  std::vector<ts_real_t> time;
  SimulationParameters parameters;
  nlohmann::json environment;
  node_id_t max_node_id = 0;

  void check_parameters() const;
  void check_breakpoints() const;
  void check_records();
  void sort_records();

public:
  /**
   * @brief Construct a tree sequence from the record columns of a simulation.
   *
   * Records are stably sorted by left locus if they are not sorted already.
   *
   * @param _breakpoints Loci at which the genealogy may change: strictly increasing, from 0 to
   *     num_loci inclusive.
   * @param _left First locus of each record.
   * @param _right One past the last locus of each record.
   * @param _children The two children of each record.
   * @param _parent The parent of each record.
   * @param _time The coalescence time of each record.
   * @param _parameters Simulation parameters; sample_size and num_loci define the samples and
   *     the locus range.
   * @param _environment Fingerprint of the environment that produced the records.
   * @throws MalformedInputError if the columns differ in length, are empty, or describe records
   *     outside [0, num_loci).
   */
  TreeSequence(std::vector<locus_t> _breakpoints, std::vector<locus_t> _left,
               std::vector<locus_t> _right, std::vector<std::array<node_id_t, 2>> _children,
               std::vector<node_id_t> _parent, std::vector<ts_real_t> _time,
               SimulationParameters _parameters,
               nlohmann::json _environment = nlohmann::json::object());

  node_id_t get_sample_size() const;
  locus_t get_num_loci() const;
  std::size_t get_num_records() const;
  node_id_t get_max_node_id() const;
  const SimulationParameters& get_parameters() const;
  const nlohmann::json& get_environment() const;
  const std::vector<locus_t>& get_breakpoints() const;
  const std::vector<locus_t>& get_left() const;
  const std::vector<locus_t>& get_right() const;
  const std::vector<std::array<node_id_t, 2>>& get_children() const;
  const std::vector<node_id_t>& get_parent() const;
  const std::vector<ts_real_t>& get_time() const;

  CoalescenceRecord record(std::size_t index) const;

  /**
   * @brief Print the parameters, the environment and every record to a stream.
   */
  void print_state(std::ostream& os) const;

  /**
   * @brief The edges leaving and entering at each change of genealogy.
   *
   * @param all_breaks if true, also emit an empty diff at every breakpoint inside a run, so that
   *     the emitted lengths are the gaps between consecutive breakpoints
   */
  DiffIterator diffs(bool all_breaks = false) const;

  /**
   * @brief Full parent and time maps for each run of records sharing a left locus.
   */
  SparseTreeIterator sparse_trees() const;

  /**
   * @brief A Newick string for each interval.
   *
   * @param precision number of decimal places of the branch lengths
   * @param all_breaks emit one tree per breakpoint interval instead of one per change
   */
  NewickGenerator newick_trees(int precision = tsl::default_newick_precision,
                               bool all_breaks = false) const;
};

#endif // TREE_SEQ_LIB_TREE_SEQUENCE_H
