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

#ifndef TREE_SEQ_LIB_DIFF_ITERATOR_H
#define TREE_SEQ_LIB_DIFF_ITERATOR_H

#include "coalescence_record.hpp"
#include "tree_sequence.hpp"
#include "types.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <vector>

/**
 * @class DiffIterator
 * @brief Forward-only sequence of the edge changes between consecutive intervals.
 *
 * Records sharing a left locus form a run. For each run, the iterator reports the length until
 * the next run (or num_loci), the edges leaving at the run's left locus, and the run's records.
 * Live edges are indexed by their right locus and retained across runs, so an edge spanning
 * several runs is reported once on entry and once on exit.
 *
 * With all_breaks, a run covering several breakpoint intervals is split: the first interval
 * carries the run's changes and each further interval is reported as an empty diff.
 *
 * Errors are fatal: after throwing, the iterator reports no further diffs.
 */
class DiffIterator {
private:
  const TreeSequence* ts;
  bool all_breaks;
  std::size_t next_record = 0;
  bool exhausted = false;

  // edges of the current tree keyed by the locus at which they leave
  std::map<locus_t, std::vector<EdgeRecord>> live_edges;

  // breakpoint bookkeeping for all_breaks
  std::size_t break_index = 1;
  locus_t position = 0;
  bool splitting_run = false;

  std::optional<TreeDiff> next_run();
  std::optional<TreeDiff> next_breakpoint_interval();

public:
  explicit DiffIterator(const TreeSequence& _ts, bool _all_breaks = false);

  /**
   * @brief Advance to the next interval.
   *
   * @return the diff for the next interval, or std::nullopt once num_loci is reached
   * @throws MalformedInputError if the records do not tile [0, num_loci) consistently, or a run
   *     boundary is missing from the breakpoints (all_breaks only)
   * @throws UnterminatedAncestryError if live edges end before num_loci after the last run
   */
  std::optional<TreeDiff> next();
};

#endif // TREE_SEQ_LIB_DIFF_ITERATOR_H
