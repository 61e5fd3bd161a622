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

#include "diff_iterator.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <string>
#include <utility>

using std::to_string;

DiffIterator::DiffIterator(const TreeSequence& _ts, bool _all_breaks)
    : ts(&_ts), all_breaks(_all_breaks) {
}

std::optional<TreeDiff> DiffIterator::next() {
  if (all_breaks) {
    return next_breakpoint_interval();
  }
  return next_run();
}

std::optional<TreeDiff> DiffIterator::next_run() {
  if (exhausted) {
    return std::nullopt;
  }
  const auto& lefts = ts->get_left();
  const std::size_t num_records = ts->get_num_records();
  const locus_t num_loci = ts->get_num_loci();

  TreeDiff diff;
  const locus_t run_left = lefts[next_record];
  while (next_record < num_records && lefts[next_record] == run_left) {
    const EdgeRecord edge = ts->record(next_record).edge();
    live_edges[ts->get_right()[next_record]].push_back(edge);
    diff.records_in.push_back(edge);
    ++next_record;
  }

  locus_t run_right = num_loci;
  if (next_record < num_records) {
    run_right = lefts[next_record];
    if (run_right < run_left) {
      exhausted = true;
      throw MalformedInputError(THROW_LINE("Records are not sorted by left locus."));
    }
  }
  else {
    exhausted = true;
    if (ts->get_right()[num_records - 1] != num_loci) {
      throw MalformedInputError(THROW_LINE("Last record ends at " +
                                           to_string(ts->get_right()[num_records - 1]) +
                                           " instead of num_loci " + to_string(num_loci)));
    }
  }

  auto leaving = live_edges.find(run_left);
  if (leaving != live_edges.end()) {
    diff.records_out = std::move(leaving->second);
    live_edges.erase(leaving);
  }

  if (exhausted) {
    // Only the edges of the final tree may remain, and they all end at num_loci
    if (!live_edges.empty() && live_edges.begin()->first != num_loci) {
      throw UnterminatedAncestryError(THROW_LINE(
          "Edges ending at locus " + to_string(live_edges.begin()->first) +
          " are still live after the last record."));
    }
  }
  else if (!live_edges.empty() && live_edges.begin()->first < run_right) {
    exhausted = true;
    throw MalformedInputError(THROW_LINE("Edges end at locus " +
                                         to_string(live_edges.begin()->first) +
                                         ", which is not the start of a run of records."));
  }

  diff.length = run_right - run_left;
  return diff;
}

std::optional<TreeDiff> DiffIterator::next_breakpoint_interval() {
  const auto& breakpoints = ts->get_breakpoints();

  if (splitting_run) {
    if (breakpoints[break_index] != position) {
      ++break_index;
      if (break_index >= breakpoints.size() || breakpoints[break_index] > position) {
        exhausted = true;
        splitting_run = false;
        throw MalformedInputError(THROW_LINE("Locus " + to_string(position) +
                                             " is not a breakpoint."));
      }
      TreeDiff empty;
      empty.length = breakpoints[break_index] - breakpoints[break_index - 1];
      return empty;
    }
    ++break_index;
    splitting_run = false;
  }

  std::optional<TreeDiff> diff = next_run();
  if (!diff) {
    return std::nullopt;
  }
  position += diff->length;
  if (break_index >= breakpoints.size() || breakpoints[break_index] > position) {
    exhausted = true;
    throw MalformedInputError(THROW_LINE("Locus " + to_string(position) +
                                         " is not a breakpoint."));
  }
  diff->length = breakpoints[break_index] - breakpoints[break_index - 1];
  splitting_run = true;
  return diff;
}
