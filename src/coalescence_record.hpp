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

#ifndef TREE_SEQ_LIB_COALESCENCE_RECORD_H
#define TREE_SEQ_LIB_COALESCENCE_RECORD_H

#include "types.hpp"

#include <array>
#include <iostream>
#include <vector>

/**
 * @class EdgeRecord
 * @brief The genealogical content of a coalescence record: two children joined under a parent.
 */
class EdgeRecord {
public:
  /**
   * @brief The two child nodes, in the order the simulator reported them.
   */
  std::array<node_id_t, 2> children;

  /**
   * @brief The parent node created by the coalescence.
   */
  node_id_t parent;

  /**
   * @brief The time of the coalescence.
   */
  ts_real_t time;

  EdgeRecord(std::array<node_id_t, 2> _children, node_id_t _parent, ts_real_t _time);

  bool operator==(const EdgeRecord& other) const;
  bool operator!=(const EdgeRecord& other) const;
  friend std::ostream& operator<<(std::ostream& os, const EdgeRecord& edge);
};

/**
 * @class CoalescenceRecord
 * @brief Represents one coalescence event valid over the half-open locus interval [left, right).
 */
class CoalescenceRecord {
public:
  /**
   * @brief The first locus of the interval.
   */
  locus_t left;

  /**
   * @brief The locus one past the end of the interval.
   */
  locus_t right;

  std::array<node_id_t, 2> children;
  node_id_t parent;
  ts_real_t time;

  /**
   * @brief Construct a new CoalescenceRecord object.
   *
   * @param _left The first locus of the interval.
   * @param _right The locus one past the end of the interval.
   * @param _children The two child nodes.
   * @param _parent The parent node.
   * @param _time The time of the coalescence.
   */
  CoalescenceRecord(locus_t _left, locus_t _right, std::array<node_id_t, 2> _children,
                    node_id_t _parent, ts_real_t _time);

  /**
   * @brief The record without its interval, as carried by a tree diff.
   */
  EdgeRecord edge() const;

  friend std::ostream& operator<<(std::ostream& os, const CoalescenceRecord& record);
};

/**
 * @class TreeDiff
 * @brief The change in genealogy between one interval and the next.
 */
class TreeDiff {
public:
  /**
   * @brief The number of loci the resulting tree is valid for.
   */
  locus_t length = 0;

  /**
   * @brief Records of the previous interval that are no longer present.
   */
  std::vector<EdgeRecord> records_out;

  /**
   * @brief Records that enter at the start of this interval.
   */
  std::vector<EdgeRecord> records_in;
};

#endif // TREE_SEQ_LIB_COALESCENCE_RECORD_H
