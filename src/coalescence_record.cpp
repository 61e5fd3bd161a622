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

#include "coalescence_record.hpp"

#include <iostream>

EdgeRecord::EdgeRecord(std::array<node_id_t, 2> _children, node_id_t _parent, ts_real_t _time)
    : children(_children), parent(_parent), time(_time) {
}

bool EdgeRecord::operator==(const EdgeRecord& other) const {
  return children == other.children && parent == other.parent && time == other.time;
}

bool EdgeRecord::operator!=(const EdgeRecord& other) const {
  return !(*this == other);
}

std::ostream& operator<<(std::ostream& os, const EdgeRecord& edge) {
  os << "(" << edge.children[0] << ", " << edge.children[1] << ") -> " << edge.parent
     << " @ " << edge.time;
  return os;
}

CoalescenceRecord::CoalescenceRecord(locus_t _left, locus_t _right,
                                     std::array<node_id_t, 2> _children, node_id_t _parent,
                                     ts_real_t _time)
    : left(_left), right(_right), children(_children), parent(_parent), time(_time) {
}

EdgeRecord CoalescenceRecord::edge() const {
  return EdgeRecord(children, parent, time);
}

std::ostream& operator<<(std::ostream& os, const CoalescenceRecord& record) {
  os << record.left << "\t" << record.right << "\t(" << record.children[0] << ", "
     << record.children[1] << ")\t" << record.parent << "\t" << record.time;
  return os;
}
