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

#ifndef TREE_SEQ_LIB_TYPES_H
#define TREE_SEQ_LIB_TYPES_H

#include <Eigen/Dense>

#include <cstdint>

// Times and branch lengths
using ts_real_t = double;

// Integer positions along the simulated genome
using locus_t = std::uint32_t;

// Node identifiers: samples are 1..n, coalescence events are numbered above n, and 0 means no node
using node_id_t = std::uint32_t;

// Rows are samples, columns are segregating sites, entries are '0' or '1'
using HaplotypeMatrix = Eigen::Matrix<char, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

#endif // TREE_SEQ_LIB_TYPES_H
