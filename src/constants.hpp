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

#ifndef TREE_SEQ_LIB_CONSTANTS_H
#define TREE_SEQ_LIB_CONSTANTS_H

namespace tsl {

/**
 * Version of tree-seq-lib, written into every tree file and environment fingerprint.
 */
constexpr const char* library_version = "0.1.0";

/**
 * Layout version of the HDF5 tree file. Files with any other `file_version` are rejected.
 */
constexpr const char* tree_file_version = "0.1";

/**
 * Number of decimal places used for Newick branch lengths unless the caller asks otherwise.
 */
constexpr int default_newick_precision = 3;

}

#endif // TREE_SEQ_LIB_CONSTANTS_H
