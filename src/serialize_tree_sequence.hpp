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

#ifndef TREE_SEQ_LIB_SERIALIZE_TREE_SEQUENCE_H
#define TREE_SEQ_LIB_SERIALIZE_TREE_SEQUENCE_H

#include "tree_sequence.hpp"

#include <string>

namespace ts_utils
{

/**
 * @brief Write a tree sequence to an HDF5 tree file.
 *
 * The root group carries the string attributes `file_version`, `library_version`, `parameters`
 * and `environment` (the last two as JSON text), and the datasets `breakpoints`,
 * `records/left`, `records/right`, `records/children`, `records/parent` and `records/time`.
 * An existing file at the path is overwritten.
 *
 * @param ts The tree sequence to write.
 * @param file_name The path of the file to create.
 * @throws std::runtime_error if the file cannot be written.
 */
void dump_tree_sequence(const TreeSequence& ts, const std::string& file_name);

/**
 * @brief Validates the integrity of a tree file.
 *
 * Checks that the file exists and is an HDF5 file, that its `file_version` is supported, and
 * that every expected attribute and dataset is present. Problems are reported on standard
 * output.
 *
 * @param file_name The path of the tree file.
 * @return Returns `true` if the file can be loaded, otherwise `false`.
 */
bool validate_tree_sequence_file(const std::string& file_name);

/**
 * @brief Read a tree sequence written by dump_tree_sequence.
 *
 * @throws std::runtime_error if the file is missing, invalid, or holds unreadable metadata.
 * @throws MalformedInputError if the stored records are inconsistent.
 */
TreeSequence load_tree_sequence(const std::string& file_name);

} // namespace ts_utils

#endif // TREE_SEQ_LIB_SERIALIZE_TREE_SEQUENCE_H
