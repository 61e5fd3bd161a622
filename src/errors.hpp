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

#ifndef TREE_SEQ_LIB_ERRORS_H
#define TREE_SEQ_LIB_ERRORS_H

#include <stdexcept>
#include <string>

// All of these end the traversal that raised them.

/**
 * @brief Records or breakpoints that are out of order, empty, inconsistent with the locus
 * range, or reference nodes that are not present.
 */
class MalformedInputError : public std::invalid_argument {
public:
  explicit MalformedInputError(const std::string& what) : std::invalid_argument(what) {}
};

/**
 * @brief The nodes present in an interval do not form one binary tree over all samples.
 */
class IncompleteCoalescenceError : public std::logic_error {
public:
  explicit IncompleteCoalescenceError(const std::string& what) : std::logic_error(what) {}
};

/**
 * @brief Live edges remain once the records are exhausted.
 */
class UnterminatedAncestryError : public std::logic_error {
public:
  explicit UnterminatedAncestryError(const std::string& what) : std::logic_error(what) {}
};

/**
 * @brief Growing the haplotype matrix would exceed the configured number of sites.
 */
class CapacityExceededError : public std::length_error {
public:
  explicit CapacityExceededError(const std::string& what) : std::length_error(what) {}
};

#endif // TREE_SEQ_LIB_ERRORS_H
