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

#ifndef TREE_SEQ_LIB_UTILS_H
#define TREE_SEQ_LIB_UTILS_H

#include "types.hpp"

#include <string>

// Utility for exceptions
#define THROW_LINE(a) (std::string(__FILE__) + ":" + std::to_string(__LINE__) + ": " + a)

namespace utils {

std::string current_time_string();

int string_to_int(std::string s);

int arg_to_int(char* arg);

ts_real_t arg_to_real(char* arg);

/**
 * @brief Format a value with a fixed number of decimal places, e.g. (1.5, 3) -> "1.500".
 *
 * @param value the value to format
 * @param precision the number of digits after the decimal point
 * @return the formatted string
 */
std::string format_fixed(ts_real_t value, int precision);

} // namespace utils

#endif // TREE_SEQ_LIB_UTILS_H
