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

#include "utils.hpp"

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

using std::string;

namespace utils {

string current_time_string() {
  auto now = std::chrono::system_clock::now();
  std::time_t curr_time = std::chrono::system_clock::to_time_t(now);

  char output[100];
  if (std::strftime(output, sizeof(output), "%Y-%m-%d %X", std::localtime(&curr_time))) {
    string my_string(output);
    return my_string;
  }
  else {
    throw std::runtime_error(THROW_LINE("Trying to get time failed."));
  }
}

int string_to_int(string s) {
  return atoi(s.c_str());
}

int arg_to_int(char* arg) {
  return string_to_int((string) arg);
}

ts_real_t arg_to_real(char* arg) {
  return std::strtod(arg, nullptr);
}

string format_fixed(ts_real_t value, int precision) {
  if (precision < 0) {
    throw std::invalid_argument(THROW_LINE("Precision must be non-negative."));
  }
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(precision) << value;
  return oss.str();
}

} // namespace utils
