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

// The output stream below follows the Eagle software file
// https://github.com/poruloh/Eagle/blob/master/src/FileUtils.hpp
// developed by Po-Ru Loh and released under the GNU General Public
// License v3.0 (GPLv3).

#ifndef TREE_SEQ_LIB_FILE_UTILS_H
#define TREE_SEQ_LIB_FILE_UTILS_H

#include <fstream>
#include <string>

#include <boost/iostreams/filtering_stream.hpp>

namespace file_utils {

/**
 * @class AutoGzOfstream
 * @brief Output file stream that gzip-compresses when the file name ends in ".gz".
 */
class AutoGzOfstream {

  boost::iostreams::filtering_ostream boost_out;
  std::ofstream fout;

public:
  // Throws std::runtime_error if the file cannot be opened
  void open(const std::string& file, std::ios_base::openmode mode = std::ios::out);
  void close();
  template <class T> AutoGzOfstream& operator<<(const T& x) {
    boost_out << x;
    return *this;
  }

  AutoGzOfstream& operator<<(std::ostream& (*manip)(std::ostream&) );
  operator bool() const;
};

bool has_gz_extension(const std::string& file);

} // namespace file_utils

#endif // TREE_SEQ_LIB_FILE_UTILS_H
