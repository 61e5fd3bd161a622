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

#include "file_utils.hpp"
#include "utils.hpp"

#include <stdexcept>

#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filtering_stream.hpp>

namespace file_utils {

bool has_gz_extension(const std::string& file) {
  return file.length() > 3 && file.compare(file.length() - 3, 3, ".gz") == 0;
}

void AutoGzOfstream::open(const std::string& file, std::ios_base::openmode mode) {
  if (has_gz_extension(file)) {
    mode |= std::ios::binary;
  }
  fout.open(file.c_str(), mode);
  if (!fout) {
    throw std::runtime_error(THROW_LINE("Unable to open file: " + file));
  }
  if (has_gz_extension(file)) {
    boost_out.push(boost::iostreams::gzip_compressor());
  }
  boost_out.push(fout);
}

void AutoGzOfstream::close() {
  // Popping the chain flushes the compressor into the file
  boost_out.reset();
  fout.close();
}

AutoGzOfstream& AutoGzOfstream::operator<<(std::ostream& (*manip)(std::ostream&) ) {
  manip(boost_out);
  return *this;
}

AutoGzOfstream::operator bool() const {
  return !boost_out.fail();
}

} // namespace file_utils
