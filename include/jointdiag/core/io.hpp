// Copyright (C) 2024 Mark van de Ruit, Delft University of Technology.
// 
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
// 
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
// 
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <https://www.gnu.org/licenses/>.

#pragma once

#include <jointdiag/core/math.hpp>
#include <filesystem>
#include <string>

namespace jd {
  namespace fs = std::filesystem;

  namespace io {
    // Simple string load/save to/from file
    std::string load_string(const fs::path &path);
    void        save_string(const fs::path &path, const std::string &string);

    // Simple matrix load/save to/from file
    // Input should be a text file, containing one matrix row per line with whitespace-separated
    // values. A '#' starts a comment that runs to the end of its line. Complex values are written as '(re,im)'.
    template <typename T>
    MatX<T> load_matrix(const fs::path &path);
    template <typename T>
    void    save_matrix(const fs::path &path, const MatX<T> &A);
  } // namespace io
} // namespace jd
