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

#include <jointdiag/core/io.hpp>
#include <jointdiag/core/utility.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>

namespace jd::io {
  std::string load_string(const fs::path &path) {
    jd_trace();

    debug::check_expr(fs::exists(path),
      fmt::format("failed to resolve path \"{}\"", path.string()));
    
    std::ifstream ifs(path);
    debug::check_expr(ifs.is_open(),
      fmt::format("failed to open file \"{}\"", path.string()));
    
    // Stream full file into buffer
    std::stringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
  }

  void save_string(const fs::path &path, const std::string &str) {
    jd_trace();
    
    std::ofstream ofs(path, std::ios::out);
    debug::check_expr(ofs.is_open(),
      fmt::format("failed to open file \"{}\"", path.string()));
    ofs << str;
  }

  template <typename T>
  MatX<T> load_matrix(const fs::path &path) {
    jd_trace();

    // Parse file line by line into rows of values
    std::vector<std::vector<T>> rows;
    std::stringstream ss(load_string(path));
    std::string line;
    uint        line_nr = 0;
    while (std::getline(ss, line)) {
      line_nr++;

      // Discard comments, then skip lines left empty
      line.erase(std::min(line.find('#'), line.size()));
      guard_continue(line.find_first_not_of(" \t\r") != std::string::npos);

      std::istringstream ls(line);
      std::vector<T> row;
      for (T v; ls >> v;)
        row.push_back(v);
      debug::check_expr(ls.eof(),
        fmt::format("unreadable value on line {} of \"{}\"", line_nr, path.string()));
      size_t expected = rows.empty() ? row.size() : rows.front().size();
      debug::check_expr(row.size() == expected,
        fmt::format("matrix row on line {} of \"{}\" holds {} values, expected {}", 
          line_nr, path.string(), row.size(), expected));
      rows.push_back(std::move(row));
    }

    guard(!rows.empty(), MatX<T>());
    MatX<T> A(rows.size(), rows.front().size());
    for (uint i = 0; i < rows.size(); ++i)
      for (uint j = 0; j < rows[i].size(); ++j)
        A(i, j) = rows[i][j];
    return A;
  }

  template <typename T>
  void save_matrix(const fs::path &path, const MatX<T> &A) {
    jd_trace();

    std::ostringstream ss;
    ss.precision(17);
    for (eig::Index i = 0; i < A.rows(); ++i) {
      for (eig::Index j = 0; j < A.cols(); ++j)
        ss << (j > 0 ? " " : "") << A(i, j);
      ss << '\n';
    }
    save_string(path, ss.str());
  }

  /* Explicit template instantiations for real and complex working precision */

  template MatX<double>  load_matrix<double>(const fs::path &);
  template MatX<cdouble> load_matrix<cdouble>(const fs::path &);
  template void save_matrix<double>(const fs::path &, const MatX<double> &);
  template void save_matrix<cdouble>(const fs::path &, const MatX<cdouble> &);
} // namespace jd::io
