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

#include <jointdiag/core/csp.hpp>
#include <jointdiag/core/io.hpp>
#include <jointdiag/core/ojob.hpp>
#include <jointdiag/core/whitening.hpp>
#include <nlohmann/json_fwd.hpp>

namespace jd {
  // Typename shorthand inside jd namespace
  using json = nlohmann::json;

  namespace io {
    /* json load/save to/from file */
    json load_json(const fs::path &path);
    void save_json(const fs::path &path, const json &js, uint indent = 2);
  } // namespace io

  /* json (de)serialization for subspace selection settings */
  void from_json(const json &js, WhiteningInfo &info);
  void to_json(json &js, const WhiteningInfo &info);

  /* json (de)serialization for csp settings */
  void from_json(const json &js, CSPInfo &info);
  void to_json(json &js, const CSPInfo &info);

  /* json (de)serialization for solver settings; init and weights are not serialized */
  template <typename T>
  void from_json(const json &js, OJoBInfo<T> &info);
  template <typename T>
  void to_json(json &js, const OJoBInfo<T> &info);
} // namespace jd
