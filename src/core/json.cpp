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

#include <jointdiag/core/json.hpp>
#include <jointdiag/core/utility.hpp>
#include <nlohmann/json.hpp>

namespace jd {
  namespace io {
    json load_json(const fs::path &path) {
      return json::parse(load_string(path));
    }

    void save_json(const fs::path &path, const json &js, uint indent) {
      save_string(path, js.dump(indent));
    }
  } // namespace io

  void from_json(const json &js, WhiteningInfo &info) {
    debug::check_config(!(js.contains("variance") && js.contains("dims")),
      "whitening settings may specify either \"variance\" or \"dims\", not both");
    if (js.contains("variance"))
      info.subspace = js.at("variance").get<double>();
    if (js.contains("dims"))
      info.subspace = js.at("dims").get<uint>();
    if (js.contains("method")) {
      auto method = js.at("method").get<std::string>();
      if (method == "first")
        info.method = SubspaceMethod::eFirstAbove;
      else if (method == "last")
        info.method = SubspaceMethod::eLastBelow;
      else
        debug::check_config(false, fmt::format("unknown subspace method \"{}\"", method));
    }
  }

  void to_json(json &js, const WhiteningInfo &info) {
    info.subspace | visit {
      [&js](double f) { js["variance"] = f; },
      [&js](uint p)   { js["dims"]     = p; }
    };
    js["method"] = info.method == SubspaceMethod::eFirstAbove ? "first" : "last";
  }

  void from_json(const json &js, CSPInfo &info) {
    if (js.contains("whitening"))
      info.whitening = js.at("whitening").get<WhiteningInfo>();
  }

  void to_json(json &js, const CSPInfo &info) {
    js["whitening"] = info.whitening;
  }
  
  template <typename T>
  void from_json(const json &js, OJoBInfo<T> &info) {
    // Absent keys keep their defaults
    if (js.contains("full_model"))      info.full_model      = js.at("full_model").get<bool>();
    if (js.contains("pre_white"))       info.pre_white       = js.at("pre_white").get<bool>();
    if (js.contains("sort"))            info.sort            = js.at("sort").get<bool>();
    if (js.contains("trace_normalize")) info.trace_normalize = js.at("trace_normalize").get<bool>();
    if (js.contains("whitening"))       info.whitening       = js.at("whitening").get<WhiteningInfo>();
    if (js.contains("tol"))             info.tol             = js.at("tol").get<real_t<T>>();
    if (js.contains("max_iters"))       info.max_iters       = js.at("max_iters").get<uint>();
    if (js.contains("verbose"))         info.verbose         = js.at("verbose").get<bool>();
  }

  template <typename T>
  void to_json(json &js, const OJoBInfo<T> &info) {
    js["full_model"]      = info.full_model;
    js["pre_white"]       = info.pre_white;
    js["sort"]            = info.sort;
    js["trace_normalize"] = info.trace_normalize;
    js["whitening"]       = info.whitening;
    js["max_iters"]       = info.max_iters;
    js["verbose"]         = info.verbose;
    if (info.tol)
      js["tol"] = *info.tol;
  }

  /* Explicit template instantiations for real and complex working precision */

  template void from_json<double>(const json &, OJoBInfo<double> &);
  template void from_json<cdouble>(const json &, OJoBInfo<cdouble> &);
  template void to_json<double>(json &, const OJoBInfo<double> &);
  template void to_json<cdouble>(json &, const OJoBInfo<cdouble> &);
} // namespace jd
