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

#include <jointdiag/core/detail/trace.hpp>
#include <jointdiag/core/detail/utility.hpp>
#include <source_location>
#include <span>
#include <string>
#include <variant>

// Simple guard statement syntactic sugar
#define guard(expr,...)                if (!(expr)) { return __VA_ARGS__ ; }
#define guard_continue(expr)           if (!(expr)) { continue; }
#define guard_break(expr)              if (!(expr)) { break; }

// Simple range-like syntactic sugar
#define range_iter(c)  c.begin(), c.end()

namespace jd {
  // Thrown before any computation if the problem description or solver
  // settings cannot describe a well-posed problem
  class InvalidConfiguration : public detail::Exception {
  protected:
    std::string_view name() const noexcept override {
      return "jd::InvalidConfiguration";
    }
  };

  // Thrown if a decomposition fails on the provided data; this indicates
  // malformed input and is never caught inside the library
  class NumericalError : public detail::Exception {
  protected:
    std::string_view name() const noexcept override {
      return "jd::NumericalError";
    }
  };

  // Visit a variant using syntactic sugar,
  // e.g. 'std::visit(visitor, variant)' formed from 'variant | visit { visitors... };'
  // Src: https://en.cppreference.com/w/cpp/utility/variant/visit
  /*
    variant | visit {
      [](uint i)  { ... },
      [](float f) { ... },
      [](auto v)  { ... },
    }
  */
  template <typename... Ts> struct visit : Ts... { using Ts::operator()...; };
  template <typename... Ts> visit(Ts...) -> visit<Ts...>;
  template <typename... Ts, typename... Fs>
  constexpr decltype(auto) operator| (std::variant<Ts...> const& v, visit<Fs...> const& f) {
    return std::visit(f, v);
  }
  template <typename... Ts, typename... Fs>
  constexpr decltype(auto) operator| (std::variant<Ts...> & v, visit<Fs...> const& f) {
    return std::visit(f, v);
  }

  // Debug namespace; mostly check_expr(...) from here on
  namespace debug {
    namespace detail {
      template <typename E>
      [[noreturn]] void throw_at(std::string_view src,
                                 std::string_view msg,
                                 const std::source_location &sl) {
        E e;
        e.put("src", src);
        if (!msg.empty())
          e.put("message", msg);
        e.put("in file", fmt::format("{}({}:{})", sl.file_name(), sl.line(), sl.column()));
        throw e;
      }
    } // namespace detail

    // Evaluate a boolean expression, throwing a detailed exception pointing
    // to the expression's origin if said expression fails
    inline
    void check_expr(bool expr,
                    std::string_view msg = "",
                    const std::source_location sl = std::source_location::current()) {
      guard(!expr);
      detail::throw_at<jd::detail::Exception>(
        "jd::debug::check_expr(...) failed, checked expression evaluated to false", msg, sl);
    }

    // Validate part of a problem configuration, throwing InvalidConfiguration
    inline
    void check_config(bool expr,
                      std::string_view msg = "",
                      const std::source_location sl = std::source_location::current()) {
      guard(!expr);
      detail::throw_at<InvalidConfiguration>(
        "jd::debug::check_config(...) failed, configuration is invalid", msg, sl);
    }

    // Validate the outcome of a numerical decomposition, throwing NumericalError
    inline
    void check_numeric(bool expr,
                       std::string_view msg = "",
                       const std::source_location sl = std::source_location::current()) {
      guard(!expr);
      detail::throw_at<NumericalError>(
        "jd::debug::check_numeric(...) failed, decomposition did not succeed", msg, sl);
    }
  } // namespace debug
} // namespace jd
