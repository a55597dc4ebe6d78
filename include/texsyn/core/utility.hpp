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

#include <texsyn/core/detail/trace.hpp>
#include <texsyn/core/detail/utility.hpp>
#include <span>
#include <source_location>

// Simple guard statement syntactic sugar
#define guard(expr,...)                if (!(expr)) { return __VA_ARGS__ ; }
#define guard_continue(expr)           if (!(expr)) { continue; }

// Simple range-like syntactic sugar
#define range_iter(c)  c.begin(), c.end()

// For class T, declare swap-based move constr/operator
// and delete copy constr/operators, making T non-copyable
#define txs_declare_noncopyable(T)                                            \
  T(const T &) = delete;                                                      \
  T & operator= (const T &) = delete;                                         \
  T(T &&o) noexcept { txs_trace(); swap(o); }                                 \
  inline T & operator= (T &&o) noexcept { txs_trace(); swap(o); return *this; }

namespace txs {
  // Interpret a span of U to a span of type T
  template <class T, class U>
  std::span<T> cast_span(std::span<U> s) {
    auto data = s.data();
    guard(data, {});
    return { reinterpret_cast<T*>(data), s.size_bytes() / sizeof(T) };
  }

  // Take a pair of integers, cast to same type, and do a ceiling divide
  template <typename T, typename T_>
  constexpr inline T ceil_div(T n, T_ div) {
    return (n + static_cast<T>(div) - T(1)) / static_cast<T>(div);
  }

  // Debug namespace; mostly check_expr(...) from here on
  namespace debug {
    // Evaluate a boolean expression, throwing a detailed exception pointing
    // to the expression's origin if said expression fails
    inline
    void check_expr(bool expr,
                    const std::string_view &msg = "",
                    const std::source_location sl = std::source_location::current()) {
      guard(!expr);

      detail::Exception e;
      e.put("src", "txs::debug::check_expr(...) failed, checked expression evaluated to false");
      e.put("message", msg);
      e.put("in file", fmt::format("{}({}:{})", sl.file_name(), sl.line(), sl.column()));
      throw e;
    }
  } // namespace debug
} // namespace txs
