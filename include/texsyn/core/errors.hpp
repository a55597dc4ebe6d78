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

#include <texsyn/core/utility.hpp>
#include <source_location>
#include <string_view>

namespace txs {
  /* Exception thrown when construction or validation parameters violate their
     contract; e.g. a zero output size, an even window or an out-of-bounds seed.
     Always thrown before any image work starts. */
  class InvalidArgumentsException : public detail::Exception {
  protected:
    std::string_view name() const noexcept override {
      return "txs::InvalidArgumentsException";
    }
  };

  /* Exception thrown when a synthesis run cannot proceed; e.g. an empty candidate
     pool, a distance function producing NaN, or an exhausted probabilistic search. */
  class SynthesisException : public detail::Exception {
  protected:
    std::string_view name() const noexcept override {
      return "txs::SynthesisException";
    }
  };

  // Throw InvalidArgumentsException pointing to the caller if expr evaluates to false
  inline
  void check_args(bool expr,
                  const std::string_view &msg,
                  const std::source_location sl = std::source_location::current()) {
    guard(!expr);

    InvalidArgumentsException e;
    e.put("src", "txs::check_args(...) failed, invalid arguments");
    e.put("message", msg);
    e.put("in file", fmt::format("{}({}:{})", sl.file_name(), sl.line(), sl.column()));
    throw e;
  }

  // Throw SynthesisException pointing to the caller if expr evaluates to false
  inline
  void check_synthesis(bool expr,
                       const std::string_view &msg,
                       const std::source_location sl = std::source_location::current()) {
    guard(!expr);

    SynthesisException e;
    e.put("src", "txs::check_synthesis(...) failed, synthesis cannot proceed");
    e.put("message", msg);
    e.put("in file", fmt::format("{}({}:{})", sl.file_name(), sl.line(), sl.column()));
    throw e;
  }
} // namespace txs
