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

#include <texsyn/core/fwd.hpp>
#include <texsyn/core/io.hpp>
#include <texsyn/quilt/quilt.hpp>
#include <texsyn/search/search.hpp>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace txs {
  /* Args.
     Minimal command line reader; arguments of the form "-key=value" or "-flag"
     are options, all other arguments are positional, in order of appearance. */
  class Args {
    std::vector<std::string>                     m_positional;
    std::unordered_map<std::string, std::string> m_options;

  public:
    Args() = default;

    // Read arguments, skipping argv[0]
    Args(int argc, const char * const argv[]);

    // Read arguments as provided
    explicit Args(std::span<const std::string> args);

    const std::vector<std::string> &positional() const { return m_positional; }

    // Test whether an option was specified, with or without value
    bool has(std::string_view key) const;

    // Parse an option's value; returns nothing if the option is absent, and
    // throws InvalidArgumentsException if the value cannot be parsed as T
    template <typename T>
    std::optional<T> get(std::string_view key) const;

    // Throw InvalidArgumentsException if any option is not one of keys
    void check_known(std::span<const std::string_view> keys) const;
  };

  /* Fully parsed invocation of the quilting front-end */
  struct QuiltCommand {
    fs::path        input;
    fs::path        output = "quilt.png";
    QuiltCreateInfo info;
  };

  /* Fully parsed invocation of the pixel-search front-end */
  struct SearchCommand {
    fs::path         input;
    fs::path         output = "search.png";
    SearchCreateInfo info;
  };

  // Parse command line for texsyn_quilt; a "-config" file is applied
  // first, and all other options override its values
  QuiltCommand parse_quilt_command(const Args &args);

  // Parse command line for texsyn_search; a "-config" file is applied
  // first, and all other options override its values
  SearchCommand parse_search_command(const Args &args);

  // Usage strings printed on argument errors
  std::string_view quilt_usage();
  std::string_view search_usage();
} // namespace txs
