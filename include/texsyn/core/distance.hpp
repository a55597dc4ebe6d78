#pragma once

#include <texsyn/core/fwd.hpp>
#include <cmath>
#include <functional>
#include <string_view>

namespace txs {
  // Pluggable color distance between two pixels; must return a non-negative value
  using DistanceFunc = std::function<double(const Colr3b &, const Colr3b &)>;

  namespace distance {
    // L1 distance, also known as Manhattan distance
    inline
    double l1(const Colr3b &a, const Colr3b &b) {
      return (a.cast<double>() - b.cast<double>()).abs().sum();
    }

    // L2 distance, also known as Euclidean distance
    inline
    double l2(const Colr3b &a, const Colr3b &b) {
      return std::sqrt((a.cast<double>() - b.cast<double>()).square().sum());
    }

    // Look up one of the above metrics by name, "l1" or "l2";
    // throws InvalidArgumentsException on unknown names
    DistanceFunc from_name(std::string_view name);
  } // namespace distance
} // namespace txs
