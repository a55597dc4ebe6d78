#pragma once

#include <texsyn/core/detail/eigen.hpp>
#include <fmt/core.h>
#include <cstddef>

namespace txs {
  // Shorthand unsigned types
  using uint  = unsigned int;
  using uchar = unsigned char;

  // 8-bit rgb color; pixel type of all synthesis inputs/outputs
  using Colr3b = eig::Array3b;
} // namespace txs
