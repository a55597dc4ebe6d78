#pragma once

#include <Eigen/Dense>
#include <concepts>

// Introduce 'eig' namespace shorthand in the texsyn namespace
namespace txs {
  namespace eig = Eigen;
} // namespace txs

namespace Eigen {
  // Concept for detecting Eigen's coefficient-wise comparison on arbitrary types
  template <typename Ty>
  concept is_array_comparable = requires(const Ty &a, const Ty &b) {
    { (a == b).all() } -> std::convertible_to<bool>;
  };

  // Eigen's arrays do not support single-component equality comparison,
  // but in general most things handle this just fine;
  // here's a nice hack for the few times this requires writing code twice
  template <typename Ty>
  bool safe_exact_compare(const Ty &a, const Ty &b) {
    if constexpr (is_array_comparable<Ty>)
      return (a == b).all();
    else
      return a == b;
  }

  /* Define useful integer types */

  using Array2u = Array<unsigned int, 2, 1>;
  using Array3b = Array<unsigned char, 3, 1>;
} // namespace Eigen
