#pragma once

#include <texsyn/core/errors.hpp>
#include <cmath>
#include <compare>
#include <concepts>
#include <optional>

namespace txs {
  /* OrderedFloat.
     Floating point wrapper which rejects NaN on construction, and thereby
     provides a strict total order; usable as a sort or priority key. */
  template <typename F>
  class OrderedFloat {
    static_assert(std::floating_point<F>);

    F m_value;

    constexpr explicit OrderedFloat(F value, std::nullopt_t)
    : m_value(value) { }

  public:
    constexpr OrderedFloat()
    : m_value(F(0)) { }

    // Construct from a value; throws SynthesisException on NaN
    explicit OrderedFloat(F value)
    : m_value(value) {
      check_synthesis(!std::isnan(value), "OrderedFloat cannot hold NaN");
    }

    // Construct from a value; returns nothing on NaN
    static std::optional<OrderedFloat> try_from(F value) {
      guard(!std::isnan(value), {});
      return OrderedFloat(value, std::nullopt);
    }

    constexpr F value() const { return m_value; }

    // NaN is excluded, so the floating point order is total here
    constexpr std::strong_ordering operator<=>(const OrderedFloat &o) const {
      if (m_value < o.m_value)
        return std::strong_ordering::less;
      else if (m_value > o.m_value)
        return std::strong_ordering::greater;
      else
        return std::strong_ordering::equal;
    }

    constexpr bool operator==(const OrderedFloat &o) const {
      return m_value == o.m_value;
    }

    // inf + -inf is the only way to produce NaN from two ordered values
    OrderedFloat operator+(const OrderedFloat &o) const {
      return OrderedFloat(m_value + o.m_value);
    }

    OrderedFloat &operator+=(const OrderedFloat &o) {
      return (*this = *this + o);
    }
  };
} // namespace txs
