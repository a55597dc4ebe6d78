#pragma once

#include <texsyn/core/fwd.hpp>
#include <texsyn/core/utility.hpp>
#include <string_view>

namespace txs {
  /* Rect.
     Axis-aligned integer rectangle used for blits and sub-image views.
     coords + size must lie within the image it addresses; see contains(...). */
  struct Rect {
    eig::Array2u coords = eig::Array2u::Zero(); // Top-left corner
    eig::Array2u size   = eig::Array2u::Zero(); // Width/height

  public:
    // One-past-the-end corner
    eig::Array2u end() const { return coords + size; }

    // Number of pixels covered
    uint area() const { return size.prod(); }

    bool empty() const { return (size == 0).any(); }

    // Test whether a position lies inside the rectangle
    bool contains(const eig::Array2u &xy) const {
      return (xy >= coords).all() && (xy < end()).all();
    }

    // Test whether another rectangle lies entirely inside this rectangle
    bool contains(const Rect &r) const {
      return (r.coords >= coords).all() && (r.end() <= end()).all();
    }

    bool operator==(const Rect &o) const {
      return (coords == o.coords).all() && (size == o.size).all();
    }
  };

  /* Patch.
     Square region in a source image, specified by its top-left corner
     and side length. Immutable once selected. */
  struct Patch {
    eig::Array2u coords = eig::Array2u::Zero();
    uint         size   = 0;

  public:
    Rect rect() const {
      return { .coords = coords, .size = eig::Array2u(size, size) };
    }

    bool operator==(const Patch &o) const {
      return (coords == o.coords).all() && size == o.size;
    }
  };

  /* OverlapArea.
     Region(s) of an about-to-be-placed patch that overlap already
     synthesized buffer content. */
  enum class OverlapArea {
    eTop,     // Patch shares only its top edge with filled content
    eLeft,    // Patch shares only its left edge with filled content
    eTopLeft  // Patch shares both top and left edges
  };

  // Determine the overlap area of a patch from its position in the patch grid;
  // the first column only has a neighbour above, the first row only one to the left.
  // Position (0, 0) is the seed patch and has no overlap.
  inline
  OverlapArea overlap_area(const eig::Array2u &grid_xy) {
    debug::check_expr((grid_xy != 0).any(), "seed patch at grid (0, 0) has no overlap area");
    if (grid_xy.x() == 0)
      return OverlapArea::eTop;
    else if (grid_xy.y() == 0)
      return OverlapArea::eLeft;
    else
      return OverlapArea::eTopLeft;
  }

  constexpr
  std::string_view to_string(OverlapArea area) {
    switch (area) {
      case OverlapArea::eTop:     return "top";
      case OverlapArea::eLeft:    return "left";
      case OverlapArea::eTopLeft: return "top-left";
      default:                    return "unknown";
    }
  }
} // namespace txs

template<>
struct fmt::formatter<txs::eig::Array2u>{
  template <typename context_ty>
  constexpr auto parse(context_ty& ctx) {
    return ctx.begin();
  }

  template <typename fmt_context_ty>
  constexpr auto format(const txs::eig::Array2u& v, fmt_context_ty& ctx) const {
    return fmt::format_to(ctx.out(), "({}, {})", v.x(), v.y());
  }
};

template<>
struct fmt::formatter<txs::OverlapArea>{
  template <typename context_ty>
  constexpr auto parse(context_ty& ctx) {
    return ctx.begin();
  }

  template <typename fmt_context_ty>
  constexpr auto format(const txs::OverlapArea& area, fmt_context_ty& ctx) const {
    return fmt::format_to(ctx.out(), "{}", txs::to_string(area));
  }
};
