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

#include <texsyn/quilt/seam.hpp>
#include <texsyn/core/errors.hpp>
#include <texsyn/core/utility.hpp>

namespace txs {
  std::vector<Rect> overlap_rects(OverlapArea area, uint patch_size, uint overlap) {
    Rect top  = { .coords = { 0, 0 },       .size = { patch_size, overlap } };
    Rect left = { .coords = { 0, 0 },       .size = { overlap, patch_size } };
    Rect rest = { .coords = { 0, overlap }, .size = { overlap, patch_size - overlap } };

    switch (area) {
      case OverlapArea::eTop:     return { top };
      case OverlapArea::eLeft:    return { left };
      case OverlapArea::eTopLeft: return { top, rest };
      default:                    return { };
    }
  }

  double patch_rect_error(const DistanceFunc &d,
                          const Texture2d3b  &a,
                          const Texture2d3b  &b,
                          const eig::Array2u &a_xy,
                          const eig::Array2u &b_xy,
                          const eig::Array2u &size) {
    debug::check_expr(contains(a, { .coords = a_xy, .size = size })
                   && contains(b, { .coords = b_xy, .size = size }),
      "patch_rect_error(...) rect exceeds texture bounds");

    double err = 0.0;
    for (uint y = 0; y < size.y(); ++y)
      for (uint x = 0; x < size.x(); ++x)
        err += d(a(a_xy.x() + x, a_xy.y() + y), b(b_xy.x() + x, b_xy.y() + y));
    return err;
  }

  double patch_overlap_error(const DistanceFunc &d,
                             const Texture2d3b  &source,
                             const Texture2d3b  &buffer,
                             const eig::Array2u &src_xy,
                             const eig::Array2u &dst_xy,
                             uint                patch_size,
                             uint                overlap,
                             OverlapArea         area) {
    double err = 0.0;
    for (const Rect &r : overlap_rects(area, patch_size, overlap))
      err += patch_rect_error(d, source, buffer, src_xy + r.coords, dst_xy + r.coords, r.size);
    return err;
  }

  ErrorSurface patch_error_surface(const DistanceFunc &d,
                                   const Texture2d3b  &source,
                                   const Texture2d3b  &buffer,
                                   const eig::Array2u &src_xy,
                                   const eig::Array2u &dst_xy,
                                   uint                patch_size,
                                   uint                overlap,
                                   OverlapArea         area) {
    txs_trace();

    ErrorSurface surface = ErrorSurface::Zero(patch_size, patch_size);
    for (const Rect &r : overlap_rects(area, patch_size, overlap)) {
      for (uint y = r.coords.y(); y < r.end().y(); ++y) {
        for (uint x = r.coords.x(); x < r.end().x(); ++x) {
          const auto &src_v = source(src_xy.x() + x, src_xy.y() + y);
          const auto &dst_v = buffer(dst_xy.x() + x, dst_xy.y() + y);
          surface(x, y) = d(src_v, dst_v);
        } // for (uint x)
      } // for (uint y)
    } // for (const Rect &r)

    return surface;
  }

  SeamPath min_cost_path_vertical(const ErrorSurface &surface, uint overlap) {
    txs_trace();

    const uint w = static_cast<uint>(surface.rows());
    const uint h = static_cast<uint>(surface.cols());
    debug::check_expr(overlap > 0 && overlap <= w && h > 0,
      "min_cost_path_vertical(...) overlap band exceeds error surface");

    // Accumulated minimum cost table over the overlap band, filled row by row;
    // each cell adds the cheapest of the up to three cells directly above
    eig::ArrayXXd cost(overlap, h);
    cost.col(0) = surface.col(0).head(overlap);
    for (uint y = 1; y < h; ++y) {
      for (uint x = 0; x < overlap; ++x) {
        uint lo = x > 0 ? x - 1 : x;
        uint hi = std::min(x + 1, overlap - 1);
        cost(x, y) = surface(x, y) + cost.col(y - 1).segment(lo, hi - lo + 1).minCoeff();
      } // for (uint x)
    } // for (uint y)

    // Recover path bottom-up, starting at the cheapest bottom cell; then walk
    // upwards, staying in the same column unless a diagonal is strictly cheaper
    SeamPath path(h);
    Eigen::Index x_min;
    cost.col(h - 1).minCoeff(&x_min);
    uint x = static_cast<uint>(x_min);
    path[h - 1] = x;
    for (uint y = h - 1; y > 0; --y) {
      uint   next   = x;
      double next_c = cost(x, y - 1);
      if (x > 0 && cost(x - 1, y - 1) < next_c) {
        next   = x - 1;
        next_c = cost(x - 1, y - 1);
      }
      if (x + 1 < overlap && cost(x + 1, y - 1) < next_c) {
        next = x + 1;
      }
      x = next;
      path[y - 1] = x;
    } // for (uint y)

    return path;
  }

  SeamPath min_cost_path_horizontal(const ErrorSurface &surface, uint overlap) {
    // Exact transpose of the vertical case
    return min_cost_path_vertical(surface.transpose().eval(), overlap);
  }

  SeamPaths min_cost_seams(const ErrorSurface &surface, uint overlap, OverlapArea area) {
    txs_trace();
    SeamPaths seams;
    if (area == OverlapArea::eLeft || area == OverlapArea::eTopLeft)
      seams.vertical = min_cost_path_vertical(surface, overlap);
    if (area == OverlapArea::eTop || area == OverlapArea::eTopLeft)
      seams.horizontal = min_cost_path_horizontal(surface, overlap);
    return seams;
  }

  bool is_past_seams(const SeamPaths &seams, const eig::Array2u &xy, OverlapArea area) {
    // Beyond each overlap band, the corresponding test always holds, as seams
    // are confined to [0, overlap); so eTopLeft reduces to the corner rule
    // inside the corner block, and to a single seam test elsewhere
    bool past_vertical   = seams.vertical.empty()   || xy.x() >= seams.vertical[xy.y()];
    bool past_horizontal = seams.horizontal.empty() || xy.y() >= seams.horizontal[xy.x()];
    switch (area) {
      case OverlapArea::eTop:     return past_horizontal;
      case OverlapArea::eLeft:    return past_vertical;
      case OverlapArea::eTopLeft: return past_vertical && past_horizontal;
      default:                    return true;
    }
  }

  void blit_seams(Texture2d3b        &buffer,
                  const Texture2d3b  &source,
                  const Patch        &patch,
                  const eig::Array2u &dst_xy,
                  const SeamPaths    &seams,
                  OverlapArea         area) {
    txs_trace();

    check_args(contains(source, patch.rect()),
      fmt::format("patch at {} of size {} exceeds source", patch.coords, patch.size));
    check_args(contains(buffer, { .coords = dst_xy, .size = { patch.size, patch.size } }),
      fmt::format("patch destination {} of size {} exceeds buffer", dst_xy, patch.size));

    for (uint y = 0; y < patch.size; ++y) {
      for (uint x = 0; x < patch.size; ++x) {
        guard_continue(is_past_seams(seams, { x, y }, area));
        buffer(dst_xy.x() + x, dst_xy.y() + y) = source(patch.coords.x() + x, patch.coords.y() + y);
      } // for (uint x)
    } // for (uint y)
  }
} // namespace txs
