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
#include <texsyn/core/distance.hpp>
#include <texsyn/core/geometry.hpp>
#include <texsyn/core/texture.hpp>
#include <vector>

namespace txs {
  /* Per-pixel error over a patch's overlap region(s); indexed as (x, y), with
     x the column offset and y the row offset inside the patch. Cells outside
     the overlap region(s) remain zero. */
  using ErrorSurface = eig::ArrayXXd;

  /* Minimum-cost seam; for a vertical seam, entry y holds the seam's column
     in row y; for a horizontal seam, entry x holds the seam's row in column x. */
  using SeamPath = std::vector<uint>;

  /* Seams for a single patch placement; a seam is empty if the
     overlap area does not require it. */
  struct SeamPaths {
    SeamPath vertical;   // Seam through left overlap band
    SeamPath horizontal; // Seam through top overlap band
  };

  // Rectangles, relative to the patch's top-left corner, covered by an overlap
  // area; the shared corner block of eTopLeft is part of the top band only
  std::vector<Rect> overlap_rects(OverlapArea area, uint patch_size, uint overlap);

  // Summed distance between same-sized rectangles at a_xy in a and b_xy in b
  double patch_rect_error(const DistanceFunc &d,
                          const Texture2d3b  &a,
                          const Texture2d3b  &b,
                          const eig::Array2u &a_xy,
                          const eig::Array2u &b_xy,
                          const eig::Array2u &size);

  // Summed distance between a candidate patch at src_xy in source, and the
  // buffer content at dst_xy it would overlap, over the given overlap area
  double patch_overlap_error(const DistanceFunc &d,
                             const Texture2d3b  &source,
                             const Texture2d3b  &buffer,
                             const eig::Array2u &src_xy,
                             const eig::Array2u &dst_xy,
                             uint                patch_size,
                             uint                overlap,
                             OverlapArea         area);

  // Per-pixel distance between a candidate patch at src_xy in source, and the
  // buffer content at dst_xy it would overlap, over the given overlap area
  ErrorSurface patch_error_surface(const DistanceFunc &d,
                                   const Texture2d3b  &source,
                                   const Texture2d3b  &buffer,
                                   const eig::Array2u &src_xy,
                                   const eig::Array2u &dst_xy,
                                   uint                patch_size,
                                   uint                overlap,
                                   OverlapArea         area);

  // Minimum-cost path running top to bottom through columns [0, overlap) of the surface
  SeamPath min_cost_path_vertical(const ErrorSurface &surface, uint overlap);

  // Minimum-cost path running left to right through rows [0, overlap) of the surface
  SeamPath min_cost_path_horizontal(const ErrorSurface &surface, uint overlap);

  // Compute the seam(s) required by an overlap area over a shared error surface
  SeamPaths min_cost_seams(const ErrorSurface &surface, uint overlap, OverlapArea area);

  // Test whether patch offset xy lies on the candidate side of the seams; seam
  // pixels themselves belong to the candidate. For eTopLeft, a pixel must lie
  // on-or-past both seams
  bool is_past_seams(const SeamPaths &seams, const eig::Array2u &xy, OverlapArea area);

  // Blit the candidate patch into the buffer at dst_xy, only overwriting
  // pixels on the candidate side of the seams
  void blit_seams(Texture2d3b        &buffer,
                  const Texture2d3b  &source,
                  const Patch        &patch,
                  const eig::Array2u &dst_xy,
                  const SeamPaths    &seams,
                  OverlapArea         area);
} // namespace txs
