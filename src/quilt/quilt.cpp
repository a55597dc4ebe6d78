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

#include <texsyn/quilt/quilt.hpp>
#include <texsyn/core/errors.hpp>
#include <texsyn/core/ordered_float.hpp>
#include <texsyn/core/utility.hpp>
#include <algorithm>
#include <execution>
#include <iterator>
#include <numeric>

namespace txs {
  namespace detail {
    // Scored candidate position in the source
    struct Candidate {
      eig::Array2u         coords;
      OrderedFloat<double> error;
    };
  } // namespace detail

  Quilter::Quilter(const Texture2d3b &source, CreateInfo info)
  : m_source(source), m_info(std::move(info)), m_sampler(m_info.seed) {
    txs_trace();

    check_args((m_info.size > 0).all(),
      fmt::format("output size {} must be non-zero", m_info.size));
    check_args(m_info.overlap > 0,
      "overlap must be non-zero");
    check_args(m_info.patch_size >= 2 * m_info.overlap,
      fmt::format("patch size {} must be at least twice the overlap {}", m_info.patch_size, m_info.overlap));
    if (m_info.selection_chance) {
      float chance = *m_info.selection_chance;
      check_args(chance > 0.f && chance <= 1.f,
        fmt::format("selection chance {} must lie in (0, 1]", chance));
    }
    check_args(static_cast<bool>(m_info.distance),
      "distance function must be provided");
  }

  std::vector<eig::Array2u> Quilter::gather_positions() {
    txs_trace();

    // Every top-left corner for which a full patch fits inside the source
    eig::Array2u n = m_source.size() - m_info.patch_size + 1u;

    std::vector<eig::Array2u> positions;
    if (!m_info.selection_chance)
      positions.reserve(n.prod());

    // Acceptance draws are made here, sequentially, so a seeded run stays
    // reproducible regardless of how scoring is scheduled afterwards
    for (uint y = 0; y < n.y(); ++y) {
      for (uint x = 0; x < n.x(); ++x) {
        guard_continue(!m_info.selection_chance || m_sampler.next_1d() < *m_info.selection_chance);
        positions.push_back({ x, y });
      } // for (uint x)
    } // for (uint y)

    return positions;
  }

  Patch Quilter::select_candidate(const Texture2d3b &buffer, const eig::Array2u &dst_xy, OverlapArea area) {
    txs_trace();

    // In probabilistic mode a pass may accept nothing; retry with fresh draws.
    // In exhaustive mode, the first pass always succeeds
    for (uint pass = 0; pass < quilt_max_passes; ++pass) {
      std::vector<eig::Array2u> positions = gather_positions();
      guard_continue(!positions.empty());

      // Score all gathered candidates against the buffer's overlap region(s)
      std::vector<double> errors(positions.size());
      #pragma omp parallel for
      for (int i = 0; i < positions.size(); ++i) {
        errors[i] = patch_overlap_error(m_info.distance, m_source, buffer,
          positions[i], dst_xy, m_info.patch_size, m_info.overlap, area);
      } // for (int i)

      // Attach errors as ordered values; rejects NaN output of the distance function
      std::vector<detail::Candidate> candidates(positions.size());
      std::transform(range_iter(positions), errors.begin(), candidates.begin(),
        [](const eig::Array2u &xy, double err) {
          return detail::Candidate { .coords = xy, .error = OrderedFloat<double>(err) }; });

      // Find the best error, then keep every candidate within the tolerance band
      auto best = std::transform_reduce(std::execution::par_unseq,
        range_iter(candidates), candidates.front().error,
        [](const auto &a, const auto &b) { return std::min(a, b); },
        [](const detail::Candidate &c) { return c.error; });
      OrderedFloat<double> bound(best.value() * quilt_tolerance);

      std::vector<detail::Candidate> kept;
      std::copy_if(range_iter(candidates), std::back_inserter(kept),
        [bound](const detail::Candidate &c) { return c.error <= bound; });

      // Tie-break among near-optimal candidates uniformly at random
      auto pick = shuffle_pick(kept, m_sampler);
      return { .coords = pick.coords, .size = m_info.patch_size };
    } // for (uint pass)

    check_synthesis(false,
      fmt::format("no candidate patch was accepted in {} sampling passes", quilt_max_passes));
    return { };
  }

  void Quilter::place_patch(Texture2d3b &buffer, const Patch &patch, const eig::Array2u &dst_xy, OverlapArea area) const {
    txs_trace();

    ErrorSurface surface = patch_error_surface(m_info.distance, m_source, buffer,
      patch.coords, dst_xy, m_info.patch_size, m_info.overlap, area);
    SeamPaths seams = min_cost_seams(surface, m_info.overlap, area);
    blit_seams(buffer, m_source, patch, dst_xy, seams, area);
  }

  Texture2d3b Quilter::quilt_image() {
    txs_trace();

    const uint patch_size = m_info.patch_size;
    const uint step       = m_info.patch_size - m_info.overlap;

    // Validate the source-dependent parameters before any image work starts
    check_args((m_source.size() >= patch_size).all(),
      fmt::format("source of size {} is smaller than patch size {}", m_source.size(), patch_size));
    if (m_info.seed_coords) {
      check_args((*m_info.seed_coords + patch_size <= m_source.size()).all(),
        fmt::format("seed patch at {} of size {} exceeds source of size {}",
          *m_info.seed_coords, patch_size, m_source.size()));
    }

    // Patch grid covering the requested size; the buffer holds a patch's worth
    // of slack on each axis, so the last row and column never need clipping
    eig::Array2u grid = { ceil_div(m_info.size.x(), step), ceil_div(m_info.size.y(), step) };
    Texture2d3b buffer = {{ .size = (m_info.size + patch_size).eval() }};

    if (m_info.verbose)
      fmt::print("Quilting {} output from {} source, {} patch grid\n",
        m_info.size, m_source.size(), grid);

    // Place seed patch at the buffer's origin
    Patch seed = { .size = patch_size };
    if (m_info.seed_coords)
      seed.coords = *m_info.seed_coords;
    else
      seed.coords = m_sampler.next_uint2(m_source.size() - patch_size);
    blit(buffer, m_source, { .size = seed.rect().size }, seed.rect());

    // Fill the grid in raster order; each patch overlaps its left and/or top neighbour
    for (uint j = 0; j < grid.y(); ++j) {
      for (uint i = 0; i < grid.x(); ++i) {
        guard_continue(i > 0 || j > 0);

        eig::Array2u grid_xy = { i, j };
        eig::Array2u dst_xy  = grid_xy * step;
        OverlapArea  area    = overlap_area(grid_xy);

        Patch patch = select_candidate(buffer, dst_xy, area);
        place_patch(buffer, patch, dst_xy, area);
      } // for (uint i)

      if (m_info.verbose)
        fmt::print("  placed row {} / {}\n", j + 1, grid.y());
    } // for (uint j)

    return crop(buffer, { .size = m_info.size });
  }
} // namespace txs
