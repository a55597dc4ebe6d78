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

#include <texsyn/search/search.hpp>
#include <texsyn/core/errors.hpp>
#include <texsyn/core/ordered_float.hpp>
#include <texsyn/core/utility.hpp>
#include <algorithm>
#include <execution>
#include <utility>

namespace txs {
  bool is_edge_pixel(const Texture2d1b &mask, const eig::Array2u &xy) {
    guard(mask[xy] == mask_empty, false);

    const auto size = mask.size();
    return (xy.x() > 0            && mask(xy.x() - 1, xy.y()) == mask_filled)
        || (xy.x() + 1 < size.x() && mask(xy.x() + 1, xy.y()) == mask_filled)
        || (xy.y() > 0            && mask(xy.x(), xy.y() - 1) == mask_filled)
        || (xy.y() + 1 < size.y() && mask(xy.x(), xy.y() + 1) == mask_filled);
  }

  uint count_filled_neighbours(const Texture2d1b &mask, const eig::Array2u &xy, uint window_size) {
    const int  half = static_cast<int>(window_size / 2);
    const auto size = mask.size().cast<int>().eval();
    const auto v    = xy.cast<int>().eval();

    // Window clipped against the mask's bounds
    eig::Array2i minv = (v - half).max(0);
    eig::Array2i maxv = (v + half).min(size - 1);

    uint n = 0;
    for (int y = minv.y(); y <= maxv.y(); ++y) {
      for (int x = minv.x(); x <= maxv.x(); ++x) {
        guard_continue(x != v.x() || y != v.y());
        if (mask(x, y) == mask_filled)
          n++;
      } // for (int x)
    } // for (int y)

    return n;
  }

  std::optional<double> neighbourhood_error(const DistanceFunc &d,
                                            const Texture2d3b  &source,
                                            const Texture2d3b  &output,
                                            const Texture2d1b  &mask,
                                            const eig::Array2u &src_xy,
                                            const eig::Array2u &dst_xy,
                                            uint                window_size) {
    const int  half     = static_cast<int>(window_size / 2);
    const auto src      = src_xy.cast<int>().eval();
    const auto dst      = dst_xy.cast<int>().eval();
    const auto src_size = source.size().cast<int>().eval();
    const auto dst_size = output.size().cast<int>().eval();

    // Window offsets clipped so both src + offs and dst + offs stay in bounds
    eig::Array2i min_offs = -(src.min(dst).min(half));
    eig::Array2i max_offs = (src_size - 1 - src).min(dst_size - 1 - dst).min(half);

    double err = 0.0;
    uint   n   = 0;
    for (int y = min_offs.y(); y <= max_offs.y(); ++y) {
      for (int x = min_offs.x(); x <= max_offs.x(); ++x) {
        guard_continue(mask(dst.x() + x, dst.y() + y) == mask_filled);
        err += d(source(src.x() + x, src.y() + y), output(dst.x() + x, dst.y() + y));
        n++;
      } // for (int x)
    } // for (int y)

    guard(n > 0, { });
    return err / static_cast<double>(n);
  }

  PixelSearch::PixelSearch(const Texture2d3b &source, CreateInfo info)
  : m_source(source), m_info(std::move(info)), m_sampler(m_info.seed) {
    txs_trace();

    check_args((m_info.size >= search_seed_size).all(),
      fmt::format("output size {} must be at least {} in both dimensions", m_info.size, search_seed_size));
    check_args(m_info.window_size % 2 == 1,
      fmt::format("window size {} must be odd", m_info.window_size));
    check_args(static_cast<bool>(m_info.distance),
      "distance function must be provided");

    // The source must hold a seed block, at the requested position if one is given
    check_args((m_source.size() >= search_seed_size).all(),
      fmt::format("source of size {} must be at least {} in both dimensions",
        m_source.size(), search_seed_size));
    if (m_info.seed_coords) {
      check_args((*m_info.seed_coords + search_seed_size <= m_source.size()).all(),
        fmt::format("seed block at {} exceeds source of size {}", *m_info.seed_coords, m_source.size()));
    }
  }

  eig::Array2u PixelSearch::next_pixel(const Texture2d1b &mask) const {
    txs_trace();

    const auto size = mask.size();
    const uint n    = size.prod();

    // Score empty edge pixels by their nr. of filled neighbours; others are excluded
    std::vector<int> counts(n);
    #pragma omp parallel for
    for (int i = 0; i < n; ++i) {
      eig::Array2u xy = { i % size.x(), i / size.x() };
      counts[i] = is_edge_pixel(mask, xy)
                ? static_cast<int>(count_filled_neighbours(mask, xy, m_info.window_size))
                : -1;
    } // for (int i)

    // std::max_element returns the first maximum, which is first in raster order
    auto it = std::max_element(range_iter(counts));
    check_synthesis(*it >= 0, "no empty edge pixel remains to be synthesized");

    uint i = static_cast<uint>(std::distance(counts.begin(), it));
    return { i % size.x(), i / size.x() };
  }

  Colr3b PixelSearch::select_pixel(const Texture2d3b &output, const Texture2d1b &mask, const eig::Array2u &dst_xy) {
    txs_trace();

    const auto size = m_source.size();
    const uint n    = size.prod();

    // Compare the neighbourhood of dst_xy against that of every source pixel
    std::vector<std::optional<double>> errors(n);
    #pragma omp parallel for
    for (int i = 0; i < n; ++i) {
      eig::Array2u xy = { i % size.x(), i / size.x() };
      errors[i] = neighbourhood_error(m_info.distance, m_source, output, mask, xy, dst_xy, m_info.window_size);
    } // for (int i)

    // Gather scored source pixels as ordered values; rejects NaN output of the distance function
    std::vector<std::pair<OrderedFloat<double>, uint>> scored;
    scored.reserve(n);
    for (uint i = 0; i < n; ++i) {
      guard_continue(errors[i].has_value());
      scored.push_back({ OrderedFloat<double>(*errors[i]), i });
    }
    check_synthesis(!scored.empty(),
      fmt::format("no source pixel shares a filled neighbourhood with output pixel {}", dst_xy));

    // Sort by error, then by index, so the tolerance band is an ordered prefix
    std::sort(std::execution::par_unseq, range_iter(scored));
    OrderedFloat<double> bound(scored.front().first.value() * search_tolerance);
    auto band_end = std::find_if(range_iter(scored),
      [bound](const auto &p) { return p.first > bound; });

    std::vector<uint> kept(std::distance(scored.begin(), band_end));
    std::transform(scored.begin(), band_end, kept.begin(), [](const auto &p) { return p.second; });

    // Tie-break among near-optimal source pixels uniformly at random
    uint i = shuffle_pick(kept, m_sampler);
    return m_source(i % size.x(), i / size.x());
  }

  Texture2d3b PixelSearch::synthesize() {
    txs_trace();

    const eig::Array2u seed_size = { search_seed_size, search_seed_size };

    // Start from an entirely empty output and mask
    Texture2d3b output = {{ .size = m_info.size }};
    m_mask = Texture2d1b({ .size = m_info.size });

    // Copy the seed block into the output's center, and mark it as filled
    Rect seed_src = { .size = seed_size };
    if (m_info.seed_coords)
      seed_src.coords = *m_info.seed_coords;
    else
      seed_src.coords = m_sampler.next_uint2(m_source.size() - search_seed_size);
    Rect seed_dst = { .coords = m_info.size / 2u - 1u, .size = seed_size };
    blit(output, m_source, seed_dst, seed_src);
    fill(m_mask, seed_dst, mask_filled);

    uint n_remaining = m_info.size.prod() - seed_dst.area();
    if (m_info.verbose)
      fmt::print("Synthesizing {} output from {} source, {} pixels left\n",
        m_info.size, m_source.size(), n_remaining);

    // Grow outward one pixel at a time, until the mask is entirely filled
    while (n_remaining > 0) {
      eig::Array2u xy = next_pixel(m_mask);
      output[xy] = select_pixel(output, m_mask, xy);
      m_mask[xy] = mask_filled;
      n_remaining--;

      if (m_info.verbose && n_remaining % search_log_interval == 0)
        fmt::print("  {} pixels left\n", n_remaining);
    } // while (n_remaining > 0)

    return output;
  }
} // namespace txs
