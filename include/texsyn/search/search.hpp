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
#include <texsyn/core/distribution.hpp>
#include <texsyn/core/geometry.hpp>
#include <texsyn/core/texture.hpp>
#include <optional>

namespace txs {
  // Tolerance band; source pixels within this factor of the best error are kept
  constexpr static double search_tolerance = 1.1;

  // Side length of the square seed block copied into the output's center
  constexpr static uint search_seed_size = 3;

  // Nr. of synthesized pixels between progress messages
  constexpr static uint search_log_interval = 1000;

  /* Parameters for a single pixel-search run. */
  struct SearchCreateInfo {
    // Requested output size; must be at least 3x3 to hold the seed block
    eig::Array2u size = eig::Array2u(1024, 1024);

    // Side length of the square comparison window; must be odd
    uint window_size = 15;

    // Top-left corner of the 3x3 seed block in the source; random if omitted
    std::optional<eig::Array2u> seed_coords = { };

    // Color distance; defaults to L2
    DistanceFunc distance = distance::l2;

    // Seed for the run's sampler; drawn from std::random_device if omitted
    std::optional<uint> seed = { };

    // Print progress every search_log_interval pixels
    bool verbose = false;
  };

  // Values of pixels in a synthesis mask
  constexpr static uchar mask_empty  = 0;
  constexpr static uchar mask_filled = 1;

  // Test whether an empty pixel is 4-adjacent to a filled pixel
  bool is_edge_pixel(const Texture2d1b &mask, const eig::Array2u &xy);

  // Count filled pixels in the window around xy, clipped to the mask,
  // excluding xy itself; window_size must be odd
  uint count_filled_neighbours(const Texture2d1b &mask, const eig::Array2u &xy, uint window_size);

  // Mean distance between the window around dst_xy in the output and the window
  // around src_xy in the source, over those window offsets that fall inside both
  // images and are filled in the mask; returns nothing if no offset contributes
  std::optional<double> neighbourhood_error(const DistanceFunc &d,
                                            const Texture2d3b  &source,
                                            const Texture2d3b  &output,
                                            const Texture2d1b  &mask,
                                            const eig::Array2u &src_xy,
                                            const eig::Array2u &dst_xy,
                                            uint                window_size);

  /* PixelSearch.
     Non-parametric pixel synthesis engine after Efros and Leung. Grows an image
     outward from a seed block copied from the source, one pixel at a time;
     each next pixel is the empty edge pixel with the most filled neighbours,
     and takes its color from a source pixel whose neighbourhood best matches
     the already-filled neighbourhood. The source is borrowed, and must
     outlive the engine. */
  class PixelSearch {
    using CreateInfo = SearchCreateInfo;

    const Texture2d3b &m_source;
    CreateInfo         m_info;
    UniformSampler<>   m_sampler;
    Texture2d1b        m_mask;

  public:
    // Validates all parameters, including the seed block's fit inside the
    // source; throws InvalidArgumentsException on violation
    PixelSearch(const Texture2d3b &source, CreateInfo info);

    // Run the full synthesis; returns an image of exactly the requested size
    Texture2d3b synthesize();

    // Select the next empty edge pixel to fill; the pixel with the most
    // filled neighbours, first in raster order on ties
    eig::Array2u next_pixel(const Texture2d1b &mask) const;

    // Select a source color for the pixel at dst_xy in the output; chooses
    // uniformly among the source pixels within the tolerance band of the best error
    Colr3b select_pixel(const Texture2d3b &output, const Texture2d1b &mask, const eig::Array2u &dst_xy);

    const CreateInfo  &info()   const { return m_info;   }
    const Texture2d3b &source() const { return m_source; }

    // Fill mask of the last synthesis run; entirely filled after a successful run
    const Texture2d1b &mask()   const { return m_mask;   }
  };
} // namespace txs
