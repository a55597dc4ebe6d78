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
#include <texsyn/quilt/seam.hpp>
#include <optional>

namespace txs {
  // Tolerance band; candidates within this factor of the best error are kept
  constexpr static double quilt_tolerance = 1.1;

  // Maximum nr. of probabilistic sampling passes before a run is abandoned
  constexpr static uint quilt_max_passes = 1024;

  /* Parameters for a single patch-quilting run. */
  struct QuiltCreateInfo {
    // Requested output size; must be non-zero in both dimensions
    eig::Array2u size = eig::Array2u(1024, 1024);

    // Side length of square patches, and width of the band in which
    // adjacent patches overlap; requires patch_size >= 2 * overlap
    uint patch_size = 64;
    uint overlap    = 12;

    // Top-left corner of the seed patch in the source; random if omitted
    std::optional<eig::Array2u> seed_coords = { };

    // If set, candidates are accepted with this probability, in (0, 1],
    // and only accepted candidates are scored; otherwise all candidates are scored
    std::optional<float> selection_chance = { };

    // Color distance; defaults to L1
    DistanceFunc distance = distance::l1;

    // Seed for the run's sampler; drawn from std::random_device if omitted
    std::optional<uint> seed = { };

    // Print per-row progress
    bool verbose = false;
  };

  /* Quilter.
     Image quilting engine after Efros and Freeman. Tiles a new image with
     square patches from a source image, selecting each patch for minimal
     error over the overlap with its already placed neighbours, and joins
     neighbours along minimum-cost seams. The source is borrowed, and must
     outlive the quilter. */
  class Quilter {
    using CreateInfo = QuiltCreateInfo;

    const Texture2d3b &m_source;
    CreateInfo         m_info;
    UniformSampler<>   m_sampler;

  public:
    // Validates the source-independent parameters;
    // throws InvalidArgumentsException on violation
    Quilter(const Texture2d3b &source, CreateInfo info);

    // Run the full synthesis; validates the source-dependent parameters,
    // then returns an image of exactly the requested size
    Texture2d3b quilt_image();

    // Select the next patch for placement at dst_xy in the buffer, given the
    // area in which it overlaps placed content; chooses uniformly among the
    // candidates within the tolerance band of the best candidate's error
    Patch select_candidate(const Texture2d3b &buffer, const eig::Array2u &dst_xy, OverlapArea area);

    // Place a selected patch at dst_xy in the buffer, cutting
    // along the minimum-cost seams through its overlap area
    void place_patch(Texture2d3b &buffer, const Patch &patch, const eig::Array2u &dst_xy, OverlapArea area) const;

    const CreateInfo &info() const { return m_info; }
    const Texture2d3b &source() const { return m_source; }

  private:
    // Candidate positions that are to be scored in one selection pass
    std::vector<eig::Array2u> gather_positions();
  };
} // namespace txs
