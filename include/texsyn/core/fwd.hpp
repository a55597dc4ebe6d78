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

#include <texsyn/core/math.hpp>
#include <random>

namespace txs {
  // Geometry primitives
  struct Rect;
  struct Patch;
  enum class OverlapArea;

  // Texture resources
  template <typename T, uint D>
  struct TextureBlock;
  template <typename T>
  struct Texture2d;
  using Texture2d1b = Texture2d<uchar>;
  using Texture2d3b = Texture2d<Colr3b>;

  // Total ordering helper
  template <typename F>
  class OrderedFloat;

  // Sampling distribution helpers
  class PCGEngine;
  template <typename E = PCGEngine> requires (std::uniform_random_bit_generator<E>)
  class UniformSampler;

  // Synthesis engines
  struct QuiltCreateInfo;
  class  Quilter;
  struct SearchCreateInfo;
  class  PixelSearch;
} // namespace txs
