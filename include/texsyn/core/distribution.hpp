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
#include <texsyn/core/utility.hpp>
#include <algorithm>
#include <optional>
#include <random>

namespace txs {
  // Encapsulation of PCG hash that
  // conforms to std::uniform_random_bit_generator
  class PCGEngine {
    // Underlying sequence
    uint m_state;
    constexpr uint pcg_hash() {
      m_state = m_state * 747796405u + 2891336453u;
      uint v = m_state;
      v ^= v >> ((v >> 28u) + 4u);
      v *= 277803737u;
      v ^= v >> 22u;
      return v;
    }

  public:
    using result_type = uint;

    // Construct the engine, optionally provide a seed
    constexpr PCGEngine(uint seed = 0)
    : m_state(seed) { }

    // Advance engine's state and return generated value
    constexpr uint operator()() {
      return pcg_hash();
    }

    // Return smallest and largest possible values in the output range
    constexpr static result_type min() { return 0;          }
    constexpr static result_type max() { return 4294967295; }
  };
  static_assert(std::uniform_random_bit_generator<PCGEngine>);

  // Simple sampler class that encapsulates a random number engine;
  // all randomness in a synthesis run flows through one sampler, so
  // a fixed seed makes the run reproducible
  template <typename E> requires (std::uniform_random_bit_generator<E>)
  class UniformSampler {
    E                                     m_engine;
    std::uniform_real_distribution<float> m_distr;

  public:
    UniformSampler(uint seed = std::random_device()())
    : m_engine(seed), m_distr(0.f, 1.f) { }

    UniformSampler(std::optional<uint> seed)
    : UniformSampler(seed.value_or(std::random_device()())) { }

    // Uniform float in [0, 1)
    float next_1d() {
      return m_distr(m_engine);
    }

    // Uniform unsigned integer in [0, n]
    uint next_uint(uint n) {
      return std::uniform_int_distribution<uint>(0, n)(m_engine);
    }

    // Uniform 2d unsigned integer position in [0, n]
    eig::Array2u next_uint2(const eig::Array2u &n) {
      uint x = next_uint(n.x());
      uint y = next_uint(n.y());
      return { x, y };
    }

    E &engine() { return m_engine; }
  };

  // Shuffle a non-empty range uniformly at random, and return its first element;
  // used as a randomized tie-break among near-optimal candidates
  template <typename C, typename E>
  typename C::value_type shuffle_pick(C &candidates, UniformSampler<E> &sampler) {
    debug::check_expr(!candidates.empty(), "shuffle_pick(...) requires a non-empty range");
    std::shuffle(range_iter(candidates), sampler.engine());
    return candidates.front();
  }
} // namespace txs
