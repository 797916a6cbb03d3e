#pragma once

#include <random>

#include "platform/types.hpp"

namespace gcsg
{
  // Seeded pseudo-random source. Owned by whoever draws from it; never shared between generations.
  // The standard distributions are implementation-defined, so values are derived from the raw engine
  // output to keep sequences identical across standard libraries.
  class prng final
  {
    std::mt19937_64 engine_;

  public:
    explicit prng(uint64 seed = 0) : engine_(seed) {}

    // Uniform in [0, 1).
    real next_unit() __restrict
    {
      return real(engine_() >> 11) * (1.0 / 9007199254740992.0);
    }

    // Uniform in [min, max).
    real next_range(real min, real max) __restrict
    {
      return min + (max - min) * next_unit();
    }
  };
}
