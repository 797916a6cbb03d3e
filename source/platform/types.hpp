#pragma once

#include <cstddef>
#include <cstdint>

namespace gcsg
{
  using uint8 = uint8_t;
  using uint32 = uint32_t;
  using uint64 = uint64_t;

  using uint = uint32;

  using usize = std::size_t;
  using ssize = std::ptrdiff_t;

  using float64 = double;

  using real = float64;
}
