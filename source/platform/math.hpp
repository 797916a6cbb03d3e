#pragma once

#include <cmath>
#include <cstdio>
#include <cstring>
#include <algorithm>
#include <string>

#include "platform/types.hpp"

namespace gcsg
{
  template <typename T>
  struct constants;

  template <>
  struct constants<double> final
  {
    constants() = delete;

    static constexpr const double epsilon = 0.00000000001;
    static constexpr const double pi = 3.141592653589793238;
    static constexpr const double pi2 = pi * 2.0;
    static constexpr const double angle_to_rad = pi2 / 360.0;
  };

  inline constexpr bool is_equal(double A, double B, double epsilon = constants<double>::epsilon)
  {
    return ((A - B) < 0.0 ? (B - A) : (A - B)) < epsilon;
  }

  template <typename T>
  constexpr T lerp(const T & __restrict x, const T & __restrict y, real s)
  {
    return x + (y - x) * s;
  }

  template <typename T>
  constexpr T clamp(const T & __restrict val, const T & __restrict _min, const T & __restrict _max)
  {
    return std::max(std::min(val, _max), _min);
  }

  inline bool is_finite(real v)
  {
    return std::isfinite(v);
  }

  // Rounds to a fixed number of decimal places. Negative zero collapses to zero so that
  // comparisons and output never see "-0".
  inline real round_to(real value, uint precision)
  {
    const real scale = std::pow(real(10.0), real(precision));
    const real out = std::round(value * scale) / scale;
    if (out == 0.0)
    {
      return 0.0;
    }
    return out;
  }

  inline bool is_equal_rounded(real A, real B, uint precision)
  {
    return round_to(A, precision) == round_to(B, precision);
  }

  // Strips trailing zeros (and a dangling decimal point) from a printf'd real.
  inline const char * trim_float(char *buffer)
  {
    if (!strchr(buffer, '.'))
    {
      return buffer;
    }

    usize len = strlen(buffer);
    while (buffer[--len] == '0')
    {
      buffer[len] = '\0';
    }
    if (buffer[len] == '.')
    {
      buffer[len] = '\0';
    }

    return buffer;
  }

  inline std::string format_real(real value, uint precision)
  {
    char buffer[512];
    snprintf(buffer, sizeof(buffer), "%.*f", int(precision), round_to(value, precision));
    return trim_float(buffer);
  }
}
