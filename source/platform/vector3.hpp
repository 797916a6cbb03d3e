#pragma once

#include <cmath>

#include "platform/types.hpp"

namespace gcsg
{
  template <typename T = real>
  class vector3 final
  {
  public:
    T x = T(0);
    T y = T(0);
    T z = T(0);

  public:
    constexpr vector3() = default;
    constexpr vector3(T _x, T _y, T _z) : x(_x), y(_y), z(_z) {}
    constexpr vector3(T _x, T _y) : vector3(_x, _y, T(0)) {}

    constexpr T length_sq() const __restrict
    {
      return x * x + y * y + z * z;
    }

    T length() const __restrict
    {
      return std::sqrt(length_sq());
    }

    constexpr vector3 with_z(T _z) const __restrict
    {
      return { x, y, _z };
    }

    constexpr vector3 operator + (const vector3 & __restrict vec) const __restrict
    {
      return { x + vec.x, y + vec.y, z + vec.z };
    }

    constexpr vector3 operator - (const vector3 & __restrict vec) const __restrict
    {
      return { x - vec.x, y - vec.y, z - vec.z };
    }

    constexpr vector3 operator * (T val) const __restrict
    {
      return { x * val, y * val, z * val };
    }

    constexpr vector3 & operator += (const vector3 & __restrict vec) __restrict
    {
      x += vec.x;
      y += vec.y;
      z += vec.z;
      return *this;
    }

    constexpr vector3 operator - () const __restrict
    {
      return { -x, -y, -z };
    }

    T distance(const vector3 & __restrict vec) const __restrict
    {
      return (*this - vec).length();
    }

    constexpr bool operator == (const vector3 & __restrict vec) const __restrict
    {
      return x == vec.x && y == vec.y && z == vec.z;
    }

    constexpr bool operator != (const vector3 & __restrict vec) const __restrict
    {
      return x != vec.x || y != vec.y || z != vec.z;
    }

    static constexpr vector3 zero()
    {
      return { T(0), T(0), T(0) };
    }
  };
}
