#include "gcsg.hpp"
#include "primitive.hpp"

#include <string>

using namespace gcsg;

geometry::segment::segment(const vector3<> & __restrict start, const vector3<> & __restrict end, uint subdivisions) :
  start_(start),
  end_(end),
  subdivisions_(subdivisions)
{
  if (subdivisions_ == 0)
  {
    throw invalid_geometry("segment subdivision count must be at least 1");
  }
}

usize geometry::segment::sample_count() const __restrict
{
  if (is_degenerate())
  {
    return 1;
  }
  return usize(subdivisions_) + 1;
}

vector3<> geometry::segment::sample(usize index) const __restrict
{
  if (index == 0 || is_degenerate())
  {
    return start_;
  }
  if (index >= subdivisions_)
  {
    return end_;
  }
  return lerp(start_, end_, real(index) / real(subdivisions_));
}

namespace
{
  void check_arc(real radius, real start_angle, real sweep)
  {
    if (!is_finite(radius) || radius <= 0.0)
    {
      throw invalid_geometry("arc radius must be positive, got " + std::to_string(radius));
    }
    if (!is_finite(start_angle) || !is_finite(sweep))
    {
      throw invalid_geometry("arc angles must be finite");
    }
  }
}

geometry::arc::arc(const vector3<> & __restrict center, real radius, real start_angle, real sweep, uint segments) :
  center_(center),
  radius_(radius),
  start_angle_(start_angle),
  sweep_(sweep),
  segments_(segments)
{}

geometry::arc geometry::arc::with_segments(const vector3<> & __restrict center, real radius, real start_angle, real sweep, uint segments)
{
  check_arc(radius, start_angle, sweep);
  if (segments == 0)
  {
    throw invalid_geometry("arc segment count must be at least 1");
  }
  return { center, radius, start_angle, sweep, segments };
}

geometry::arc geometry::arc::with_tolerance(const vector3<> & __restrict center, real radius, real start_angle, real sweep, real tolerance)
{
  check_arc(radius, start_angle, sweep);
  return { center, radius, start_angle, sweep, segments_for_tolerance(sweep, radius, tolerance) };
}

bool geometry::arc::is_full_circle() const __restrict
{
  return is_equal(std::abs(sweep_), constants<real>::pi2);
}

vector3<> geometry::arc::point_at(real angle) const __restrict
{
  return {
    center_.x + radius_ * std::cos(angle),
    center_.y + radius_ * std::sin(angle),
    center_.z
  };
}

vector3<> geometry::arc::end_point() const __restrict
{
  // A full circle must close exactly, not to within the error of cos/sin at 2pi.
  if (is_full_circle())
  {
    return start_point();
  }
  return point_at(start_angle_ + sweep_);
}

usize geometry::arc::sample_count() const __restrict
{
  if (is_degenerate())
  {
    return 1;
  }
  return usize(segments_) + 1;
}

vector3<> geometry::arc::sample(usize index) const __restrict
{
  if (index == 0 || is_degenerate())
  {
    return start_point();
  }
  if (index >= segments_)
  {
    return end_point();
  }
  return point_at(start_angle_ + sweep_ * (real(index) / real(segments_)));
}

uint geometry::segments_for_tolerance(real sweep, real radius, real tolerance)
{
  if (!is_finite(radius) || radius <= 0.0)
  {
    throw invalid_geometry("arc radius must be positive, got " + std::to_string(radius));
  }
  if (!is_finite(tolerance) || tolerance <= 0.0)
  {
    throw invalid_geometry("chord tolerance must be positive, got " + std::to_string(tolerance));
  }

  // Largest angular step whose sagitta r * (1 - cos(step / 2)) stays within the tolerance.
  const real max_step = 2.0 * std::acos(clamp(1.0 - tolerance / radius, -1.0, 1.0));
  const real count = std::ceil(std::abs(sweep) / max_step);

  if (!(count >= 1.0))
  {
    return 1;
  }
  if (count > real(max_segments))
  {
    throw invalid_geometry("chord tolerance " + std::to_string(tolerance) + " is too fine for radius " + std::to_string(radius));
  }
  return uint(count);
}

vector3<> geometry::start_point(const primitive & __restrict p)
{
  return std::visit([](const auto &prim) -> vector3<> { return prim.start_point(); }, p);
}

vector3<> geometry::end_point(const primitive & __restrict p)
{
  return std::visit([](const auto &prim) -> vector3<> { return prim.end_point(); }, p);
}

real geometry::length(const primitive & __restrict p)
{
  return std::visit([](const auto &prim) -> real { return prim.length(); }, p);
}

namespace
{
  vector3<> planar_unit(real x, real y)
  {
    const real length = std::sqrt(x * x + y * y);
    if (length == 0.0)
    {
      return vector3<>::zero();
    }
    return { x / length, y / length, 0.0 };
  }

  vector3<> tangent(const geometry::arc & __restrict a, real angle)
  {
    if (a.is_clockwise())
    {
      return { std::sin(angle), -std::cos(angle), 0.0 };
    }
    return { -std::sin(angle), std::cos(angle), 0.0 };
  }
}

vector3<> geometry::start_direction(const primitive & __restrict p)
{
  return std::visit(overloaded{
    [](const segment & __restrict s)
    {
      const vector3<> d = s.end_point() - s.start_point();
      return planar_unit(d.x, d.y);
    },
    [](const arc & __restrict a)
    {
      return a.is_degenerate() ? vector3<>::zero() : tangent(a, a.start_angle());
    }
  }, p);
}

vector3<> geometry::end_direction(const primitive & __restrict p)
{
  return std::visit(overloaded{
    [](const segment & __restrict s)
    {
      const vector3<> d = s.end_point() - s.start_point();
      return planar_unit(d.x, d.y);
    },
    [](const arc & __restrict a)
    {
      return a.is_degenerate() ? vector3<>::zero() : tangent(a, a.start_angle() + a.sweep());
    }
  }, p);
}
