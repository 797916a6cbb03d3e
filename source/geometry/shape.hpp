#pragma once

#include "gcsg.hpp"
#include "primitive.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace gcsg
{
  struct config;
}

// Shape descriptors as they appear in a generation config. Coordinates are absolute. A shape
// whose placement is left unset is anchored so that its path begins at config::start_position.
namespace gcsg::shapes
{
  struct line final
  {
    std::optional<vector3<>> start;
    // When unset the line runs `length` units from the start at `angle` degrees.
    std::optional<vector3<>> end;
    real length = 0.0;
    real angle = 0.0;
    uint subdivisions = 1;
  };

  // Axis-aligned, traced counter-clockwise from its lower-left corner.
  struct rectangle final
  {
    std::optional<vector3<>> origin;
    real width = 0.0;
    real height = 0.0;
    uint subdivisions = 1;
  };

  // Circle when the sweep is a full turn. Angles are degrees, a positive sweep runs counter-clockwise.
  struct arc final
  {
    std::optional<vector3<>> center;
    real radius = 0.0;
    real start_angle = 0.0;
    real sweep = 360.0;
  };

  struct polygon final
  {
    std::vector<vector3<>> vertices;
    bool closed = true;
    uint subdivisions = 1;
  };

  struct rounded_rectangle final
  {
    std::optional<vector3<>> origin;
    real width = 0.0;
    real height = 0.0;
    real corner_radius = 0.0;
  };

  // Obround: two parallel edges of `length` joined by half circles of `radius`.
  struct slot final
  {
    std::optional<vector3<>> center;
    real length = 0.0;
    real radius = 0.0;
  };

  using planar = std::variant<line, rectangle, arc, polygon, rounded_rectangle, slot>;

  // A planar shape repeated on `layers` levels, each `layer_height` above the last.
  struct stack final
  {
    planar base;
    uint layers = 1;
    std::optional<real> layer_height;
  };

  using shape = std::variant<line, rectangle, arc, polygon, rounded_rectangle, slot, stack>;

  inline arc circle(real radius)
  {
    arc out;
    out.radius = radius;
    return out;
  }

  inline arc circle(const vector3<> & __restrict center, real radius)
  {
    arc out;
    out.center = center;
    out.radius = radius;
    return out;
  }

  // The planar shape of a stack, or the shape itself.
  extern planar base_of(const shape & __restrict s);

  extern const char * name(const planar & __restrict s);
  extern const char * name(const shape & __restrict s);
}

namespace gcsg::geometry
{
  // Contiguous primitive path tracing the shape at its own Z.
  extern path build_path(const shapes::planar & __restrict shape, const config & __restrict cfg);

  // Human-readable summary used for the comment that precedes a shape.
  extern std::string describe(const shapes::shape & __restrict shape, uint precision);
}
