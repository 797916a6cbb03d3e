#include "gcsg.hpp"
#include "config.hpp"

#include <cstdarg>
#include <cstdio>

using namespace gcsg;

namespace
{
  [[noreturn]] void fail(const char * __restrict format, ...)
  {
    char buffer[512];
    va_list args;
    va_start(args, format);
    vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);
    throw invalid_spec(buffer);
  }

  bool is_finite_point(const vector3<> & __restrict v)
  {
    return gcsg::is_finite(v.x) && gcsg::is_finite(v.y) && gcsg::is_finite(v.z);
  }

  void check_point(const std::optional<vector3<>> & __restrict point, const char * __restrict shape, const char * __restrict field)
  {
    if (point && !is_finite_point(*point))
    {
      fail("%s %s must be finite", shape, field);
    }
  }

  void check_positive(real value, const char * __restrict shape, const char * __restrict field)
  {
    if (!gcsg::is_finite(value) || value <= 0.0)
    {
      fail("%s %s must be positive, got %g", shape, field, value);
    }
  }

  void check_range(const config::range & __restrict range, const char * __restrict field)
  {
    check_positive(range.min, "cutting_data", field);
    if (!gcsg::is_finite(range.max) || range.max < range.min)
    {
      fail("cutting_data %s range is empty: [%g, %g]", field, range.min, range.max);
    }
  }

  void check_subdivisions(uint subdivisions, const char * __restrict shape)
  {
    if (subdivisions == 0)
    {
      fail("%s subdivisions must be at least 1", shape);
    }
  }

  void check_layers(uint layers, const std::optional<real> & __restrict layer_height, const char * __restrict owner)
  {
    if (layers == 0)
    {
      fail("%s layers must be at least 1", owner);
    }
    if (layers > 1)
    {
      if (!layer_height)
      {
        fail("%s has %u layers but no layer_height", owner, layers);
      }
      if (!gcsg::is_finite(*layer_height) || *layer_height == 0.0)
      {
        fail("%s layer_height must be finite and non-zero, got %g", owner, *layer_height);
      }
    }
    else if (layer_height && !gcsg::is_finite(*layer_height))
    {
      fail("%s layer_height must be finite", owner);
    }
  }

  void check_planar(const shapes::planar & __restrict shape)
  {
    std::visit(overloaded{
      [](const shapes::line & __restrict s)
      {
        check_point(s.start, "line", "start");
        check_point(s.end, "line", "end");
        if (!s.end && (!gcsg::is_finite(s.length) || s.length < 0.0))
        {
          fail("line length must be zero or positive, got %g", s.length);
        }
        if (!gcsg::is_finite(s.angle))
        {
          fail("line angle must be finite");
        }
        check_subdivisions(s.subdivisions, "line");
      },
      [](const shapes::rectangle & __restrict s)
      {
        check_point(s.origin, "rectangle", "origin");
        check_positive(s.width, "rectangle", "width");
        check_positive(s.height, "rectangle", "height");
        check_subdivisions(s.subdivisions, "rectangle");
      },
      [](const shapes::arc & __restrict s)
      {
        check_point(s.center, "arc", "center");
        check_positive(s.radius, "arc", "radius");
        if (!gcsg::is_finite(s.start_angle))
        {
          fail("arc start_angle must be finite");
        }
        if (!gcsg::is_finite(s.sweep) || std::abs(s.sweep) > 360.0)
        {
          fail("arc sweep must be within [-360, 360] degrees, got %g", s.sweep);
        }
      },
      [](const shapes::polygon & __restrict s)
      {
        if (s.vertices.size() < 2)
        {
          fail("polygon needs at least 2 vertices, got %zu", s.vertices.size());
        }
        for (const vector3<> & __restrict vertex : s.vertices)
        {
          if (!is_finite_point(vertex))
          {
            fail("polygon vertices must be finite");
          }
        }
        check_subdivisions(s.subdivisions, "polygon");
      },
      [](const shapes::rounded_rectangle & __restrict s)
      {
        check_point(s.origin, "rounded_rectangle", "origin");
        check_positive(s.width, "rounded_rectangle", "width");
        check_positive(s.height, "rounded_rectangle", "height");
        check_positive(s.corner_radius, "rounded_rectangle", "corner_radius");
        if (s.corner_radius * 2.0 > std::min(s.width, s.height))
        {
          fail("rounded_rectangle corner_radius %g does not fit a %g x %g rectangle", s.corner_radius, s.width, s.height);
        }
      },
      [](const shapes::slot & __restrict s)
      {
        check_point(s.center, "slot", "center");
        check_positive(s.radius, "slot", "radius");
        if (!gcsg::is_finite(s.length) || s.length < 0.0)
        {
          fail("slot length must be zero or positive, got %g", s.length);
        }
      }
    }, shape);
  }

  bool has_explicit_z(const shapes::planar & __restrict shape)
  {
    const auto off_plane = [](const std::optional<vector3<>> & __restrict point) -> bool
    {
      return point && point->z != 0.0;
    };

    return std::visit(overloaded{
      [&](const shapes::line & __restrict s) { return off_plane(s.start) || off_plane(s.end); },
      [&](const shapes::rectangle & __restrict s) { return off_plane(s.origin); },
      [&](const shapes::arc & __restrict s) { return off_plane(s.center); },
      [&](const shapes::polygon & __restrict s)
      {
        for (const vector3<> & __restrict vertex : s.vertices)
        {
          if (vertex.z != 0.0)
          {
            return true;
          }
        }
        return false;
      },
      [&](const shapes::rounded_rectangle & __restrict s) { return off_plane(s.origin); },
      [&](const shapes::slot & __restrict s) { return off_plane(s.center); }
    }, shape);
  }
}

bool config::uses_z() const __restrict
{
  if (clearance || layers > 1 || start_position.z != 0.0)
  {
    return true;
  }

  for (const gcsg::shapes::shape & __restrict shape : shapes)
  {
    if (const auto * __restrict s = std::get_if<gcsg::shapes::stack>(&shape))
    {
      if (s->layers > 1)
      {
        return true;
      }
    }
    if (has_explicit_z(gcsg::shapes::base_of(shape)))
    {
      return true;
    }
  }

  return false;
}

void gcsg::validate(const config & __restrict cfg)
{
  if (cfg.shapes.empty())
  {
    fail("no shapes to generate");
  }

  if (!is_finite_point(cfg.start_position))
  {
    fail("start_position must be finite");
  }

  if (!cfg.motion.feed_rate && !cfg.cutting_data)
  {
    fail("feed_rate is required unless cutting_data is given");
  }
  if (cfg.motion.feed_rate)
  {
    check_positive(*cfg.motion.feed_rate, "motion", "feed_rate");
  }
  if (cfg.motion.travel_rate)
  {
    check_positive(*cfg.motion.travel_rate, "motion", "travel_rate");
  }
  if (cfg.motion.plunge_rate)
  {
    check_positive(*cfg.motion.plunge_rate, "motion", "plunge_rate");
  }

  if (cfg.resolution.segment_count && cfg.resolution.chord_tolerance)
  {
    fail("resolution takes either segment_count or chord_tolerance, not both");
  }
  if (cfg.resolution.segment_count && *cfg.resolution.segment_count == 0)
  {
    fail("resolution segment_count must be at least 1");
  }
  if (cfg.resolution.chord_tolerance)
  {
    check_positive(*cfg.resolution.chord_tolerance, "resolution", "chord_tolerance");
  }
  if (cfg.resolution.max_segment_length)
  {
    check_positive(*cfg.resolution.max_segment_length, "resolution", "max_segment_length");
  }

  check_layers(cfg.layers, cfg.layer_height, "config");

  if (cfg.jitter && (!is_finite(cfg.jitter->magnitude) || cfg.jitter->magnitude < 0.0))
  {
    fail("jitter magnitude must be zero or positive, got %g", cfg.jitter->magnitude);
  }

  // Beyond this a double cannot carry the requested digits.
  static constexpr const uint max_precision = 15;
  if (cfg.output.precision > max_precision)
  {
    fail("precision must be at most %u, got %u", max_precision, cfg.output.precision);
  }
  if (cfg.output.max_instructions && *cfg.output.max_instructions == 0)
  {
    fail("max_instructions must be at least 1");
  }

  if (cfg.machine.spindle)
  {
    check_positive(cfg.machine.spindle->rpm, "spindle", "rpm");
  }

  if (cfg.cutting_data)
  {
    const auto & __restrict data = *cfg.cutting_data;
    check_positive(data.diameter, "cutting_data", "diameter");
    check_range(data.sfm, "sfm");
    check_range(data.ipt, "ipt");
    if (data.max_plunge_divisor == 0)
    {
      fail("cutting_data max_plunge_divisor must be at least 1");
    }
  }

  if (cfg.lead)
  {
    if (!is_finite(cfg.lead->approach) || cfg.lead->approach < 0.0)
    {
      fail("lead approach must be zero or positive, got %g", cfg.lead->approach);
    }
    check_positive(cfg.lead->in_radius, "lead", "in_radius");
    check_positive(cfg.lead->out_radius, "lead", "out_radius");
  }

  if (cfg.clearance && !is_finite(cfg.clearance->safe_z))
  {
    fail("clearance safe_z must be finite");
  }

  if (cfg.extrusion)
  {
    const auto & __restrict extrusion = *cfg.extrusion;
    check_positive(extrusion.per_mm, "extrusion", "per_mm");
    if (extrusion.hotend_temperature && (!is_finite(*extrusion.hotend_temperature) || *extrusion.hotend_temperature < 0.0))
    {
      fail("extrusion hotend_temperature must be zero or positive");
    }
    if (extrusion.bed_temperature && (!is_finite(*extrusion.bed_temperature) || *extrusion.bed_temperature < 0.0))
    {
      fail("extrusion bed_temperature must be zero or positive");
    }
    if (extrusion.fan_speed && (!is_finite(*extrusion.fan_speed) || *extrusion.fan_speed < 0.0 || *extrusion.fan_speed > 255.0))
    {
      fail("extrusion fan_speed must be within [0, 255], got %g", *extrusion.fan_speed);
    }
  }

  for (const shapes::shape & __restrict shape : cfg.shapes)
  {
    if (const auto * __restrict s = std::get_if<shapes::stack>(&shape))
    {
      check_layers(s->layers, s->layer_height, "stack");
    }
    check_planar(shapes::base_of(shape));
  }
}
