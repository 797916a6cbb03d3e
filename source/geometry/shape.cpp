#include "gcsg.hpp"
#include "shape.hpp"
#include "config.hpp"

using namespace gcsg;

shapes::planar shapes::base_of(const shape & __restrict s)
{
  return std::visit([](const auto &alternative) -> planar
  {
    using T = std::decay_t<decltype(alternative)>;
    if constexpr (std::is_same_v<T, stack>)
    {
      return alternative.base;
    }
    else
    {
      return alternative;
    }
  }, s);
}

const char * shapes::name(const planar & __restrict s)
{
  return std::visit(overloaded{
    [](const line &) { return "line"; },
    [](const rectangle &) { return "rectangle"; },
    [](const arc & __restrict a) { return (std::abs(a.sweep) == 360.0) ? "circle" : "arc"; },
    [](const polygon &) { return "polygon"; },
    [](const rounded_rectangle &) { return "rounded rectangle"; },
    [](const slot &) { return "slot"; }
  }, s);
}

const char * shapes::name(const shape & __restrict s)
{
  if (std::holds_alternative<stack>(s))
  {
    return "stack";
  }
  return name(base_of(s));
}

namespace
{
  // Appends primitives for one shape, applying the configured resolution.
  class path_builder final
  {
    const config &cfg_;
    geometry::path path_;

  public:
    explicit path_builder(const config & __restrict cfg) : cfg_(cfg) {}

    void edge(const vector3<> & __restrict start, const vector3<> & __restrict end, uint subdivisions = 1) __restrict
    {
      uint count = subdivisions;
      if (cfg_.resolution.max_segment_length)
      {
        const real max_length = *cfg_.resolution.max_segment_length;
        const real pieces = std::ceil(start.distance(end) / max_length);
        if (!(pieces <= real(geometry::max_segments)))
        {
          throw invalid_geometry(
            "max_segment_length " + format_real(max_length, 15) + " would split an edge into more than " +
            std::to_string(geometry::max_segments) + " pieces"
          );
        }
        if (pieces > real(count))
        {
          count = uint(pieces);
        }
      }
      path_.emplace_back(geometry::segment{ start, end, count });
    }

    // Angles in degrees.
    void arc(const vector3<> & __restrict center, real radius, real start_angle, real sweep) __restrict
    {
      arc_rad(center, radius, start_angle * constants<real>::angle_to_rad, sweep * constants<real>::angle_to_rad);
    }

    void arc_rad(const vector3<> & __restrict center, real radius, real start_rad, real sweep_rad) __restrict
    {
      if (cfg_.resolution.segment_count)
      {
        path_.emplace_back(geometry::arc::with_segments(center, radius, start_rad, sweep_rad, *cfg_.resolution.segment_count));
      }
      else
      {
        const real tolerance = cfg_.resolution.chord_tolerance.value_or(config::default_chord_tolerance);
        path_.emplace_back(geometry::arc::with_tolerance(center, radius, start_rad, sweep_rad, tolerance));
      }
    }

    void append(const geometry::path & __restrict path) __restrict
    {
      path_.insert(path_.end(), path.begin(), path.end());
    }

    geometry::path take() __restrict
    {
      return std::move(path_);
    }
  };

  // Quarter turns entering and leaving the path tangentially from the right of its direction of travel,
  // which is the outside of a counter-clockwise contour. The entry is preceded by a straight approach.
  geometry::path with_leads(geometry::path && __restrict path, const config::lead_options & __restrict lead, const config & __restrict cfg)
  {
    if (path.empty())
    {
      return std::move(path);
    }

    const vector3<> in_direction = geometry::start_direction(path.front());
    const vector3<> out_direction = geometry::end_direction(path.back());
    if (in_direction == vector3<>::zero() || out_direction == vector3<>::zero())
    {
      return std::move(path);
    }

    static constexpr const real quarter = constants<real>::pi * 0.5;

    path_builder builder{ cfg };

    const vector3<> entry = geometry::start_point(path.front());
    const vector3<> in_center = entry + vector3<>{ in_direction.y, -in_direction.x, 0.0 } * lead.in_radius;
    const real in_end = std::atan2(entry.y - in_center.y, entry.x - in_center.x);
    const real in_start = in_end + quarter;

    if (lead.approach > 0.0)
    {
      const vector3<> arc_start = {
        in_center.x + lead.in_radius * std::cos(in_start),
        in_center.y + lead.in_radius * std::sin(in_start),
        in_center.z
      };
      const vector3<> arc_direction = { std::sin(in_start), -std::cos(in_start), 0.0 };
      builder.edge(arc_start - arc_direction * lead.approach, arc_start);
    }
    builder.arc_rad(in_center, lead.in_radius, in_start, -quarter);

    builder.append(path);

    const vector3<> leave = geometry::end_point(path.back());
    const vector3<> out_center = leave + vector3<>{ out_direction.y, -out_direction.x, 0.0 } * lead.out_radius;
    const real out_start = std::atan2(leave.y - out_center.y, leave.x - out_center.x);
    builder.arc_rad(out_center, lead.out_radius, out_start, -quarter);

    return builder.take();
  }
}

geometry::path geometry::build_path(const shapes::planar & __restrict shape, const config & __restrict cfg)
{
  const vector3<> & __restrict anchor = cfg.start_position;
  path_builder builder{ cfg };

  std::visit(overloaded{
    [&](const shapes::line & __restrict s)
    {
      const vector3<> start = s.start.value_or(anchor);
      vector3<> end;
      if (s.end)
      {
        end = *s.end;
      }
      else
      {
        const real angle = s.angle * constants<real>::angle_to_rad;
        end = start + vector3<>{ s.length * std::cos(angle), s.length * std::sin(angle), 0.0 };
      }
      builder.edge(start, end, s.subdivisions);
    },
    [&](const shapes::rectangle & __restrict s)
    {
      const vector3<> o = s.origin.value_or(anchor);
      const vector3<> corners[4] = {
        o,
        o + vector3<>{ s.width, 0.0 },
        o + vector3<>{ s.width, s.height },
        o + vector3<>{ 0.0, s.height }
      };
      for (usize i = 0; i < 4; ++i)
      {
        builder.edge(corners[i], corners[(i + 1) % 4], s.subdivisions);
      }
    },
    [&](const shapes::arc & __restrict s)
    {
      const real start_rad = s.start_angle * constants<real>::angle_to_rad;
      // Unplaced arcs put their first point on the anchor.
      const vector3<> center = s.center.value_or(
        anchor - vector3<>{ s.radius * std::cos(start_rad), s.radius * std::sin(start_rad), 0.0 }
      );
      builder.arc(center, s.radius, s.start_angle, s.sweep);
    },
    [&](const shapes::polygon & __restrict s)
    {
      const usize count = s.vertices.size();
      for (usize i = 1; i < count; ++i)
      {
        builder.edge(s.vertices[i - 1], s.vertices[i], s.subdivisions);
      }
      if (s.closed && s.vertices.back() != s.vertices.front())
      {
        builder.edge(s.vertices.back(), s.vertices.front(), s.subdivisions);
      }
    },
    [&](const shapes::rounded_rectangle & __restrict s)
    {
      const real r = s.corner_radius;
      const vector3<> o = s.origin.value_or(anchor - vector3<>{ r, 0.0 });
      const real w = s.width;
      const real h = s.height;

      builder.edge(o + vector3<>{ r, 0.0 }, o + vector3<>{ w - r, 0.0 });
      builder.arc(o + vector3<>{ w - r, r }, r, -90.0, 90.0);
      builder.edge(o + vector3<>{ w, r }, o + vector3<>{ w, h - r });
      builder.arc(o + vector3<>{ w - r, h - r }, r, 0.0, 90.0);
      builder.edge(o + vector3<>{ w - r, h }, o + vector3<>{ r, h });
      builder.arc(o + vector3<>{ r, h - r }, r, 90.0, 90.0);
      builder.edge(o + vector3<>{ 0.0, h - r }, o + vector3<>{ 0.0, r });
      builder.arc(o + vector3<>{ r, r }, r, 180.0, 90.0);
    },
    [&](const shapes::slot & __restrict s)
    {
      const real half = s.length * 0.5;
      const real r = s.radius;
      const vector3<> c = s.center.value_or(anchor + vector3<>{ half, r });

      builder.edge(c + vector3<>{ -half, -r }, c + vector3<>{ half, -r });
      builder.arc(c + vector3<>{ half, 0.0 }, r, -90.0, 180.0);
      builder.edge(c + vector3<>{ half, r }, c + vector3<>{ -half, r });
      builder.arc(c + vector3<>{ -half, 0.0 }, r, 90.0, 180.0);
    }
  }, shape);

  if (cfg.lead)
  {
    return with_leads(builder.take(), *cfg.lead, cfg);
  }
  return builder.take();
}

std::string geometry::describe(const shapes::shape & __restrict shape, uint precision)
{
  const auto num = [precision](real value) -> std::string
  {
    return format_real(value, precision);
  };

  const auto describe_planar = [&](const shapes::planar & __restrict planar) -> std::string
  {
    return std::visit(overloaded{
      [&](const shapes::line & __restrict s) -> std::string
      {
        if (s.end)
        {
          return "line to X" + num(s.end->x) + " Y" + num(s.end->y);
        }
        return "line length " + num(s.length) + " angle " + num(s.angle);
      },
      [&](const shapes::rectangle & __restrict s) -> std::string
      {
        return "rectangle " + num(s.width) + " x " + num(s.height);
      },
      [&](const shapes::arc & __restrict s) -> std::string
      {
        if (std::abs(s.sweep) == 360.0)
        {
          return "circle radius " + num(s.radius);
        }
        return "arc radius " + num(s.radius) + " sweep " + num(s.sweep);
      },
      [&](const shapes::polygon & __restrict s) -> std::string
      {
        return "polygon " + std::to_string(s.vertices.size()) + " vertices" + (s.closed ? "" : " open");
      },
      [&](const shapes::rounded_rectangle & __restrict s) -> std::string
      {
        return "rounded rectangle " + num(s.width) + " x " + num(s.height) + " corner " + num(s.corner_radius);
      },
      [&](const shapes::slot & __restrict s) -> std::string
      {
        return "slot length " + num(s.length) + " radius " + num(s.radius);
      }
    }, planar);
  };

  if (const auto * __restrict s = std::get_if<shapes::stack>(&shape))
  {
    std::string out = describe_planar(s->base);
    out += ", " + std::to_string(s->layers) + " layers";
    if (s->layer_height)
    {
      out += " of " + num(*s->layer_height);
    }
    return out;
  }

  return describe_planar(shapes::base_of(shape));
}
