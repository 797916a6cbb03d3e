#include "gcsg.hpp"
#include "planner.hpp"

using namespace gcsg;

motion::planner::planner(const config & __restrict cfg, prng random) :
  cfg_(cfg),
  random_(std::move(random)),
  native_arcs_(cfg.use_native_arcs())
{
  if (cfg_.machine.home)
  {
    position_ = vector3<>::zero();
  }
}

motion::shape_plan motion::planner::plan(const shapes::shape & __restrict shape) __restrict
{
  uint layers = cfg_.layers;
  real layer_height = cfg_.layer_height.value_or(0.0);
  if (const auto * __restrict s = std::get_if<shapes::stack>(&shape))
  {
    layers = s->layers;
    layer_height = s->layer_height.value_or(0.0);
  }

  const geometry::path path = geometry::build_path(shapes::base_of(shape), cfg_);

  shape_plan out;
  out.reserve(layers);

  jitter_.clear();

  for (uint layer = 0; layer < layers; ++layer)
  {
    const vector3<> offset = { 0.0, 0.0, real(layer) * layer_height };
    cut_index_ = 0;

    step_list steps;
    begin_pass(steps, geometry::start_point(path.front()) + offset);
    trace(steps, path, offset);
    end_pass(steps);

    out.push_back(std::move(steps));
  }

  return out;
}

void motion::planner::trace(step_list & __restrict out, const geometry::path & __restrict path, const vector3<> & __restrict offset) __restrict
{
  for (const geometry::primitive & __restrict primitive : path)
  {
    std::visit(overloaded{
      [&](const geometry::segment & __restrict seg)
      {
        bool first = true;
        for (const vector3<> & point : geometry::samples(seg))
        {
          // The first sample is where the previous primitive ended.
          if (!first)
          {
            cut(out, point + offset);
          }
          first = false;
        }
      },
      [&](const geometry::arc & __restrict arc)
      {
        if (arc.is_degenerate())
        {
          return;
        }
        if (native_arcs_)
        {
          cut_arc(out, arc, offset);
          return;
        }
        bool first = true;
        for (const vector3<> & point : geometry::samples(arc))
        {
          if (!first)
          {
            cut(out, point + offset);
          }
          first = false;
        }
      }
    }, primitive);
  }
}

void motion::planner::begin_pass(step_list & __restrict out, const vector3<> & __restrict start) __restrict
{
  if (!cfg_.clearance)
  {
    rapid(out, start);
    return;
  }

  // Retract, travel over the pass start at the safe height, then plunge.
  const real safe_z = cfg_.clearance->safe_z;
  if (position_)
  {
    rapid(out, position_->with_z(safe_z));
  }
  rapid(out, start.with_z(safe_z));
  plunge(out, start);
}

void motion::planner::end_pass(step_list & __restrict out) __restrict
{
  if (cfg_.clearance && position_)
  {
    rapid(out, position_->with_z(cfg_.clearance->safe_z));
  }
}

void motion::planner::rapid(step_list & __restrict out, const vector3<> & __restrict target) __restrict
{
  if (is_current(target))
  {
    return;
  }

  step s;
  s.mode_ = mode::rapid;
  s.target_ = target;
  s.extrusion_ = extrusion_;
  if (cfg_.dialect.rapid_feed)
  {
    s.feedrate_ = cfg_.travel_rate();
  }
  out.push_back(s);

  position_ = target;
}

void motion::planner::plunge(step_list & __restrict out, const vector3<> & __restrict target) __restrict
{
  if (is_current(target))
  {
    return;
  }

  step s;
  s.mode_ = mode::linear;
  s.target_ = target;
  s.extrusion_ = extrusion_;
  s.feedrate_ = cfg_.plunge_rate();
  out.push_back(s);

  position_ = target;
}

void motion::planner::cut(step_list & __restrict out, vector3<> target) __restrict
{
  if (cfg_.jitter)
  {
    if (cut_index_ == jitter_.size())
    {
      jitter_.push_back(jitter());
    }
    target += jitter_[cut_index_++];
  }

  if (is_current(target))
  {
    return;
  }

  if (cfg_.extrusion && position_)
  {
    extrusion_ += position_->distance(target) * cfg_.extrusion->per_mm;
  }

  step s;
  s.mode_ = mode::linear;
  s.target_ = target;
  s.extrusion_ = extrusion_;
  s.feedrate_ = cfg_.feed_rate();
  out.push_back(s);

  position_ = target;
}

void motion::planner::cut_arc(step_list & __restrict out, const geometry::arc & __restrict arc, const vector3<> & __restrict offset) __restrict
{
  if (cfg_.extrusion)
  {
    extrusion_ += arc.length() * cfg_.extrusion->per_mm;
  }

  const vector3<> center_offset = arc.center() - arc.start_point();

  step s;
  s.mode_ = arc.is_clockwise() ? mode::arc_cw : mode::arc_ccw;
  s.target_ = arc.end_point() + offset;
  s.extrusion_ = extrusion_;
  s.feedrate_ = cfg_.feed_rate();
  s.center_offset_ = { center_offset.x, center_offset.y, 0.0 };
  out.push_back(s);

  position_ = s.target_;
}

// Offset of at most jitter->magnitude, in the XY plane.
vector3<> motion::planner::jitter() __restrict
{
  const real radius = cfg_.jitter->magnitude * random_.next_unit();
  const real angle = constants<real>::pi2 * random_.next_unit();
  return { radius * std::cos(angle), radius * std::sin(angle), 0.0 };
}

bool motion::planner::is_current(const vector3<> & __restrict target) const __restrict
{
  if (!position_)
  {
    return false;
  }

  const uint precision = cfg_.output.precision;
  return
    is_equal_rounded(position_->x, target.x, precision) &&
    is_equal_rounded(position_->y, target.y, precision) &&
    is_equal_rounded(position_->z, target.z, precision);
}
