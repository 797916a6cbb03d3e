#pragma once

#include "gcsg.hpp"
#include "step.hpp"
#include "config.hpp"
#include "geometry/shape.hpp"
#include "platform/random.hpp"

#include <optional>
#include <vector>

namespace gcsg::motion
{
  // Turns shapes into motion steps. Holds the planned tool position across shapes so that a shape
  // starting where the previous one ended needs no positioning move.
  class planner final
  {
    const config &cfg_;
    prng random_;
    std::optional<vector3<>> position_; // Unknown until the first move (or homing).
    real extrusion_ = 0.0;
    bool native_arcs_;

    // Jitter drawn for the current shape, indexed by cut. Every layer replays the same offsets.
    std::vector<vector3<>> jitter_;
    usize cut_index_ = 0;

  public:
    planner(const config & __restrict cfg, prng random);

    shape_plan plan(const shapes::shape & __restrict shape) __restrict;

  private:
    void trace(step_list & __restrict out, const geometry::path & __restrict path, const vector3<> & __restrict offset) __restrict;

    void begin_pass(step_list & __restrict out, const vector3<> & __restrict start) __restrict;
    void end_pass(step_list & __restrict out) __restrict;

    void rapid(step_list & __restrict out, const vector3<> & __restrict target) __restrict;
    void plunge(step_list & __restrict out, const vector3<> & __restrict target) __restrict;
    void cut(step_list & __restrict out, vector3<> target) __restrict;
    void cut_arc(step_list & __restrict out, const geometry::arc & __restrict arc, const vector3<> & __restrict offset) __restrict;

    vector3<> jitter() __restrict;
    bool is_current(const vector3<> & __restrict target) const __restrict;
  };
}
