#pragma once

#include "gcsg.hpp"
#include "config.hpp"

#include <optional>

namespace gcsg::output
{
  // What the machine has been told so far. Unset fields have never been emitted, so the first
  // instruction that sets them always goes out.
  struct state
  {
    std::optional<unit_system> units;
    bool absolute = false;
    bool plane_xy = false;
    bool relative_extrusion = false;

    std::optional<real> feedrate;
    std::optional<uint> tool;
    bool spindle_on = false;
    cutter_side compensation = cutter_side::none;

    std::optional<real> extruder_temp;
    std::optional<real> bed_temp;
    std::optional<real> fan_speed;

    // Last emitted coordinates, already rounded.
    std::optional<real> x;
    std::optional<real> y;
    std::optional<real> z;
    real extrusion = 0.0; // Absolute E total as emitted.
  };
}
