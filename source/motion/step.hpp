#pragma once

#include "gcsg.hpp"

#include <optional>
#include <vector>

namespace gcsg::motion
{
  enum class mode : uint8
  {
    rapid = 0,
    linear,
    arc_cw,
    arc_ccw
  };

  // One planned move. Positions are absolute; extrusion_ is the running E total at the target.
  struct step final
  {
    mode mode_ = mode::rapid;
    vector3<> target_;
    real extrusion_ = 0.0;
    // Unset for rapids unless the dialect puts a feed on them.
    std::optional<real> feedrate_;
    // Arcs only: center relative to the step's start point (I, J).
    vector3<> center_offset_;

    bool is_arc() const __restrict
    {
      return mode_ == mode::arc_cw || mode_ == mode::arc_ccw;
    }
  };

  using step_list = std::vector<step>;

  // Steps of one shape, one list per layer.
  using shape_plan = std::vector<step_list>;
}
