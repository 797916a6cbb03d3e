#pragma once

#include "gcsg.hpp"
#include "config.hpp"
#include "platform/random.hpp"

namespace gcsg::motion
{
  struct speeds final
  {
    real spindle_rpm;
    real feed_rate;
    real plunge_rate;
  };

  // Draws one set of speeds from the tool's ranges. Explicit rates and spindle settings in cfg are kept.
  extern speeds draw_speeds(const config & __restrict cfg, const config::cutting_data_options & __restrict data, prng & __restrict random);

  // cfg with its unset feed, plunge and spindle filled in from cutting_data. Unchanged without it.
  extern config apply_cutting_data(const config & __restrict cfg);
}
