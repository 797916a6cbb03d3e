#include "gcsg.hpp"
#include "speeds.hpp"

#include <cmath>

using namespace gcsg;

namespace
{
  static constexpr const real mm_per_inch = 25.4;
  // 12 / pi, surface feet per minute to revolutions per minute for a diameter in inches.
  static constexpr const real sfm_to_rpm = 3.82;
  // Drawn values are kept to hundredths, as tool catalogs quote them.
  static constexpr const uint speed_precision = 2;
}

motion::speeds motion::draw_speeds(const config & __restrict cfg, const config::cutting_data_options & __restrict data, prng & __restrict random)
{
  const bool metric = cfg.units == unit_system::millimeter;
  const real diameter = metric ? data.diameter / mm_per_inch : data.diameter;

  speeds out;

  const real sfm = random.next_range(data.sfm.min, data.sfm.max);
  out.spindle_rpm = cfg.machine.spindle ?
    cfg.machine.spindle->rpm :
    round_to(sfm * sfm_to_rpm / diameter, speed_precision);

  const real ipt = random.next_range(data.ipt.min, data.ipt.max);
  const real inches_per_minute = ipt * out.spindle_rpm;
  out.feed_rate = cfg.motion.feed_rate ?
    *cfg.motion.feed_rate :
    round_to(metric ? inches_per_minute * mm_per_inch : inches_per_minute, speed_precision);

  // Whole divisor in [1, max_plunge_divisor].
  const real divisor = std::min(
    std::floor(random.next_range(1.0, real(data.max_plunge_divisor) + 1.0)),
    real(data.max_plunge_divisor)
  );
  out.plunge_rate = cfg.motion.plunge_rate ?
    *cfg.motion.plunge_rate :
    round_to(out.feed_rate / divisor, speed_precision);

  return out;
}

config motion::apply_cutting_data(const config & __restrict cfg)
{
  config out = cfg;
  if (!cfg.cutting_data)
  {
    return out;
  }

  prng random{ cfg.cutting_data->seed };
  const speeds drawn = draw_speeds(cfg, *cfg.cutting_data, random);

  if (drawn.feed_rate <= 0.0 || drawn.plunge_rate <= 0.0 || drawn.spindle_rpm <= 0.0)
  {
    throw invalid_spec("cutting_data gives a zero speed at the output precision of hundredths");
  }

  out.motion.feed_rate = drawn.feed_rate;
  out.motion.plunge_rate = drawn.plunge_rate;
  if (!out.machine.spindle)
  {
    out.machine.spindle = config::spindle_options{ drawn.spindle_rpm, spindle_direction::clockwise };
  }

  log::info(
    cfg.options.verbose,
    "Cutting data: S%.2f F%.2f, plunge F%.2f\n",
    drawn.spindle_rpm, drawn.feed_rate, drawn.plunge_rate
  );

  return out;
}
