#include "gcsg.hpp"
#include "config.hpp"
#include "program/assembler.hpp"

#include <cstdio>

using namespace gcsg;

int main()
{
  config cfg;
  cfg.units = unit_system::millimeter;
  cfg.motion.travel_rate = 3000.0;
  cfg.resolution.chord_tolerance = 0.05;
  cfg.clearance = config::clearance_options{};
  cfg.lead = config::lead_options{};
  cfg.machine.home = true;
  cfg.machine.tool = config::tool_options{ 2 };

  // 1/4" end mill.
  config::cutting_data_options cutting;
  cutting.seed = 2024;
  cutting.diameter = 6.35;
  cutting.sfm = { 300.0, 600.0 };
  cutting.ipt = { 0.001, 0.003 };
  cfg.cutting_data = cutting;
  cfg.options.verbose = true;

  shapes::rectangle outline;
  outline.origin = vector3<>{ 0.0, 0.0, -1.0 };
  outline.width = 40.0;
  outline.height = 25.0;

  shapes::stack pocket;
  pocket.base = shapes::circle({ 20.0, 12.5, -1.0 }, 6.0);
  pocket.layers = 3;
  pocket.layer_height = -1.0;

  shapes::slot slot;
  slot.center = vector3<>{ 20.0, 30.0, -0.5 };
  slot.length = 15.0;
  slot.radius = 2.5;

  cfg.shapes = { outline, pocket, slot };

  try
  {
    const std::string text = program::generate(cfg);
    fwrite(text.c_str(), 1, text.length(), stdout);
  }
  catch (const error &ex)
  {
    fprintf(stderr, "gcsg_sample: %s\n", ex.what());
    return 1;
  }

  return 0;
}
