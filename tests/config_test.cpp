#include "gcsg.hpp"
#include "config.hpp"
#include "fixtures.hpp"

#include <gtest/gtest.h>

#include <limits>

using namespace gcsg;

TEST(Validate, AcceptsMinimalConfig)
{
  EXPECT_NO_THROW(validate(test::basic_config(test::rectangle(10.0, 5.0))));
}

TEST(Validate, RequiresShapesAndFeed)
{
  config empty;
  empty.motion.feed_rate = 100.0;
  EXPECT_THROW(validate(empty), invalid_spec);

  config no_feed = test::basic_config(test::rectangle(10.0, 5.0));
  no_feed.motion.feed_rate.reset();
  EXPECT_THROW(validate(no_feed), invalid_spec);

  config zero_feed = test::basic_config(test::rectangle(10.0, 5.0));
  zero_feed.motion.feed_rate = 0.0;
  EXPECT_THROW(validate(zero_feed), invalid_spec);
}

TEST(Validate, LayersNeedAHeight)
{
  config cfg = test::basic_config(test::line(10.0));
  cfg.layers = 3;
  EXPECT_THROW(validate(cfg), invalid_spec);

  cfg.layer_height = 0.0;
  EXPECT_THROW(validate(cfg), invalid_spec);

  cfg.layer_height = -0.5;
  EXPECT_NO_THROW(validate(cfg));

  cfg.layers = 0;
  EXPECT_THROW(validate(cfg), invalid_spec);
}

TEST(Validate, StackLayersNeedAHeight)
{
  shapes::stack stacked;
  stacked.base = test::line(10.0);
  stacked.layers = 2;

  config cfg = test::basic_config(stacked);
  EXPECT_THROW(validate(cfg), invalid_spec);
}

TEST(Validate, ResolutionIsExclusive)
{
  config cfg = test::basic_config(shapes::circle(5.0));
  cfg.resolution.segment_count = 32;
  cfg.resolution.chord_tolerance = 0.01;
  EXPECT_THROW(validate(cfg), invalid_spec);

  cfg.resolution.chord_tolerance.reset();
  cfg.resolution.segment_count = 0;
  EXPECT_THROW(validate(cfg), invalid_spec);

  cfg.resolution.segment_count.reset();
  cfg.resolution.chord_tolerance = -1.0;
  EXPECT_THROW(validate(cfg), invalid_spec);
}

TEST(Validate, ShapeDimensions)
{
  EXPECT_THROW(validate(test::basic_config(test::rectangle(0.0, 5.0))), invalid_spec);
  EXPECT_THROW(validate(test::basic_config(shapes::circle(-1.0))), invalid_spec);

  shapes::arc too_far = shapes::circle(1.0);
  too_far.sweep = 400.0;
  EXPECT_THROW(validate(test::basic_config(too_far)), invalid_spec);

  shapes::polygon lonely;
  lonely.vertices = { { 0.0, 0.0 } };
  EXPECT_THROW(validate(test::basic_config(lonely)), invalid_spec);

  shapes::rounded_rectangle rounded;
  rounded.width = 10.0;
  rounded.height = 4.0;
  rounded.corner_radius = 3.0;
  EXPECT_THROW(validate(test::basic_config(rounded)), invalid_spec);

  shapes::rectangle nan_origin = test::rectangle(1.0, 1.0);
  nan_origin.origin = vector3<>{ std::numeric_limits<real>::quiet_NaN(), 0.0 };
  EXPECT_THROW(validate(test::basic_config(nan_origin)), invalid_spec);
}

TEST(Validate, OutputAndMachineOptions)
{
  config cfg = test::basic_config(test::rectangle(1.0, 1.0));
  cfg.output.precision = 16;
  EXPECT_THROW(validate(cfg), invalid_spec);

  cfg = test::basic_config(test::rectangle(1.0, 1.0));
  cfg.output.max_instructions = 0;
  EXPECT_THROW(validate(cfg), invalid_spec);

  cfg = test::basic_config(test::rectangle(1.0, 1.0));
  cfg.jitter = config::jitter_options{ 1, -0.1 };
  EXPECT_THROW(validate(cfg), invalid_spec);

  cfg = test::basic_config(test::rectangle(1.0, 1.0));
  cfg.machine.spindle = config::spindle_options{ 0.0, spindle_direction::clockwise };
  EXPECT_THROW(validate(cfg), invalid_spec);

  cfg = test::basic_config(test::rectangle(1.0, 1.0));
  cfg.extrusion = config::extrusion_options{};
  cfg.extrusion->fan_speed = 300.0;
  EXPECT_THROW(validate(cfg), invalid_spec);
}

TEST(Config, ActiveAxes)
{
  config cfg = test::basic_config(test::rectangle(1.0, 1.0));
  EXPECT_FALSE(cfg.uses_z());

  cfg.clearance = config::clearance_options{};
  EXPECT_TRUE(cfg.uses_z());

  cfg = test::basic_config(test::rectangle(1.0, 1.0));
  std::get<shapes::rectangle>(cfg.shapes.front()).origin = vector3<>{ 0.0, 0.0, -1.0 };
  EXPECT_TRUE(cfg.uses_z());
}

TEST(Config, NativeArcsNeedDialectAndNoJitter)
{
  config cfg = test::basic_config(shapes::circle(1.0));
  EXPECT_TRUE(cfg.use_native_arcs());

  cfg.dialect.native_arcs = false;
  EXPECT_FALSE(cfg.use_native_arcs());

  cfg.dialect.native_arcs = true;
  cfg.jitter = config::jitter_options{ 7, 0.1 };
  EXPECT_FALSE(cfg.use_native_arcs());
}

TEST(Validate, CuttingDataReplacesFeed)
{
  config cfg = test::basic_config(test::rectangle(1.0, 1.0));
  cfg.motion.feed_rate.reset();

  config::cutting_data_options data;
  data.diameter = 0.5;
  data.sfm = { 200.0, 400.0 };
  data.ipt = { 0.001, 0.002 };
  cfg.cutting_data = data;
  EXPECT_NO_THROW(validate(cfg));

  cfg.cutting_data->diameter = 0.0;
  EXPECT_THROW(validate(cfg), invalid_spec);

  cfg.cutting_data = data;
  cfg.cutting_data->sfm = { 400.0, 200.0 };
  EXPECT_THROW(validate(cfg), invalid_spec);

  cfg.cutting_data = data;
  cfg.cutting_data->ipt = { 0.0, 0.002 };
  EXPECT_THROW(validate(cfg), invalid_spec);

  cfg.cutting_data = data;
  cfg.cutting_data->max_plunge_divisor = 0;
  EXPECT_THROW(validate(cfg), invalid_spec);
}

TEST(Validate, LeadDimensions)
{
  config cfg = test::basic_config(test::rectangle(1.0, 1.0));
  cfg.lead = config::lead_options{};
  EXPECT_NO_THROW(validate(cfg));

  cfg.lead->approach = -1.0;
  EXPECT_THROW(validate(cfg), invalid_spec);

  cfg.lead = config::lead_options{};
  cfg.lead->in_radius = 0.0;
  EXPECT_THROW(validate(cfg), invalid_spec);

  cfg.lead = config::lead_options{};
  cfg.lead->out_radius = -0.25;
  EXPECT_THROW(validate(cfg), invalid_spec);
}
