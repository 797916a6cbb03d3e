#include "gcsg.hpp"
#include "motion/planner.hpp"
#include "fixtures.hpp"

#include <gtest/gtest.h>

using namespace gcsg;

namespace
{
  motion::shape_plan plan_first(const config & __restrict cfg, uint64 seed = 0)
  {
    motion::planner planner{ cfg, prng{ seed } };
    return planner.plan(cfg.shapes.front());
  }
}

TEST(Planner, RectangleIsOneRapidThenFourCuts)
{
  const config cfg = test::basic_config(test::rectangle(10.0, 5.0));
  const motion::shape_plan plan = plan_first(cfg);

  ASSERT_EQ(plan.size(), 1u);
  const motion::step_list & steps = plan.front();
  ASSERT_EQ(steps.size(), 5u);

  EXPECT_EQ(steps[0].mode_, motion::mode::rapid);
  EXPECT_FALSE(steps[0].feedrate_.has_value());
  EXPECT_EQ(steps[0].target_, (vector3<>{ 0.0, 0.0 }));

  for (usize i = 1; i < steps.size(); ++i)
  {
    EXPECT_EQ(steps[i].mode_, motion::mode::linear);
    EXPECT_EQ(steps[i].feedrate_.value_or(0.0), 100.0);
  }
  EXPECT_EQ(steps[2].target_, (vector3<>{ 10.0, 5.0 }));
  EXPECT_EQ(steps.back().target_, (vector3<>{ 0.0, 0.0 }));
}

TEST(Planner, LayersRepeatAtIncreasingHeight)
{
  config cfg = test::basic_config(test::line(10.0));
  cfg.layers = 3;
  cfg.layer_height = 2.0;

  const motion::shape_plan plan = plan_first(cfg);
  ASSERT_EQ(plan.size(), 3u);

  for (usize layer = 0; layer < plan.size(); ++layer)
  {
    const real z = 2.0 * real(layer);
    ASSERT_EQ(plan[layer].size(), 2u);
    EXPECT_EQ(plan[layer][0].mode_, motion::mode::rapid);
    EXPECT_EQ(plan[layer][0].target_, (vector3<>{ 0.0, 0.0, z }));
    EXPECT_EQ(plan[layer][1].target_, (vector3<>{ 10.0, 0.0, z }));
  }
}

TEST(Planner, NoRapidWhenAlreadyAtStart)
{
  config cfg = test::basic_config(test::rectangle(2.0, 2.0));
  cfg.machine.home = true;

  const motion::shape_plan plan = plan_first(cfg);
  ASSERT_EQ(plan.front().size(), 4u);
  EXPECT_EQ(plan.front().front().mode_, motion::mode::linear);
}

TEST(Planner, ConsecutiveShapesShareEndpoints)
{
  config cfg = test::basic_config(test::rectangle(2.0, 2.0));
  cfg.shapes.push_back(test::line(5.0));

  motion::planner planner{ cfg, prng{} };
  const motion::shape_plan first = planner.plan(cfg.shapes[0]);
  const motion::shape_plan second = planner.plan(cfg.shapes[1]);

  // The line is anchored at the same start, where the rectangle closed.
  ASSERT_EQ(second.front().size(), 1u);
  EXPECT_EQ(second.front().front().mode_, motion::mode::linear);
  EXPECT_EQ(first.front().size(), 5u);
}

TEST(Planner, NativeArcIsOneStep)
{
  const config cfg = test::basic_config(shapes::circle(5.0));
  const motion::shape_plan plan = plan_first(cfg);

  ASSERT_EQ(plan.front().size(), 2u);
  const motion::step & s = plan.front()[1];
  EXPECT_EQ(s.mode_, motion::mode::arc_ccw);
  EXPECT_NEAR(s.center_offset_.x, -5.0, 1e-12);
  EXPECT_NEAR(s.center_offset_.y, 0.0, 1e-12);
  EXPECT_EQ(s.target_, plan.front()[0].target_);
}

TEST(Planner, LinearizedArcUsesChords)
{
  config cfg = test::basic_config(shapes::circle(5.0));
  cfg.arc_mode = arc_style::linearized;
  cfg.resolution.segment_count = 12;

  const motion::shape_plan plan = plan_first(cfg);
  ASSERT_EQ(plan.front().size(), 13u);
  for (usize i = 1; i < plan.front().size(); ++i)
  {
    EXPECT_EQ(plan.front()[i].mode_, motion::mode::linear);
  }
}

TEST(Planner, JitterIsSeededAndBounded)
{
  config plain = test::basic_config(test::rectangle(10.0, 5.0));
  config jittered = plain;
  jittered.jitter = config::jitter_options{ 42, 0.25 };

  const motion::shape_plan reference = plan_first(plain);
  const motion::shape_plan a = plan_first(jittered, 42);
  const motion::shape_plan b = plan_first(jittered, 42);
  const motion::shape_plan c = plan_first(jittered, 43);

  ASSERT_EQ(a.front().size(), reference.front().size());
  ASSERT_EQ(b.front().size(), a.front().size());

  bool differs = false;
  for (usize i = 0; i < a.front().size(); ++i)
  {
    EXPECT_EQ(a.front()[i].target_, b.front()[i].target_);
    EXPECT_LE(a.front()[i].target_.distance(reference.front()[i].target_), 0.25 + 1e-12);
    if (i < c.front().size() && c.front()[i].target_ != a.front()[i].target_)
    {
      differs = true;
    }
  }
  EXPECT_TRUE(differs);

  // Positioning moves are never perturbed.
  EXPECT_EQ(a.front()[0].target_, reference.front()[0].target_);
}

TEST(Planner, JitterRepeatsOnEveryLayer)
{
  config cfg = test::basic_config(test::rectangle(10.0, 5.0));
  cfg.layers = 3;
  cfg.layer_height = 1.0;
  cfg.jitter = config::jitter_options{ 7, 0.5 };

  const motion::shape_plan plan = plan_first(cfg, 7);
  ASSERT_EQ(plan.size(), 3u);

  const motion::step_list & first = plan.front();
  for (usize layer = 1; layer < plan.size(); ++layer)
  {
    ASSERT_EQ(plan[layer].size(), first.size());
    for (usize i = 0; i < first.size(); ++i)
    {
      EXPECT_EQ(plan[layer][i].mode_, first[i].mode_);
      EXPECT_EQ(plan[layer][i].target_.x, first[i].target_.x);
      EXPECT_EQ(plan[layer][i].target_.y, first[i].target_.y);
      EXPECT_EQ(plan[layer][i].target_.z, real(layer));
    }
  }

  // The next shape draws fresh offsets.
  motion::planner planner{ cfg, prng{ 7 } };
  const motion::shape_plan again = planner.plan(cfg.shapes.front());
  const motion::shape_plan next = planner.plan(cfg.shapes.front());
  EXPECT_NE(again.front()[1].target_, next.front()[1].target_);
}

TEST(Planner, ClearanceRetractsAndPlunges)
{
  shapes::rectangle r = test::rectangle(4.0, 4.0);
  r.origin = vector3<>{ 0.0, 0.0, -1.0 };

  config cfg = test::basic_config(r);
  cfg.clearance = config::clearance_options{ 5.0 };
  cfg.motion.plunge_rate = 30.0;

  const motion::shape_plan plan = plan_first(cfg);
  const motion::step_list & steps = plan.front();
  ASSERT_EQ(steps.size(), 7u);

  EXPECT_EQ(steps[0].mode_, motion::mode::rapid);
  EXPECT_EQ(steps[0].target_, (vector3<>{ 0.0, 0.0, 5.0 }));
  EXPECT_EQ(steps[1].mode_, motion::mode::linear);
  EXPECT_EQ(steps[1].target_, (vector3<>{ 0.0, 0.0, -1.0 }));
  EXPECT_EQ(steps[1].feedrate_.value_or(0.0), 30.0);
  EXPECT_EQ(steps.back().mode_, motion::mode::rapid);
  EXPECT_EQ(steps.back().target_, (vector3<>{ 0.0, 0.0, 5.0 }));
}

TEST(Planner, ExtrusionAccumulatesAlongCuts)
{
  config cfg = test::basic_config(test::rectangle(10.0, 5.0));
  cfg.extrusion = config::extrusion_options{};
  cfg.extrusion->per_mm = 0.1;

  const motion::shape_plan plan = plan_first(cfg);
  const motion::step_list & steps = plan.front();
  ASSERT_EQ(steps.size(), 5u);
  EXPECT_DOUBLE_EQ(steps[0].extrusion_, 0.0);
  EXPECT_DOUBLE_EQ(steps[1].extrusion_, 1.0);
  EXPECT_DOUBLE_EQ(steps[2].extrusion_, 1.5);
  EXPECT_DOUBLE_EQ(steps[4].extrusion_, 3.0);
}

TEST(Planner, RapidFeedDialect)
{
  config cfg = test::basic_config(test::line(1.0));
  cfg.dialect.rapid_feed = true;
  cfg.motion.travel_rate = 900.0;

  const motion::shape_plan plan = plan_first(cfg);
  const motion::step_list & steps = plan.front();
  EXPECT_EQ(steps.front().feedrate_.value_or(0.0), 900.0);
}
