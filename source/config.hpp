#pragma once

#include "gcsg.hpp"
#include "geometry/shape.hpp"

#include <optional>
#include <vector>

namespace gcsg
{
  enum class unit_system : uint8
  {
    millimeter = 0,
    inch
  };

  enum class arc_style : uint8
  {
    native = 0, // One G2/G3 per arc primitive.
    linearized  // Arcs are emitted as chords.
  };

  enum class comment_format : uint8
  {
    semicolon = 0,
    parentheses
  };

  enum class end_code : uint8
  {
    M2 = 0,
    M30
  };

  enum class cutter_side : uint8
  {
    none = 0,
    left,
    right
  };

  enum class spindle_direction : uint8
  {
    clockwise = 0,
    counter_clockwise
  };

  // Generation options. Read-only once handed to the generator; validate() is run before any work.
  struct config final
  {
    static constexpr const real default_chord_tolerance = 0.01;

    std::vector<gcsg::shapes::shape> shapes;

    unit_system units = unit_system::millimeter;
    vector3<> start_position;

    struct
    {
      std::optional<real> feed_rate;
      std::optional<real> travel_rate; // Defaults to feed_rate.
      std::optional<real> plunge_rate; // Defaults to feed_rate.
    } motion;

    // At most one of segment_count and chord_tolerance. Without either, arcs use default_chord_tolerance.
    struct
    {
      std::optional<uint> segment_count;
      std::optional<real> chord_tolerance;
      std::optional<real> max_segment_length;
    } resolution;

    // Applies to every shape that is not itself a stack.
    uint layers = 1;
    std::optional<real> layer_height;

    arc_style arc_mode = arc_style::native;

    struct jitter_options
    {
      uint64 seed = 0;
      real magnitude = 0.0;
    };
    std::optional<jitter_options> jitter;

    struct
    {
      uint precision = 3;
      std::optional<usize> max_instructions;
      bool full_axis = false; // Emit every active axis on every move instead of only the changed ones.
      comment_format comment_style = comment_format::semicolon;
    } output;

    struct
    {
      bool native_arcs = true;
      bool rapid_feed = false; // Marlin-style G0 carrying the travel rate.
      end_code program_end = end_code::M2;
    } dialect;

    struct tool_options
    {
      uint number = 1;
    };

    struct spindle_options
    {
      real rpm = 0.0;
      spindle_direction direction = spindle_direction::clockwise;
    };

    struct
    {
      bool home = false;
      std::optional<tool_options> tool;
      std::optional<spindle_options> spindle;
      cutter_side compensation = cutter_side::none;
    } machine;

    // Speeds and feeds drawn from a cutting tool's recommended ranges, as tool catalogs give them:
    // surface feet per minute and inches per tooth. The diameter is in program units. The spindle
    // speed is sfm * 3.82 / diameter (inches), the feed ipt * rpm, and the plunge feed the feed divided
    // by a whole number drawn from [1, max_plunge_divisor]. Explicitly set rates and spindle win.
    struct range
    {
      real min = 0.0;
      real max = 0.0;
    };

    struct cutting_data_options
    {
      uint64 seed = 0;
      real diameter = 0.0;
      range sfm;
      range ipt;
      uint max_plunge_divisor = 5;
    };
    std::optional<cutting_data_options> cutting_data;

    // Tangential entry and exit quarter arcs around every pass, entered after a straight approach.
    struct lead_options
    {
      real approach = 1.0;
      real in_radius = 1.0;
      real out_radius = 0.25;
    };
    std::optional<lead_options> lead;

    // Approach and retract through a safe height around every pass.
    struct clearance_options
    {
      real safe_z = 5.0;
    };
    std::optional<clearance_options> clearance;

    // Additive mode: cutting moves carry an E amount proportional to their length.
    struct extrusion_options
    {
      real per_mm = 0.05;
      std::optional<real> hotend_temperature;
      std::optional<real> bed_temperature;
      bool wait = true; // M109 / M190 instead of M104 / M140.
      std::optional<real> fan_speed; // 0 - 255
    };
    std::optional<extrusion_options> extrusion;

    struct
    {
      bool verbose = false;
    } options;

    real feed_rate() const __restrict { return motion.feed_rate.value_or(0.0); }
    real travel_rate() const __restrict { return motion.travel_rate.value_or(feed_rate()); }
    real plunge_rate() const __restrict { return motion.plunge_rate.value_or(feed_rate()); }

    bool use_native_arcs() const __restrict
    {
      return arc_mode == arc_style::native && dialect.native_arcs && !jitter;
    }

    // Whether Z ever leaves the start height, and so belongs to the active axis set.
    bool uses_z() const __restrict;
  };

  // Throws invalid_spec describing the first problem found.
  extern void validate(const config & __restrict cfg);
}
