#pragma once

#include "gcsg.hpp"

#include <optional>
#include <string>
#include <vector>

namespace gcsg::output
{
  enum class opcode : uint8
  {
    G0 = 0, // Rapid positioning
    G1,     // Linear interpolation
    G2,     // Clockwise arc
    G3,     // Counter-clockwise arc
    G17,    // XY plane
    G20,    // Inches
    G21,    // Millimeters
    G28,    // Home
    G40,    // Cutter compensation off
    G41,    // Cutter compensation left
    G42,    // Cutter compensation right
    G90,    // Absolute positioning
    M2,     // Program end
    M3,     // Spindle on, clockwise
    M4,     // Spindle on, counter-clockwise
    M5,     // Spindle stop
    M6,     // Tool change
    M30,    // Program end and rewind
    M83,    // Relative extrusion
    M84,    // Disable steppers
    M104,   // Set hotend temperature
    M106,   // Fan on
    M107,   // Fan off
    M109,   // Set hotend temperature and wait
    M140,   // Set bed temperature
    M190,   // Set bed temperature and wait
    feed,   // Bare F word
    comment
  };

  enum class family : uint8
  {
    motion = 0,
    state_set,
    comment,
    program_start,
    program_end
  };

  struct argument final
  {
    char letter;
    real value;
  };

  // One line of the program. Immutable once built; arguments are stored already rounded.
  class instruction final
  {
    opcode opcode_;
    std::vector<argument> arguments_;
    std::string text_;

    instruction(opcode op, std::vector<argument> && __restrict arguments, std::string && __restrict text);

  public:
    // Throws std::invalid_argument for a letter outside the opcode's canonical set, a repeated letter
    // or a non-finite value.
    static instruction make(opcode op, std::vector<argument> arguments = {});
    static instruction make_comment(std::string text);

    opcode get_opcode() const __restrict { return opcode_; }
    family get_family() const __restrict;

    const std::vector<argument> & arguments() const __restrict { return arguments_; }
    std::optional<real> get_argument(char letter) const __restrict;
    bool has_argument(char letter) const __restrict { return get_argument(letter).has_value(); }

    const std::string & text() const __restrict { return text_; }
  };

  // G/M word written for the opcode ("" for the bare feed word).
  extern const char * token(opcode op);

  // Argument letters in the order they are written.
  extern const char * canonical_arguments(opcode op);

  extern family family_of(opcode op);
}
