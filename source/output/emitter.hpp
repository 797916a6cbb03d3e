#pragma once

#include "gcsg.hpp"
#include "config.hpp"
#include "instruction.hpp"
#include "state.hpp"
#include "motion/step.hpp"

#include <string>
#include <vector>

namespace gcsg::output
{
  // Turns motion steps into instructions, dropping anything the machine state already holds.
  class emitter final
  {
    const config &cfg_;
    state state_;
    std::vector<instruction> out_;
    bool uses_z_;

  public:
    explicit emitter(const config & __restrict cfg);

    void begin_program() __restrict;
    void end_program() __restrict;

    void comment(std::string text) __restrict;
    void compensation(cutter_side side) __restrict;

    void emit(const motion::step_list & __restrict steps) __restrict;
    void emit(const motion::step & __restrict step) __restrict;

    usize size() const __restrict { return out_.size(); }
    std::vector<instruction> take() __restrict;

  private:
    real round(real value) const __restrict;
    void push(opcode op, std::vector<argument> arguments = {}) __restrict;
    void set_feedrate(real feedrate) __restrict;
  };
}
