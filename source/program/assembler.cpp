#include "gcsg.hpp"
#include "assembler.hpp"
#include "motion/planner.hpp"
#include "motion/speeds.hpp"
#include "output/emitter.hpp"
#include "output/gcode/gcode_out.hpp"

#include <stdexcept>

using namespace gcsg;

namespace
{
  // Enforces the size limit as the program grows.
  class size_guard final
  {
    const output::emitter &emitter_;
    const std::optional<usize> limit_;
    usize last_ = 0;

  public:
    size_guard(const output::emitter & __restrict emitter, const std::optional<usize> & __restrict limit) :
      emitter_(emitter),
      limit_(limit)
    {}

    void check() __restrict
    {
      const usize count = emitter_.size();
      if (count < last_)
      {
        throw std::logic_error("instruction count went down");
      }
      if (limit_ && count > *limit_)
      {
        throw program_too_large(
          "program needs more than " + std::to_string(*limit_) + " instructions (" + std::to_string(count) + " so far)"
        );
      }
      last_ = count;
    }
  };

  void check_bookends(const program::instruction_list & __restrict program)
  {
    usize starts = 0;
    usize ends = 0;
    for (const output::instruction & __restrict ins : program)
    {
      starts += (ins.get_family() == output::family::program_start) ? 1 : 0;
      ends += (ins.get_family() == output::family::program_end) ? 1 : 0;
    }

    if (
      starts != 1 || ends != 1 ||
      program.front().get_family() != output::family::program_start ||
      program.back().get_family() != output::family::program_end
    )
    {
      throw std::logic_error("program must open with one start record and close with one end record");
    }
  }
}

program::instruction_list program::assemble(const config & __restrict input)
{
  validate(input);
  const config cfg = motion::apply_cutting_data(input);

  const bool verbose = cfg.options.verbose;
  const uint precision = cfg.output.precision;
  const usize shape_count = cfg.shapes.size();

  log::info(verbose, "Generating %zu shape(s)\n", shape_count);

  motion::planner planner{ cfg, prng{ cfg.jitter ? cfg.jitter->seed : 0 } };
  output::emitter emitter{ cfg };
  size_guard guard{ emitter, cfg.output.max_instructions };

  emitter.begin_program();
  guard.check();

  for (usize i = 0; i < shape_count; ++i)
  {
    const shapes::shape & __restrict shape = cfg.shapes[i];

    log::info(verbose, "Shape %zu/%zu: %s\n", i + 1, shape_count, shapes::name(shape));

    emitter.comment(geometry::describe(shape, precision));

    motion::shape_plan plan = planner.plan(shape);

    if (cfg.machine.compensation != cutter_side::none)
    {
      emitter.compensation(cfg.machine.compensation);
    }
    guard.check();

    const usize layer_count = plan.size();
    for (usize layer = 0; layer < layer_count; ++layer)
    {
      if (layer_count > 1)
      {
        emitter.comment("layer " + std::to_string(layer + 1) + "/" + std::to_string(layer_count));
      }
      emitter.emit(plan[layer]);
      guard.check();
    }

    if (cfg.machine.compensation != cutter_side::none)
    {
      emitter.compensation(cutter_side::none);
      guard.check();
    }
  }

  emitter.end_program();
  guard.check();

  instruction_list program = emitter.take();
  check_bookends(program);

  log::info(verbose, "Done, %zu instructions\n", program.size());

  return program;
}

std::string program::generate(const config & __restrict cfg)
{
  const instruction_list program = assemble(cfg);
  return output::serialize(program, cfg);
}
