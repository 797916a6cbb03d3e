#include "gcsg.hpp"
#include "emitter.hpp"

using namespace gcsg;

output::emitter::emitter(const config & __restrict cfg) :
  cfg_(cfg),
  uses_z_(cfg.uses_z())
{}

real output::emitter::round(real value) const __restrict
{
  return round_to(value, cfg_.output.precision);
}

void output::emitter::push(opcode op, std::vector<argument> arguments) __restrict
{
  out_.push_back(instruction::make(op, std::move(arguments)));
}

std::vector<output::instruction> output::emitter::take() __restrict
{
  return std::move(out_);
}

void output::emitter::begin_program() __restrict
{
  push(cfg_.units == unit_system::inch ? opcode::G20 : opcode::G21);
  state_.units = cfg_.units;

  push(opcode::G90);
  state_.absolute = true;

  if (cfg_.extrusion)
  {
    push(opcode::M83);
    state_.relative_extrusion = true;
  }

  if (cfg_.machine.home)
  {
    push(opcode::G28);
    state_.x = state_.y = state_.z = 0.0;
  }

  if (cfg_.extrusion)
  {
    const auto & __restrict extrusion = *cfg_.extrusion;
    // Bed first, it takes the longest to come up.
    if (extrusion.bed_temperature)
    {
      const real temp = round(*extrusion.bed_temperature);
      push(extrusion.wait ? opcode::M190 : opcode::M140, { { 'S', temp } });
      state_.bed_temp = temp;
    }
    if (extrusion.hotend_temperature)
    {
      const real temp = round(*extrusion.hotend_temperature);
      push(extrusion.wait ? opcode::M109 : opcode::M104, { { 'S', temp } });
      state_.extruder_temp = temp;
    }
    if (extrusion.fan_speed && *extrusion.fan_speed > 0.0)
    {
      const real speed = round(*extrusion.fan_speed);
      push(opcode::M106, { { 'S', speed } });
      state_.fan_speed = speed;
    }
  }

  if (cfg_.machine.tool)
  {
    push(opcode::M6, { { 'T', real(cfg_.machine.tool->number) } });
    state_.tool = cfg_.machine.tool->number;
  }

  if (cfg_.machine.spindle)
  {
    const auto & __restrict spindle = *cfg_.machine.spindle;
    push(
      spindle.direction == spindle_direction::clockwise ? opcode::M3 : opcode::M4,
      { { 'S', round(spindle.rpm) } }
    );
    state_.spindle_on = true;
  }
}

void output::emitter::end_program() __restrict
{
  compensation(cutter_side::none);

  if (state_.spindle_on)
  {
    push(opcode::M5);
    state_.spindle_on = false;
  }

  if (cfg_.extrusion)
  {
    if (state_.extruder_temp && *state_.extruder_temp != 0.0)
    {
      push(opcode::M104, { { 'S', 0.0 } });
      state_.extruder_temp = 0.0;
    }
    if (state_.bed_temp && *state_.bed_temp != 0.0)
    {
      push(opcode::M140, { { 'S', 0.0 } });
      state_.bed_temp = 0.0;
    }
    if (state_.fan_speed && *state_.fan_speed != 0.0)
    {
      push(opcode::M107);
      state_.fan_speed = 0.0;
    }
    push(opcode::M84);
  }

  push(cfg_.dialect.program_end == end_code::M30 ? opcode::M30 : opcode::M2);
}

void output::emitter::comment(std::string text) __restrict
{
  out_.push_back(instruction::make_comment(std::move(text)));
}

void output::emitter::compensation(cutter_side side) __restrict
{
  if (side == state_.compensation)
  {
    return;
  }

  switch (side)
  {
  case cutter_side::none:
    push(opcode::G40); break;
  case cutter_side::left:
    push(opcode::G41); break;
  case cutter_side::right:
    push(opcode::G42); break;
  }
  state_.compensation = side;
}

void output::emitter::set_feedrate(real feedrate) __restrict
{
  const real rounded = round(feedrate);
  if (state_.feedrate && *state_.feedrate == rounded)
  {
    return;
  }
  push(opcode::feed, { { 'F', rounded } });
  state_.feedrate = rounded;
}

void output::emitter::emit(const motion::step_list & __restrict steps) __restrict
{
  for (const motion::step & __restrict step : steps)
  {
    emit(step);
  }
}

void output::emitter::emit(const motion::step & __restrict step) __restrict
{
  const bool full_axis = cfg_.output.full_axis;
  const bool is_arc = step.is_arc();

  std::vector<argument> arguments;
  arguments.reserve(6);

  const real x = round(step.target_.x);
  const real y = round(step.target_.y);
  const real z = round(step.target_.z);

  bool changed = false;
  const auto axis = [&](char letter, real value, const std::optional<real> & __restrict current)
  {
    const bool differs = !current || *current != value;
    changed = changed || differs;
    if (full_axis || differs)
    {
      arguments.push_back({ letter, value });
    }
  };

  axis('X', x, state_.x);
  axis('Y', y, state_.y);
  if (uses_z_)
  {
    axis('Z', z, state_.z);
  }

  if (is_arc)
  {
    // Center offsets are relative to the start point and always required.
    arguments.push_back({ 'I', round(step.center_offset_.x) });
    arguments.push_back({ 'J', round(step.center_offset_.y) });
  }

  real extrusion = state_.extrusion;
  if (cfg_.extrusion && step.mode_ != motion::mode::rapid)
  {
    const real delta = round(round(step.extrusion_) - state_.extrusion);
    if (delta != 0.0)
    {
      arguments.push_back({ 'E', delta });
      extrusion = round(state_.extrusion + delta);
      changed = true;
    }
  }

  // Already where the machine is. Arcs always go out, a full circle ends where it starts.
  if (!changed && !is_arc)
  {
    return;
  }

  if (is_arc && !state_.plane_xy)
  {
    push(opcode::G17);
    state_.plane_xy = true;
  }

  if (step.feedrate_)
  {
    set_feedrate(*step.feedrate_);
  }

  opcode op = opcode::G1;
  switch (step.mode_)
  {
  case motion::mode::rapid:
    op = opcode::G0; break;
  case motion::mode::linear:
    op = opcode::G1; break;
  case motion::mode::arc_cw:
    op = opcode::G2; break;
  case motion::mode::arc_ccw:
    op = opcode::G3; break;
  }

  push(op, std::move(arguments));

  state_.x = x;
  state_.y = y;
  if (uses_z_)
  {
    state_.z = z;
  }
  state_.extrusion = extrusion;
}
