#include "gcsg.hpp"
#include "instruction.hpp"

#include <cstring>
#include <stdexcept>

using namespace gcsg;

const char * output::token(opcode op)
{
  switch (op)
  {
  case opcode::G0: return "G0";
  case opcode::G1: return "G1";
  case opcode::G2: return "G2";
  case opcode::G3: return "G3";
  case opcode::G17: return "G17";
  case opcode::G20: return "G20";
  case opcode::G21: return "G21";
  case opcode::G28: return "G28";
  case opcode::G40: return "G40";
  case opcode::G41: return "G41";
  case opcode::G42: return "G42";
  case opcode::G90: return "G90";
  case opcode::M2: return "M2";
  case opcode::M3: return "M3";
  case opcode::M4: return "M4";
  case opcode::M5: return "M5";
  case opcode::M6: return "M6";
  case opcode::M30: return "M30";
  case opcode::M83: return "M83";
  case opcode::M84: return "M84";
  case opcode::M104: return "M104";
  case opcode::M106: return "M106";
  case opcode::M107: return "M107";
  case opcode::M109: return "M109";
  case opcode::M140: return "M140";
  case opcode::M190: return "M190";
  case opcode::feed: return "";
  case opcode::comment: return "";
  }
  throw std::invalid_argument("unknown opcode");
}

const char * output::canonical_arguments(opcode op)
{
  switch (op)
  {
  case opcode::G0:
  case opcode::G1:
    return "XYZE";
  case opcode::G2:
  case opcode::G3:
    return "XYZIJE";
  case opcode::M3:
  case opcode::M4:
  case opcode::M104:
  case opcode::M106:
  case opcode::M109:
  case opcode::M140:
  case opcode::M190:
    return "S";
  case opcode::M6:
    return "T";
  case opcode::feed:
    return "F";
  default:
    return "";
  }
}

output::family output::family_of(opcode op)
{
  switch (op)
  {
  case opcode::G0:
  case opcode::G1:
  case opcode::G2:
  case opcode::G3:
    return family::motion;
  // The units word opens every program.
  case opcode::G20:
  case opcode::G21:
    return family::program_start;
  case opcode::M2:
  case opcode::M30:
    return family::program_end;
  case opcode::comment:
    return family::comment;
  default:
    return family::state_set;
  }
}

output::instruction::instruction(opcode op, std::vector<argument> && __restrict arguments, std::string && __restrict text) :
  opcode_(op),
  arguments_(std::move(arguments)),
  text_(std::move(text))
{}

output::instruction output::instruction::make(opcode op, std::vector<argument> arguments)
{
  if (op == opcode::comment)
  {
    throw std::invalid_argument("comments are built with make_comment");
  }

  const char * __restrict allowed = canonical_arguments(op);
  for (usize i = 0; i < arguments.size(); ++i)
  {
    const argument & __restrict arg = arguments[i];
    if (arg.letter == '\0' || !strchr(allowed, arg.letter))
    {
      throw std::invalid_argument(std::string("argument '") + arg.letter + "' is not valid for " + token(op));
    }
    if (!is_finite(arg.value))
    {
      throw std::invalid_argument(std::string("argument '") + arg.letter + "' is not finite");
    }
    for (usize j = 0; j < i; ++j)
    {
      if (arguments[j].letter == arg.letter)
      {
        throw std::invalid_argument(std::string("argument '") + arg.letter + "' given twice");
      }
    }
  }

  return { op, std::move(arguments), std::string{} };
}

output::instruction output::instruction::make_comment(std::string text)
{
  return { opcode::comment, std::vector<argument>{}, std::move(text) };
}

output::family output::instruction::get_family() const __restrict
{
  return family_of(opcode_);
}

std::optional<real> output::instruction::get_argument(char letter) const __restrict
{
  for (const argument & __restrict arg : arguments_)
  {
    if (arg.letter == letter)
    {
      return arg.value;
    }
  }
  return std::nullopt;
}
