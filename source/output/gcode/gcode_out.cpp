#include "gcsg.hpp"
#include "gcode_out.hpp"

using namespace gcsg;

namespace
{
  std::string comment_text(const std::string & __restrict text, comment_format style)
  {
    std::string out;
    out.reserve(text.size());
    for (char c : text)
    {
      // A comment must stay on its line, and parentheses cannot nest.
      if (c == '\n' || c == '\r')
      {
        c = ' ';
      }
      else if (style == comment_format::parentheses && (c == '(' || c == ')'))
      {
        c = ' ';
      }
      out += c;
    }

    if (style == comment_format::parentheses)
    {
      return "(" + out + ")";
    }
    return "; " + out;
  }
}

std::string output::format_line(const instruction & __restrict ins, uint precision, comment_format style)
{
  if (ins.get_opcode() == opcode::comment)
  {
    return comment_text(ins.text(), style);
  }

  std::string line = token(ins.get_opcode());

  for (const char * __restrict letter = canonical_arguments(ins.get_opcode()); *letter; ++letter)
  {
    const std::optional<real> value = ins.get_argument(*letter);
    if (!value)
    {
      continue;
    }
    if (!line.empty())
    {
      line += ' ';
    }
    line += *letter;
    line += format_real(*value, precision);
  }

  return line;
}

std::string output::serialize(const std::vector<instruction> & __restrict program, const config & __restrict cfg)
{
  std::string output;
  output.reserve(program.size() * 16);

  for (const instruction & __restrict ins : program)
  {
    output += format_line(ins, cfg.output.precision, cfg.output.comment_style);
    output += '\n';
  }

  return output;
}

