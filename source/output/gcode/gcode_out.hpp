#pragma once

#include "gcsg.hpp"
#include "config.hpp"
#include "output/instruction.hpp"

#include <string>
#include <vector>

namespace gcsg::output
{
  // One line, without the trailing newline.
  extern std::string format_line(const instruction & __restrict ins, uint precision, comment_format style);

  // Whole program, one instruction per line, newline terminated.
  extern std::string serialize(const std::vector<instruction> & __restrict program, const config & __restrict cfg);
}
