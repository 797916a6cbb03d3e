#pragma once

#include "gcsg.hpp"
#include "config.hpp"
#include "output/instruction.hpp"

#include <string>
#include <vector>

namespace gcsg::test
{
  inline shapes::rectangle rectangle(real width, real height)
  {
    shapes::rectangle out;
    out.width = width;
    out.height = height;
    return out;
  }

  inline shapes::line line(real length)
  {
    shapes::line out;
    out.length = length;
    return out;
  }

  // Millimeters, feed 100, one shape.
  inline config basic_config(const shapes::shape & __restrict shape)
  {
    config cfg;
    cfg.shapes = { shape };
    cfg.motion.feed_rate = 100.0;
    return cfg;
  }

  inline std::vector<std::string> split_lines(const std::string & __restrict text)
  {
    std::vector<std::string> out;
    usize begin = 0;
    while (begin < text.size())
    {
      const usize end = text.find('\n', begin);
      if (end == std::string::npos)
      {
        out.push_back(text.substr(begin));
        break;
      }
      out.push_back(text.substr(begin, end - begin));
      begin = end + 1;
    }
    return out;
  }

  inline usize count_opcode(const std::vector<output::instruction> & __restrict program, output::opcode op)
  {
    usize count = 0;
    for (const output::instruction & __restrict ins : program)
    {
      count += (ins.get_opcode() == op) ? 1 : 0;
    }
    return count;
  }
}
