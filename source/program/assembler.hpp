#pragma once

#include "gcsg.hpp"
#include "config.hpp"
#include "output/instruction.hpp"

#include <string>
#include <vector>

namespace gcsg::program
{
  using instruction_list = std::vector<output::instruction>;

  // Validates the config and builds the whole program. Throws invalid_spec, invalid_geometry or
  // program_too_large; nothing partial is ever returned.
  extern instruction_list assemble(const config & __restrict cfg);

  // assemble() followed by serialization.
  extern std::string generate(const config & __restrict cfg);
}
