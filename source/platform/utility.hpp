#pragma once

#include <variant>

namespace gcsg
{
  // Builds a single visitor out of a set of lambdas, for std::visit over the shape and primitive variants.
  template <typename... Ts>
  struct overloaded : Ts...
  {
    using Ts::operator()...;
  };

  template <typename... Ts>
  overloaded(Ts...) -> overloaded<Ts...>;
}
