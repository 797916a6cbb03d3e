#pragma once

#include <stdexcept>
#include <string>

namespace gcsg
{
  // Every failure the engine reports aborts the generation run. Nothing is retried and no
  // partial program is returned.
  class error : public std::runtime_error
  {
  public:
    using std::runtime_error::runtime_error;
  };

  // Missing or out-of-range configuration value. Raised by validate() before any work is done.
  class invalid_spec final : public error
  {
  public:
    using error::error;
  };

  // Degenerate or undefined primitive (non-positive radius, tolerance or segment count).
  class invalid_geometry final : public error
  {
  public:
    using error::error;
  };

  // The assembled program exceeded output.max_instructions.
  class program_too_large final : public error
  {
  public:
    using error::error;
  };
}
