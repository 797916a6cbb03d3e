#pragma once

#include <cstdarg>
#include <cstdio>

namespace gcsg::log
{
  // Progress messages. Written to stderr so they never mix with a program printed to stdout.
  inline void info(bool enabled, const char * __restrict format, ...)
  {
    if (!enabled)
    {
      return;
    }

    va_list args;
    va_start(args, format);
    vfprintf(stderr, format, args);
    va_end(args);
  }
}
