/***
 * Name: pyhost::support debug trace
 * Purpose: Opt-in stderr trace for the bridge internals.
 * Theory of Operation: Enabled when PYHOST_DEBUG is true at first use, or
 *   explicitly through setDebugEnabled() (the CLI's --debug). Lines look like
 *   "[refs] reclaimed 3 deferred reference(s)".
 */
#pragma once

#include <cstdio>

namespace pyhost::support {

bool debugEnabled() noexcept;

void setDebugEnabled(bool on) noexcept;

} // namespace pyhost::support

#define PYHOST_DEBUG_LOG(area, ...)                          \
  do {                                                       \
    if (::pyhost::support::debugEnabled()) {                 \
      std::fprintf(stderr, "[" area "] " __VA_ARGS__);       \
      std::fputc('\n', stderr);                              \
    }                                                        \
  } while (0)
