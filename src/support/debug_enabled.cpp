/***
 * Name: pyhost::support::debugEnabled / setDebugEnabled
 * Purpose: Process-wide switch for the [area] trace lines.
 * Inputs: PYHOST_DEBUG (read once), or an explicit setDebugEnabled() call
 * Outputs: Current switch state
 * Theory of Operation: Atomic flag seeded from the environment on first use.
 */
#include "pyhost/support/debug_log.h"
#include "pyhost/support/env.h"

#include <atomic>

namespace pyhost::support {

static std::atomic<bool>& debugFlag() {
  static std::atomic<bool> flag{envFlag("PYHOST_DEBUG")};
  return flag;
}

bool debugEnabled() noexcept { return debugFlag().load(std::memory_order_relaxed); }

void setDebugEnabled(bool on) noexcept { debugFlag().store(on, std::memory_order_relaxed); }

} // namespace pyhost::support
