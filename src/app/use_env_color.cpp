#include "pyhost/app/Runner.h"
#include "pyhost/support/env.h"

namespace pyhost {
    bool Runner::use_env_color() { return support::envFlag("PYHOST_COLOR"); }
} // namespace pyhost
