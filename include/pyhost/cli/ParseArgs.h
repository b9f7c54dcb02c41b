#pragma once

#include "pyhost/cli/Options.h"

namespace pyhost::cli {

    // Parse argv into Options. Returns false on fatal parse error (already reported on stderr).
    bool ParseArgs(int argc, char** argv, Options& out);

} // namespace pyhost::cli
