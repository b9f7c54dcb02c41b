#include "pyhost/cli/ParseArgsInternals.h"

namespace pyhost::cli::detail {
    /***
     * Name: pyhost::cli::detail::applySimpleBoolFlags
     * Purpose: Handle flag-only boolean options and set outputs.
     */
    bool applySimpleBoolFlags(std::string_view arg, Options &out) {
        if (isFlag(arg, "-h") || isFlag(arg, "--help")) {
            out.showHelp = true;
            return true;
        }
        if (isFlag(arg, "--metrics")) {
            out.metrics = true;
            return true;
        }
        if (isFlag(arg, "--metrics-json")) {
            out.metricsJson = true;
            return true;
        }
        if (isFlag(arg, "--debug")) {
            out.debug = true;
            return true;
        }
        return false;
    }
} // namespace pyhost::cli::detail
