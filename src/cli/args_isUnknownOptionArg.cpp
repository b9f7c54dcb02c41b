#include "pyhost/cli/ParseArgsInternals.h"

namespace pyhost::cli::detail {
    /***
     * Name: pyhost::cli::detail::isUnknownOptionArg
     * Purpose: Detect unsupported option-like arguments that start with '-'.
     */
    bool isUnknownOptionArg(const std::string_view arg) {
        return arg.size() > 1 && arg[0] == '-';
    }
} // namespace pyhost::cli::detail
