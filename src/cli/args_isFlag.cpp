#include "pyhost/cli/ParseArgsInternals.h"

namespace pyhost::cli::detail {
    /***
     * Name: pyhost::cli::detail::isFlag
     * Purpose: Check if an argument exactly matches a flag.
     */
    bool isFlag(const std::string_view arg, const std::string_view flag) {
        return arg == flag;
    }
} // namespace pyhost::cli::detail
