#include "pyhost/cli/ParseArgsInternals.h"

namespace pyhost::cli::detail {
    /***
     * Name: pyhost::cli::detail::handleExpressionFlag
     * Purpose: Handle `-e <expr>` by consuming the next argument.
     */
    bool handleExpressionFlag(int &idx, int argc, char **argv, Options &out, bool &malformed) {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (const std::string_view arg{argv[idx]}; !isFlag(arg, "-e")) { return false; }
        if (idx + 1 >= argc) {
            malformed = true;
            return true;
        }
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        out.expression = argv[++idx];
        return true;
    }
} // namespace pyhost::cli::detail
