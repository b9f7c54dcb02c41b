#include "pyhost/cli/ParseArgsInternals.h"

namespace pyhost::cli::detail {

/***
 * Name: pyhost::cli::detail::collectRemainingAsPositionals
 * Purpose: Gather remaining argv entries as module, function and call arguments.
 */
void collectRemainingAsPositionals(std::size_t startIndex, int argc, char** argv, Options& out) {
    for (int j = static_cast<int>(startIndex); j < argc; ++j) {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        out.positionals.emplace_back(argv[j]);
    }
}

} // namespace pyhost::cli::detail
