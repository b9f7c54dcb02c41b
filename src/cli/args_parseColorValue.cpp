#include "pyhost/cli/ParseArgsInternals.h"

namespace pyhost::cli::detail {

/***
 * Name: pyhost::cli::detail::parseColorValue
 * Purpose: Parse --color value into ColorMode with default.
 */
ColorMode parseColorValue(std::string_view value) {
    using enum pyhost::cli::ColorMode;
    if (value == "always") { return Always; }
    if (value == "never") { return Never; }
    return Auto;
}

} // namespace pyhost::cli::detail
