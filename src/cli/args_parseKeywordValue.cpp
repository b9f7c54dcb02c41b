#include "pyhost/cli/ParseArgsInternals.h"

namespace pyhost::cli::detail {

/***
 * Name: pyhost::cli::detail::parseKeywordValue
 * Purpose: Split a --kw value at its first '='.
 */
std::optional<std::pair<std::string, std::string>> parseKeywordValue(std::string_view value) {
    const auto eq = value.find('=');
    if (eq == std::string_view::npos || eq == 0) { return std::nullopt; }
    return std::make_pair(std::string(value.substr(0, eq)), std::string(value.substr(eq + 1)));
}

} // namespace pyhost::cli::detail
