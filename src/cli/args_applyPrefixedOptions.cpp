#include "pyhost/cli/ParseArgsInternals.h"

#include <string>

namespace pyhost::cli::detail {
    /***
     * Name: pyhost::cli::detail::applyPrefixedOptions
     * Purpose: Parse and apply --key=value options like color/path/kw.
     */
    bool applyPrefixedOptions(std::string_view arg, Options &out, bool &malformed) {
        if (constexpr std::string_view colorPrefix{"--color="}; arg.rfind(colorPrefix, 0) == 0) {
            out.color = parseColorValue(arg.substr(colorPrefix.size()));
            return true;
        }

        if (constexpr std::string_view pathPrefix{"--path="}; arg.rfind(pathPrefix, 0) == 0) {
            const auto dir = arg.substr(pathPrefix.size());
            if (dir.empty()) { malformed = true; }
            else { out.searchPaths.emplace_back(dir); }
            return true;
        }

        if (constexpr std::string_view kwPrefix{"--kw="}; arg.rfind(kwPrefix, 0) == 0) {
            if (auto keyword = parseKeywordValue(arg.substr(kwPrefix.size()))) {
                out.keywords.push_back(std::move(*keyword));
            } else {
                malformed = true;
            }
            return true;
        }
        return false;
    }
} // namespace pyhost::cli::detail
