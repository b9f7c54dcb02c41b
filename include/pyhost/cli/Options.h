#pragma once

#include <string>
#include <utility>
#include <vector>

#include "pyhost/cli/ColorMode.h"

namespace pyhost::cli {

    struct Options {
        bool showHelp{false};
        bool metrics{false};          // --metrics
        bool metricsJson{false};      // --metrics-json
        bool debug{false};            // --debug
        std::string expression{};     // -e <expr>
        std::vector<std::string> searchPaths{};                        // --path=<dir>
        std::vector<std::pair<std::string, std::string>> keywords{};   // --kw=<name>=<value>
        std::vector<std::string> positionals{};                        // <module> <function> [args...]
        ColorMode color{ColorMode::Auto};
    };

} // namespace pyhost::cli
