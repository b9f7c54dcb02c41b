#include "pyhost/cli/ParseArgs.h"
#include "pyhost/cli/ParseArgsInternals.h"

#include <iostream>

namespace pyhost::cli {
    /***
     * Name: pyhost::cli::ParseArgs
     * Purpose: Command line parser for pyhost.
     * Theory of Operation:
     *   Options may appear anywhere before the function name. Once <module> and
     *   <function> are known, every remaining argument is a call argument, so
     *   values such as "-3" pass through unchanged.
     */
    bool ParseArgs(const int argc, char **argv, Options &out) {
        for (int i = 1; i < argc; ++i) {
            // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            const std::string_view arg{argv[i]};
            if (detail::isFlag(arg, "--") || out.positionals.size() >= 2) {
                const int start = detail::isFlag(arg, "--") ? i + 1 : i;
                detail::collectRemainingAsPositionals(static_cast<std::size_t>(start), argc, argv, out);
                break;
            }
            bool malformed = false;
            if (detail::handleExpressionFlag(i, argc, argv, out, malformed)) {
                if (malformed) {
                    std::cerr << "pyhost: option '-e' requires an expression\n";
                    return false;
                }
                continue;
            }
            if (detail::applySimpleBoolFlags(arg, out)) { continue; }
            if (detail::applyPrefixedOptions(arg, out, malformed)) {
                if (malformed) {
                    std::cerr << "pyhost: malformed option '" << arg << "'\n";
                    return false;
                }
                continue;
            }

            // Positional
            if (detail::isUnknownOptionArg(arg)) {
                std::cerr << "pyhost: unknown option '" << arg << "'\n";
                return false;
            }
            out.positionals.emplace_back(arg);
        }

        if (const char* error = detail::targetError(out); error != nullptr) {
            std::cerr << "pyhost: " << error << "\n";
            return false;
        }

        return true;
    }
} // namespace pyhost::cli
