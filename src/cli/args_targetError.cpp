#include "pyhost/cli/ParseArgsInternals.h"

namespace pyhost::cli::detail {
    /***
     * Name: pyhost::cli::detail::targetError
     * Purpose: Validate that exactly one of `-e <expr>` or `<module> <function>` was given.
     */
    const char* targetError(const Options &opts) {
        if (opts.showHelp) { return nullptr; }
        if (!opts.expression.empty()) {
            if (!opts.positionals.empty()) { return "cannot combine -e with <module> <function>"; }
            if (!opts.keywords.empty()) { return "--kw applies only to <module> <function> calls"; }
            return nullptr;
        }
        if (opts.positionals.empty()) { return "missing <module> <function> or -e <expr>"; }
        if (opts.positionals.size() < 2) { return "missing <function> after <module>"; }
        return nullptr;
    }
} // namespace pyhost::cli::detail
