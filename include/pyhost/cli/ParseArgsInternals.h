/**
 * @file
 * @brief Declarations for pyhost CLI argument parsing helpers.
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "pyhost/cli/ColorMode.h"
#include "pyhost/cli/Options.h"

namespace pyhost::cli::detail {

/** Return true if `arg` exactly matches the `flag`. */
bool isFlag(std::string_view arg, std::string_view flag);

/** Parse `--color=<value>` to ColorMode with default fallback. */
ColorMode parseColorValue(std::string_view value);

/** Split `name=value` from `--kw=`; empty when there is no '=' or no name. */
std::optional<std::pair<std::string, std::string>> parseKeywordValue(std::string_view value);

/** Collect remaining argv items as positionals starting at index. */
void collectRemainingAsPositionals(std::size_t startIndex, int argc, char** argv, Options& out);

/** Detect unknown option-like arguments beginning with '-' that aren't supported. */
bool isUnknownOptionArg(std::string_view arg);

/** Describe why the parsed options name no runnable target; nullptr when they do. */
const char* targetError(const Options& opts);

/** Handle boolean, flag-only options like -h, --metrics, --debug. */
bool applySimpleBoolFlags(std::string_view arg, Options& out);

/** Handle `--key=value` style options (color, path, kw). Sets `malformed` for a bad value. */
bool applyPrefixedOptions(std::string_view arg, Options& out, bool& malformed);

/** Handle `-e <expr>` by consuming the next argv item. Sets `malformed` when it is missing. */
bool handleExpressionFlag(int& idx, int argc, char** argv, Options& out, bool& malformed);

} // namespace pyhost::cli::detail
