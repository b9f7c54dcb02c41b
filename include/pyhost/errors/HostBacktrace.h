/***
 * Name: pyhost::errors::captureHostStack
 * Purpose: Capture the host (C++) call stack at an error translation site.
 * Inputs:
 *   - maxFrames: capture depth
 * Outputs: Frames innermost first; every frame up to and including the
 *   outermost pyhost::errors frame is removed
 * Theory of Operation:
 *   Uses backtrace(3) and dladdr(3); names are demangled with the C++ ABI.
 *   Symbol names require exported symbols (-rdynamic); without them frames
 *   keep their object name and an address-only function name, and only the
 *   capture frame itself is trimmed.
 */
#pragma once

#include <cstddef>
#include <vector>

#include "pyhost/errors/StackFrame.h"

namespace pyhost::errors {

std::vector<StackFrame> captureHostStack(std::size_t maxFrames = 64);

} // namespace pyhost::errors
