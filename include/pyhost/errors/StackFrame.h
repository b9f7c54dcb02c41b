/***
 * Name: pyhost::errors::StackFrame
 * Purpose: One entry of a composed foreign+host stack trace.
 * Theory of Operation: Foreign frames carry the "<pythonX.Y>" module marker
 *   and a source line; host frames carry the object file name, a demangled
 *   function name when the symbol is exported, and line 0.
 */
#pragma once

#include <ostream>
#include <string>

namespace pyhost::errors {

struct StackFrame {
  std::string module;
  std::string function;
  std::string file;
  int line{0};
};

// "  at <module> function (file:line)"
std::ostream& operator<<(std::ostream& out, const StackFrame& frame);

} // namespace pyhost::errors
