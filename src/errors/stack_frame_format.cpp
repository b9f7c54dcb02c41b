/***
 * Name: pyhost::errors::operator<<(StackFrame)
 * Purpose: One-line rendering of a stack frame.
 */
#include "pyhost/errors/StackFrame.h"

namespace pyhost::errors {

std::ostream& operator<<(std::ostream& out, const StackFrame& frame) {
  out << "  at " << frame.module << ' ' << (frame.function.empty() ? "??" : frame.function);
  if (!frame.file.empty()) {
    out << " (" << frame.file;
    if (frame.line > 0) { out << ':' << frame.line; }
    out << ')';
  }
  return out;
}

} // namespace pyhost::errors
