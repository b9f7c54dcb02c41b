/***
 * Name: pyhost::exceptions::ForeignError::ForeignError
 * Purpose: Construct a translated Python error.
 * Inputs:
 *   - typeName: Python exception class name
 *   - text: str() of the exception value
 *   - stack: composed stack trace
 * Outputs: Initialized exception object
 * Theory of Operation: The message follows the "[Type] text" form used by every
 *   pyhost error report.
 */
#include "pyhost/exceptions/foreign_error.h"

#include <utility>

namespace pyhost::exceptions {

ForeignError::ForeignError(std::string typeName, std::string text, std::vector<errors::StackFrame> stack)
    : PyhostException("[" + typeName + "] " + text),
      typeName_(std::move(typeName)),
      text_(std::move(text)),
      stack_(std::move(stack)) {}

}  // namespace pyhost::exceptions
