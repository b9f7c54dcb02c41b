/***
 * Name: pyhost::exceptions::PyhostException::what
 * Purpose: Return the stored error message.
 * Inputs: none
 * Outputs: C-string pointer valid for the lifetime of the exception
 * Theory of Operation: Returns message_.c_str(); noexcept.
 */
#include "pyhost/exceptions/pyhost_exception.h"

namespace pyhost::exceptions {

const char* PyhostException::what() const noexcept { return message_.c_str(); }

}  // namespace pyhost::exceptions
