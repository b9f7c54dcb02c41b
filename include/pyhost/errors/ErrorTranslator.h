/***
 * Name: pyhost::errors::ErrorTranslator
 * Purpose: Single reader of the CPython error indicator; converts a pending
 *   Python exception into exceptions::ForeignError.
 * Inputs: Called immediately after a foreign call returned its failure sentinel
 * Outputs:
 *   - checkAndFetch(): ForeignError if the indicator was set (now cleared)
 *   - raiseFailure(): throws ForeignError, or InvariantViolation when the
 *     sentinel came back with no error set
 * Theory of Operation:
 *   Fetch-and-clear the (type, value, traceback) triple, normalize it, and take
 *   ownership of all three through the ReferenceManager. The message is
 *   "[<type.__name__>] <str(value)>". The stack is traceback.extract_tb(tb)
 *   reversed (innermost first) followed by the host stack below this class.
 *   The traceback module is imported on first use and kept until
 *   releaseCache().
 */
#pragma once

#include <optional>
#include <string>

#include "pyhost/exceptions/foreign_error.h"
#include "pyhost/refs/ManagedReference.h"

namespace pyhost {
class Bridge;
}

namespace pyhost::errors {

class ErrorTranslator {
 public:
  ErrorTranslator(Bridge& bridge, std::string libraryName);

  std::optional<exceptions::ForeignError> checkAndFetch();

  [[noreturn]] void raiseFailure(const char* operation);

  // For entry points whose failure sentinel is also a legitimate value.
  void raiseIfSet();

  const std::string& libraryName() const noexcept { return libraryName_; }

  // Drop the cached traceback module (before interpreter shutdown).
  void releaseCache() noexcept;

 private:
  exceptions::ForeignError translate(refs::ManagedReference type,
                                     refs::ManagedReference value,
                                     std::optional<refs::ManagedReference> traceback);

  Bridge& bridge_;
  std::string libraryName_;
  std::optional<refs::ManagedReference> tracebackModule_;
};

} // namespace pyhost::errors
