/***
 * Name: pyhost::exceptions::ForeignError
 * Purpose: Host-native form of a Python exception.
 * Inputs:
 *   - typeName: Python exception class name (e.g. "ValueError")
 *   - text: str() of the exception value
 *   - stack: composed stack, foreign frames then host frames, innermost first
 * Outputs: Exception object; what() is "[<typeName>] <text>"
 * Theory of Operation: Built only by errors::ErrorTranslator; immutable after
 *   construction.
 */
#pragma once

#include <string>
#include <vector>

#include "pyhost/errors/StackFrame.h"
#include "pyhost/exceptions/pyhost_exception.h"

namespace pyhost {
namespace exceptions {

class ForeignError : public PyhostException {
 public:
  ForeignError(std::string typeName, std::string text, std::vector<errors::StackFrame> stack);

  const std::string& typeName() const noexcept { return typeName_; }
  const std::string& text() const noexcept { return text_; }
  const std::vector<errors::StackFrame>& stack() const noexcept { return stack_; }

 private:
  std::string typeName_;
  std::string text_;
  std::vector<errors::StackFrame> stack_;
};

}  // namespace exceptions
}  // namespace pyhost
