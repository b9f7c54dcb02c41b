/***
 * Name: pyhost::exceptions::PyhostException
 * Purpose: Base class for all pyhost exceptions; do not use built-in exceptions directly.
 * Inputs: Message string describing the error condition
 * Outputs: Exception object providing `what()` text
 * Theory of Operation: Derives from std::exception to interoperate with catch sites,
 *   but all throws in pyhost must use a custom type derived from this base.
 */
#pragma once

#include <exception>
#include <string>

namespace pyhost {
namespace exceptions {

class PyhostException : public std::exception {
 public:
  virtual ~PyhostException() noexcept = default;
  const char* what() const noexcept override;

 protected:
  explicit PyhostException(std::string msg) noexcept;
  std::string message_;
};

}  // namespace exceptions
}  // namespace pyhost
