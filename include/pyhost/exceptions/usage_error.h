/***
 * Name: pyhost::exceptions::UsageError
 * Purpose: Exception for host-side misuse of a proxy (closed or moved-from
 *   proxy, dereferencing an exhausted iterator).
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from PyhostException. Never raised
 *   for foreign failures; those are ForeignError.
 */
#pragma once

#include <string>
#include <utility>

#include "pyhost/exceptions/pyhost_exception.h"

namespace pyhost {
namespace exceptions {

class UsageError : public PyhostException {
 public:
  explicit UsageError(std::string msg) noexcept : PyhostException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace pyhost
