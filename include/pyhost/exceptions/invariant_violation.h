/***
 * Name: pyhost::exceptions::InvariantViolation
 * Purpose: A foreign call returned its failure sentinel but the foreign error
 *   indicator was not set.
 * Inputs: Name of the failing operation
 * Outputs: Exception object
 * Theory of Operation: Signals a defect in the bridge itself. It is not a
 *   ForeignError, so catch sites handling Python errors never absorb it.
 */
#pragma once

#include <string>
#include <utility>

#include "pyhost/exceptions/pyhost_exception.h"

namespace pyhost {
namespace exceptions {

class InvariantViolation : public PyhostException {
 public:
  explicit InvariantViolation(std::string msg) noexcept : PyhostException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace pyhost
