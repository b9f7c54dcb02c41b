/***
 * Name: pyhost::Bridge
 * Purpose: Acquisition helpers shared by every proxy operation.
 * Theory of Operation:
 *   A NULL `new` or `borrowed` handle is a failure sentinel: raise first, then
 *   acquire. ReferenceManager only drains its queue on a successful acquisition
 *   path, after the error indicator has been consumed.
 */
#include "pyhost/Bridge.h"

#include <utility>

#include "pyhost/exceptions/invariant_violation.h"
#include "pyhost/object/ProxyObject.h"

namespace pyhost {

Bridge::Bridge(const ffi::CallTable& api, std::string libraryName)
    : api_(api), refs_(api), errors_(*this, std::move(libraryName)) {}

object::ProxyObject Bridge::receive(ffi::Handle handle, const char* operation) {
  if (handle == nullptr) { errors_.raiseFailure(operation); }
  auto ref = refs_.receive(handle);
  if (!ref) { throw exceptions::InvariantViolation(std::string(operation) + ": reference manager dropped a live handle"); }
  return object::ProxyObject(*this, std::move(*ref));
}

object::ProxyObject Bridge::borrow(ffi::Handle handle, const char* operation) {
  if (handle == nullptr) { errors_.raiseFailure(operation); }
  auto ref = refs_.borrow(handle);
  if (!ref) { throw exceptions::InvariantViolation(std::string(operation) + ": reference manager dropped a live handle"); }
  return object::ProxyObject(*this, std::move(*ref));
}

std::optional<object::ProxyObject> Bridge::receiveOptional(ffi::Handle handle) {
  auto ref = refs_.receive(handle);
  if (!ref) { return std::nullopt; }
  return object::ProxyObject(*this, std::move(*ref));
}

void Bridge::checkStatus(int status, const char* operation) {
  if (status == -1) { errors_.raiseFailure(operation); }
}

object::ProxyObject Bridge::none() { return borrow(api_.none(), "None"); }

object::ProxyObject Bridge::importModule(const std::string& name) {
  return receive(api_.importModule(name.c_str()), "import");
}

} // namespace pyhost
