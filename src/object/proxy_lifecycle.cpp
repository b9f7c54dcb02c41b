/***
 * Name: pyhost::object::ProxyObject (lifecycle)
 * Purpose: Construction, copying, closing and raw handle access.
 * Theory of Operation: A copy borrows the source handle through the reference
 *   manager, so it owns its own count and may be closed independently.
 */
#include "pyhost/object/ProxyObject.h"

#include <utility>

#include "pyhost/exceptions/usage_error.h"

namespace pyhost::object {

namespace {

refs::ManagedReference borrowFrom(Bridge& bridge, const refs::ManagedReference& source) {
  if (source.closed()) { throw exceptions::UsageError("cannot copy a closed Python object proxy"); }
  auto ref = bridge.refs().borrow(source.get());
  if (!ref) { throw exceptions::UsageError("cannot copy a closed Python object proxy"); }
  return std::move(*ref);
}

} // namespace

ProxyObject::ProxyObject(Bridge& bridge, refs::ManagedReference ref) noexcept
    : bridge_(&bridge), ref_(std::move(ref)) {}

ProxyObject::ProxyObject(const ProxyObject& other)
    : bridge_(other.bridge_), ref_(borrowFrom(*other.bridge_, other.ref_)) {}

ProxyObject& ProxyObject::operator=(const ProxyObject& other) {
  if (this != &other) {
    refs::ManagedReference copy = borrowFrom(*other.bridge_, other.ref_);
    bridge_ = other.bridge_;
    ref_ = std::move(copy);
  }
  return *this;
}

ffi::Handle ProxyObject::handle() const {
  if (ref_.closed()) { throw exceptions::UsageError("operation on a closed Python object proxy"); }
  return ref_.get();
}

void ProxyObject::close() { ref_.close(); }

std::ostream& operator<<(std::ostream& out, const ProxyObject& obj) { return out << obj.str(); }

} // namespace pyhost::object
