/***
 * Name: pyhost::object::ProxyObject (comparison and protocol queries)
 * Purpose: Rich comparison, hash, truthiness.
 * Theory of Operation:
 *   hash() may legitimately be -1 from the host's point of view, so -1 is only
 *   an error when the indicator is set; with nothing set it is returned as is.
 */
#include "pyhost/object/ProxyObject.h"

namespace pyhost::object {

bool ProxyObject::compare(ffi::CompareOp op, const ProxyObject& other) const {
  const int result = bridge_->api().richCompareBool(handle(), other.handle(), static_cast<int>(op));
  bridge_->checkStatus(result, "compare");
  return result == 1;
}

std::int64_t ProxyObject::hash() const {
  const Py_hash_t value = bridge_->api().hash(handle());
  if (value == -1) { bridge_->errors().raiseIfSet(); }
  return static_cast<std::int64_t>(value);
}

bool ProxyObject::truthy() const {
  const int result = bridge_->api().isTrue(handle());
  bridge_->checkStatus(result, "truth test");
  return result == 1;
}

} // namespace pyhost::object
