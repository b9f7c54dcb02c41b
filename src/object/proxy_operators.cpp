/***
 * Name: pyhost::object::ProxyObject (operators)
 * Purpose: Binary, unary and in-place operator application.
 * Theory of Operation:
 *   applyInPlace receives the in-place result (which may be the same object
 *   for mutable types, with its own count) and then closes the reference it
 *   replaces, so the old count is released before the call returns.
 */
#include "pyhost/object/ProxyObject.h"

#include <string>
#include <utility>

namespace pyhost::object {

ProxyObject ProxyObject::apply(BinaryOp op, const ProxyObject& rhs) const {
  return bridge_->receive(detail::applyBinary(bridge_->api(), op, handle(), rhs.handle()), operatorName(op));
}

ProxyObject ProxyObject::apply(UnaryOp op) const {
  return bridge_->receive(detail::applyUnary(bridge_->api(), op, handle()), operatorName(op));
}

void ProxyObject::applyInPlace(BinaryOp op, const ProxyObject& rhs) {
  const std::string name = std::string(operatorName(op)) + "=";
  ProxyObject result = bridge_->receive(detail::applyInPlace(bridge_->api(), op, handle(), rhs.handle()), name.c_str());
  refs::ManagedReference previous = std::exchange(ref_, std::move(result.ref_));
  previous.close();
}

} // namespace pyhost::object
