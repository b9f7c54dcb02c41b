/***
 * Name: pyhost::object::ProxyObject (attributes and items)
 * Purpose: getattr/setattr and subscript get/set.
 */
#include "pyhost/object/ProxyObject.h"

namespace pyhost::object {

ProxyObject ProxyObject::getAttribute(const std::string& name) const {
  return bridge_->receive(bridge_->api().getAttrString(handle(), name.c_str()), "getattr");
}

void ProxyObject::setAttribute(const std::string& name, const ProxyObject& value) {
  bridge_->checkStatus(bridge_->api().setAttrString(handle(), name.c_str(), value.handle()), "setattr");
}

ProxyObject ProxyObject::getItem(const ProxyObject& key) const {
  return bridge_->receive(bridge_->api().getItem(handle(), key.handle()), "getitem");
}

void ProxyObject::setItem(const ProxyObject& key, const ProxyObject& value) {
  bridge_->checkStatus(bridge_->api().setItem(handle(), key.handle(), value.handle()), "setitem");
}

} // namespace pyhost::object
