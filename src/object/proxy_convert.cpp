/***
 * Name: pyhost::object::ProxyObject (string forms and scalar conversion)
 * Purpose: str()/repr() as UTF-8 host strings; int and float extraction.
 * Theory of Operation: Both numeric accessors return -1 for failure and for a
 *   real -1, so they consult the error indicator before deciding.
 */
#include "pyhost/object/ProxyObject.h"

namespace pyhost::object {

namespace {

std::string utf8Of(Bridge& bridge, const ProxyObject& text, const char* operation) {
  Py_ssize_t size = 0;
  const char* data = bridge.api().unicodeAsUTF8AndSize(text.handle(), &size);
  if (data == nullptr) { bridge.errors().raiseFailure(operation); }
  return std::string(data, static_cast<std::size_t>(size));
}

} // namespace

std::string ProxyObject::str() const {
  const ProxyObject text = bridge_->receive(bridge_->api().str(handle()), "str");
  return utf8Of(*bridge_, text, "str");
}

std::string ProxyObject::repr() const {
  const ProxyObject text = bridge_->receive(bridge_->api().repr(handle()), "repr");
  return utf8Of(*bridge_, text, "repr");
}

long long ProxyObject::toLong() const {
  const long long value = bridge_->api().longAsLongLong(handle());
  if (value == -1) { bridge_->errors().raiseIfSet(); }
  return value;
}

double ProxyObject::toDouble() const {
  const double value = bridge_->api().floatAsDouble(handle());
  if (value == -1.0) { bridge_->errors().raiseIfSet(); }
  return value;
}

} // namespace pyhost::object
