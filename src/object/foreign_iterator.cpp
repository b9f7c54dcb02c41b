/***
 * Name: pyhost::object::ForeignIterator
 * Purpose: Step a Python iterator from the host.
 */
#include "pyhost/object/ForeignIterator.h"

#include "pyhost/exceptions/usage_error.h"

namespace pyhost::object {

ForeignIterator ProxyObject::iterate() const {
  return ForeignIterator(bridge_->receive(bridge_->api().getIter(handle()), "iter"));
}

std::optional<ProxyObject> ForeignIterator::next() {
  if (exhausted_) { return std::nullopt; }
  Bridge& bridge = iterator_.bridge();
  const ffi::Handle item = bridge.api().iterNext(iterator_.handle());
  if (item == nullptr) {
    bridge.errors().raiseIfSet();
    exhausted_ = true;
    return std::nullopt;
  }
  return bridge.receiveOptional(item);
}

ForeignIterator::Cursor::Cursor(ForeignIterator* owner) : owner_(owner), current_(owner->next()) {}

const ProxyObject& ForeignIterator::Cursor::operator*() const {
  if (!current_) { throw exceptions::UsageError("dereferencing an exhausted Python iterator"); }
  return *current_;
}

ForeignIterator::Cursor& ForeignIterator::Cursor::operator++() {
  if (owner_ != nullptr && current_) { current_ = owner_->next(); }
  return *this;
}

} // namespace pyhost::object
