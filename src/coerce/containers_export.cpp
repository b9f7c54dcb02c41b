/***
 * Name: pyhost::coerce container export
 * Purpose: Build list, tuple, set, dict and slice objects from proxies.
 * Theory of Operation:
 *   PyList_SetItem/PyTuple_SetItem steal the item reference (and release it
 *   themselves on failure), so each element is incremented immediately before
 *   it is stored. The element proxies keep their own counts and release them as
 *   usual.
 */
#include "pyhost/coerce/Containers.h"

#include <limits>
#include <utility>

#include "pyhost/coerce/ToForeign.h"

namespace pyhost::coerce {

namespace {

using Setter = int (*)(ffi::Handle, Py_ssize_t, ffi::Handle);

object::ProxyObject fillIndexed(Bridge& bridge, object::ProxyObject container, Setter setItem,
                                const std::vector<object::ProxyObject>& items, const char* operation) {
  const auto& api = bridge.api();
  for (std::size_t i = 0; i < items.size(); ++i) {
    const ffi::Handle item = items[i].handle();
    api.incRef(item);
    bridge.checkStatus(setItem(container.handle(), static_cast<Py_ssize_t>(i), item), operation);
  }
  return container;
}

} // namespace

object::ProxyObject toList(Bridge& bridge, const std::vector<object::ProxyObject>& items) {
  const auto& api = bridge.api();
  auto list = bridge.receive(api.listNew(static_cast<Py_ssize_t>(items.size())), "list");
  return fillIndexed(bridge, std::move(list), api.listSetItem, items, "list item");
}

object::ProxyObject toTuple(Bridge& bridge, const std::vector<object::ProxyObject>& items) {
  const auto& api = bridge.api();
  auto tuple = bridge.receive(api.tupleNew(static_cast<Py_ssize_t>(items.size())), "tuple");
  return fillIndexed(bridge, std::move(tuple), api.tupleSetItem, items, "tuple item");
}

object::ProxyObject toSet(Bridge& bridge, const std::vector<object::ProxyObject>& items) {
  const auto& api = bridge.api();
  auto set = bridge.receive(api.setNew(nullptr), "set");
  for (const auto& item : items) { bridge.checkStatus(api.setAdd(set.handle(), item.handle()), "set add"); }
  return set;
}

object::ProxyObject toDict(Bridge& bridge,
                           const std::vector<std::pair<object::ProxyObject, object::ProxyObject>>& entries) {
  const auto& api = bridge.api();
  auto dict = bridge.receive(api.dictNew(), "dict");
  for (const auto& [key, value] : entries) {
    bridge.checkStatus(api.dictSetItem(dict.handle(), key.handle(), value.handle()), "dict item");
  }
  return dict;
}

object::ProxyObject toDict(Bridge& bridge, const std::map<std::string, object::ProxyObject>& entries) {
  const auto& api = bridge.api();
  auto dict = bridge.receive(api.dictNew(), "dict");
  for (const auto& [name, value] : entries) {
    const auto key = detail::fromUtf8(bridge, name);
    bridge.checkStatus(api.dictSetItem(dict.handle(), key.handle(), value.handle()), "dict item");
  }
  return dict;
}

object::ProxyObject toSlice(Bridge& bridge, const Range& range) {
  const auto& api = bridge.api();
  const auto start = bridge.receive(api.longFromLongLong(range.start), "slice start");
  const auto step = bridge.receive(api.longFromLongLong(range.step), "slice step");
  if (range.inclusive && (range.end == -1 || range.end == std::numeric_limits<long long>::max())) {
    return bridge.receive(api.sliceNew(start.handle(), nullptr, step.handle()), "slice");
  }
  const auto stop = bridge.receive(api.longFromLongLong(range.inclusive ? range.end + 1 : range.end), "slice stop");
  return bridge.receive(api.sliceNew(start.handle(), stop.handle(), step.handle()), "slice");
}

} // namespace pyhost::coerce
