/***
 * Name: pyhost::coerce container import
 * Purpose: Read any iterable or mapping back into host containers of proxies.
 */
#include "pyhost/coerce/Containers.h"

#include <utility>

#include "pyhost/object/ForeignIterator.h"

namespace pyhost::coerce {

std::vector<object::ProxyObject> toSeq(const object::ProxyObject& iterable) {
  std::vector<object::ProxyObject> items;
  auto it = iterable.iterate();
  while (auto item = it.next()) { items.push_back(std::move(*item)); }
  return items;
}

std::unordered_set<object::ProxyObject> toSet(const object::ProxyObject& iterable) {
  std::unordered_set<object::ProxyObject> items;
  auto it = iterable.iterate();
  while (auto item = it.next()) { items.insert(std::move(*item)); }
  return items;
}

std::unordered_map<object::ProxyObject, object::ProxyObject> toMap(const object::ProxyObject& mapping) {
  Bridge& bridge = mapping.bridge();
  const auto items = bridge.receive(bridge.api().mappingItems(mapping.handle()), "items");
  std::unordered_map<object::ProxyObject, object::ProxyObject> entries;
  auto it = items.iterate();
  while (auto pair = it.next()) {
    auto key = bridge.receive(bridge.api().sequenceGetItem(pair->handle(), 0), "items key");
    auto value = bridge.receive(bridge.api().sequenceGetItem(pair->handle(), 1), "items value");
    entries.insert_or_assign(std::move(key), std::move(value));
  }
  return entries;
}

} // namespace pyhost::coerce
