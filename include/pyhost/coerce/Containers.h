/***
 * Name: pyhost::coerce containers
 * Purpose: Build Python containers from proxies and read them back.
 * Inputs: Proxies already boxed (see ToForeign.h for host element types)
 * Outputs:
 *   - toList/toTuple/toSet/toDict/toSlice: new Python objects
 *   - toSeq/toSet(proxy)/toMap: host containers of proxies
 * Theory of Operation:
 *   Lists and tuples are created at their final size and filled by index. The
 *   index setters steal a reference, so each element is incremented before it
 *   is stored; the element proxies keep their own counts. The set and dict
 *   setters do not steal. Reading back only iterates: toMap walks the mapping's
 *   items and unpacks each pair by index 0 and 1.
 */
#pragma once

#include <map>
#include <string>
#include <utility>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "pyhost/Bridge.h"
#include "pyhost/coerce/Range.h"
#include "pyhost/object/ProxyObject.h"

namespace pyhost::coerce {

object::ProxyObject toList(Bridge& bridge, const std::vector<object::ProxyObject>& items);
object::ProxyObject toTuple(Bridge& bridge, const std::vector<object::ProxyObject>& items);
object::ProxyObject toSet(Bridge& bridge, const std::vector<object::ProxyObject>& items);
object::ProxyObject toDict(Bridge& bridge,
                           const std::vector<std::pair<object::ProxyObject, object::ProxyObject>>& entries);
object::ProxyObject toDict(Bridge& bridge, const std::map<std::string, object::ProxyObject>& entries);
object::ProxyObject toSlice(Bridge& bridge, const Range& range);

std::vector<object::ProxyObject> toSeq(const object::ProxyObject& iterable);
std::unordered_set<object::ProxyObject> toSet(const object::ProxyObject& iterable);
std::unordered_map<object::ProxyObject, object::ProxyObject> toMap(const object::ProxyObject& mapping);

// UTF-8 encoding of one code point; UsageError for surrogates and values past U+10FFFF.
std::string encodeCodePoint(char32_t codePoint);

} // namespace pyhost::coerce
