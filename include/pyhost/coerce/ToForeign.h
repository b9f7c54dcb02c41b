/***
 * Name: pyhost::coerce::ToForeign<T>
 * Purpose: Explicit host-to-Python conversion, one specialization per
 *   supported host type.
 * Inputs: A Bridge and a host value
 * Outputs: A ProxyObject owning a new Python object (or a copy of a proxy)
 * Theory of Operation:
 *   ProxyObject arguments and Bridge::box() resolve through this trait, so a
 *   type with no specialization is a compile error rather than a silent
 *   conversion. Integers exclude bool and the character types, which have
 *   their own mappings; a char becomes the one-character str for its byte
 *   value (U+0000..U+00FF). Containers box each element through the same trait and
 *   hand the proxies to the builders in Containers.h.
 */
#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "pyhost/Bridge.h"
#include "pyhost/coerce/Containers.h"
#include "pyhost/coerce/Range.h"
#include "pyhost/object/ProxyObject.h"

namespace pyhost::coerce {

namespace detail {

template <typename T>
inline constexpr bool isCharLike =
    std::is_same_v<T, bool> || std::is_same_v<T, char> || std::is_same_v<T, wchar_t> ||
    std::is_same_v<T, char8_t> || std::is_same_v<T, char16_t> || std::is_same_v<T, char32_t>;

template <typename T>
inline constexpr bool isSignedInt = std::is_integral_v<T> && std::is_signed_v<T> && !isCharLike<T>;

template <typename T>
inline constexpr bool isUnsignedInt = std::is_integral_v<T> && std::is_unsigned_v<T> && !isCharLike<T>;

object::ProxyObject fromUtf8(Bridge& bridge, std::string_view text);

template <typename Items>
std::vector<object::ProxyObject> boxEach(Bridge& bridge, const Items& items);

} // namespace detail

template <typename T, typename Enable = void>
struct ToForeign;

template <>
struct ToForeign<object::ProxyObject> {
  static object::ProxyObject convert(Bridge& /*bridge*/, const object::ProxyObject& value) { return value; }
};

template <typename T>
struct ToForeign<T, std::enable_if_t<detail::isSignedInt<T>>> {
  static object::ProxyObject convert(Bridge& bridge, T value) {
    return bridge.receive(bridge.api().longFromLongLong(static_cast<long long>(value)), "int");
  }
};

template <typename T>
struct ToForeign<T, std::enable_if_t<detail::isUnsignedInt<T>>> {
  static object::ProxyObject convert(Bridge& bridge, T value) {
    return bridge.receive(bridge.api().longFromUnsignedLongLong(static_cast<unsigned long long>(value)), "int");
  }
};

template <>
struct ToForeign<bool> {
  static object::ProxyObject convert(Bridge& bridge, bool value) {
    return bridge.receive(bridge.api().boolFromLong(value ? 1 : 0), "bool");
  }
};

template <typename T>
struct ToForeign<T, std::enable_if_t<std::is_floating_point_v<T>>> {
  static object::ProxyObject convert(Bridge& bridge, T value) {
    return bridge.receive(bridge.api().floatFromDouble(static_cast<double>(value)), "float");
  }
};

template <>
struct ToForeign<char> {
  static object::ProxyObject convert(Bridge& bridge, char value) {
    // A char is one Latin-1 byte, not a UTF-8 fragment.
    return detail::fromUtf8(bridge, encodeCodePoint(static_cast<unsigned char>(value)));
  }
};

template <>
struct ToForeign<char32_t> {
  static object::ProxyObject convert(Bridge& bridge, char32_t value) {
    return detail::fromUtf8(bridge, encodeCodePoint(value));
  }
};

template <>
struct ToForeign<std::string> {
  static object::ProxyObject convert(Bridge& bridge, const std::string& value) { return detail::fromUtf8(bridge, value); }
};

template <>
struct ToForeign<std::string_view> {
  static object::ProxyObject convert(Bridge& bridge, std::string_view value) { return detail::fromUtf8(bridge, value); }
};

template <>
struct ToForeign<const char*> {
  static object::ProxyObject convert(Bridge& bridge, const char* value) {
    return detail::fromUtf8(bridge, value == nullptr ? std::string_view{} : std::string_view{value});
  }
};

template <>
struct ToForeign<char*> : ToForeign<const char*> {};

template <>
struct ToForeign<std::nullopt_t> {
  static object::ProxyObject convert(Bridge& bridge, std::nullopt_t /*none*/) { return bridge.none(); }
};

template <>
struct ToForeign<Range> {
  static object::ProxyObject convert(Bridge& bridge, const Range& value) { return toSlice(bridge, value); }
};

template <typename T, typename A>
struct ToForeign<std::vector<T, A>> {
  static object::ProxyObject convert(Bridge& bridge, const std::vector<T, A>& items) {
    if constexpr (std::is_same_v<T, object::ProxyObject> && std::is_same_v<A, std::allocator<T>>) {
      return toList(bridge, items);
    } else {
      return toList(bridge, detail::boxEach(bridge, items));
    }
  }
};

template <typename T, typename C, typename A>
struct ToForeign<std::set<T, C, A>> {
  static object::ProxyObject convert(Bridge& bridge, const std::set<T, C, A>& items) {
    return toSet(bridge, detail::boxEach(bridge, items));
  }
};

template <typename T, typename H, typename E, typename A>
struct ToForeign<std::unordered_set<T, H, E, A>> {
  static object::ProxyObject convert(Bridge& bridge, const std::unordered_set<T, H, E, A>& items) {
    return toSet(bridge, detail::boxEach(bridge, items));
  }
};

namespace detail {

template <typename Map>
object::ProxyObject boxMap(Bridge& bridge, const Map& entries) {
  std::vector<std::pair<object::ProxyObject, object::ProxyObject>> boxed;
  boxed.reserve(entries.size());
  for (const auto& [key, value] : entries) {
    boxed.emplace_back(ToForeign<std::decay_t<decltype(key)>>::convert(bridge, key),
                       ToForeign<std::decay_t<decltype(value)>>::convert(bridge, value));
  }
  return toDict(bridge, boxed);
}

template <typename Items>
std::vector<object::ProxyObject> boxEach(Bridge& bridge, const Items& items) {
  std::vector<object::ProxyObject> boxed;
  boxed.reserve(items.size());
  for (const auto& item : items) {
    boxed.push_back(ToForeign<std::decay_t<decltype(item)>>::convert(bridge, item));
  }
  return boxed;
}

} // namespace detail

template <typename K, typename V, typename C, typename A>
struct ToForeign<std::map<K, V, C, A>> {
  static object::ProxyObject convert(Bridge& bridge, const std::map<K, V, C, A>& entries) {
    return detail::boxMap(bridge, entries);
  }
};

template <typename K, typename V, typename H, typename E, typename A>
struct ToForeign<std::unordered_map<K, V, H, E, A>> {
  static object::ProxyObject convert(Bridge& bridge, const std::unordered_map<K, V, H, E, A>& entries) {
    return detail::boxMap(bridge, entries);
  }
};

} // namespace pyhost::coerce

namespace pyhost {

template <typename T>
object::ProxyObject Bridge::box(const T& value) {
  return coerce::ToForeign<std::decay_t<T>>::convert(*this, value);
}

} // namespace pyhost
