/***
 * Name: pyhost::object::ProxyObject
 * Purpose: Uniform host-side handle on a live Python object.
 * Inputs: A Bridge and the ManagedReference it produced
 * Outputs: Closed operation set: attributes, items, calls, call-or-subscript,
 *   method calls, comparison, hash, string forms, truthiness, operators,
 *   iteration and scalar conversion
 * Theory of Operation:
 *   Every operation is one or more CallTable invocations; every returned handle
 *   goes through Bridge::receive/borrow according to the entry point's
 *   convention, and every failure sentinel goes through the ErrorTranslator.
 *   Copies borrow the same handle (one more foreign count); moves transfer it.
 *   Host arguments are boxed explicitly through coerce::ToForeign at the
 *   argument boundary. Comparing with anything that is not a ProxyObject is
 *   false and never reaches Python.
 *   All members except the destructor require the GIL.
 */
#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "pyhost/Bridge.h"
#include "pyhost/ffi/CallTable.h"
#include "pyhost/object/Operators.h"
#include "pyhost/refs/ManagedReference.h"

namespace pyhost::coerce {
template <typename T, typename Enable>
struct ToForeign;
} // namespace pyhost::coerce

namespace pyhost::object {

class ForeignIterator;

class ProxyObject {
 public:
  using Args = std::vector<ProxyObject>;
  using Kwargs = std::map<std::string, ProxyObject>;

  ProxyObject(Bridge& bridge, refs::ManagedReference ref) noexcept;
  ProxyObject(const ProxyObject& other);
  ProxyObject& operator=(const ProxyObject& other);
  ProxyObject(ProxyObject&& other) noexcept = default;
  ProxyObject& operator=(ProxyObject&& other) noexcept = default;
  ~ProxyObject() = default;

  // Raw handle for passing back into the CallTable; throws UsageError once closed.
  ffi::Handle handle() const;
  Bridge& bridge() const noexcept { return *bridge_; }
  bool closed() const noexcept { return ref_.closed(); }

  // Release the foreign reference now instead of at destruction.
  void close();

  // Attributes
  ProxyObject getAttribute(const std::string& name) const;
  void setAttribute(const std::string& name, const ProxyObject& value);
  template <typename V>
  void setAttribute(const std::string& name, const V& value) { setAttribute(name, box(value)); }

  // Items
  ProxyObject getItem(const ProxyObject& key) const;
  template <typename K>
  ProxyObject getItem(const K& key) const { return getItem(box(key)); }
  template <typename K>
  ProxyObject operator[](const K& key) const { return getItem(box(key)); }
  void setItem(const ProxyObject& key, const ProxyObject& value);
  template <typename K, typename V>
  void setItem(const K& key, const V& value) { setItem(box(key), box(value)); }

  // Calls
  bool callable() const;
  ProxyObject callWith(const Args& args) const;
  ProxyObject callWith(const Args& args, const Kwargs& kwargs) const;
  template <typename... A>
  ProxyObject call(const A&... args) const { return callWith(pack(args...)); }

  // One argument on a non-callable receiver is an item lookup; anything else is a call.
  ProxyObject invoke(const Args& args) const;
  template <typename... A>
  ProxyObject operator()(const A&... args) const { return invoke(pack(args...)); }

  ProxyObject callMethodWith(const std::string& name, const Args& args) const;
  ProxyObject callMethodWith(const std::string& name, const Args& args, const Kwargs& kwargs) const;
  template <typename... A>
  ProxyObject callMethod(const std::string& name, const A&... args) const {
    return callMethodWith(name, pack(args...));
  }

  // Comparison
  bool compare(ffi::CompareOp op, const ProxyObject& other) const;
  bool operator==(const ProxyObject& other) const { return compare(ffi::CompareOp::Eq, other); }
  template <typename T, typename = std::enable_if_t<!std::is_same_v<std::decay_t<T>, ProxyObject>>>
  bool operator==(const T& /*other*/) const noexcept { return false; }
  bool operator<(const ProxyObject& other) const { return compare(ffi::CompareOp::Lt, other); }
  bool operator<=(const ProxyObject& other) const { return compare(ffi::CompareOp::Le, other); }
  bool operator>(const ProxyObject& other) const { return compare(ffi::CompareOp::Gt, other); }
  bool operator>=(const ProxyObject& other) const { return compare(ffi::CompareOp::Ge, other); }

  std::int64_t hash() const;
  std::string str() const;
  std::string repr() const;
  bool truthy() const;
  explicit operator bool() const { return truthy(); }

  // Operators
  ProxyObject apply(BinaryOp op, const ProxyObject& rhs) const;
  ProxyObject apply(UnaryOp op) const;
  // Replaces the held reference with whatever the in-place protocol returns.
  void applyInPlace(BinaryOp op, const ProxyObject& rhs);

  ProxyObject operator+(const ProxyObject& rhs) const { return apply(BinaryOp::Add, rhs); }
  ProxyObject operator-(const ProxyObject& rhs) const { return apply(BinaryOp::Subtract, rhs); }
  ProxyObject operator*(const ProxyObject& rhs) const { return apply(BinaryOp::Multiply, rhs); }
  ProxyObject operator/(const ProxyObject& rhs) const { return apply(BinaryOp::TrueDivide, rhs); }
  ProxyObject operator%(const ProxyObject& rhs) const { return apply(BinaryOp::Remainder, rhs); }
  ProxyObject operator<<(const ProxyObject& rhs) const { return apply(BinaryOp::LeftShift, rhs); }
  ProxyObject operator>>(const ProxyObject& rhs) const { return apply(BinaryOp::RightShift, rhs); }
  ProxyObject operator&(const ProxyObject& rhs) const { return apply(BinaryOp::And, rhs); }
  ProxyObject operator^(const ProxyObject& rhs) const { return apply(BinaryOp::Xor, rhs); }
  ProxyObject operator|(const ProxyObject& rhs) const { return apply(BinaryOp::Or, rhs); }
  ProxyObject matmul(const ProxyObject& rhs) const { return apply(BinaryOp::MatrixMultiply, rhs); }
  ProxyObject floorDiv(const ProxyObject& rhs) const { return apply(BinaryOp::FloorDivide, rhs); }
  ProxyObject pow(const ProxyObject& rhs) const { return apply(BinaryOp::Power, rhs); }
  ProxyObject operator-() const { return apply(UnaryOp::Negative); }
  ProxyObject operator+() const { return apply(UnaryOp::Positive); }
  ProxyObject operator~() const { return apply(UnaryOp::Invert); }

  ProxyObject& operator+=(const ProxyObject& rhs) { applyInPlace(BinaryOp::Add, rhs); return *this; }
  ProxyObject& operator-=(const ProxyObject& rhs) { applyInPlace(BinaryOp::Subtract, rhs); return *this; }
  ProxyObject& operator*=(const ProxyObject& rhs) { applyInPlace(BinaryOp::Multiply, rhs); return *this; }
  ProxyObject& operator/=(const ProxyObject& rhs) { applyInPlace(BinaryOp::TrueDivide, rhs); return *this; }
  ProxyObject& operator%=(const ProxyObject& rhs) { applyInPlace(BinaryOp::Remainder, rhs); return *this; }
  ProxyObject& operator<<=(const ProxyObject& rhs) { applyInPlace(BinaryOp::LeftShift, rhs); return *this; }
  ProxyObject& operator>>=(const ProxyObject& rhs) { applyInPlace(BinaryOp::RightShift, rhs); return *this; }
  ProxyObject& operator&=(const ProxyObject& rhs) { applyInPlace(BinaryOp::And, rhs); return *this; }
  ProxyObject& operator^=(const ProxyObject& rhs) { applyInPlace(BinaryOp::Xor, rhs); return *this; }
  ProxyObject& operator|=(const ProxyObject& rhs) { applyInPlace(BinaryOp::Or, rhs); return *this; }
  void matmulInPlace(const ProxyObject& rhs) { applyInPlace(BinaryOp::MatrixMultiply, rhs); }
  void floorDivInPlace(const ProxyObject& rhs) { applyInPlace(BinaryOp::FloorDivide, rhs); }
  void powInPlace(const ProxyObject& rhs) { applyInPlace(BinaryOp::Power, rhs); }

  // Scalar conversion
  long long toLong() const;
  int toInt() const { return static_cast<int>(toLong()); }
  short toShort() const { return static_cast<short>(toLong()); }
  signed char toByte() const { return static_cast<signed char>(toLong()); }
  double toDouble() const;
  float toFloat() const { return static_cast<float>(toDouble()); }
  bool toBool() const { return truthy(); }
  std::string toString() const { return str(); }

  // Obtains the Python iterator now; elements are fetched one per step.
  ForeignIterator iterate() const;

 private:
  template <typename T>
  ProxyObject box(const T& value) const {
    return coerce::ToForeign<std::decay_t<T>, void>::convert(*bridge_, value);
  }

  template <typename... A>
  Args pack(const A&... args) const {
    Args packed;
    packed.reserve(sizeof...(A));
    (packed.push_back(box(args)), ...);
    return packed;
  }

  Bridge* bridge_;
  refs::ManagedReference ref_;
};

std::ostream& operator<<(std::ostream& out, const ProxyObject& obj);

// Hash functor delegating to Python's hash(); pairs with ProxyObject::operator==.
struct ProxyHash {
  std::size_t operator()(const ProxyObject& obj) const { return static_cast<std::size_t>(obj.hash()); }
};

} // namespace pyhost::object

template <>
struct std::hash<pyhost::object::ProxyObject> {
  std::size_t operator()(const pyhost::object::ProxyObject& obj) const { return static_cast<std::size_t>(obj.hash()); }
};
