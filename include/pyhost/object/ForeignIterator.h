/***
 * Name: pyhost::object::ForeignIterator
 * Purpose: Lazy host-side view of a Python iterator.
 * Inputs: A ProxyObject wrapping the result of iter(x)
 * Outputs:
 *   - next(): the next element, or empty at exhaustion
 *   - begin()/end(): single-pass input range for range-for loops
 * Theory of Operation:
 *   Each step calls the iterator's next entry point once. A NULL result with no
 *   error set is exhaustion; a NULL result with an error set raises the
 *   translated error. Once exhausted, next() keeps returning empty without
 *   calling into Python again.
 */
#pragma once

#include <cstddef>
#include <iterator>
#include <optional>
#include <utility>

#include "pyhost/object/ProxyObject.h"

namespace pyhost::object {

class ForeignIterator {
 public:
  explicit ForeignIterator(ProxyObject iterator) noexcept : iterator_(std::move(iterator)) {}

  std::optional<ProxyObject> next();

  bool exhausted() const noexcept { return exhausted_; }

  class Cursor {
   public:
    using iterator_category = std::input_iterator_tag;
    using value_type = ProxyObject;
    using difference_type = std::ptrdiff_t;
    using pointer = const ProxyObject*;
    using reference = const ProxyObject&;

    Cursor() noexcept = default;
    explicit Cursor(ForeignIterator* owner);

    reference operator*() const;
    pointer operator->() const { return &**this; }
    Cursor& operator++();
    void operator++(int) { ++*this; }

    bool operator==(const Cursor& other) const noexcept { return atEnd() == other.atEnd(); }
    bool operator!=(const Cursor& other) const noexcept { return !(*this == other); }

   private:
    bool atEnd() const noexcept { return !current_.has_value(); }

    ForeignIterator* owner_{nullptr};
    std::optional<ProxyObject> current_;
  };

  Cursor begin() { return Cursor(this); }
  Cursor end() noexcept { return Cursor(); }

 private:
  ProxyObject iterator_;
  bool exhausted_{false};
};

} // namespace pyhost::object
