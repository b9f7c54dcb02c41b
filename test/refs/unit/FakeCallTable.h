// Utility: counting reference-count entry points over fake handles
#pragma once

#include <cstdint>
#include <map>
#include <mutex>

#include "pyhost/ffi/CallTable.h"

namespace testutil {

struct RefCounts {
  std::mutex mu;
  std::map<pyhost::ffi::Handle, int> increments;
  std::map<pyhost::ffi::Handle, int> decrements;

  void reset() {
    std::lock_guard<std::mutex> lock(mu);
    increments.clear();
    decrements.clear();
  }
  int inc(pyhost::ffi::Handle h) {
    std::lock_guard<std::mutex> lock(mu);
    return increments[h];
  }
  int dec(pyhost::ffi::Handle h) {
    std::lock_guard<std::mutex> lock(mu);
    return decrements[h];
  }
  int totalDec() {
    std::lock_guard<std::mutex> lock(mu);
    int n = 0;
    for (const auto& [h, c] : decrements) { n += c; }
    return n;
  }
};

inline RefCounts& counts() {
  static RefCounts c;
  return c;
}

inline pyhost::ffi::CallTable countingTable() {
  pyhost::ffi::CallTable table;
  table.incRef = [](pyhost::ffi::Handle h) {
    std::lock_guard<std::mutex> lock(counts().mu);
    ++counts().increments[h];
  };
  table.decRef = [](pyhost::ffi::Handle h) {
    std::lock_guard<std::mutex> lock(counts().mu);
    ++counts().decrements[h];
  };
  return table;
}

// Distinct, never dereferenced handle values.
inline pyhost::ffi::Handle fakeHandle(std::uintptr_t n) { return reinterpret_cast<pyhost::ffi::Handle>(n * 16U); }

} // namespace testutil
