/***
 * Name: pyhost::refs::ReclamationQueue
 * Purpose: Hold foreign handles whose decrement is owed but not yet applied.
 * Inputs:
 *   - push(): any thread, with or without the interpreter lock
 *   - drain(): the thread about to make a foreign call (holds the GIL)
 * Outputs: Handles handed to the drain callback exactly once each
 * Theory of Operation:
 *   Producers append under a short mutex. drain() swaps the whole buffer out
 *   under the same mutex and runs the callback outside it, so a drain is bounded
 *   by what was queued at swap time and never blocks producers while it calls
 *   into the foreign runtime.
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>

#include "pyhost/ffi/CallTable.h"

namespace pyhost::refs {

class ReclamationQueue {
 public:
  void push(ffi::Handle handle) noexcept;

  // Returns the number of handles passed to `release`.
  std::size_t drain(const std::function<void(ffi::Handle)>& release);

  std::size_t size() const noexcept { return size_.load(std::memory_order_relaxed); }
  uint64_t peak() const noexcept { return peak_.load(std::memory_order_relaxed); }

 private:
  mutable std::mutex mu_;
  std::vector<ffi::Handle> pending_;
  std::atomic<std::size_t> size_{0};
  std::atomic<uint64_t> peak_{0};
};

} // namespace pyhost::refs
