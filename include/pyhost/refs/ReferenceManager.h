/***
 * Name: pyhost::refs::ReferenceManager
 * Purpose: Turn raw foreign handles into ManagedReferences under the calling
 *   convention of the entry point that produced them.
 * Inputs:
 *   - borrow(h): h is lent; the manager increments before wrapping
 *   - receive(h): h was transferred to the caller; wrapped as is
 * Outputs: std::optional<ManagedReference>; empty for a NULL handle ("no object")
 * Theory of Operation:
 *   Both acquisition modes drain the reclamation queue first, so references
 *   dropped since the previous acquisition are decremented before any new
 *   foreign work starts. All members except enqueue()/pending()/stats() require
 *   the GIL.
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>

#include "pyhost/ffi/CallTable.h"
#include "pyhost/refs/BridgeStats.h"
#include "pyhost/refs/ManagedReference.h"
#include "pyhost/refs/ReclamationQueue.h"

namespace pyhost::refs {

class ReferenceManager {
 public:
  explicit ReferenceManager(const ffi::CallTable& api) noexcept : api_(api) {}
  ReferenceManager(const ReferenceManager&) = delete;
  ReferenceManager& operator=(const ReferenceManager&) = delete;

  std::optional<ManagedReference> borrow(ffi::Handle handle);
  std::optional<ManagedReference> receive(ffi::Handle handle);

  // Apply every queued decrement; returns how many were applied.
  std::size_t reclaim();

  // Deferred release entry used by ManagedReference's destructor.
  void enqueue(ffi::Handle handle) noexcept;

  // Synchronous release entry used by ManagedReference::close().
  void release(ffi::Handle handle);

  std::size_t pending() const noexcept { return queue_.size(); }
  const ffi::CallTable& api() const noexcept { return api_; }

  void noteTranslatedError() noexcept { translatedErrors_.fetch_add(1, std::memory_order_relaxed); }
  BridgeStats stats() const noexcept;

 private:
  const ffi::CallTable& api_;
  ReclamationQueue queue_;
  std::atomic<uint64_t> borrowed_{0};
  std::atomic<uint64_t> received_{0};
  std::atomic<uint64_t> closed_{0};
  std::atomic<uint64_t> enqueued_{0};
  std::atomic<uint64_t> reclaimed_{0};
  std::atomic<uint64_t> translatedErrors_{0};
};

} // namespace pyhost::refs
