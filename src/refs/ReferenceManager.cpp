/***
 * Name: pyhost::refs::ReferenceManager
 * Purpose: Borrow/receive acquisition, synchronous release and queue reclamation.
 * Theory of Operation:
 *   The drain at the top of borrow()/receive() is the only place deferred
 *   decrements are applied outside an explicit reclaim(); this bounds the
 *   unreclaimed foreign memory by the references dropped between two
 *   acquisitions.
 */
#include "pyhost/refs/ReferenceManager.h"
#include "pyhost/support/debug_log.h"

namespace pyhost::refs {

std::optional<ManagedReference> ReferenceManager::borrow(ffi::Handle handle) {
  reclaim();
  if (handle == nullptr) { return std::nullopt; }
  api_.incRef(handle);
  borrowed_.fetch_add(1, std::memory_order_relaxed);
  return ManagedReference(this, handle);
}

std::optional<ManagedReference> ReferenceManager::receive(ffi::Handle handle) {
  reclaim();
  if (handle == nullptr) { return std::nullopt; }
  received_.fetch_add(1, std::memory_order_relaxed);
  return ManagedReference(this, handle);
}

std::size_t ReferenceManager::reclaim() {
  const std::size_t count = queue_.drain([this](ffi::Handle handle) { api_.decRef(handle); });
  if (count > 0) {
    reclaimed_.fetch_add(count, std::memory_order_relaxed);
    PYHOST_DEBUG_LOG("refs", "reclaimed %zu deferred reference(s)", count);
  }
  return count;
}

void ReferenceManager::enqueue(ffi::Handle handle) noexcept {
  queue_.push(handle);
  enqueued_.fetch_add(1, std::memory_order_relaxed);
}

void ReferenceManager::release(ffi::Handle handle) {
  api_.decRef(handle);
  closed_.fetch_add(1, std::memory_order_relaxed);
}

BridgeStats ReferenceManager::stats() const noexcept {
  BridgeStats st;
  st.numBorrowed = borrowed_.load(std::memory_order_relaxed);
  st.numReceived = received_.load(std::memory_order_relaxed);
  st.numClosed = closed_.load(std::memory_order_relaxed);
  st.numEnqueued = enqueued_.load(std::memory_order_relaxed);
  st.numReclaimed = reclaimed_.load(std::memory_order_relaxed);
  st.numTranslatedErrors = translatedErrors_.load(std::memory_order_relaxed);
  st.peakPending = queue_.peak();
  return st;
}

} // namespace pyhost::refs
