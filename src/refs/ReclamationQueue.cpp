/***
 * Name: pyhost::refs::ReclamationQueue
 * Purpose: Multi-producer queue of owed decrements, drained by swap.
 */
#include "pyhost/refs/ReclamationQueue.h"

#include <utility>

namespace pyhost::refs {

void ReclamationQueue::push(ffi::Handle handle) noexcept {
  if (handle == nullptr) { return; }
  const std::lock_guard<std::mutex> lockGuard(mu_);
  pending_.push_back(handle);
  const auto depth = static_cast<uint64_t>(pending_.size());
  size_.store(pending_.size(), std::memory_order_relaxed);
  uint64_t seen = peak_.load(std::memory_order_relaxed);
  while (depth > seen && !peak_.compare_exchange_weak(seen, depth, std::memory_order_relaxed)) {}
}

std::size_t ReclamationQueue::drain(const std::function<void(ffi::Handle)>& release) {
  std::vector<ffi::Handle> batch;
  {
    const std::lock_guard<std::mutex> lockGuard(mu_);
    if (pending_.empty()) { return 0; }
    batch.swap(pending_);
    size_.store(0, std::memory_order_relaxed);
  }
  for (ffi::Handle handle : batch) { release(handle); }
  return batch.size();
}

} // namespace pyhost::refs
