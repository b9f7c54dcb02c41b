/***
 * Name: pyhost::refs::ManagedReference
 * Purpose: Own exactly one foreign reference count on one handle.
 * Inputs: Created only by ReferenceManager::borrow/receive
 * Outputs: The raw handle for passing back into the CallTable
 * Theory of Operation:
 *   Move-only. close() decrements synchronously and clears the handle, which
 *   makes it idempotent and turns the destructor into a no-op. A destructor on
 *   an unclosed reference only enqueues the raw handle on its manager's
 *   reclamation queue; it never calls into the foreign runtime, so references
 *   may die on any thread.
 */
#pragma once

#include "pyhost/ffi/CallTable.h"

namespace pyhost::refs {

class ReferenceManager;

class ManagedReference {
 public:
  ManagedReference(ManagedReference&& other) noexcept;
  ManagedReference& operator=(ManagedReference&& other) noexcept;
  ManagedReference(const ManagedReference&) = delete;
  ManagedReference& operator=(const ManagedReference&) = delete;
  ~ManagedReference();

  ffi::Handle get() const noexcept { return handle_; }
  bool closed() const noexcept { return handle_ == nullptr; }
  ReferenceManager* manager() const noexcept { return manager_; }

  // Release now. Requires the GIL. Safe to call more than once.
  void close();

 private:
  friend class ReferenceManager;
  ManagedReference(ReferenceManager* manager, ffi::Handle handle) noexcept
      : manager_(manager), handle_(handle) {}

  void deferRelease() noexcept;

  ReferenceManager* manager_{nullptr};
  ffi::Handle handle_{nullptr};
};

} // namespace pyhost::refs
