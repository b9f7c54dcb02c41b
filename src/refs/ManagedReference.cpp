/***
 * Name: pyhost::refs::ManagedReference
 * Purpose: Single-owner foreign reference with synchronous close and deferred drop.
 */
#include "pyhost/refs/ManagedReference.h"
#include "pyhost/refs/ReferenceManager.h"

#include <utility>

namespace pyhost::refs {

ManagedReference::ManagedReference(ManagedReference&& other) noexcept
    : manager_(other.manager_), handle_(std::exchange(other.handle_, nullptr)) {}

ManagedReference& ManagedReference::operator=(ManagedReference&& other) noexcept {
  if (this != &other) {
    deferRelease();
    manager_ = other.manager_;
    handle_ = std::exchange(other.handle_, nullptr);
  }
  return *this;
}

ManagedReference::~ManagedReference() { deferRelease(); }

void ManagedReference::close() {
  ffi::Handle handle = std::exchange(handle_, nullptr);
  if (handle == nullptr) { return; }
  manager_->release(handle);
}

void ManagedReference::deferRelease() noexcept {
  ffi::Handle handle = std::exchange(handle_, nullptr);
  if (handle == nullptr || manager_ == nullptr) { return; }
  manager_->enqueue(handle);
}

} // namespace pyhost::refs
