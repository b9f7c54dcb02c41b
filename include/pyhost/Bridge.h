/***
 * Name: pyhost::Bridge
 * Purpose: The context every proxy captures: call table, reference manager and
 *   error translator for one embedded interpreter.
 * Inputs:
 *   - api: entry points into the foreign runtime
 *   - libraryName: marker used on foreign stack frames ("python3.11")
 * Outputs: Wrapping helpers that pair an entry point's return with the right
 *   acquisition mode and failure check.
 * Theory of Operation:
 *   Created once per interpreter (interp::Interpreter owns it) and never moved;
 *   proxies keep a pointer to it. receive()/borrow() treat a NULL handle as a
 *   failure sentinel and route it through the translator before any queued
 *   reclamation runs, so a pending Python error is never disturbed by a
 *   deferred decrement.
 */
#pragma once

#include <optional>
#include <string>

#include "pyhost/errors/ErrorTranslator.h"
#include "pyhost/ffi/CallTable.h"
#include "pyhost/refs/ReferenceManager.h"

namespace pyhost {

namespace object {
class ProxyObject;
}

class Bridge {
 public:
  explicit Bridge(const ffi::CallTable& api, std::string libraryName = ffi::linkedLibraryName());
  Bridge(const Bridge&) = delete;
  Bridge& operator=(const Bridge&) = delete;
  Bridge(Bridge&&) = delete;
  Bridge& operator=(Bridge&&) = delete;

  const ffi::CallTable& api() const noexcept { return api_; }
  refs::ReferenceManager& refs() noexcept { return refs_; }
  errors::ErrorTranslator& errors() noexcept { return errors_; }

  // Wrap a `new` handle; NULL raises the pending Python error.
  object::ProxyObject receive(ffi::Handle handle, const char* operation);

  // Wrap a `borrowed` handle; NULL raises the pending Python error.
  object::ProxyObject borrow(ffi::Handle handle, const char* operation);

  // Wrap a `new` handle where NULL means "no object" rather than failure.
  std::optional<object::ProxyObject> receiveOptional(ffi::Handle handle);

  // Raise the pending Python error when an int-status entry point returned -1.
  void checkStatus(int status, const char* operation);

  object::ProxyObject none();

  object::ProxyObject importModule(const std::string& name);

  // Host value to proxy through coerce::ToForeign<T> (see coerce/ToForeign.h).
  template <typename T>
  object::ProxyObject box(const T& value);

 private:
  const ffi::CallTable& api_;
  refs::ReferenceManager refs_;
  errors::ErrorTranslator errors_;
};

} // namespace pyhost
