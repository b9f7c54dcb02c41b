/***
 * Name: pyhost::errors::ErrorTranslator
 * Purpose: Read, clear and translate the CPython error indicator.
 * Theory of Operation:
 *   The fetched triple is owned through ReferenceManager::receive right after
 *   the indicator is cleared, so any queued reclamation that runs during the
 *   translation happens with no error pending. Building the message and the
 *   foreign frames uses ordinary proxy operations; a failure inside them is
 *   reported as its own ForeignError.
 */
#include "pyhost/errors/ErrorTranslator.h"

#include <algorithm>
#include <utility>
#include <vector>

#include "pyhost/Bridge.h"
#include "pyhost/coerce/ToForeign.h"
#include "pyhost/errors/HostBacktrace.h"
#include "pyhost/exceptions/invariant_violation.h"
#include "pyhost/object/ForeignIterator.h"
#include "pyhost/object/ProxyObject.h"
#include "pyhost/support/debug_log.h"

namespace pyhost::errors {

namespace {

int frameLine(const object::ProxyObject& summary, ffi::Handle none) {
  auto lineno = summary.getAttribute("lineno");
  if (lineno.handle() == none) { return 0; }
  return static_cast<int>(lineno.toLong());
}

} // namespace

ErrorTranslator::ErrorTranslator(Bridge& bridge, std::string libraryName)
    : bridge_(bridge), libraryName_(std::move(libraryName)) {}

std::optional<exceptions::ForeignError> ErrorTranslator::checkAndFetch() {
  const auto& api = bridge_.api();
  if (api.errOccurred() == nullptr) { return std::nullopt; }

  ffi::Handle type = nullptr;
  ffi::Handle value = nullptr;
  ffi::Handle traceback = nullptr;
  api.errFetch(&type, &value, &traceback);
  api.errNormalize(&type, &value, &traceback);

  auto& refs = bridge_.refs();
  auto typeRef = refs.receive(type);
  auto valueRef = refs.receive(value);
  auto tracebackRef = refs.receive(traceback);
  if (!typeRef || !valueRef) {
    throw exceptions::InvariantViolation("error indicator was set but fetched no exception");
  }
  return translate(std::move(*typeRef), std::move(*valueRef), std::move(tracebackRef));
}

void ErrorTranslator::raiseFailure(const char* operation) {
  if (auto error = checkAndFetch()) { throw std::move(*error); }
  PYHOST_DEBUG_LOG("errors", "%s returned a failure sentinel with no error set", operation);
  throw exceptions::InvariantViolation(std::string(operation) + " returned a failure sentinel with no Python error set");
}

void ErrorTranslator::raiseIfSet() {
  if (auto error = checkAndFetch()) { throw std::move(*error); }
}

void ErrorTranslator::releaseCache() noexcept { tracebackModule_.reset(); }

exceptions::ForeignError ErrorTranslator::translate(refs::ManagedReference type,
                                                    refs::ManagedReference value,
                                                    std::optional<refs::ManagedReference> traceback) {
  const object::ProxyObject typeObj(bridge_, std::move(type));
  const object::ProxyObject valueObj(bridge_, std::move(value));
  std::string typeName = typeObj.getAttribute("__name__").str();
  std::string text = valueObj.str();

  std::vector<StackFrame> stack;
  if (traceback) {
    const object::ProxyObject tb(bridge_, std::move(*traceback));
    if (!tracebackModule_) {
      auto module = bridge_.refs().receive(bridge_.api().importModule("traceback"));
      if (!module) { raiseFailure("import traceback"); }
      tracebackModule_ = std::move(module);
    }
    const ffi::Handle none = bridge_.api().none();
    const auto module = bridge_.borrow(tracebackModule_->get(), "traceback");
    auto summaries = module.callMethod("extract_tb", tb).iterate();
    while (auto summary = summaries.next()) {
      stack.push_back(StackFrame{"<" + libraryName_ + ">",
                                 summary->getAttribute("name").str(),
                                 summary->getAttribute("filename").str(),
                                 frameLine(*summary, none)});
    }
    std::reverse(stack.begin(), stack.end());
  }
  auto host = captureHostStack();
  stack.insert(stack.end(), std::make_move_iterator(host.begin()), std::make_move_iterator(host.end()));

  bridge_.refs().noteTranslatedError();
  PYHOST_DEBUG_LOG("errors", "translated %s: %s", typeName.c_str(), text.c_str());
  return exceptions::ForeignError(std::move(typeName), std::move(text), std::move(stack));
}

} // namespace pyhost::errors
