/***
 * Name: pyhost::interp::Interpreter
 * Purpose: Bootstrap and shut down the embedded interpreter.
 */
#include "pyhost/interp/Interpreter.h"

#include <atomic>
#include <cstdio>
#include <utility>

#include "pyhost/coerce/ToForeign.h"
#include "pyhost/exceptions/config_error.h"
#include "pyhost/ffi/CallTable.h"
#include "pyhost/support/debug_log.h"

namespace pyhost::interp {

namespace {

std::atomic<bool> g_started{false};

void initializeRuntime(const InterpreterConfig& config) {
  PyConfig pyConfig;
  PyConfig_InitPythonConfig(&pyConfig);
  pyConfig.install_signal_handlers = config.installSignalHandlers ? 1 : 0;
  pyConfig.parse_argv = 0;
  PyStatus status = PyConfig_SetBytesString(&pyConfig, &pyConfig.program_name, config.programName.c_str());
  if (!PyStatus_Exception(status)) { status = Py_InitializeFromConfig(&pyConfig); }
  PyConfig_Clear(&pyConfig);
  if (PyStatus_Exception(status)) {
    throw exceptions::ConfigError(std::string("python initialization failed: ") +
                                  (status.err_msg != nullptr ? status.err_msg : "unknown error"));
  }
}

} // namespace

std::unique_ptr<Interpreter> Interpreter::start(const InterpreterConfig& config) {
  if (g_started.exchange(true)) {
    throw exceptions::ConfigError("the Python interpreter can only be started once per process");
  }
  return std::unique_ptr<Interpreter>(new Interpreter(config));
}

Interpreter::Interpreter(const InterpreterConfig& config)
    : executable_(resolveExecutable(config)), libraryName_(ffi::linkedLibraryName()) {
  if (config.debug) { support::setDebugEnabled(true); }
  const auto& api = ffi::linkedCallTable();
  if (api.isInitialized() != 0) {
    throw exceptions::ConfigError("a Python interpreter is already initialized in this process");
  }
  initializeRuntime(config);
  PYHOST_DEBUG_LOG("interp", "initialized %s (executable %s)", libraryName_.c_str(), executable_.c_str());

  const std::string script = fixupScript(executable_, config.searchPaths);
  if (api.runSimpleString(script.c_str(), nullptr) != 0) {
    Py_FinalizeEx();
    throw exceptions::ConfigError("python start-up script failed");
  }

  bridge_ = std::make_unique<Bridge>(api, libraryName_);
  builtins_.emplace(bridge_->borrow(api.evalGetBuiltins(), "builtins"));
}

Interpreter::~Interpreter() {
  builtins_.reset();
  bridge_->errors().releaseCache();
  const std::size_t reclaimed = bridge_->refs().reclaim();
  PYHOST_DEBUG_LOG("interp", "shutdown: reclaimed %zu reference(s), %zu still queued", reclaimed,
                   bridge_->refs().pending());
  bridge_.reset();
  if (Py_FinalizeEx() != 0) { std::fprintf(stderr, "pyhost: error flushing Python buffers at shutdown\n"); }
}

object::ProxyObject Interpreter::builtin(const std::string& name) const {
  return builtins_->getItem(name);
}

object::ProxyObject Interpreter::importModule(const std::string& name) { return bridge_->importModule(name); }

} // namespace pyhost::interp
