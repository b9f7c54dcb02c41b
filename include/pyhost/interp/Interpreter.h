/***
 * Name: pyhost::interp::Interpreter
 * Purpose: The one embedded CPython instance of the process and its Bridge.
 * Inputs: InterpreterConfig
 * Outputs:
 *   - bridge(): context for proxies
 *   - builtins()/builtin(name): the builtins namespace
 *   - importModule(name): imported module as a proxy
 * Theory of Operation:
 *   start() initializes CPython through PyConfig, runs the fix-up script
 *   (sys.argv, sys.executable, sys.path) and builds the Bridge on the linked
 *   call table. CPython cannot be reliably initialized twice, so a second
 *   start() in the same process throws ConfigError even after the first
 *   instance is gone. The calling thread keeps the GIL for the lifetime of the
 *   instance. Destruction drains pending reclamation and finalizes CPython;
 *   proxies must not outlive it.
 */
#pragma once

#include <memory>
#include <optional>
#include <string>

#include "pyhost/Bridge.h"
#include "pyhost/interp/InterpreterConfig.h"
#include "pyhost/object/ProxyObject.h"

namespace pyhost::interp {

class Interpreter {
 public:
  static std::unique_ptr<Interpreter> start(const InterpreterConfig& config = InterpreterConfig::fromEnvironment());

  Interpreter(const Interpreter&) = delete;
  Interpreter& operator=(const Interpreter&) = delete;
  ~Interpreter();

  Bridge& bridge() noexcept { return *bridge_; }
  const object::ProxyObject& builtins() const noexcept { return *builtins_; }
  object::ProxyObject builtin(const std::string& name) const;
  object::ProxyObject importModule(const std::string& name);

  const std::string& libraryName() const noexcept { return libraryName_; }
  const std::string& executable() const noexcept { return executable_; }

 private:
  explicit Interpreter(const InterpreterConfig& config);

  std::string executable_;
  std::string libraryName_;
  std::unique_ptr<Bridge> bridge_;
  std::optional<object::ProxyObject> builtins_;
};

} // namespace pyhost::interp
