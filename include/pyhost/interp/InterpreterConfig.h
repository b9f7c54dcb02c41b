/***
 * Name: pyhost::interp::InterpreterConfig
 * Purpose: Settings for bootstrapping the embedded interpreter.
 * Inputs: CLI options and environment (PYHOST_EXECUTABLE, PYHOST_DEBUG)
 * Outputs: Plain value consumed by Interpreter::start
 */
#pragma once

#include <string>
#include <vector>

namespace pyhost::interp {

struct InterpreterConfig {
  std::string programName{"python"};
  std::string executable{};                 // empty: PYHOST_EXECUTABLE, then python3 on PATH
  std::vector<std::string> searchPaths{};   // prepended to sys.path after ''
  bool installSignalHandlers{false};
  bool debug{false};

  static InterpreterConfig fromEnvironment();
};

// Executable path reported as sys.executable.
std::string resolveExecutable(const InterpreterConfig& config);

// Python source run once after initialization.
std::string fixupScript(const std::string& executable, const std::vector<std::string>& searchPaths);

// Python single-quoted string literal for `text`.
std::string pythonStringLiteral(const std::string& text);

} // namespace pyhost::interp
