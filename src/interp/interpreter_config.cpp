/***
 * Name: pyhost::interp::InterpreterConfig::fromEnvironment / resolveExecutable
 * Purpose: Fill bootstrap settings from the environment and locate python3.
 * Theory of Operation:
 *   The executable is only reported to Python code (sys.executable); the
 *   runtime itself is the libpython this binary links. Lookup order is the
 *   explicit setting, PYHOST_EXECUTABLE, then the first executable "python3"
 *   on PATH. When nothing is found the bare name is used.
 */
#include "pyhost/interp/InterpreterConfig.h"

#include <unistd.h>

#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <system_error>

#include "pyhost/support/env.h"

namespace pyhost::interp {

InterpreterConfig InterpreterConfig::fromEnvironment() {
  InterpreterConfig config;
  if (const char* exe = std::getenv("PYHOST_EXECUTABLE"); exe != nullptr && *exe != '\0') { config.executable = exe; }
  config.debug = support::envFlag("PYHOST_DEBUG");
  return config;
}

std::string resolveExecutable(const InterpreterConfig& config) {
  if (!config.executable.empty()) { return config.executable; }
  if (const char* exe = std::getenv("PYHOST_EXECUTABLE"); exe != nullptr && *exe != '\0') { return exe; }
  const char* path = std::getenv("PATH");
  if (path != nullptr) {
    std::istringstream dirs{std::string(path)};
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
      if (dir.empty()) { continue; }
      const std::filesystem::path candidate = std::filesystem::path(dir) / "python3";
      std::error_code ec;
      if (std::filesystem::is_regular_file(candidate, ec) && ::access(candidate.c_str(), X_OK) == 0) {
        return candidate.string();
      }
    }
  }
  return "python3";
}

} // namespace pyhost::interp
