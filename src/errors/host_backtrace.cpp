/***
 * Name: pyhost::errors::captureHostStack
 * Purpose: Host half of a merged error trace.
 * Inputs:
 *   - maxFrames: capture depth
 * Outputs: Frames innermost first, with the error translation frames removed
 * Theory of Operation:
 *   backtrace(3) gives return addresses; dladdr() resolves each to its object
 *   file and nearest exported symbol, which abi::__cxa_demangle turns into a
 *   readable name. Executables are linked with exported symbols so the names
 *   of the program's own functions resolve. Everything up to and including the
 *   last frame inside pyhost::errors:: is the translator itself and is dropped;
 *   when no such frame resolves, only this function's frame is dropped.
 */
#include "pyhost/errors/HostBacktrace.h"

#include <cxxabi.h>
#include <dlfcn.h>
#include <execinfo.h>

#include <cstdlib>
#include <cstddef>
#include <memory>
#include <string>
#include <utility>

namespace pyhost::errors {

namespace {

std::string demangle(const char* symbol) {
  if (symbol == nullptr) { return {}; }
  int status = 0;
  const std::unique_ptr<char, decltype(&std::free)> name{
      abi::__cxa_demangle(symbol, nullptr, nullptr, &status), &std::free};
  if (status == 0 && name) { return name.get(); }
  return symbol;
}

std::string baseName(const char* path) {
  if (path == nullptr) { return "??"; }
  const std::string p{path};
  const auto slash = p.find_last_of('/');
  return slash == std::string::npos ? p : p.substr(slash + 1);
}

} // namespace

std::vector<StackFrame> captureHostStack(std::size_t maxFrames) {
  std::vector<void*> addrs(maxFrames == 0 ? 1 : maxFrames);
  const int n = ::backtrace(addrs.data(), static_cast<int>(addrs.size()));
  std::vector<StackFrame> frames;
  frames.reserve(static_cast<std::size_t>(n > 0 ? n : 0));
  std::size_t lastTranslatorFrame = 0;
  bool sawTranslator = false;
  for (int i = 0; i < n; ++i) {
    Dl_info info{};
    StackFrame frame;
    if (::dladdr(addrs[static_cast<std::size_t>(i)], &info) != 0) {
      frame.module = baseName(info.dli_fname);
      frame.function = demangle(info.dli_sname);
      frame.file = info.dli_fname != nullptr ? info.dli_fname : "";
    } else {
      frame.module = "??";
    }
    if (frame.function.find("pyhost::errors::") != std::string::npos) {
      lastTranslatorFrame = frames.size();
      sawTranslator = true;
    }
    frames.push_back(std::move(frame));
  }
  const std::size_t drop = sawTranslator ? lastTranslatorFrame + 1 : 1;
  if (drop >= frames.size()) { return {}; }
  frames.erase(frames.begin(), frames.begin() + static_cast<std::ptrdiff_t>(drop));
  return frames;
}

} // namespace pyhost::errors
