/***
 * Name: pyhost::Runner::run
 * Purpose: Execute one pyhost CLI request end-to-end.
 */
#include "pyhost/app/Runner.h"
#include "pyhost/cli/ColorMode.h"
#include "pyhost/cli/Options.h"
#include "pyhost/coerce/Containers.h"
#include "pyhost/coerce/ToForeign.h"
#include "pyhost/exceptions/foreign_error.h"
#include "pyhost/interp/Interpreter.h"
#include "pyhost/metrics/stats.h"

#include <unistd.h>

#include <iostream>
#include <map>
#include <string>
#include <vector>

namespace pyhost {

object::ProxyObject Runner::evaluate(interp::Interpreter &runtime, const cli::Options &opts) {
  Bridge &bridge = runtime.bridge();
  if (!opts.expression.empty()) {
    // eval() needs explicit globals when no Python frame is active.
    const auto globals = coerce::toDict(bridge, std::map<std::string, object::ProxyObject>{});
    return runtime.builtin("eval").call(opts.expression, globals);
  }
  const auto module = runtime.importModule(opts.positionals[0]);
  const auto function = module.getAttribute(opts.positionals[1]);
  object::ProxyObject::Args args;
  for (std::size_t i = 2; i < opts.positionals.size(); ++i) { args.push_back(bridge.box(opts.positionals[i])); }
  object::ProxyObject::Kwargs kwargs;
  for (const auto &[name, value] : opts.keywords) { kwargs.insert_or_assign(name, bridge.box(value)); }
  return function.callWith(args, kwargs);
}

int Runner::run(const cli::Options &opts) {
  interp::InterpreterConfig config = interp::InterpreterConfig::fromEnvironment();
  config.searchPaths = opts.searchPaths;
  config.debug = config.debug || opts.debug;
  auto python = interp::Interpreter::start(config);

  int rc = 0;
  try {
    const auto result = evaluate(*python, opts);
    std::cout << result.str() << "\n";
  } catch (const exceptions::ForeignError &err) {
    bool color = false;
    if (opts.color == cli::ColorMode::Always) { color = true; }
    else if (opts.color == cli::ColorMode::Never) { color = false; }
    else {
      constexpr int kStderrFd = 2;
      color = (isatty(kStderrFd) != 0) || use_env_color();
    }
    print_error(err, color);
    rc = 1;
  }

  auto &manager = python->bridge().refs();
  manager.reclaim();
  if (opts.metrics) { metrics::PrintStats(manager.stats(), manager.pending(), std::cout); }
  if (opts.metricsJson) { metrics::PrintStatsJson(manager.stats(), manager.pending(), std::cout); }
  return rc;
}

} // namespace pyhost
