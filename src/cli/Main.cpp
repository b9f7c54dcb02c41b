#include "pyhost/app/Runner.h"
#include "pyhost/cli/ParseArgs.h"
#include "pyhost/cli/Usage.h"
#include "pyhost/exceptions/invariant_violation.h"
#include "pyhost/exceptions/pyhost_exception.h"
#include <iostream>
/***
 * Name: pyhost::main
 * Purpose: CLI entry point for pyhost.
 * Inputs:
 *   - argv
 * Outputs:
 *   - Exit status: 0 ok, 1 Python error, 2 usage/configuration error,
 *     70 internal bridge error
 * Theory of Operation:
 *   Parse args then invoke Runner::run.
 */
int main(const int argc, char** argv) {
  constexpr int kUsageExit = 2;
  constexpr int kInternalExit = 70;
  try {
    pyhost::cli::Options opts;
    if (!pyhost::cli::ParseArgs(argc, argv, opts)) {
      std::cerr << pyhost::cli::Usage();
      return kUsageExit;
    }
    if (opts.showHelp) {
      std::cout << pyhost::cli::Usage();
      return 0;
    }
    return pyhost::Runner::run(opts);
  } catch (const pyhost::exceptions::InvariantViolation& ex) {
    std::cerr << "pyhost: internal error: " << ex.what() << "\n";
    return kInternalExit;
  } catch (const pyhost::exceptions::PyhostException& ex) {
    std::cerr << "pyhost: " << ex.what() << "\n";
    return kUsageExit;
  } catch (const std::exception& ex) {
    std::cerr << "pyhost: internal error: " << ex.what() << "\n";
    return kInternalExit;
  }
}
