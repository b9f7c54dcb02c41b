#pragma once

/***
 * Name: pyhost::Runner
 * Purpose: Run one CLI request against the embedded interpreter.
 * Inputs:
 *   - CLI options
 * Outputs:
 *   - Result on stdout; error report on stderr; exit code
 * Theory of Operation:
 *   Starts the interpreter, evaluates the expression or calls
 *   <module>.<function> with string arguments, prints str() of the result and
 *   optionally the bridge statistics. A Python error is reported with its
 *   merged stack and yields exit code 1. Bridge invariant violations are not
 *   handled here.
 */

#include <string>

namespace pyhost { namespace cli { struct Options; } }
namespace pyhost { namespace exceptions { class ForeignError; } }
namespace pyhost { namespace interp { class Interpreter; } }
namespace pyhost { namespace object { class ProxyObject; } }

namespace pyhost {
    class Runner {
    public:
        static int run(const cli::Options &opts);

        static object::ProxyObject evaluate(interp::Interpreter &runtime, const cli::Options &opts);

        static bool use_env_color();

        static void print_error(const exceptions::ForeignError &err, bool color);
    };
} // namespace pyhost
