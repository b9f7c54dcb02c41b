#include "pyhost/cli/Usage.h"
#include <string>
#include <string_view>
namespace pyhost::cli {

namespace {
constexpr std::string_view kUsageText = R"(pyhost [options] <module> <function> [args...]
pyhost [options] -e <expr>

Calls <module>.<function>(args...) in the embedded Python interpreter, or
evaluates <expr>, and prints str() of the result.

Options:
  -h, --help           Print this help and exit
  -e <expr>            Evaluate a Python expression instead of calling a function
  --kw=<name>=<value>  Pass a keyword argument (string value); repeatable
  --path=<dir>         Add <dir> to sys.path; repeatable
  --metrics            Print bridge reference statistics
  --metrics-json       Print bridge reference statistics in JSON
  --debug              Trace reference and error handling on stderr
  --color=<mode>       Color error reports: always|never|auto (default: auto)
  --                   End of options

Environment:
  PYHOST_EXECUTABLE    Value for sys.executable (default: python3 on PATH)
  PYHOST_DEBUG         Same as --debug when 1/true/yes
  PYHOST_COLOR         Color error reports in auto mode when 1/true/yes
)";
} // namespace

std::string Usage() { return std::string(kUsageText); }
} // namespace pyhost::cli
