/***
 * Name: pyhost::interp::fixupScript
 * Purpose: Post-initialization adjustments to the sys module.
 * Inputs:
 *   - executable: value for sys.executable
 *   - searchPaths: extra module directories, searched after the working directory
 * Outputs: Python source text
 * Theory of Operation:
 *   Some modules expect a non-empty sys.argv and a real sys.executable; the
 *   working directory is put first on sys.path so local modules import.
 */
#include "pyhost/interp/InterpreterConfig.h"

#include <cstdio>

namespace pyhost::interp {

std::string pythonStringLiteral(const std::string& text) {
  std::string out;
  out.reserve(text.size() + 2);
  out += '\'';
  for (const unsigned char ch : text) {
    switch (ch) {
      case '\\': out += "\\\\"; break;
      case '\'': out += "\\'"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (ch < 0x20 || ch == 0x7f) {
          char buf[5];
          std::snprintf(buf, sizeof(buf), "\\x%02x", ch);
          out += buf;
        } else {
          out += static_cast<char>(ch);
        }
    }
  }
  out += '\'';
  return out;
}

std::string fixupScript(const std::string& executable, const std::vector<std::string>& searchPaths) {
  std::string script = "import sys\n";
  script += "sys.argv = ['']\n";
  script += "sys.executable = " + pythonStringLiteral(executable) + "\n";
  script += "sys.path.insert(0, '')\n";
  for (std::size_t i = 0; i < searchPaths.size(); ++i) {
    script += "sys.path.insert(" + std::to_string(i + 1) + ", " + pythonStringLiteral(searchPaths[i]) + ")\n";
  }
  return script;
}

} // namespace pyhost::interp
