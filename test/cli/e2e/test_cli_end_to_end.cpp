/***
 * Name: test_cli_end_to_end
 * Purpose: Run the pyhost binary: help, expressions, module calls, error
 *   reports, exit codes and metrics.
 */
#include <gtest/gtest.h>
#include <sys/wait.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

#ifndef PYHOST_BINARY
#error "PYHOST_BINARY must name the pyhost executable"
#endif

static fs::path testing_dir() {
  const fs::path dir = fs::temp_directory_path() / "pyhost-e2e";
  std::error_code ec;
  fs::create_directories(dir, ec);
  return dir;
}

static std::string read_all(const fs::path& path) {
  std::ifstream in(path); std::string s, line; while (std::getline(in, line)) { s += line; s += '\n'; } return s;
}

// Runs pyhost with `args`; stdout and stderr land in out.txt and err.txt.
static int run_pyhost(const std::string& args) {
  const auto dir = testing_dir();
  const std::string cmd = std::string("PYHOST_COLOR=0 '") + PYHOST_BINARY + "' " + args + " > '" +
                          (dir / "out.txt").string() + "' 2> '" + (dir / "err.txt").string() + "'";
  const int status = std::system(cmd.c_str());
  return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

static std::string out_text() { return read_all(testing_dir() / "out.txt"); }
static std::string err_text() { return read_all(testing_dir() / "err.txt"); }

TEST(CLI_EndToEnd, HelpPrintsUsage) {
  ASSERT_EQ(run_pyhost("--help"), 0);
  EXPECT_NE(out_text().find("pyhost [options] <module> <function>"), std::string::npos);
  ASSERT_EQ(run_pyhost("-h"), 0);
  EXPECT_NE(out_text().find("-e <expr>"), std::string::npos);
}

TEST(CLI_EndToEnd, EvaluatesExpression) {
  ASSERT_EQ(run_pyhost("-e '2 ** 10'"), 0);
  EXPECT_EQ(out_text(), "1024\n");
}

TEST(CLI_EndToEnd, CallsModuleFunction) {
  ASSERT_EQ(run_pyhost("posixpath basename /usr/lib/libpython.so"), 0);
  EXPECT_EQ(out_text(), "libpython.so\n");
}

TEST(CLI_EndToEnd, DashArgumentsAfterFunction) {
  ASSERT_EQ(run_pyhost("builtins len -3"), 0);
  EXPECT_EQ(out_text(), "2\n");
}

TEST(CLI_EndToEnd, ImportsFromSearchPath) {
  const auto dir = testing_dir() / "mods";
  std::error_code ec;
  fs::create_directories(dir, ec);
  { std::ofstream(dir / "pyhost_e2e_mod.py") << "def greet(name, punct='.'):\n    return 'hi ' + name + punct\n"; }
  ASSERT_EQ(run_pyhost("--path='" + dir.string() + "' --kw=punct=! pyhost_e2e_mod greet bob"), 0);
  EXPECT_EQ(out_text(), "hi bob!\n");
}

TEST(CLI_EndToEnd, PythonErrorExitsOneWithMergedStack) {
  ASSERT_EQ(run_pyhost("-e '1 / 0'"), 1);
  const auto err = err_text();
  EXPECT_NE(err.find("error: [ZeroDivisionError] division by zero"), std::string::npos);
  EXPECT_NE(err.find("  at <python"), std::string::npos);
  EXPECT_EQ(out_text(), "");
}

TEST(CLI_EndToEnd, UsageErrorsExitTwo) {
  EXPECT_EQ(run_pyhost(""), 2);
  EXPECT_EQ(run_pyhost("--bogus -e 1"), 2);
  EXPECT_EQ(run_pyhost("math"), 2);
  EXPECT_NE(err_text().find("missing <function> after <module>"), std::string::npos);
}

TEST(CLI_EndToEnd, MetricsTextAndJson) {
  ASSERT_EQ(run_pyhost("--metrics -e 'len([1, 2])'"), 0);
  const auto txt = out_text();
  EXPECT_EQ(txt.rfind("2\n", 0), 0u);
  EXPECT_NE(txt.find("== Bridge stats =="), std::string::npos);
  EXPECT_NE(txt.find("  pending: 0"), std::string::npos);

  ASSERT_EQ(run_pyhost("--metrics-json -e 'len([1, 2])'"), 0);
  const auto js = out_text();
  EXPECT_NE(js.find("\"received\""), std::string::npos);
  EXPECT_NE(js.find("\"pending\": 0"), std::string::npos);
}
