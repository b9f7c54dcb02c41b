/***
 * Name: test_proxy_dispatch
 * Purpose: Call-or-subscript decision, callable check and keyword calls.
 */
#include <gtest/gtest.h>

#include <map>
#include <string>

#include "PythonEnvironment.h"
#include "pyhost/pyhost.h"

using pyhost::object::ProxyObject;
using testutil::bridge;
using testutil::python;

TEST(ProxyDispatch, SingleArgumentOnNonCallableIsSubscript) {
  const auto dict = bridge().box(std::map<std::string, int>{{"k", 7}});
  EXPECT_FALSE(dict.callable());
  EXPECT_EQ(dict("k").toInt(), 7);

  const auto list = bridge().box(std::vector<std::string>{"a", "b", "c"});
  EXPECT_EQ(list(1).str(), "b");
  EXPECT_EQ(list(-1).str(), "c");
}

TEST(ProxyDispatch, CallableReceiverIsCalled) {
  const auto len = python().builtin("len");
  EXPECT_TRUE(len.callable());
  EXPECT_EQ(len("abc").toInt(), 3);
}

TEST(ProxyDispatch, MultipleArgumentsAlwaysCall) {
  const auto dict = bridge().box(std::map<std::string, int>{{"k", 7}});
  EXPECT_THROW((void)dict("k", "v"), pyhost::exceptions::ForeignError);
  EXPECT_THROW((void)dict(), pyhost::exceptions::ForeignError);
}

TEST(ProxyDispatch, ExplicitItemAndCallPaths) {
  const auto text = bridge().box("hello");
  EXPECT_EQ(text.getItem(0).str(), "h");
  EXPECT_EQ(text.getItem(pyhost::coerce::Range::until(1, 3)).str(), "el");
  EXPECT_EQ(python().builtin("max").call(3, 9, 4).toInt(), 9);
  EXPECT_EQ(python().builtin("int").callWith({bridge().box("ff")}, {{"base", bridge().box(16)}}).toInt(), 255);
}

TEST(ProxyDispatch, MethodCallErrorsAreTranslated) {
  const auto text = bridge().box("abc");
  try {
    (void)text.callMethod("index", "z");
    FAIL() << "expected ForeignError";
  } catch (const pyhost::exceptions::ForeignError& err) {
    EXPECT_EQ(err.typeName(), "ValueError");
    EXPECT_EQ(std::string(err.what()), "[ValueError] substring not found");
  }
  EXPECT_THROW((void)text.callMethod("no_such_method"), pyhost::exceptions::ForeignError);
}
