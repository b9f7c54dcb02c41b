/***
 * Name: test_exceptions
 * Purpose: Every pyhost exception type is constructible and throwable by
 *   callers, and reports its message through what().
 */
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "pyhost/exceptions/config_error.h"
#include "pyhost/exceptions/foreign_error.h"
#include "pyhost/exceptions/invariant_violation.h"
#include "pyhost/exceptions/usage_error.h"

using namespace pyhost::exceptions;

TEST(Exceptions, MarkerTypesThrowAsPyhostException) {
  EXPECT_THROW(throw UsageError("proxy is closed"), PyhostException);
  EXPECT_THROW(throw ConfigError("no interpreter"), PyhostException);
  EXPECT_THROW(throw InvariantViolation("getattr"), PyhostException);
  try {
    throw InvariantViolation("call returned NULL without an error set");
  } catch (const std::exception& e) {
    EXPECT_STREQ(e.what(), "call returned NULL without an error set");
  }
}

TEST(Exceptions, ForeignErrorKeepsItsParts) {
  const std::vector<pyhost::errors::StackFrame> stack(3);
  const ForeignError err("ValueError", "bad value", stack);
  EXPECT_STREQ(err.what(), "[ValueError] bad value");
  EXPECT_EQ(err.typeName(), "ValueError");
  EXPECT_EQ(err.text(), "bad value");
  EXPECT_EQ(err.stack().size(), 3u);
  EXPECT_THROW(throw ForeignError(err), PyhostException);
}

TEST(Exceptions, ForeignErrorWithLongText) {
  const std::string text(1 << 16, 'x');
  const ForeignError err("MemoryError", text, {});
  EXPECT_EQ(std::string(err.what()).size(), text.size() + std::string("[MemoryError] ").size());
  EXPECT_TRUE(err.stack().empty());
}
