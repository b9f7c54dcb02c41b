/***
 * Name: test_env_flags
 * Purpose: Boolean environment switches and the debug trace toggle.
 */
#include <gtest/gtest.h>

#include <cstdlib>

#include "pyhost/app/Runner.h"
#include "pyhost/support/debug_log.h"
#include "pyhost/support/env.h"

using namespace pyhost::support;

TEST(EnvFlags, TrueValues) {
  EXPECT_TRUE(isTrueValue("1"));
  EXPECT_TRUE(isTrueValue("true"));
  EXPECT_TRUE(isTrueValue("YES"));
  EXPECT_FALSE(isTrueValue("0"));
  EXPECT_FALSE(isTrueValue(""));
  EXPECT_FALSE(isTrueValue("on"));
  EXPECT_FALSE(isTrueValue(nullptr));
}

TEST(EnvFlags, ReadsNamedVariable) {
  ::setenv("PYHOST_TEST_FLAG", "True", 1);
  EXPECT_TRUE(envFlag("PYHOST_TEST_FLAG"));
  ::unsetenv("PYHOST_TEST_FLAG");
  EXPECT_FALSE(envFlag("PYHOST_TEST_FLAG"));
}

TEST(EnvFlags, ColorFromEnvironment) {
  ::setenv("PYHOST_COLOR", "yes", 1);
  EXPECT_TRUE(pyhost::Runner::use_env_color());
  ::setenv("PYHOST_COLOR", "no", 1);
  EXPECT_FALSE(pyhost::Runner::use_env_color());
  ::unsetenv("PYHOST_COLOR");
}

TEST(EnvFlags, DebugTraceToggle) {
  const bool was = debugEnabled();
  setDebugEnabled(true);
  EXPECT_TRUE(debugEnabled());
  testing::internal::CaptureStderr();
  PYHOST_DEBUG_LOG("test", "value %d", 7);
  EXPECT_EQ(testing::internal::GetCapturedStderr(), "[test] value 7\n");
  setDebugEnabled(false);
  testing::internal::CaptureStderr();
  PYHOST_DEBUG_LOG("test", "hidden");
  EXPECT_EQ(testing::internal::GetCapturedStderr(), "");
  setDebugEnabled(was);
}
