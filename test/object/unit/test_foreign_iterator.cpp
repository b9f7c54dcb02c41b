/***
 * Name: test_foreign_iterator
 * Purpose: Lazy iteration, exhaustion and errors raised mid-iteration.
 */
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "PythonEnvironment.h"
#include "pyhost/pyhost.h"

using pyhost::object::ForeignIterator;
using pyhost::object::ProxyObject;
using testutil::bridge;
using testutil::python;

TEST(ForeignIterator, RangeForVisitsEveryElement) {
  const auto range = python().builtin("range").call(5);
  long long sum = 0;
  for (const auto& item : range.iterate()) { sum += item.toLong(); }
  EXPECT_EQ(sum, 10);
}

TEST(ForeignIterator, ExhaustionIsStable) {
  ForeignIterator it = bridge().box(std::vector<int>{1, 2}).iterate();
  ASSERT_TRUE(it.next().has_value());
  ASSERT_TRUE(it.next().has_value());
  EXPECT_FALSE(it.next().has_value());
  EXPECT_TRUE(it.exhausted());
  EXPECT_FALSE(it.next().has_value());
  EXPECT_EQ(it.begin(), it.end());
}

TEST(ForeignIterator, ElementsAreFetchedLazily) {
  const auto counter = python().importModule("itertools").getAttribute("count").call(10);
  ForeignIterator it = counter.iterate();
  EXPECT_EQ(it.next()->toLong(), 10);
  EXPECT_EQ(it.next()->toLong(), 11);
  EXPECT_FALSE(it.exhausted());
}

TEST(ForeignIterator, ErrorDuringIterationIsTranslated) {
  const auto gen = python().builtin("map").call(python().builtin("int"), std::vector<std::string>{"1", "x"});
  ForeignIterator it = gen.iterate();
  EXPECT_EQ(it.next()->toLong(), 1);
  EXPECT_THROW((void)it.next(), pyhost::exceptions::ForeignError);
}

TEST(ForeignIterator, NonIterableRaises) {
  EXPECT_THROW((void)bridge().box(3).iterate(), pyhost::exceptions::ForeignError);
}

TEST(ForeignIterator, DereferencingEndIsUsageError) {
  ForeignIterator it = bridge().box(std::vector<int>{}).iterate();
  auto cursor = it.begin();
  EXPECT_EQ(cursor, it.end());
  EXPECT_THROW((void)*cursor, pyhost::exceptions::UsageError);
}
