/***
 * Name: test_coerce
 * Purpose: Host values become the expected Python types and read back intact.
 */
#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "PythonEnvironment.h"
#include "pyhost/pyhost.h"

using pyhost::coerce::Range;
using pyhost::object::ProxyObject;
using testutil::bridge;
using testutil::python;

namespace {
std::string typeName(const ProxyObject& obj) {
  return python().builtin("type").call(obj).getAttribute("__name__").str();
}
} // namespace

TEST(Coerce, ScalarsMapToPythonTypes) {
  EXPECT_EQ(typeName(bridge().box(1)), "int");
  EXPECT_EQ(typeName(bridge().box(static_cast<std::uint8_t>(200))), "int");
  EXPECT_EQ(typeName(bridge().box(true)), "bool");
  EXPECT_EQ(typeName(bridge().box(1.5F)), "float");
  EXPECT_EQ(typeName(bridge().box('c')), "str");
  EXPECT_EQ(typeName(bridge().box(U'é')), "str");
  EXPECT_EQ(typeName(bridge().box(std::string_view("sv"))), "str");
  EXPECT_EQ(typeName(bridge().box(std::nullopt)), "NoneType");
}

TEST(Coerce, IntegerExtremes) {
  const auto maxU = bridge().box(std::numeric_limits<std::uint64_t>::max());
  EXPECT_EQ(maxU.str(), "18446744073709551615");
  const auto minS = bridge().box(std::numeric_limits<std::int64_t>::min());
  EXPECT_EQ(minS.toLong(), std::numeric_limits<long long>::min());
  EXPECT_THROW((void)maxU.toLong(), pyhost::exceptions::ForeignError);
}

TEST(Coerce, CodePointsEncodeAsUtf8) {
  EXPECT_EQ(bridge().box(U'é').str(), "\xc3\xa9");
  EXPECT_EQ(bridge().box(U'\U0001F600').str(), "\xf0\x9f\x98\x80");
  EXPECT_EQ(python().builtin("len").call(bridge().box(U'\U0001F600')).toInt(), 1);
  EXPECT_THROW((void)bridge().box(static_cast<char32_t>(0xD800)), pyhost::exceptions::UsageError);
  EXPECT_THROW((void)bridge().box(static_cast<char32_t>(0x110000)), pyhost::exceptions::UsageError);
}

TEST(Coerce, CharIsOneLatin1Character) {
  EXPECT_EQ(bridge().box('c').str(), "c");
  const auto accented = bridge().box('\xE9');
  EXPECT_EQ(accented.str(), "\xc3\xa9");
  EXPECT_EQ(python().builtin("len").call(accented).toInt(), 1);
  EXPECT_EQ(python().builtin("ord").call(bridge().box('\xFF')).toInt(), 255);
}

TEST(Coerce, Utf8StringsRoundTrip) {
  const std::string text = "gr\xc3\xbc\xc3\x9f dich";
  EXPECT_EQ(bridge().box(text).str(), text);
  EXPECT_EQ(python().builtin("len").call(text).toInt(), 9);
}

TEST(Coerce, ListTupleRoundTrip) {
  const std::vector<ProxyObject> items{bridge().box(1), bridge().box("two"), bridge().box(3.0)};
  const auto list = pyhost::coerce::toList(bridge(), items);
  const auto tuple = pyhost::coerce::toTuple(bridge(), items);
  EXPECT_EQ(list.str(), "[1, 'two', 3.0]");
  EXPECT_EQ(tuple.str(), "(1, 'two', 3.0)");
  const auto back = pyhost::coerce::toSeq(list);
  ASSERT_EQ(back.size(), items.size());
  for (std::size_t i = 0; i < items.size(); ++i) { EXPECT_TRUE(back[i] == items[i]); }
  EXPECT_EQ(typeName(pyhost::coerce::toTuple(bridge(), {})), "tuple");
}

TEST(Coerce, ContainersKeepElementsAlive) {
  ProxyObject element = python().builtin("object").call();
  const long long before = testutil::refcount(element);
  const auto list = bridge().box(std::vector<ProxyObject>{element});
  bridge().refs().reclaim();
  EXPECT_EQ(testutil::refcount(element), before + 1);
}

TEST(Coerce, NestedHostContainers) {
  const std::vector<std::vector<int>> grid{{1, 2}, {3}};
  EXPECT_EQ(bridge().box(grid).str(), "[[1, 2], [3]]");
  const std::map<std::string, std::vector<int>> named{{"a", {1}}, {"b", {}}};
  EXPECT_EQ(bridge().box(named).str(), "{'a': [1], 'b': []}");
}

TEST(Coerce, SetsAndMapsRoundTrip) {
  const auto set = bridge().box(std::set<int>{3, 1, 2});
  EXPECT_EQ(typeName(set), "set");
  const auto hostSet = pyhost::coerce::toSet(set);
  EXPECT_EQ(hostSet.size(), 3u);
  EXPECT_EQ(hostSet.count(bridge().box(2)), 1u);

  const auto uset = bridge().box(std::unordered_set<std::string>{"x"});
  EXPECT_EQ(uset.str(), "{'x'}");

  const auto dict = bridge().box(std::unordered_map<std::string, int>{{"a", 1}, {"b", 2}});
  EXPECT_EQ(typeName(dict), "dict");
  const auto hostMap = pyhost::coerce::toMap(dict);
  ASSERT_EQ(hostMap.size(), 2u);
  EXPECT_EQ(hostMap.at(bridge().box("b")).toInt(), 2);
}

TEST(Coerce, RangesBecomeSlices) {
  const auto digits = bridge().box("0123456789");
  EXPECT_EQ(digits[Range::until(2, 5)].str(), "234");
  EXPECT_EQ(digits[Range::to(2, 5)].str(), "2345");
  EXPECT_EQ(digits[Range::to(7, -1)].str(), "789");
  EXPECT_EQ(digits[Range::until(0, 10, 3)].str(), "0369");
  EXPECT_EQ(bridge().box(Range::to(1, 4)).str(), "slice(1, 5, 1)");
  EXPECT_EQ(bridge().box(Range::to(1, -1)).str(), "slice(1, None, 1)");
  constexpr auto last = std::numeric_limits<long long>::max();
  EXPECT_EQ(bridge().box(Range::to(0, last)).str(), "slice(0, None, 1)");
  EXPECT_EQ(digits[Range::to(3, last)].str(), "3456789");
  EXPECT_EQ(bridge().box(Range::until(0, last)).str(), "slice(0, 9223372036854775807, 1)");
}
