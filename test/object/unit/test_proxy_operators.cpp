/***
 * Name: test_proxy_operators
 * Purpose: Binary, unary and in-place operators delegate to Python's number
 *   protocol.
 */
#include <gtest/gtest.h>

#include <vector>

#include "PythonEnvironment.h"
#include "pyhost/pyhost.h"

using pyhost::object::BinaryOp;
using pyhost::object::ProxyObject;
using pyhost::object::UnaryOp;
using testutil::bridge;
using testutil::refcount;

namespace {
ProxyObject num(long long v) { return bridge().box(v); }
} // namespace

TEST(ProxyOperators, Arithmetic) {
  EXPECT_EQ(num(3).pow(num(4)).toLong(), 81);
  EXPECT_EQ(num(7).floorDiv(num(2)).toLong(), 3);
  EXPECT_DOUBLE_EQ((num(7) / num(2)).toDouble(), 3.5);
  EXPECT_EQ((num(7) % num(2)).toLong(), 1);
  EXPECT_EQ((num(11) % num(3)).toLong(), 2);
  EXPECT_EQ((num(2) + num(3) * num(4) - num(1)).toLong(), 13);
  EXPECT_EQ((num(-7) % num(3)).toLong(), 2);
  EXPECT_EQ(num(-7).floorDiv(num(2)).toLong(), -4);
}

TEST(ProxyOperators, BitwiseAndUnary) {
  EXPECT_EQ((num(1) << num(10)).toLong(), 1024);
  EXPECT_EQ((num(1024) >> num(3)).toLong(), 128);
  EXPECT_EQ((num(12) & num(10)).toLong(), 8);
  EXPECT_EQ((num(12) | num(10)).toLong(), 14);
  EXPECT_EQ((num(12) ^ num(10)).toLong(), 6);
  EXPECT_EQ((-num(5)).toLong(), -5);
  EXPECT_EQ((+num(5)).toLong(), 5);
  EXPECT_EQ((~num(5)).toLong(), -6);
  EXPECT_EQ(num(5).apply(UnaryOp::Negative).toLong(), -5);
}

TEST(ProxyOperators, SequencesUseTheSameProtocol) {
  EXPECT_EQ((bridge().box("ab") + bridge().box("cd")).str(), "abcd");
  EXPECT_EQ((bridge().box("ab") * num(3)).str(), "ababab");
}

TEST(ProxyOperators, TypeErrorsAreTranslated) {
  try {
    (void)(num(1) + bridge().box("x"));
    FAIL() << "expected ForeignError";
  } catch (const pyhost::exceptions::ForeignError& err) {
    EXPECT_EQ(err.typeName(), "TypeError");
  }
  EXPECT_THROW((void)(num(1) / num(0)), pyhost::exceptions::ForeignError);
  EXPECT_THROW((void)num(1).matmul(num(2)), pyhost::exceptions::ForeignError);
}

TEST(ProxyOperators, InPlaceOnImmutableRebindsOnlyThisProxy) {
  ProxyObject x = num(1);
  const ProxyObject y = x;
  x += num(1);
  EXPECT_EQ(x.toLong(), 2);
  EXPECT_EQ(y.toLong(), 1);
  x.powInPlace(num(3));
  EXPECT_EQ(x.toLong(), 8);
  x.floorDivInPlace(num(3));
  EXPECT_EQ(x.toLong(), 2);
}

TEST(ProxyOperators, InPlaceOnMutableKeepsIdentityAndBalance) {
  ProxyObject list = bridge().box(std::vector<int>{1});
  const ProxyObject alias = list;
  bridge().refs().reclaim();
  const long long before = refcount(alias);
  list += bridge().box(std::vector<int>{2, 3});
  EXPECT_EQ(list.handle(), alias.handle());
  EXPECT_EQ(alias.str(), "[1, 2, 3]");
  bridge().refs().reclaim();
  EXPECT_EQ(refcount(alias), before);
  list *= num(2);
  EXPECT_EQ(alias.str(), "[1, 2, 3, 1, 2, 3]");
}

TEST(ProxyOperators, EveryBinaryOpHasAName) {
  const std::vector<BinaryOp> ops{BinaryOp::Add, BinaryOp::Subtract, BinaryOp::Multiply, BinaryOp::MatrixMultiply,
                                  BinaryOp::FloorDivide, BinaryOp::TrueDivide, BinaryOp::Remainder, BinaryOp::Power,
                                  BinaryOp::LeftShift, BinaryOp::RightShift, BinaryOp::And, BinaryOp::Xor,
                                  BinaryOp::Or};
  for (const auto op : ops) { EXPECT_STRNE(pyhost::object::operatorName(op), "?"); }
  EXPECT_STREQ(pyhost::object::operatorName(BinaryOp::Power), "**");
}
