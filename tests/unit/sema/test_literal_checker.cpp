// tests/unit/sema/test_literal_checker.cpp - Unit tests for literal range checks
//
#include <gtest/gtest.h>

#include <string>

#include "cnext/test_support/parse_helpers.hpp"

using cnext::test_support::TestModule;

namespace
{

std::string help_of(const cnext::DiagnosticBag & diags, std::string_view code)
{
  for (const auto & d : diags) {
    if (d.code == code) return d.help_message.value_or("");
  }
  return {};
}

}  // namespace

TEST(SemaLiteralChecker, SignedMinimumIsRejectedWithBoundaryConstant)
{
  TestModule m;
  EXPECT_FALSE(m.analyze(R"(
    i32 f() {
      i32 low <- -2147483648;
      return low;
    }
  )"));
  EXPECT_EQ(m.diags.count_code("E0701"), 1U);
  EXPECT_NE(help_of(m.diags, "E0701").find("i32.MIN"), std::string::npos);
}

TEST(SemaLiteralChecker, UnsignedMaximumIsRejected)
{
  TestModule m;
  EXPECT_FALSE(m.analyze("u8 top <- 255;"));
  EXPECT_TRUE(m.diags.has_code("E0701"));
  EXPECT_NE(help_of(m.diags, "E0701").find("u8.MAX"), std::string::npos);
}

TEST(SemaLiteralChecker, BoundaryConstantIsAccepted)
{
  TestModule m;
  EXPECT_TRUE(m.analyze(R"(
    i8 low <- i8.MIN;
    u16 top <- u16.MAX;
  )"));
}

TEST(SemaLiteralChecker, HexBoundaryIsAccepted)
{
  // Mask-style literals spell bit patterns, not magnitudes.
  TestModule m;
  EXPECT_TRUE(m.analyze("u8 mask <- 0xFF;"));
}

TEST(SemaLiteralChecker, OneInsideBoundaryIsAccepted)
{
  TestModule m;
  EXPECT_TRUE(m.analyze(R"(
    i8 a <- -127;
    u8 b <- 254;
  )"));
}

TEST(SemaLiteralChecker, OutOfRangeLiteralIsRejected)
{
  TestModule m;
  EXPECT_FALSE(m.analyze("u8 too_big <- 256;"));
  EXPECT_TRUE(m.diags.has_code("E0702"));
}

TEST(SemaLiteralChecker, NegativeLiteralForUnsignedIsRejected)
{
  TestModule m;
  EXPECT_FALSE(m.analyze("u16 wrap <- -1;"));
  EXPECT_TRUE(m.diags.has_code("E0702"));
}

TEST(SemaLiteralChecker, LiteralAdoptsTypeOfOtherOperand)
{
  TestModule m;
  EXPECT_FALSE(m.analyze(R"(
    bool f(u8 v) {
      return v = 255;
    }
  )"));
  EXPECT_TRUE(m.diags.has_code("E0701"));
}
