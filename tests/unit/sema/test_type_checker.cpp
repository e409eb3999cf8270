// tests/unit/sema/test_type_checker.cpp - Unit tests for type checking
//
#include <gtest/gtest.h>

#include <string>

#include "cnext/test_support/parse_helpers.hpp"

using cnext::test_support::TestModule;

// ============================================================================
// Assignments and initializers
// ============================================================================

TEST(SemaTypeChecker, IntegerWidthsMixFreely)
{
  TestModule m;
  EXPECT_TRUE(m.resolve(R"(
    void f() {
      u8 small <- 3;
      u32 wide <- small;
      i64 signed_wide <- wide + small;
      f32 ratio <- wide;
    }
  )"));
}

TEST(SemaTypeChecker, BoolFromIntegerIsRejected)
{
  TestModule m;
  EXPECT_FALSE(m.resolve(R"(
    void f() {
      bool b <- 1;
    }
  )"));
  EXPECT_TRUE(m.diags.has_code("E0304"));
}

TEST(SemaTypeChecker, IntegerFromFloatIsRejectedWithCastHint)
{
  TestModule m;
  EXPECT_FALSE(m.resolve(R"(
    void f(f32 x) {
      u32 n <- x;
    }
  )"));
  ASSERT_TRUE(m.diags.has_code("E0304"));
  bool hint = false;
  for (const auto & d : m.diags) {
    if (d.help_message && d.help_message->find("(u32)") != std::string::npos) {
      hint = true;
    }
  }
  EXPECT_TRUE(hint);
}

TEST(SemaTypeChecker, ExplicitCastIsAccepted)
{
  TestModule m;
  EXPECT_TRUE(m.resolve(R"(
    void f(f32 x) {
      u32 n <- (u32)x;
    }
  )"));
}

TEST(SemaTypeChecker, ConditionMustBeBool)
{
  TestModule m;
  EXPECT_FALSE(m.resolve(R"(
    void f(u32 v) {
      if (v) { }
    }
  )"));
  EXPECT_TRUE(m.diags.has_code("E0304"));
}

TEST(SemaTypeChecker, ComparisonConditionIsAccepted)
{
  TestModule m;
  EXPECT_TRUE(m.resolve(R"(
    void f(u32 v) {
      while (v != 0) {
        v -<- 1;
      }
    }
  )"));
}

TEST(SemaTypeChecker, ConstLocalNeedsInitializer)
{
  TestModule m;
  EXPECT_FALSE(m.resolve(R"(
    void f() {
      const u32 limit;
    }
  )"));
  EXPECT_TRUE(m.diags.has_code("E0304"));
}

// ============================================================================
// Returns and calls
// ============================================================================

TEST(SemaTypeChecker, VoidFunctionCannotReturnValue)
{
  TestModule m;
  EXPECT_FALSE(m.resolve(R"(
    void f() {
      return 1;
    }
  )"));
  EXPECT_TRUE(m.diags.has_code("E0304"));
}

TEST(SemaTypeChecker, WrongArgumentCountIsReported)
{
  TestModule m;
  EXPECT_FALSE(m.resolve(R"(
    u32 add(u32 a, u32 b) {
      return a + b;
    }
    u32 f() {
      return add(1);
    }
  )"));
  EXPECT_EQ(m.diags.count_code("E0307"), 1U);
}

TEST(SemaTypeChecker, VariadicForeignCallAcceptsExtraArguments)
{
  TestModule m;
  m.add_system_header("stdio.h");
  EXPECT_TRUE(m.resolve(R"(
    void f(u32 v) {
      printf("%u %u\n", v, v);
    }
  )"));
}

// ============================================================================
// Aggregates
// ============================================================================

TEST(SemaTypeChecker, StructLiteralFieldsAreChecked)
{
  TestModule m;
  EXPECT_TRUE(m.resolve(R"(
    struct Point { i32 x; i32 y; }
    void f() {
      Point p <- {x: 1, y: -2};
    }
  )"));

  TestModule bad;
  EXPECT_FALSE(bad.resolve(R"(
    struct Point { i32 x; i32 y; }
    void f() {
      Point p <- {x: 1, z: 2};
    }
  )"));
  EXPECT_TRUE(bad.diags.has_code("E0304"));
}

TEST(SemaTypeChecker, ArrayLiteralLongerThanArrayIsRejected)
{
  TestModule m;
  EXPECT_FALSE(m.resolve(R"(
    void f() {
      u8 buf[2] <- [1, 2, 3];
    }
  )"));
  EXPECT_TRUE(m.diags.has_code("E0304"));
}

TEST(SemaTypeChecker, ArraysCannotBeCopied)
{
  TestModule m;
  EXPECT_FALSE(m.resolve(R"(
    void f() {
      u8 a[4] <- [1, 2, 3, 4];
      u8 b[4] <- [0];
      b <- a;
    }
  )"));
  EXPECT_TRUE(m.diags.has_code("E0304"));
}

TEST(SemaTypeChecker, StringLiteralMustFitCapacity)
{
  TestModule m;
  EXPECT_TRUE(m.resolve(R"(
    void f() {
      string<5> s <- "hello";
    }
  )"));

  TestModule bad;
  EXPECT_FALSE(bad.resolve(R"(
    void f() {
      string<4> s <- "hello";
    }
  )"));
  EXPECT_EQ(bad.diags.count_code("E0306"), 1U);
}

TEST(SemaTypeChecker, BitmapWidthsMustFillTheBitmap)
{
  TestModule m;
  EXPECT_TRUE(m.resolve(R"(
    bitmap8 Status { ready, error, mode[3], count[3] }
    bool is_ready(Status s) {
      return s.ready;
    }
  )"));

  TestModule bad;
  EXPECT_FALSE(bad.resolve("bitmap8 Status { ready, mode[3] }\n"));
  EXPECT_TRUE(bad.diags.has_code("E0305"));
}

TEST(SemaTypeChecker, EnumsDoNotMix)
{
  TestModule m;
  EXPECT_FALSE(m.resolve(R"(
    enum Color { Red, Green }
    enum Shape { Circle, Square }
    void f() {
      Color c <- Shape.Circle;
    }
  )"));
  EXPECT_TRUE(m.diags.has_code("E0304"));
}

TEST(SemaTypeChecker, StdintLimitMacrosTakeTheirCType)
{
  TestModule m;
  m.add_system_header("stdint.h");
  EXPECT_TRUE(m.analyze(R"(
    u32 top() {
      return UINT32_MAX;
    }
    i64 bottom() {
      return INT64_MIN;
    }
    u64 widest() {
      return UINT64_MAX;
    }
  )"));
}
