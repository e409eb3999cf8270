// tests/unit/sema/test_division_checker.cpp - Unit tests for constant division by zero
//
#include <gtest/gtest.h>

#include "cnext/test_support/parse_helpers.hpp"

using cnext::test_support::TestModule;

TEST(SemaDivisionChecker, DivisionByLiteralZeroIsRejected)
{
  TestModule m;
  EXPECT_FALSE(m.analyze(R"(
    u32 f(u32 a) {
      return a / 0;
    }
  )"));
  EXPECT_EQ(m.diags.count_code("E0703"), 1U);
}

TEST(SemaDivisionChecker, ModuloByLiteralZeroIsRejected)
{
  TestModule m;
  EXPECT_FALSE(m.analyze(R"(
    u32 f(u32 a) {
      u32 r <- a % 0;
      return r;
    }
  )"));
  EXPECT_EQ(m.diags.count_code("E0703"), 1U);
}

TEST(SemaDivisionChecker, ConstZeroDivisorIsRejected)
{
  TestModule m;
  EXPECT_FALSE(m.analyze(R"(
    const u32 ZERO <- 0;
    u32 f(u32 a) {
      const u32 none <- ZERO;
      u32 x <- a / ZERO;
      return x + (a % none);
    }
  )"));
  EXPECT_EQ(m.diags.count_code("E0703"), 2U);
}

TEST(SemaDivisionChecker, CompoundDivisionByZeroIsRejected)
{
  TestModule m;
  EXPECT_FALSE(m.analyze(R"(
    void f() {
      u32 x <- 10;
      x /<- 0;
      x %<- 0;
    }
  )"));
  EXPECT_EQ(m.diags.count_code("E0703"), 2U);
}

TEST(SemaDivisionChecker, FoldedZeroDivisorIsRejected)
{
  TestModule m;
  EXPECT_FALSE(m.analyze(R"(
    u32 f(u32 a) {
      return a / (4 - 4);
    }
  )"));
  EXPECT_TRUE(m.diags.has_code("E0703"));
}

TEST(SemaDivisionChecker, NonZeroAndRuntimeDivisorsAreAccepted)
{
  TestModule m;
  EXPECT_TRUE(m.analyze(R"(
    const u32 TWO <- 2;
    u32 f(u32 a, u32 b) {
      u32 x <- a / TWO;
      return (x % 3) + (a / b);
    }
  )"));
  EXPECT_FALSE(m.diags.has_code("E0703"));
}
