// tests/unit/sema/test_init_checker.cpp - Unit tests for definite initialization
//
// Tests the InitializationChecker which verifies that local variables are
// assigned on every path before they are read.
//
#include <gtest/gtest.h>

#include <string>

#include "cnext/test_support/parse_helpers.hpp"

using cnext::test_support::TestModule;

// ============================================================================
// Basic
// ============================================================================

TEST(SemaInitChecker, InitializedDeclarationIsReadable)
{
  TestModule m;
  EXPECT_TRUE(m.analyze(R"(
    u32 f() {
      u32 x <- 4;
      return x;
    }
  )"));
}

TEST(SemaInitChecker, ReadBeforeAssignmentIsRejected)
{
  TestModule m;
  EXPECT_FALSE(m.analyze(R"(
    u32 f() {
      u32 x;
      return x;
    }
  )"));
  EXPECT_EQ(m.diags.count_code("E0381"), 1U);
}

TEST(SemaInitChecker, AssignmentBeforeReadIsAccepted)
{
  TestModule m;
  EXPECT_TRUE(m.analyze(R"(
    u32 f() {
      u32 x;
      x <- 7;
      return x + 1;
    }
  )"));
}

// ============================================================================
// Control flow joins
// ============================================================================

TEST(SemaInitChecker, IfWithoutElseLeavesVariableUninitialized)
{
  TestModule m;
  EXPECT_FALSE(m.analyze(R"(
    u32 f(bool flag) {
      u32 x;
      if (flag) {
        x <- 1;
      }
      return x;
    }
  )"));
  EXPECT_TRUE(m.diags.has_code("E0381"));
}

TEST(SemaInitChecker, AssignedInBothBranchesIsAccepted)
{
  TestModule m;
  EXPECT_TRUE(m.analyze(R"(
    u32 f(bool flag) {
      u32 x;
      if (flag) {
        x <- 1;
      } else {
        x <- 2;
      }
      return x;
    }
  )"));
}

TEST(SemaInitChecker, LoopBodyAssignmentDoesNotCountAfterLoop)
{
  TestModule m;
  EXPECT_FALSE(m.analyze(R"(
    u32 f(u32 n) {
      u32 x;
      u32 i <- 0;
      while (i < n) {
        x <- i;
        i +<- 1;
      }
      return x;
    }
  )"));
  EXPECT_TRUE(m.diags.has_code("E0381"));
}

TEST(SemaInitChecker, DoWhileBodyRunsAtLeastOnce)
{
  TestModule m;
  EXPECT_TRUE(m.analyze(R"(
    u32 f(u32 n) {
      u32 x;
      u32 i <- 0;
      do {
        x <- i;
        i +<- 1;
      } while (i < n);
      return x;
    }
  )"));
}

TEST(SemaInitChecker, CompoundAssignmentReadsTheTarget)
{
  TestModule m;
  EXPECT_FALSE(m.analyze(R"(
    u32 f() {
      u32 x;
      x +<- 1;
      return x;
    }
  )"));
  EXPECT_TRUE(m.diags.has_code("E0381"));
}

// ============================================================================
// Structs and arrays
// ============================================================================

TEST(SemaInitChecker, StructFieldsAreTrackedSeparately)
{
  TestModule m;
  EXPECT_FALSE(m.analyze(R"(
    struct Point {
      i32 x;
      i32 y;
    }
    i32 f() {
      Point p;
      p.x <- 1;
      return p.y;
    }
  )"));
  EXPECT_EQ(m.diags.count_code("E0381"), 1U);
}

TEST(SemaInitChecker, AssignedFieldIsReadable)
{
  TestModule m;
  EXPECT_TRUE(m.analyze(R"(
    struct Point {
      i32 x;
      i32 y;
    }
    i32 f() {
      Point p;
      p.x <- 1;
      return p.x;
    }
  )"));
}

TEST(SemaInitChecker, ArraysAreZeroFilled)
{
  TestModule m;
  EXPECT_TRUE(m.analyze(R"(
    u8 f() {
      u8 buf[4];
      return buf[2];
    }
  )"));
}
