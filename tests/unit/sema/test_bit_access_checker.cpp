// tests/unit/sema/test_bit_access_checker.cpp - Unit tests for bit and slice access
//
#include <gtest/gtest.h>

#include <string>

#include "cnext/test_support/parse_helpers.hpp"

using cnext::test_support::TestModule;

// ============================================================================
// Bit index / bit range
// ============================================================================

TEST(SemaBitAccess, BitsInsideWidthAreAccepted)
{
  TestModule m;
  EXPECT_TRUE(m.analyze(R"(
    void f() {
      u8 flags <- 0;
      flags[7] <- true;
      flags[0, 4] <- 5;
      u32 word <- 0;
      word[31] <- false;
      word[8, 24] <- 1;
    }
  )"));
}

TEST(SemaBitAccess, BitIndexBeyondWidthIsRejected)
{
  TestModule m;
  EXPECT_FALSE(m.analyze(R"(
    bool f(u8 flags) {
      return flags[8];
    }
  )"));
  EXPECT_EQ(m.diags.count_code("E0601"), 1U);
}

TEST(SemaBitAccess, BitRangeBeyondWidthIsRejected)
{
  TestModule m;
  EXPECT_FALSE(m.analyze(R"(
    void f() {
      u16 reg <- 0;
      reg[12, 8] <- 1;
    }
  )"));
  EXPECT_TRUE(m.diags.has_code("E0602"));
}

TEST(SemaBitAccess, ZeroWidthRangeIsRejected)
{
  TestModule m;
  EXPECT_FALSE(m.analyze(R"(
    u16 f(u16 reg) {
      return reg[3, 0];
    }
  )"));
  EXPECT_TRUE(m.diags.has_code("E0602"));
}

TEST(SemaBitAccess, BitAccessOnFloatIsRejected)
{
  TestModule m;
  EXPECT_FALSE(m.analyze(R"(
    void f() {
      f32 x <- 1.5;
      bool b <- x[0];
    }
  )"));
  EXPECT_TRUE(m.diags.has_code("E0603"));
}

TEST(SemaBitAccess, VariableBitIndexIsCheckedAtRunTimeOnly)
{
  TestModule m;
  EXPECT_TRUE(m.analyze(R"(
    bool f(u32 word, u8 bit) {
      return word[bit];
    }
  )"));
}

// ============================================================================
// Slices
// ============================================================================

TEST(SemaBitAccess, SliceWithinArrayIsAccepted)
{
  TestModule m;
  EXPECT_TRUE(m.analyze(R"(
    void f() {
      u8 packet[8];
      u32 value <- 7;
      packet[2, 4] <- value;
    }
  )"));
}

TEST(SemaBitAccess, SliceOverrunIsRejected)
{
  TestModule m;
  EXPECT_FALSE(m.analyze(R"(
    void f() {
      u8 packet[8];
      u32 value <- 7;
      packet[6, 4] <- value;
    }
  )"));
  EXPECT_TRUE(m.diags.has_code("E0605"));
}

TEST(SemaBitAccess, SliceLongerThanSourceIsRejected)
{
  TestModule m;
  EXPECT_FALSE(m.analyze(R"(
    void f() {
      u8 buf[8];
      u32 v <- 5;
      buf[0, 8] <- v;
    }
  )"));
  EXPECT_EQ(m.diags.count_code("E0605"), 1u);
}

TEST(SemaBitAccess, SliceOfWholeSourceIsAccepted)
{
  TestModule m;
  EXPECT_TRUE(m.analyze(R"(
    void f() {
      u8 buf[8];
      u32 v <- 5;
      buf[4, 4] <- v;
    }
  )"));
}

TEST(SemaBitAccess, SliceOfMultiDimensionalArrayIsRejected)
{
  TestModule m;
  EXPECT_FALSE(m.analyze(R"(
    void f() {
      u8 g[2][4];
      u32 v <- 5;
      g[4, 4] <- v;
    }
  )"));
  EXPECT_TRUE(m.diags.has_code("E0605"));
}

TEST(SemaBitAccess, SliceOfInnerRowIsAccepted)
{
  TestModule m;
  EXPECT_TRUE(m.analyze(R"(
    void f() {
      u8 g[2][4];
      u32 v <- 5;
      g[1][0, 4] <- v;
    }
  )"));
}

TEST(SemaBitAccess, NonConstantSliceIsRejected)
{
  TestModule m;
  EXPECT_FALSE(m.analyze(R"(
    void f(u32 offset) {
      u8 packet[8];
      u16 value <- 7;
      packet[offset, 2] <- value;
    }
  )"));
  EXPECT_TRUE(m.diags.has_code("E0604"));
}

TEST(SemaBitAccess, SliceReadIsRejected)
{
  TestModule m;
  EXPECT_FALSE(m.analyze(R"(
    void f() {
      u8 packet[8];
      u16 value <- packet[0, 2];
    }
  )"));
  EXPECT_TRUE(m.diags.has_code("E0606"));
}

TEST(SemaBitAccess, ConstantIndexOutOfBoundsIsRejected)
{
  TestModule m;
  EXPECT_FALSE(m.analyze(R"(
    void f() {
      u8 packet[8];
      packet[8] <- 1;
    }
  )"));
  EXPECT_TRUE(m.diags.has_code("E0607"));
}
