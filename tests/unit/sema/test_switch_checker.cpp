// tests/unit/sema/test_switch_checker.cpp - Unit tests for switch exhaustiveness
//
#include <gtest/gtest.h>

#include <string>

#include "cnext/test_support/parse_helpers.hpp"

using cnext::test_support::TestModule;

namespace
{

const char * const k_four_states = R"(
  enum State { Idle, Run, Stop, Fault }
)";

const char * const k_five_states = R"(
  enum State { Idle, Run, Stop, Fault, Reset }
)";

std::string with_switch(const char * enum_decl, const std::string & body)
{
  return std::string(enum_decl) + "\nu8 code(State s) {\n  u8 out <- 0;\n  switch (s) {\n" +
         body + "\n  }\n  return out;\n}\n";
}

const char * const k_three_cases = R"(
    case State.Idle { out <- 1; }
    case State.Run { out <- 2; }
    case State.Stop { out <- 3; }
)";

}  // namespace

// ============================================================================
// Enum switches
// ============================================================================

TEST(SemaSwitchChecker, EveryVariantCoveredIsAccepted)
{
  TestModule m;
  EXPECT_TRUE(m.analyze(with_switch(k_four_states, std::string(k_three_cases) +
                                                     "case State.Fault { out <- 4; }")));
}

TEST(SemaSwitchChecker, ThreeCasesPlusDefaultOfOneIsAccepted)
{
  TestModule m;
  EXPECT_TRUE(
    m.analyze(with_switch(k_four_states, std::string(k_three_cases) + "default(1) { out <- 9; }")));
}

TEST(SemaSwitchChecker, ThreeCasesPlusDefaultOfTwoIsRejected)
{
  TestModule m;
  EXPECT_FALSE(
    m.analyze(with_switch(k_four_states, std::string(k_three_cases) + "default(2) { out <- 9; }")));
  EXPECT_EQ(m.diags.count_code("E0802"), 1U);
}

TEST(SemaSwitchChecker, DefaultOfOneWithFiveVariantsIsRejected)
{
  TestModule m;
  EXPECT_FALSE(
    m.analyze(with_switch(k_five_states, std::string(k_three_cases) + "default(1) { out <- 9; }")));
  EXPECT_TRUE(m.diags.has_code("E0802"));
}

TEST(SemaSwitchChecker, MissingVariantWithoutDefaultIsRejected)
{
  TestModule m;
  EXPECT_FALSE(m.analyze(with_switch(k_four_states, k_three_cases)));
  EXPECT_TRUE(m.diags.has_code("E0801"));
  bool names_missing = false;
  for (const auto & d : m.diags) {
    if (d.code == "E0801" && d.message.find("State.Fault") != std::string::npos) {
      names_missing = true;
    }
  }
  EXPECT_TRUE(names_missing);
}

TEST(SemaSwitchChecker, OrGroupedLabelsCountOncePerVariant)
{
  TestModule m;
  EXPECT_TRUE(m.analyze(with_switch(k_four_states, R"(
    case State.Idle || State.Stop { out <- 1; }
    case State.Run { out <- 2; }
    default(1) { out <- 3; }
  )")));
}

TEST(SemaSwitchChecker, PlainDefaultOnEnumIsRejected)
{
  TestModule m;
  EXPECT_FALSE(
    m.analyze(with_switch(k_four_states, std::string(k_three_cases) + "default { out <- 9; }")));
  EXPECT_TRUE(m.diags.has_code("E0804"));
}

TEST(SemaSwitchChecker, DefaultAfterFullCoverageIsRejected)
{
  TestModule m;
  EXPECT_FALSE(m.analyze(with_switch(
    k_four_states,
    std::string(k_three_cases) + "case State.Fault { out <- 4; }\n default(1) { out <- 9; }")));
  EXPECT_TRUE(m.diags.has_code("E0805"));
}

TEST(SemaSwitchChecker, DuplicateVariantIsRejected)
{
  TestModule m;
  EXPECT_FALSE(m.analyze(with_switch(k_four_states, R"(
    case State.Idle || State.Run { out <- 1; }
    case State.Run { out <- 2; }
    default(2) { out <- 3; }
  )")));
  EXPECT_TRUE(m.diags.has_code("E0803"));
}

// ============================================================================
// Integer switches
// ============================================================================

TEST(SemaSwitchChecker, IntegerSwitchNeedsDefault)
{
  TestModule m;
  EXPECT_FALSE(m.analyze(R"(
    u8 f(u8 v) {
      u8 out <- 0;
      switch (v) {
        case 1 { out <- 10; }
        case 2 || 3 { out <- 20; }
      }
      return out;
    }
  )"));
  EXPECT_TRUE(m.diags.has_code("E0801"));
}

TEST(SemaSwitchChecker, IntegerSwitchWithDefaultIsAccepted)
{
  TestModule m;
  EXPECT_TRUE(m.analyze(R"(
    u8 f(u8 v) {
      u8 out <- 0;
      switch (v) {
        case 1 { out <- 10; }
        case 2 || 3 { out <- 20; }
        default { out <- 30; }
      }
      return out;
    }
  )"));
}

TEST(SemaSwitchChecker, CountedDefaultOnIntegerSwitchIsRejected)
{
  TestModule m;
  EXPECT_FALSE(m.analyze(R"(
    void f(u8 v) {
      switch (v) {
        case 1 { }
        default(3) { }
      }
    }
  )"));
  EXPECT_TRUE(m.diags.has_code("E0806"));
}

TEST(SemaSwitchChecker, DuplicateIntegerLabelIsRejected)
{
  TestModule m;
  EXPECT_FALSE(m.analyze(R"(
    void f(u8 v) {
      switch (v) {
        case 1 || 0x1 { }
        default { }
      }
    }
  )"));
  EXPECT_TRUE(m.diags.has_code("E0803"));
}
