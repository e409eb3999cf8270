// tests/unit/sema/test_const_checker.cpp - Unit tests for const checking
//
// Covers explicit const violations and the parameter mutability inference
// that decides which parameters are emitted const.
//
#include <gtest/gtest.h>

#include <string>

#include "cnext/basic/casting.hpp"
#include "cnext/test_support/parse_helpers.hpp"

using namespace cnext;
using cnext::test_support::TestModule;

namespace
{

const FunctionDecl * find_function(const Program * program, std::string_view name)
{
  for (const Decl * d : program->decls) {
    if (const auto * fn = dyn_cast<FunctionDecl>(d); fn != nullptr && fn->name == name) {
      return fn;
    }
  }
  return nullptr;
}

}  // namespace

// ============================================================================
// Explicit const
// ============================================================================

TEST(SemaConstChecker, AssignToConstLocalIsRejected)
{
  TestModule m;
  EXPECT_FALSE(m.analyze(R"(
    void f() {
      const u8 limit <- 3;
      limit <- 4;
    }
  )"));
  EXPECT_EQ(m.diags.count_code("E0384"), 1U);
}

TEST(SemaConstChecker, CompoundAssignToConstParameterIsRejected)
{
  TestModule m;
  EXPECT_FALSE(m.analyze(R"(
    void f(const u32 n) {
      n +<- 1;
    }
  )"));
  EXPECT_TRUE(m.diags.has_code("E0384"));
}

TEST(SemaConstChecker, WriteThroughElementOfConstArrayIsRejected)
{
  TestModule m;
  EXPECT_FALSE(m.analyze(R"(
    const u8 table[4] <- [1, 2, 3, 4];
    void f() {
      table[0] <- 9;
    }
  )"));
  EXPECT_TRUE(m.diags.has_code("E0384"));
}

TEST(SemaConstChecker, BitWriteToConstIsRejected)
{
  TestModule m;
  EXPECT_FALSE(m.analyze(R"(
    void f() {
      const u8 flags <- 0;
      flags[3] <- true;
    }
  )"));
  EXPECT_TRUE(m.diags.has_code("E0384"));
}

TEST(SemaConstChecker, ConstPassedToMutatingParameterIsRejected)
{
  TestModule m;
  EXPECT_FALSE(m.analyze(R"(
    void bump(u32 v) {
      v +<- 1;
    }
    void f() {
      const u32 x <- 1;
      bump(x);
    }
  )"));
  EXPECT_TRUE(m.diags.has_code("E0384"));
}

// ============================================================================
// Parameter inference
// ============================================================================

TEST(SemaConstChecker, NeverAssignedParameterStaysImmutable)
{
  TestModule m;
  ASSERT_TRUE(m.analyze(R"(
    u32 twice(u32 v) {
      return v * 2;
    }
  )"));
  const FunctionDecl * fn = find_function(m.program(), "twice");
  ASSERT_NE(fn, nullptr);
  EXPECT_FALSE(fn->params[0]->isMutated);
}

TEST(SemaConstChecker, DirectlyAssignedParameterIsMutable)
{
  TestModule m;
  ASSERT_TRUE(m.analyze(R"(
    void reset(u32 v) {
      v <- 0;
    }
  )"));
  EXPECT_TRUE(find_function(m.program(), "reset")->params[0]->isMutated);
}

TEST(SemaConstChecker, MutationThroughEarlierCalleeIsTransitive)
{
  TestModule m;
  ASSERT_TRUE(m.analyze(R"(
    void reset(u32 v) {
      v <- 0;
    }
    void forward(u32 w) {
      reset(w);
    }
    void observe(u32 z) {
      forward(z);
    }
  )"));
  EXPECT_TRUE(find_function(m.program(), "forward")->params[0]->isMutated);
  EXPECT_TRUE(find_function(m.program(), "observe")->params[0]->isMutated);
}

TEST(SemaConstChecker, FieldWriteMarksStructParameterMutable)
{
  TestModule m;
  ASSERT_TRUE(m.analyze(R"(
    struct Config {
      u16 rate;
    }
    void configure(Config cfg) {
      cfg.rate <- 100;
    }
    u16 rate_of(Config cfg) {
      return cfg.rate;
    }
  )"));
  EXPECT_TRUE(find_function(m.program(), "configure")->params[0]->isMutated);
  EXPECT_FALSE(find_function(m.program(), "rate_of")->params[0]->isMutated);
}
