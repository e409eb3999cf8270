// tests/unit/sema/test_name_resolver.cpp - Unit tests for name resolution
//
#include <gtest/gtest.h>

#include <string>

#include "cnext/basic/casting.hpp"
#include "cnext/test_support/parse_helpers.hpp"

using cnext::test_support::TestModule;

// ============================================================================
// Definition order
// ============================================================================

TEST(SemaNameResolver, DefinitionsAboveUseResolve)
{
  TestModule m;
  EXPECT_TRUE(m.resolve(R"(
    u32 limit <- 10;
    u32 clamp(u32 v) {
      if (v > limit) { return limit; }
      return v;
    }
    u32 twice(u32 v) {
      return clamp(v) * 2;
    }
  )"));
  EXPECT_FALSE(m.diags.has_errors());
}

TEST(SemaNameResolver, CallBeforeDefinitionIsRejected)
{
  TestModule m;
  EXPECT_FALSE(m.resolve(R"(
    u32 first() {
      return second();
    }
    u32 second() {
      return 1;
    }
  )"));
  EXPECT_EQ(m.diags.count_code("E0421"), 1U);
}

TEST(SemaNameResolver, TypeBeforeDefinitionIsRejected)
{
  TestModule m;
  EXPECT_FALSE(m.resolve(R"(
    Point origin;
    struct Point { i32 x; i32 y; }
  )"));
  EXPECT_TRUE(m.diags.has_code("E0421"));
}

TEST(SemaNameResolver, RecursionIsRejected)
{
  TestModule m;
  EXPECT_FALSE(m.resolve(R"(
    u32 fact(u32 n) {
      if (n = 0) { return 1; }
      return n * fact(n - 1);
    }
  )"));
  ASSERT_TRUE(m.diags.has_code("E0421"));
  bool mentions_recursion = false;
  for (const auto & d : m.diags) {
    if (d.code == "E0421" && d.message.find("recursion") != std::string::npos) {
      mentions_recursion = true;
    }
  }
  EXPECT_TRUE(mentions_recursion);
}

TEST(SemaNameResolver, UnknownIdentifierIsReported)
{
  TestModule m;
  EXPECT_FALSE(m.resolve(R"(
    u32 f() {
      return missing;
    }
  )"));
  EXPECT_TRUE(m.diags.has_code("E0420"));
}

TEST(SemaNameResolver, UnknownTypeIsReported)
{
  TestModule m;
  EXPECT_FALSE(m.resolve("Widget w;\n"));
  EXPECT_TRUE(m.diags.has_code("E0303"));
}

TEST(SemaNameResolver, LocalsGoOutOfScopeWithTheirBlock)
{
  TestModule m;
  EXPECT_FALSE(m.resolve(R"(
    u32 f(bool c) {
      if (c) {
        u32 inner <- 1;
      }
      return inner;
    }
  )"));
  EXPECT_TRUE(m.diags.has_code("E0420"));
}

// ============================================================================
// Scopes
// ============================================================================

TEST(SemaNameResolver, ScopeMembersUseThisPrefix)
{
  TestModule m;
  ASSERT_TRUE(m.resolve(R"(
    scope Motor {
      u32 speed <- 0;
      public void set(u32 v) {
        this.speed <- v;
      }
      public u32 get() {
        return this.speed;
      }
    }
    void run() {
      Motor.set(3);
    }
  )"));
}

TEST(SemaNameResolver, BareScopeMemberIsRejected)
{
  TestModule m;
  EXPECT_FALSE(m.resolve(R"(
    scope Motor {
      u32 speed <- 0;
      public void set(u32 v) {
        speed <- v;
      }
    }
  )"));
  EXPECT_TRUE(m.diags.has_code("E0423"));
}

TEST(SemaNameResolver, BareGlobalInsideScopeIsRejected)
{
  TestModule m;
  EXPECT_FALSE(m.resolve(R"(
    u32 ticks <- 0;
    scope Clock {
      public u32 now() {
        return ticks;
      }
    }
  )"));
  EXPECT_TRUE(m.diags.has_code("E0423"));
}

TEST(SemaNameResolver, GlobalPrefixInsideScopeResolves)
{
  TestModule m;
  EXPECT_TRUE(m.resolve(R"(
    u32 ticks <- 0;
    scope Clock {
      public u32 now() {
        return global.ticks;
      }
    }
  )"));
}

TEST(SemaNameResolver, PrivateScopeMemberIsHiddenOutside)
{
  TestModule m;
  EXPECT_FALSE(m.resolve(R"(
    scope Motor {
      u32 speed <- 0;
    }
    u32 peek() {
      return Motor.speed;
    }
  )"));
  EXPECT_TRUE(m.diags.has_code("E0422"));
}

TEST(SemaNameResolver, ThisOutsideScopeIsRejected)
{
  TestModule m;
  EXPECT_FALSE(m.resolve(R"(
    u32 x <- 0;
    u32 f() {
      return this.x;
    }
  )"));
  EXPECT_TRUE(m.diags.has_code("E0420"));
}

TEST(SemaNameResolver, ScopeMembersAreFlattenedInC)
{
  TestModule m;
  ASSERT_TRUE(m.resolve(R"(
    scope Motor {
      public u32 speed <- 0;
    }
  )"));
  const auto * scope = cnext::dyn_cast<cnext::ScopeDecl>(m.program()->decls[0]);
  ASSERT_NE(scope, nullptr);
  const auto * speed = cnext::dyn_cast<cnext::GlobalVarDecl>(scope->members[0]);
  ASSERT_NE(speed, nullptr);
  EXPECT_EQ(speed->cName, "Motor_speed");
}

// ============================================================================
// Enums
// ============================================================================

TEST(SemaNameResolver, UnqualifiedEnumMemberSuggestsQualifiedName)
{
  TestModule m;
  EXPECT_FALSE(m.resolve(R"(
    enum Color { Red, Green }
    Color pick() {
      return Red;
    }
  )"));
  ASSERT_TRUE(m.diags.has_code("E0424"));
  bool suggests = false;
  for (const auto & d : m.diags) {
    if (d.code == "E0424" && d.help_message && d.help_message->find("Color.Red") != std::string::npos) {
      suggests = true;
    }
  }
  EXPECT_TRUE(suggests);
}

TEST(SemaNameResolver, UnknownEnumMemberIsReported)
{
  TestModule m;
  EXPECT_FALSE(m.resolve(R"(
    enum Color { Red, Green }
    Color pick() {
      return Color.Blue;
    }
  )"));
  EXPECT_TRUE(m.diags.has_code("E0420"));
}

TEST(SemaNameResolver, ForeignEnumeratorsStayUnqualified)
{
  TestModule m;
  m.add_c_header("modes.h", "typedef enum { MODE_OFF, MODE_ON } mode_t;\n");
  EXPECT_TRUE(m.resolve(R"(
    mode_t current() {
      return MODE_ON;
    }
  )"));
}

// ============================================================================
// Foreign symbols
// ============================================================================

TEST(SemaNameResolver, ForeignFunctionIsCallable)
{
  TestModule m;
  m.add_c_header("hal.h", "void hal_init(void);\nint hal_read(int channel);\n");
  EXPECT_TRUE(m.resolve(R"(
    void setup() {
      hal_init();
      i32 v <- hal_read(2);
    }
  )"));
}

TEST(SemaNameResolver, NamespacedCppSymbolIsRejected)
{
  TestModule m;
  m.add_cpp_header("driver.hpp", "namespace drv {\nint read_pin(int pin);\n}\n");
  EXPECT_FALSE(m.resolve(R"(
    void f() {
      i32 v <- drv::read_pin(1);
    }
  )"));
  EXPECT_TRUE(m.diags.has_code("E0425"));
}
