// tests/unit/codegen/test_c_generator.cpp - Unit tests for .c generation
//
#include <gtest/gtest.h>

#include <string>

#include "cnext/test_support/parse_helpers.hpp"

using cnext::test_support::TestModule;

static void expect_contains(const std::string & haystack, const std::string & needle)
{
  EXPECT_NE(haystack.find(needle), std::string::npos)
    << "Expected to find: " << needle << "\nIn output:\n"
    << haystack;
}

static void expect_not_contains(const std::string & haystack, const std::string & needle)
{
  EXPECT_EQ(haystack.find(needle), std::string::npos)
    << "Expected NOT to find: " << needle << "\nIn output:\n"
    << haystack;
}

static std::string generate_c(TestModule & m, const std::string & src)
{
  EXPECT_TRUE(m.analyze(src, "unit.cnx"));
  return m.c_source();
}

// ============================================================================
// File layout
// ============================================================================

TEST(CGenerator, IncludesOwnHeaderFirst)
{
  TestModule m;
  const std::string c = generate_c(m, "u32 counter <- 0;\n");
  expect_contains(c, "/* Generated by cnextc from unit.cnx. Do not edit. */\n#include \"unit.h\"");
  expect_contains(c, "uint32_t counter = 0U;");
}

TEST(CGenerator, EntryPointReturnsInt)
{
  TestModule m;
  const std::string c = generate_c(m, "void main() {\n}\n");
  expect_contains(c, "int main(void) {");
}

// ============================================================================
// Parameters and const inference
// ============================================================================

TEST(CGenerator, UnmodifiedScalarParamIsConstValue)
{
  TestModule m;
  const std::string c = generate_c(m, "u32 twice(u32 v) {\n  return v * 2;\n}\n");
  expect_contains(c, "uint32_t twice(const uint32_t v) {");
  expect_contains(c, "return v * 2U;");
}

TEST(CGenerator, ModifiedScalarParamIsPassedByPointer)
{
  TestModule m;
  const std::string c = generate_c(m, R"(
    void bump(u32 v) {
      v +<- 1;
    }
    void run() {
      u32 count <- 0;
      bump(count);
    }
  )");
  expect_contains(c, "void bump(uint32_t *v) {");
  expect_contains(c, "(*v) += 1U;");
  expect_contains(c, "bump(&count);");
}

TEST(CGenerator, StructParamIsConstPointerWhenUnmodified)
{
  TestModule m;
  const std::string c = generate_c(m, R"(
    struct Point { i32 x; i32 y; }
    i32 sum(Point p) {
      return p.x + p.y;
    }
  )");
  expect_contains(c, "int32_t sum(const Point *p) {");
}

TEST(CGenerator, ScopeMembersAreFlattenedAndPrivateOnesStatic)
{
  TestModule m;
  const std::string c = generate_c(m, R"(
    scope Motor {
      u32 speed <- 0;
      public void set(u32 v) {
        this.speed <- v;
      }
    }
  )");
  expect_contains(c, "static uint32_t Motor_speed = 0U;");
  expect_contains(c, "void Motor_set(const uint32_t v) {");
  expect_contains(c, "Motor_speed = v;");
  expect_not_contains(c, "static void Motor_set");
}

// ============================================================================
// Bits and boundaries
// ============================================================================

TEST(CGenerator, BitReadBecomesShiftAndMask)
{
  TestModule m;
  const std::string c = generate_c(m, R"(
    bool ready(u8 status) {
      return status[3];
    }
  )");
  expect_contains(c, "return ((status >> 3U) & 1U) != 0U;");
}

TEST(CGenerator, BitWriteClearsThenSetsTheBit)
{
  TestModule m;
  const std::string c = generate_c(m, R"(
    u8 with_flag() {
      u8 flags <- 0;
      flags[3] <- true;
      return flags;
    }
  )");
  expect_contains(c, "flags = (uint8_t)((flags & ~(1U << ");
}

TEST(CGenerator, BitRangeUsesWidthMask)
{
  TestModule m;
  const std::string c = generate_c(m, R"(
    u8 mode(u32 reg) {
      return reg[4, 3];
    }
  )");
  expect_contains(c, "0x7U");
}

TEST(CGenerator, BoundaryConstantsUseStdintMacros)
{
  TestModule m;
  const std::string c = generate_c(m, R"(
    void limits() {
      i32 lowest <- i32.MIN;
      u16 highest <- u16.MAX;
    }
  )");
  expect_contains(c, "int32_t lowest = INT32_MIN;");
  expect_contains(c, "uint16_t highest = UINT16_MAX;");
}

TEST(CGenerator, LengthOfScalarIsItsWidth)
{
  TestModule m;
  const std::string c = generate_c(m, R"(
    u32 width(u16 v) {
      return v.length;
    }
  )");
  expect_contains(c, "return 16U;");
}

// ============================================================================
// Statements
// ============================================================================

TEST(CGenerator, EnumSwitchAlwaysGetsDefault)
{
  TestModule m;
  const std::string c = generate_c(m, R"(
    enum Color { Red, Green }
    u8 code(Color c) {
      u8 out <- 0;
      switch (c) {
        case Color.Red { out <- 1; }
        case Color.Green { out <- 2; }
      }
      return out;
    }
  )");
  expect_contains(c, "switch (c) {");
  expect_contains(c, "case Color_Red: {");
  expect_contains(c, "default: {");
}

TEST(CGenerator, OrLabelsShareOneBody)
{
  TestModule m;
  const std::string c = generate_c(m, R"(
    u8 f(u8 v) {
      u8 out <- 0;
      switch (v) {
        case 1 || 2 { out <- 1; }
        default { out <- 9; }
      }
      return out;
    }
  )");
  expect_contains(c, "case 1U:\n");
  expect_contains(c, "case 2U: {");
}

TEST(CGenerator, BoundedStringAssignmentIsCopied)
{
  TestModule m;
  const std::string c = generate_c(m, R"(
    void names() {
      string<8> name <- "abc";
      name <- "xy";
    }
  )");
  expect_contains(c, "char name[9] = \"abc\";");
  expect_contains(c, "(void)memcpy(name, \"xy\", 3U);");
  expect_contains(c, "#include <string.h>");
}

TEST(CGenerator, UnusedReturnValueIsCastToVoid)
{
  TestModule m;
  m.add_system_header("stdio.h");
  const std::string c = generate_c(m, R"(
    void greet() {
      printf("hi\n");
    }
  )");
  expect_contains(c, "(void)printf(\"hi\\n\");");
}

// ============================================================================
// Overflow behaviour
// ============================================================================

TEST(CGenerator, CompoundAddOnIntegerClampsByDefault)
{
  TestModule m;
  const std::string c = generate_c(m, R"(
    u8 level <- 0;
    void raise() {
      level +<- 1;
    }
  )");
  expect_contains(c, "level = cnx_clamp_add_u8(level, 1U);");
  expect_contains(c, "static inline uint8_t cnx_clamp_add_u8(uint8_t a, uint8_t b) {");
  expect_contains(c, "return (b > (uint8_t)(UINT8_MAX - a)) ? UINT8_MAX : (uint8_t)(a + b);");
}

TEST(CGenerator, SignedClampHelperSaturatesBothWays)
{
  TestModule m;
  const std::string c = generate_c(m, R"(
    void trim() {
      i16 t <- 0;
      t -<- 5;
    }
  )");
  expect_contains(c, "t = cnx_clamp_sub_i16(t, 5);");
  expect_contains(c, "if (b < 0 && a > INT16_MAX + b) return INT16_MAX;");
  expect_contains(c, "if (b > 0 && a < INT16_MIN + b) return INT16_MIN;");
}

TEST(CGenerator, WrapModifierKeepsPlainCompoundAssignment)
{
  TestModule m;
  const std::string c = generate_c(m, R"(
    wrap u32 ticks <- 0;
    void tick() {
      wrap u16 local <- 0;
      ticks +<- 1;
      local *<- 3;
    }
  )");
  expect_contains(c, "ticks += 1U;");
  expect_contains(c, "local *= 3U;");
  expect_not_contains(c, "cnx_clamp_");
}

TEST(CGenerator, EachClampHelperIsEmittedOnce)
{
  TestModule m;
  const std::string c = generate_c(m, R"(
    void run() {
      u32 a <- 0;
      u32 b <- 0;
      a +<- 1;
      b +<- 2;
      a *<- 2;
    }
  )");
  const std::string sig = "static inline uint32_t cnx_clamp_add_u32(";
  const size_t first = c.find(sig);
  ASSERT_NE(first, std::string::npos) << c;
  EXPECT_EQ(c.find(sig, first + 1), std::string::npos) << c;
  expect_contains(c, "static inline uint32_t cnx_clamp_mul_u32(uint32_t a, uint32_t b) {");
}

TEST(CGenerator, FloatCompoundAssignmentIsNotClamped)
{
  TestModule m;
  const std::string c = generate_c(m, R"(
    void scale() {
      f32 gain <- 1.0;
      gain *<- 2.0;
    }
  )");
  expect_not_contains(c, "cnx_clamp_");
}

TEST(CGenerator, ConflictingOverflowModifiersAreRejected)
{
  TestModule m;
  EXPECT_FALSE(m.parse("wrap clamp u8 x <- 0;\n"));
}

TEST(CGenerator, OverflowModifierOnFunctionIsRejected)
{
  TestModule m;
  EXPECT_FALSE(m.parse("wrap u8 f() {\n  return 0;\n}\n"));
}

// ============================================================================
// Comments
// ============================================================================

TEST(CGenerator, CommentsAreCopiedBeforeTheirDeclarations)
{
  TestModule m;
  const std::string c = generate_c(m, R"(// Tick counter
u32 ticks <- 0;

/* Advances the counter.
 * Called from the timer interrupt. */
void tick() {
  // one step
  ticks +<- 1;
  // trailing note
}
)");
  expect_contains(c, "// Tick counter\nuint32_t ticks = 0U;");
  expect_contains(c, "/* Advances the counter.\n * Called from the timer interrupt. */\nvoid tick(void) {");
  expect_contains(c, "    // one step\n    ticks = cnx_clamp_add_u32(ticks, 1U);");
  expect_contains(c, "    // trailing note\n}");
}

TEST(CGenerator, TypeCommentsStayOutOfTheSourceFile)
{
  TestModule m;
  const std::string c = generate_c(m, R"(// Motor state
struct Motor {
  u32 speed; // rpm
}
void run() {
}
)");
  expect_not_contains(c, "Motor state");
  expect_not_contains(c, "rpm");
  EXPECT_NE(m.c_header().find("// Motor state\ntypedef struct Motor {"), std::string::npos)
    << m.c_header();
}
