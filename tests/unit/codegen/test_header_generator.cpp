// tests/unit/codegen/test_header_generator.cpp - Unit tests for .h generation
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

TEST(HeaderGenerator, GuardAndStandardIncludes)
{
  TestModule m;
  ASSERT_TRUE(m.analyze("u32 counter <- 0;\n", "motor-ctl.cnx"));
  const std::string h = m.c_header();
  expect_contains(h, "#ifndef MOTOR_CTL_H\n#define MOTOR_CTL_H");
  expect_contains(h, "#include <stdint.h>");
  expect_contains(h, "#include <stdbool.h>");
  expect_contains(h, "#endif /* MOTOR_CTL_H */");
  expect_contains(h, "extern uint32_t counter;");
}

TEST(HeaderGenerator, PrototypeConstMatchesDefinition)
{
  TestModule m;
  ASSERT_TRUE(m.analyze(R"(
    u32 twice(u32 v) {
      return v * 2;
    }
    void bump(u32 v) {
      v +<- 1;
    }
  )"));
  const std::string h = m.c_header();
  const std::string c = m.c_source();

  expect_contains(h, "uint32_t twice(const uint32_t v);");
  expect_contains(c, "uint32_t twice(const uint32_t v) {");
  expect_contains(h, "void bump(uint32_t *v);");
  expect_contains(c, "void bump(uint32_t *v) {");
}

TEST(HeaderGenerator, PrivateScopeMembersStayOut)
{
  TestModule m;
  ASSERT_TRUE(m.analyze(R"(
    scope Motor {
      u32 speed <- 0;
      void apply() {
      }
      public void stop() {
        this.speed <- 0;
        this.apply();
      }
    }
  )"));
  const std::string h = m.c_header();
  expect_contains(h, "void Motor_stop(void);");
  expect_not_contains(h, "Motor_speed");
  expect_not_contains(h, "Motor_apply");
}

TEST(HeaderGenerator, EntryPointHasNoPrototype)
{
  TestModule m;
  ASSERT_TRUE(m.analyze("void main() {\n}\n"));
  expect_not_contains(m.c_header(), "main(");
}

TEST(HeaderGenerator, TypesAreDeclared)
{
  TestModule m;
  ASSERT_TRUE(m.analyze(R"(
    struct Point { i32 x; i32 y; }
    enum Color { Red, Green <- 5, Blue }
    bitmap8 Status { ready, error, mode[3], count[3] }
  )"));
  const std::string h = m.c_header();
  expect_contains(h, "typedef struct Point {\n    int32_t x;\n    int32_t y;\n} Point;");
  expect_contains(h, "Color_Red = 0,");
  expect_contains(h, "Color_Green = 5,");
  expect_contains(h, "Color_Blue = 6\n} Color;");
  expect_contains(h, "typedef uint8_t Status;");
  expect_contains(h, " *   mode bits 2..4");
}

TEST(HeaderGenerator, RegistersBecomeVolatileMacros)
{
  TestModule m;
  ASSERT_TRUE(m.analyze(R"(
    register GPIO @ 0x40020000 {
      ODR: u32 rw @ 0x14,
      IDR: u32 ro @ 0x10,
    }
  )"));
  const std::string h = m.c_header();
  expect_contains(h, "#define GPIO_ODR (*(volatile uint32_t*)(0x40020000 + 0x14)) /* rw */");
  expect_contains(h, "#define GPIO_IDR (*(volatile uint32_t*)(0x40020000 + 0x10)) /* ro */");
}

TEST(HeaderGenerator, CNextIncludesBecomeHeaderIncludes)
{
  TestModule m;
  ASSERT_TRUE(m.analyze("#include \"drivers/led.cnx\"\n#include <stdio.h>\nu8 x <- 0;\n"));
  const std::string h = m.c_header();
  expect_contains(h, "#include \"drivers/led.h\"");
  expect_contains(h, "#include <stdio.h>");
}
