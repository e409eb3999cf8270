// tests/unit/sema/test_null_checker.cpp - Unit tests for null safety
//
// Results of the nullable C functions must land in c_ variables and every
// use of such a variable must be dominated by a NULL check.
//
#include <gtest/gtest.h>

#include <string>

#include "cnext/sema/analysis/null_checker.hpp"
#include "cnext/test_support/parse_helpers.hpp"

using cnext::test_support::TestModule;

namespace
{

TestModule with_libc()
{
  TestModule m;
  m.add_system_header("stdio.h");
  m.add_system_header("stdlib.h");
  m.add_system_header("string.h");
  return m;
}

}  // namespace

TEST(SemaNullChecker, Whitelist)
{
  EXPECT_TRUE(cnext::is_nullable_c_function("getenv"));
  EXPECT_TRUE(cnext::is_nullable_c_function("fopen"));
  EXPECT_TRUE(cnext::is_nullable_c_function("strchr"));
  EXPECT_FALSE(cnext::is_nullable_c_function("strlen"));
  EXPECT_TRUE(cnext::is_forbidden_allocation("malloc"));
  EXPECT_TRUE(cnext::is_forbidden_allocation("free"));
  EXPECT_FALSE(cnext::is_forbidden_allocation("memset"));
  EXPECT_TRUE(cnext::has_interop_prefix("c_file"));
  EXPECT_FALSE(cnext::has_interop_prefix("file"));
}

TEST(SemaNullChecker, CheckedUseIsAccepted)
{
  TestModule m = with_libc();
  EXPECT_TRUE(m.analyze(R"(
    #include <stdio.h>
    #include <stdlib.h>
    void show() {
      cstring c_home <- getenv("HOME");
      if (c_home != NULL) {
        puts(c_home);
      }
    }
  )"));
}

TEST(SemaNullChecker, UncheckedUseIsRejected)
{
  TestModule m = with_libc();
  EXPECT_FALSE(m.analyze(R"(
    #include <stdio.h>
    #include <stdlib.h>
    void show() {
      cstring c_home <- getenv("HOME");
      puts(c_home);
    }
  )"));
  EXPECT_TRUE(m.diags.has_code("E0908"));
}

TEST(SemaNullChecker, CheckOnOnlyOneBranchIsNotEnough)
{
  TestModule m = with_libc();
  EXPECT_FALSE(m.analyze(R"(
    #include <stdio.h>
    #include <stdlib.h>
    void show(bool verbose) {
      cstring c_home <- getenv("HOME");
      if (verbose) {
        if (c_home = NULL) {
          return;
        }
      }
      puts(c_home);
    }
  )"));
  EXPECT_TRUE(m.diags.has_code("E0908"));
}

TEST(SemaNullChecker, EarlyReturnOnNullProvesNonNull)
{
  TestModule m = with_libc();
  EXPECT_TRUE(m.analyze(R"(
    #include <stdio.h>
    #include <stdlib.h>
    void show() {
      cstring c_home <- getenv("HOME");
      if (c_home = NULL) {
        return;
      }
      puts(c_home);
    }
  )"));
}

TEST(SemaNullChecker, MissingPrefixIsRejected)
{
  TestModule m = with_libc();
  EXPECT_FALSE(m.analyze(R"(
    #include <stdlib.h>
    void show() {
      cstring home <- getenv("HOME");
    }
  )"));
  EXPECT_TRUE(m.diags.has_code("E0905"));
}

TEST(SemaNullChecker, DirectUseOfNullableResultIsRejected)
{
  TestModule m = with_libc();
  EXPECT_FALSE(m.analyze(R"(
    #include <stdio.h>
    #include <stdlib.h>
    void show() {
      puts(getenv("HOME"));
    }
  )"));
  EXPECT_TRUE(m.diags.has_code("E0901"));
}

TEST(SemaNullChecker, AllocationIsForbidden)
{
  TestModule m = with_libc();
  EXPECT_FALSE(m.analyze(R"(
    #include <stdlib.h>
    void leak() {
      free(NULL);
    }
  )"));
  EXPECT_TRUE(m.diags.has_code("E0902"));
}

TEST(SemaNullChecker, NullOutsideComparisonIsRejected)
{
  TestModule m = with_libc();
  EXPECT_FALSE(m.analyze(R"(
    #include <stdlib.h>
    void show() {
      cstring c_home <- NULL;
    }
  )"));
  EXPECT_TRUE(m.diags.has_code("E0903"));
}

TEST(SemaNullChecker, PrefixOnNonNullableTypeIsRejected)
{
  TestModule m = with_libc();
  EXPECT_FALSE(m.analyze(R"(
    void f() {
      u32 c_count <- 0;
    }
  )"));
  EXPECT_TRUE(m.diags.has_code("E0906"));
}

TEST(SemaNullChecker, NullComparisonOfPlainValueIsRejected)
{
  TestModule m = with_libc();
  EXPECT_FALSE(m.analyze(R"(
    #include <stdlib.h>
    bool f(u32 count) {
      return count != NULL;
    }
  )"));
  EXPECT_TRUE(m.diags.has_code("E0907"));
}
