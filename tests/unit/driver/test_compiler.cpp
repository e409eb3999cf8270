// tests/unit/driver/test_compiler.cpp - End-to-end tests for the compiler driver
//
#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <string>

#include "cnext/driver/compiler.hpp"
#include "cnext/driver/source_discovery.hpp"
#include "cnext/test_support/parse_helpers.hpp"

using cnext::CompileMode;
using cnext::CompileOptions;
using cnext::Compiler;
using cnext::test_support::TempDir;

namespace fs = std::filesystem;

static void expect_contains(const std::string & haystack, const std::string & needle)
{
  EXPECT_NE(haystack.find(needle), std::string::npos)
    << "Expected to find: " << needle << "\nIn output:\n"
    << haystack;
}

static CompileOptions build_options()
{
  CompileOptions options;
  options.mode = CompileMode::Build;
  return options;
}

static std::string codes_of(const cnext::DiagnosticBag & diags)
{
  std::string out;
  for (const auto & d : diags) {
    out += d.code + ": " + d.message + "\n";
  }
  return out;
}

// ============================================================================
// Source discovery
// ============================================================================

TEST(SourceDiscovery, DirectoryIsScannedRecursivelyAndSorted)
{
  TempDir dir;
  dir.write("b.cnx", "");
  dir.write("a/z.cnx", "");
  dir.write("a/notes.txt", "");
  dir.write(".hidden/skip.cnx", "");

  cnext::DiagnosticBag diags;
  const auto sources = cnext::discover_sources(dir.path(), diags);
  EXPECT_FALSE(diags.has_errors());
  ASSERT_EQ(sources.size(), 2U);
  EXPECT_EQ(sources[0], dir.path() / "a" / "z.cnx");
  EXPECT_EQ(sources[1], dir.path() / "b.cnx");
}

TEST(SourceDiscovery, BadInputsReportE0001)
{
  TempDir dir;
  dir.write("notes.txt", "");
  dir.write("empty/readme.md", "");

  cnext::DiagnosticBag missing;
  EXPECT_TRUE(cnext::discover_sources(dir.path() / "nope.cnx", missing).empty());
  EXPECT_TRUE(missing.has_code("E0001"));

  cnext::DiagnosticBag wrong_ext;
  EXPECT_TRUE(cnext::discover_sources(dir.path() / "notes.txt", wrong_ext).empty());
  EXPECT_TRUE(wrong_ext.has_code("E0001"));

  cnext::DiagnosticBag no_sources;
  EXPECT_TRUE(cnext::discover_sources(dir.path() / "empty", no_sources).empty());
  EXPECT_TRUE(no_sources.has_code("E0001"));
}

// ============================================================================
// Build
// ============================================================================

TEST(CompilerDriver, BuildWritesCAndHeaderBesideSource)
{
  TempDir dir;
  dir.write("blink.cnx", R"(
    #include <stdint.h>
    u32 ticks <- 0;
    void tick() {
      ticks +<- 1;
    }
  )");

  const auto result = Compiler::compile(dir.path() / "blink.cnx", build_options());
  ASSERT_TRUE(result.success) << codes_of(result.diagnostics);
  EXPECT_EQ(result.generated_files.size(), 2U);
  expect_contains(dir.read("blink.c"), "#include \"blink.h\"");
  expect_contains(dir.read("blink.h"), "#ifndef BLINK_H");
  expect_contains(dir.read("blink.h"), "void tick(void);");
}

TEST(CompilerDriver, CheckModeWritesNothing)
{
  TempDir dir;
  dir.write("blink.cnx", "u32 ticks <- 0;\n");
  CompileOptions options;
  options.mode = CompileMode::Check;

  const auto result = Compiler::compile(dir.path() / "blink.cnx", options);
  ASSERT_TRUE(result.success) << codes_of(result.diagnostics);
  EXPECT_TRUE(result.generated_files.empty());
  EXPECT_FALSE(fs::exists(dir.path() / "blink.c"));
}

TEST(CompilerDriver, ErrorsPreventGeneration)
{
  TempDir dir;
  dir.write("bad.cnx", "u32 f() {\n  return missing;\n}\n");

  const auto result = Compiler::compile(dir.path() / "bad.cnx", build_options());
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.diagnostics.has_code("E0420"));
  EXPECT_FALSE(fs::exists(dir.path() / "bad.c"));
}

TEST(CompilerDriver, MissingIncludeOnlyStopsItsOwnModule)
{
  TempDir dir;
  dir.write("src/broken.cnx", "#include \"absent.h\"\nu8 b <- 0;\n");
  dir.write("src/fine.cnx", "u8 f <- 1;\n");

  const auto result = Compiler::compile(dir.path() / "src", build_options());
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.diagnostics.has_code("E0503"));
  EXPECT_FALSE(fs::exists(dir.path() / "src" / "broken.c"));
  EXPECT_TRUE(fs::exists(dir.path() / "src" / "fine.c"));
}

TEST(CompilerDriver, ModuleIncludingABrokenModuleIsNotGenerated)
{
  TempDir dir;
  dir.write("src/base.cnx", "#include \"absent.h\"\nu8 b <- 0;\n");
  dir.write("src/user.cnx", "#include \"base.cnx\"\nu8 u <- 1;\n");

  const auto result = Compiler::compile(dir.path() / "src", build_options());
  EXPECT_FALSE(result.success);
  EXPECT_FALSE(fs::exists(dir.path() / "src" / "user.c"));
}

TEST(CompilerDriver, MissingInputIsE0001)
{
  TempDir dir;
  const auto result = Compiler::compile(dir.path() / "absent.cnx", build_options());
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.diagnostics.has_code("E0001"));
}

TEST(CompilerDriver, OutputFileOverride)
{
  TempDir dir;
  dir.write("app.cnx", "u8 x <- 1;\n");
  CompileOptions options = build_options();
  options.output = dir.path() / "out" / "app.c";

  const auto result = Compiler::compile(dir.path() / "app.cnx", options);
  ASSERT_TRUE(result.success) << codes_of(result.diagnostics);
  EXPECT_TRUE(fs::exists(dir.path() / "out" / "app.c"));
  EXPECT_TRUE(fs::exists(dir.path() / "out" / "app.h"));
}

TEST(CompilerDriver, OutputFileWithSeveralInputsIsRejected)
{
  TempDir dir;
  dir.write("src/a.cnx", "u8 a <- 1;\n");
  dir.write("src/b.cnx", "u8 b <- 2;\n");
  CompileOptions options = build_options();
  options.output = dir.path() / "out.c";

  const auto result = Compiler::compile(dir.path() / "src", options);
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.diagnostics.has_code("E0002"));
}

TEST(CompilerDriver, IncludedCNextModuleIsVisibleAndGenerated)
{
  TempDir dir;
  dir.write("lib/math.cnx", "u32 twice(u32 v) {\n  return v * 2;\n}\n");
  dir.write("app.cnx", R"(
    #include "lib/math.cnx"
    u32 run() {
      return twice(21);
    }
  )");

  const auto result = Compiler::compile(dir.path() / "app.cnx", build_options());
  ASSERT_TRUE(result.success) << codes_of(result.diagnostics);
  EXPECT_TRUE(fs::exists(dir.path() / "lib" / "math.c"));
  expect_contains(dir.read("app.h"), "#include \"lib/math.h\"");
  expect_contains(dir.read("app.c"), "return twice(21U);");
}

TEST(CompilerDriver, SymbolFromUnincludedFileIsNotVisible)
{
  TempDir dir;
  dir.write("src/math.cnx", "u32 twice(u32 v) {\n  return v * 2;\n}\n");
  dir.write("src/zapp.cnx", "u32 run() {\n  return twice(21);\n}\n");

  const auto result = Compiler::compile(dir.path() / "src", build_options());
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.diagnostics.has_code("E0420"));
}

TEST(CompilerDriver, ForeignStructFieldWidthResolves)
{
  TempDir dir;
  dir.write("frame.h", "#include <stdint.h>\ntypedef struct {\n  uint32_t word;\n} frame_t;\n");
  dir.write("app.cnx", R"(
    #include "frame.h"
    u32 bits(frame_t f) {
      return f.word.length;
    }
  )");

  const auto result = Compiler::compile(dir.path() / "app.cnx", build_options());
  ASSERT_TRUE(result.success) << codes_of(result.diagnostics);
  expect_contains(dir.read("app.c"), "return 32U;");
}

TEST(CompilerDriver, CrossLanguageConflictAbortsBeforeAnalysis)
{
  TempDir dir;
  dir.write("a.h", "int shared(void);\n");
  dir.write("b.hpp", "int shared(int v);\n");
  dir.write("app.cnx", "#include \"a.h\"\n#include \"b.hpp\"\nu8 y <- 0;\n");

  const auto result = Compiler::compile(dir.path() / "app.cnx", build_options());
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.diagnostics.has_code("E0301"));
  EXPECT_FALSE(fs::exists(dir.path() / "app.c"));
}

// ============================================================================
// Configuration and cache
// ============================================================================

TEST(CompilerDriver, ProjectConfigSuppliesIncludePathsAndOutputDir)
{
  TempDir dir;
  dir.write(
    "cnext.yaml", "compiler:\n  include_paths: [vendor]\n  output_dir: gen\n");
  dir.write("vendor/board.h", "#define LED_PIN 13\n");
  dir.write("src/app.cnx", R"(
    #include <board.h>
    u32 pin() {
      return LED_PIN;
    }
  )");

  const auto result = Compiler::compile(dir.path() / "src" / "app.cnx", build_options());
  ASSERT_TRUE(result.success) << codes_of(result.diagnostics);
  ASSERT_TRUE(result.config_file.has_value());
  EXPECT_TRUE(fs::exists(dir.path() / "gen" / "app.c"));
}

TEST(CompilerDriver, InvalidProjectConfigIsE0003)
{
  TempDir dir;
  dir.write("cnext.yaml", "compiler: [broken\n");
  dir.write("app.cnx", "u8 x <- 0;\n");

  const auto result = Compiler::compile(dir.path() / "app.cnx", build_options());
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.diagnostics.has_code("E0003"));
}

TEST(CompilerDriver, SecondRunReadsHeadersFromCache)
{
  TempDir dir;
  dir.write("hal.h", "void hal_init(void);\n");
  dir.write("app.cnx", "#include \"hal.h\"\nvoid setup() {\n  hal_init();\n}\n");

  const auto first = Compiler::compile(dir.path() / "app.cnx", build_options());
  ASSERT_TRUE(first.success) << codes_of(first.diagnostics);
  EXPECT_EQ(first.stats.headersParsed, 1U);
  EXPECT_EQ(first.stats.headersFromCache, 0U);
  EXPECT_TRUE(fs::exists(dir.path() / ".cnx-cache" / "cache.json"));

  const auto second = Compiler::compile(dir.path() / "app.cnx", build_options());
  ASSERT_TRUE(second.success) << codes_of(second.diagnostics);
  EXPECT_EQ(second.stats.headersParsed, 0U);
  EXPECT_EQ(second.stats.headersFromCache, 1U);
}

TEST(CompilerDriver, ChangedIncludedHeaderRefreshesCachedIncluder)
{
  TempDir dir;
  const fs::path cfg = dir.write("cfg.h", "#define N 4\n");
  dir.write("hal.h", "#include \"cfg.h\"\ntypedef struct { unsigned char b[N]; } Buf;\n");
  dir.write("app.cnx", R"(
    #include "hal.h"
    u32 size(Buf x) {
      return x.b.length;
    }
  )");

  const auto first = Compiler::compile(dir.path() / "app.cnx", build_options());
  ASSERT_TRUE(first.success) << codes_of(first.diagnostics);
  expect_contains(dir.read("app.c"), "return 4U;");

  const auto stamp = fs::last_write_time(cfg);
  dir.write("cfg.h", "#define N 8\n");
  fs::last_write_time(cfg, stamp + std::chrono::seconds(2));

  const auto second = Compiler::compile(dir.path() / "app.cnx", build_options());
  ASSERT_TRUE(second.success) << codes_of(second.diagnostics);
  EXPECT_EQ(second.stats.headersParsed, 2U);
  EXPECT_EQ(second.stats.headersFromCache, 0U);
  expect_contains(dir.read("app.c"), "return 8U;");
}

TEST(CompilerDriver, NoCacheLeavesNoCacheDirectory)
{
  TempDir dir;
  dir.write("app.cnx", "u8 x <- 0;\n");
  CompileOptions options = build_options();
  options.use_cache = false;

  const auto result = Compiler::compile(dir.path() / "app.cnx", options);
  ASSERT_TRUE(result.success) << codes_of(result.diagnostics);
  EXPECT_FALSE(fs::exists(dir.path() / ".cnx-cache"));
}

TEST(CompilerDriver, CleanRemovesGeneratedFilesAndCache)
{
  TempDir dir;
  dir.write("app.cnx", "u8 x <- 0;\n");
  ASSERT_TRUE(Compiler::compile(dir.path() / "app.cnx", build_options()).success);
  ASSERT_TRUE(fs::exists(dir.path() / "app.c"));

  const auto cleaned = Compiler::clean(dir.path() / "app.cnx", build_options());
  ASSERT_TRUE(cleaned.success) << codes_of(cleaned.diagnostics);
  EXPECT_FALSE(fs::exists(dir.path() / "app.c"));
  EXPECT_FALSE(fs::exists(dir.path() / "app.h"));
  EXPECT_FALSE(fs::exists(dir.path() / ".cnx-cache"));
  EXPECT_TRUE(fs::exists(dir.path() / "app.cnx"));
}
