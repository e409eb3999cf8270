// tests/unit/project/test_project_config.cpp - Unit tests for cnext.yaml loading
//
#include <gtest/gtest.h>

#include "cnext/project/project_config.hpp"
#include "cnext/test_support/parse_helpers.hpp"

using cnext::test_support::TempDir;

TEST(ProjectConfig, FullFileIsLoaded)
{
  TempDir dir;
  const auto path = dir.write(
    "cnext.yaml",
    "project:\n"
    "  name: blinky\n"
    "compiler:\n"
    "  include_paths:\n"
    "    - include\n"
    "    - /opt/sdk/include\n"
    "  output_dir: build/gen\n"
    "  cache_dir: .cache\n"
    "  cache: false\n");

  const auto result = cnext::load_project_config(path);
  ASSERT_TRUE(result.success) << result.error;
  const auto & cfg = result.config;
  EXPECT_EQ(cfg.project.name, "blinky");
  EXPECT_EQ(cfg.project_root, dir.path());
  EXPECT_EQ(cfg.compiler.output_dir, "build/gen");
  EXPECT_EQ(cfg.compiler.cache_dir, ".cache");
  EXPECT_FALSE(cfg.compiler.cache);

  const auto includes = cfg.resolved_include_paths();
  ASSERT_EQ(includes.size(), 2U);
  EXPECT_EQ(includes[0], dir.path() / "include");
  EXPECT_EQ(includes[1], "/opt/sdk/include");
}

TEST(ProjectConfig, EmptyFileSelectsDefaults)
{
  TempDir dir;
  const auto result = cnext::load_project_config(dir.write("cnext.yaml", ""));
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_TRUE(result.config.compiler.include_paths.empty());
  EXPECT_TRUE(result.config.compiler.output_dir.empty());
  EXPECT_EQ(result.config.compiler.cache_dir, ".cnx-cache");
  EXPECT_TRUE(result.config.compiler.cache);
}

TEST(ProjectConfig, MissingFileFails)
{
  TempDir dir;
  const auto result = cnext::load_project_config(dir.path() / "cnext.yaml");
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("not found"), std::string::npos);
}

TEST(ProjectConfig, MalformedYamlFails)
{
  TempDir dir;
  const auto result =
    cnext::load_project_config(dir.write("cnext.yaml", "compiler: [unterminated\n"));
  EXPECT_FALSE(result.success);
}

TEST(ProjectConfig, WrongShapesAreRejected)
{
  TempDir dir;
  EXPECT_FALSE(cnext::load_project_config(dir.write("a/cnext.yaml", "- just\n- a list\n")).success);
  EXPECT_FALSE(
    cnext::load_project_config(dir.write("b/cnext.yaml", "compiler:\n  include_paths: inc\n"))
      .success);
  EXPECT_FALSE(
    cnext::load_project_config(dir.write("c/cnext.yaml", "compiler:\n  cache: maybe\n")).success);
}

TEST(ProjectConfig, SearchWalksUpFromSourceFile)
{
  TempDir dir;
  dir.write("cnext.yaml", "project:\n  name: root\n");
  const auto source = dir.write("src/drivers/uart.cnx", "");

  const auto found = cnext::find_project_config(source);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(*found, dir.path() / "cnext.yaml");
}

TEST(ProjectConfig, NearestConfigWins)
{
  TempDir dir;
  dir.write("cnext.yaml", "");
  dir.write("sub/cnext.yaml", "");
  const auto found = cnext::find_project_config(dir.path() / "sub");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(*found, dir.path() / "sub" / "cnext.yaml");
}
