// tests/unit/resolution/test_include_resolver.cpp - Unit tests for include resolution
//
#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "cnext/resolution/dependency_graph.hpp"
#include "cnext/resolution/include_resolver.hpp"
#include "cnext/test_support/parse_helpers.hpp"

using cnext::DependencyGraph;
using cnext::DependencyNode;
using cnext::FileLanguage;
using cnext::IncludeResolver;
using cnext::test_support::TempDir;

namespace
{

struct Resolved
{
  cnext::SourceRegistry sources;
  DependencyGraph graph;
  cnext::DiagnosticBag diags;
  DependencyNode * root = nullptr;
  size_t files_loaded = 0;
};

void resolve_into(
  Resolved & out, const std::filesystem::path & entry,
  std::vector<std::filesystem::path> search_paths = {})
{
  IncludeResolver resolver(out.sources, out.graph, out.diags, std::move(search_paths));
  out.root = resolver.resolve(entry);
  out.files_loaded = resolver.files_loaded();
}

std::vector<std::string> filenames(const std::vector<DependencyNode *> & nodes)
{
  std::vector<std::string> out;
  for (const auto * n : nodes) {
    out.push_back(n->is_system() ? n->systemName : n->path.filename().string());
  }
  return out;
}

}  // namespace

TEST(IncludeResolver, QuotedIncludeFoundBesideIncludingFile)
{
  TempDir dir;
  dir.write("hal.h", "void hal_init(void);\n");
  const auto entry = dir.write("main.cnx", "#include \"hal.h\"\nvoid main() { hal_init(); }\n");

  Resolved r;
  resolve_into(r, entry);
  ASSERT_NE(r.root, nullptr);
  EXPECT_FALSE(r.diags.has_errors());
  EXPECT_EQ(r.root->language, FileLanguage::CNext);
  ASSERT_EQ(r.root->children.size(), 1U);
  EXPECT_EQ(r.root->children[0]->language, FileLanguage::C);
}

TEST(IncludeResolver, SearchPathsAreUsedAfterLocalDirectory)
{
  TempDir dir;
  dir.write("vendor/drivers/uart.h", "void uart_send(int c);\n");
  const auto entry = dir.write("src/main.cnx", "#include <uart.h>\n");

  Resolved r;
  resolve_into(r, entry, {dir.path() / "vendor" / "drivers"});
  ASSERT_NE(r.root, nullptr);
  EXPECT_FALSE(r.diags.has_errors());
  ASSERT_EQ(r.root->children.size(), 1U);
  EXPECT_EQ(r.root->children[0]->path.filename(), "uart.h");
}

TEST(IncludeResolver, BuiltinSystemHeadersAreNotRead)
{
  TempDir dir;
  const auto entry = dir.write("main.cnx", "#include <stdio.h>\n#include <stdint.h>\n");

  Resolved r;
  resolve_into(r, entry);
  ASSERT_NE(r.root, nullptr);
  ASSERT_EQ(r.root->children.size(), 2U);
  EXPECT_TRUE(r.root->children[0]->is_system());
  EXPECT_EQ(r.root->children[0]->systemName, "stdio.h");
  EXPECT_EQ(r.files_loaded, 1U);
}

TEST(IncludeResolver, IncludeCycleVisitsEachFileOnce)
{
  TempDir dir;
  dir.write("a.h", "#include \"b.h\"\nint a(void);\n");
  dir.write("b.h", "#include \"a.h\"\nint b(void);\n");
  const auto entry = dir.write("main.cnx", "#include \"a.h\"\n");

  Resolved r;
  resolve_into(r, entry);
  ASSERT_NE(r.root, nullptr);
  EXPECT_FALSE(r.diags.has_errors());
  EXPECT_EQ(r.graph.size(), 3U);
  EXPECT_EQ(r.files_loaded, 3U);

  const auto order = filenames(r.graph.leaves_first_order());
  ASSERT_EQ(order.size(), 3U);
  EXPECT_EQ(order.back(), "main.cnx");
  EXPECT_EQ(std::count(order.begin(), order.end(), "a.h"), 1);
  EXPECT_EQ(std::count(order.begin(), order.end(), "b.h"), 1);
}

TEST(IncludeResolver, SharedHeaderIsLoadedOnce)
{
  TempDir dir;
  dir.write("types.h", "typedef int id_t;\n");
  dir.write("left.h", "#include \"types.h\"\n");
  dir.write("right.h", "#include \"types.h\"\n");
  const auto entry = dir.write("main.cnx", "#include \"left.h\"\n#include \"right.h\"\n");

  Resolved r;
  resolve_into(r, entry);
  EXPECT_EQ(r.graph.size(), 4U);

  const auto order = filenames(r.graph.leaves_first_order());
  const auto types_at = std::find(order.begin(), order.end(), "types.h");
  const auto left_at = std::find(order.begin(), order.end(), "left.h");
  ASSERT_NE(types_at, order.end());
  ASSERT_NE(left_at, order.end());
  EXPECT_LT(types_at, left_at);
}

TEST(IncludeResolver, MissingIncludeNamesSearchedLocations)
{
  TempDir dir;
  const auto entry = dir.write("main.cnx", "#include \"missing.h\"\n");

  Resolved r;
  resolve_into(r, entry, {dir.path() / "inc"});
  ASSERT_TRUE(r.diags.has_code("E0503"));
  bool names_locations = false;
  for (const auto & d : r.diags) {
    if (d.code == "E0503" && d.help_message &&
        d.help_message->find("inc/missing.h") != std::string::npos) {
      names_locations = true;
    }
  }
  EXPECT_TRUE(names_locations);
}

TEST(IncludeResolver, UnknownAngleIncludeFromForeignHeaderIsTolerated)
{
  TempDir dir;
  dir.write("hal.h", "#include <toolchain_specific.h>\nvoid hal_init(void);\n");
  const auto entry = dir.write("main.cnx", "#include \"hal.h\"\n");

  Resolved r;
  resolve_into(r, entry);
  EXPECT_FALSE(r.diags.has_errors());
}

TEST(IncludeResolver, GeneratedHeaderOfCNextSourceIsRejected)
{
  TempDir dir;
  dir.write("motor.cnx", "public void motor_stop() { }\n");
  dir.write("motor.h", "void motor_stop(void);\n");
  const auto entry = dir.write("main.cnx", "#include \"motor.h\"\n");

  Resolved r;
  resolve_into(r, entry);
  ASSERT_TRUE(r.diags.has_code("E0504"));
  bool suggests_cnx = false;
  for (const auto & d : r.diags) {
    if (d.code == "E0504" && d.help_message &&
        d.help_message->find("motor.cnx") != std::string::npos) {
      suggests_cnx = true;
    }
  }
  EXPECT_TRUE(suggests_cnx);
}

TEST(IncludeResolver, CNextIncludeBecomesCNextNode)
{
  TempDir dir;
  dir.write("lib/util.cnx", "public u32 twice(u32 v) { return v * 2; }\n");
  const auto entry = dir.write("main.cnx", "#include \"lib/util.cnx\"\n");

  Resolved r;
  resolve_into(r, entry);
  ASSERT_NE(r.root, nullptr);
  ASSERT_EQ(r.root->children.size(), 1U);
  EXPECT_EQ(r.root->children[0]->language, FileLanguage::CNext);
}
