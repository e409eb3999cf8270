// tests/unit/cache/test_cache_manager.cpp - Unit tests for the symbol cache
//
#include <gtest/gtest.h>

#include <string>

#include "cnext/cache/cache_manager.hpp"
#include "cnext/symbols/system_headers.hpp"
#include "cnext/test_support/parse_helpers.hpp"

using cnext::CacheEntry;
using cnext::CacheManager;
using cnext::test_support::TempDir;

namespace
{

CacheEntry sample_entry(const std::string & key, int64_t mtime)
{
  CacheEntry entry;
  entry.key = key;
  entry.language = cnext::FileLanguage::Cpp;
  entry.mtime = mtime;
  entry.includes = cnext::scan_includes("#include <stdint.h>\n#include \"regs.h\"\n");
  entry.dependencies = {{"/src/regs.h", 17}};

  cnext::Symbol fn;
  fn.name = "hal::read";
  fn.language = cnext::SourceLanguage::Cpp;
  fn.originFile = key;
  fn.line = 7;
  fn.type = cnext::builtin_c_type("int32_t");
  cnext::FunctionInfo info;
  info.returnType = fn.type;
  cnext::ParamInfo param;
  param.name = "out";
  param.type = cnext::builtin_c_type("int*");
  param.writesThroughPointer = true;
  info.params.push_back(param);
  fn.details = info;
  entry.symbols.push_back(fn);

  cnext::Symbol regs;
  regs.name = "regs_t";
  regs.language = cnext::SourceLanguage::Cpp;
  regs.originFile = key;
  regs.type = cnext::make_named_type(cnext::TypeKind::Struct, "regs_t");
  cnext::StructInfo fields;
  fields.fields.push_back({"ctrl", cnext::builtin_c_type("uint32_t")});
  regs.details = fields;
  entry.symbols.push_back(regs);
  return entry;
}

}  // namespace

TEST(CacheManager, MissingFileIsAnEmptyCache)
{
  TempDir dir;
  CacheManager cache(dir.path() / ".cnx-cache", "paths");
  EXPECT_TRUE(cache.load());
  EXPECT_EQ(cache.size(), 0U);
}

TEST(CacheManager, SavedEntriesReloadIntact)
{
  TempDir dir;
  const auto cache_dir = dir.path() / ".cnx-cache";
  {
    CacheManager cache(cache_dir, "paths");
    cache.store(sample_entry("/src/hal.hpp", 42));
    const auto saved = cache.save();
    ASSERT_TRUE(saved.success) << saved.error;
  }
  EXPECT_TRUE(std::filesystem::exists(cache_dir / "cache.json"));

  CacheManager reloaded(cache_dir, "paths");
  ASSERT_TRUE(reloaded.load());
  const CacheEntry * entry = reloaded.lookup("/src/hal.hpp", 42);
  ASSERT_NE(entry, nullptr);
  EXPECT_EQ(entry->language, cnext::FileLanguage::Cpp);
  ASSERT_EQ(entry->includes.size(), 2U);
  EXPECT_EQ(entry->includes[1].path, "regs.h");
  ASSERT_EQ(entry->dependencies.size(), 1U);
  EXPECT_EQ(entry->dependencies.at("/src/regs.h"), 17);
  ASSERT_EQ(entry->symbols.size(), 2U);

  const auto * fn = entry->symbols[0].as<cnext::FunctionInfo>();
  ASSERT_NE(fn, nullptr);
  EXPECT_EQ(entry->symbols[0].name, "hal::read");
  EXPECT_EQ(entry->symbols[0].line, 7U);
  ASSERT_EQ(fn->params.size(), 1U);
  EXPECT_TRUE(fn->params[0].writesThroughPointer);
  EXPECT_TRUE(fn->params[0].type.isPointer);

  const auto * st = entry->symbols[1].as<cnext::StructInfo>();
  ASSERT_NE(st, nullptr);
  ASSERT_EQ(st->fields.size(), 1U);
  EXPECT_EQ(st->fields[0].type.bitWidth, 32U);
}

TEST(CacheManager, ChangedMtimeIsStale)
{
  TempDir dir;
  CacheManager cache(dir.path(), "paths");
  cache.store(sample_entry("/src/hal.hpp", 42));
  EXPECT_NE(cache.lookup("/src/hal.hpp", 42), nullptr);
  EXPECT_EQ(cache.lookup("/src/hal.hpp", 43), nullptr);
  EXPECT_EQ(cache.lookup("/src/other.hpp", 42), nullptr);
}

TEST(CacheManager, DifferentSearchPathsDiscardEntries)
{
  TempDir dir;
  {
    CacheManager cache(dir.path(), CacheManager::fingerprint_for({"/a", "/b"}));
    cache.store(sample_entry("/src/hal.hpp", 1));
    ASSERT_TRUE(cache.save().success);
  }
  CacheManager other(dir.path(), CacheManager::fingerprint_for({"/b", "/a"}));
  EXPECT_TRUE(other.load());
  EXPECT_EQ(other.size(), 0U);
}

TEST(CacheManager, CorruptFileIsDiscarded)
{
  TempDir dir;
  dir.write("cache.json", "{ this is not json");
  CacheManager cache(dir.path(), "paths");
  EXPECT_FALSE(cache.load());
  EXPECT_EQ(cache.size(), 0U);
}

TEST(CacheManager, WrongVersionIsDiscarded)
{
  TempDir dir;
  dir.write("cache.json", R"({"version": 999, "fingerprint": "paths", "files": []})");
  CacheManager cache(dir.path(), "paths");
  EXPECT_FALSE(cache.load());
}
