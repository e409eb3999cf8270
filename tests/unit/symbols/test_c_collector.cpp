// tests/unit/symbols/test_c_collector.cpp - Unit tests for C and C++ header collection
//
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "cnext/symbols/c_collector.hpp"
#include "cnext/symbols/cpp_collector.hpp"
#include "cnext/test_support/parse_helpers.hpp"

using cnext::FunctionInfo;
using cnext::MacroInfo;
using cnext::StructInfo;
using cnext::Symbol;
using cnext::SymbolKind;
using cnext::TypeKind;
using cnext::test_support::TestModule;

namespace
{

struct Collected
{
  cnext::SourceRegistry sources;
  cnext::SymbolTable known;
  cnext::DiagnosticBag diags;
  std::vector<Symbol> symbols;

  [[nodiscard]] const Symbol * find(const std::string & name) const
  {
    for (const auto & s : symbols) {
      if (s.name == name) return &s;
    }
    return nullptr;
  }
};

Collected collect_c(std::string text)
{
  Collected out;
  const cnext::FileId id = out.sources.register_file("hal.h", std::move(text));
  cnext::CHeaderCollector collector(*out.sources.get_file(id), id, out.known, out.diags);
  out.symbols = collector.collect();
  return out;
}

Collected collect_cpp(std::string text)
{
  Collected out;
  const cnext::FileId id = out.sources.register_file("hal.hpp", std::move(text));
  cnext::CppHeaderCollector collector(*out.sources.get_file(id), id, out.known, out.diags);
  out.symbols = collector.collect();
  return out;
}

}  // namespace

// ============================================================================
// C headers
// ============================================================================

TEST(CHeaderCollector, ObjectLikeMacrosKeepIntegerValues)
{
  const auto c = collect_c("#define BUF_SIZE 64\n#define MASK (1 << 4)\n#define NAME \"x\"\n");
  const Symbol * buf = c.find("BUF_SIZE");
  ASSERT_NE(buf, nullptr);
  ASSERT_EQ(buf->kind(), SymbolKind::Macro);
  EXPECT_EQ(buf->as<MacroInfo>()->intValue, 64);

  const Symbol * mask = c.find("MASK");
  ASSERT_NE(mask, nullptr);
  EXPECT_EQ(mask->as<MacroInfo>()->intValue, 16);

  const Symbol * name = c.find("NAME");
  ASSERT_NE(name, nullptr);
  EXPECT_FALSE(name->as<MacroInfo>()->intValue.has_value());
}

TEST(CHeaderCollector, FunctionPrototypes)
{
  const auto c = collect_c(
    "#include <stdint.h>\n"
    "void hal_init(void);\n"
    "int32_t hal_read(uint8_t channel, int *out);\n"
    "int log_msg(const char *fmt, ...);\n");
  EXPECT_FALSE(c.diags.has_errors());

  const Symbol * init = c.find("hal_init");
  ASSERT_NE(init, nullptr);
  EXPECT_TRUE(init->as<FunctionInfo>()->params.empty());

  const Symbol * read = c.find("hal_read");
  ASSERT_NE(read, nullptr);
  const auto * fn = read->as<FunctionInfo>();
  ASSERT_EQ(fn->params.size(), 2U);
  EXPECT_EQ(fn->params[0].type.bitWidth, 8U);
  EXPECT_TRUE(fn->params[1].type.isPointer);
  EXPECT_EQ(fn->returnType.bitWidth, 32U);
  EXPECT_TRUE(fn->returnType.isSigned);

  const Symbol * log = c.find("log_msg");
  ASSERT_NE(log, nullptr);
  EXPECT_TRUE(log->as<FunctionInfo>()->isVariadic);
}

TEST(CHeaderCollector, TypedefStructKeepsFieldTypes)
{
  const auto c = collect_c(
    "#include <stdint.h>\n"
    "typedef struct {\n"
    "  uint32_t length;\n"
    "  uint8_t flags[4];\n"
    "} packet_t;\n");
  const Symbol * packet = c.find("packet_t");
  ASSERT_NE(packet, nullptr);
  ASSERT_EQ(packet->kind(), SymbolKind::Struct);

  const StructInfo * info = packet->as<StructInfo>();
  ASSERT_EQ(info->fields.size(), 2U);
  EXPECT_EQ(info->fields[0].name, "length");
  EXPECT_EQ(info->fields[0].type.bitWidth, 32U);
  EXPECT_EQ(info->fields[1].type.arrayDims, std::vector<uint32_t>{4});
}

TEST(CHeaderCollector, EnumValuesFollowCRules)
{
  const auto c = collect_c("enum mode { MODE_OFF, MODE_SLOW = 5, MODE_FAST };\n");
  const Symbol * mode = c.find("mode");
  ASSERT_NE(mode, nullptr);
  const auto * info = mode->as<cnext::EnumInfo>();
  ASSERT_NE(info, nullptr);
  ASSERT_EQ(info->members.size(), 3U);
  EXPECT_EQ(info->members[0].value, 0);
  EXPECT_EQ(info->members[1].value, 5);
  EXPECT_EQ(info->members[2].value, 6);
}

TEST(CHeaderCollector, FunctionBodiesAreSkipped)
{
  const auto c = collect_c(
    "static inline int twice(int v) { if (v) { return v * 2; } return 0; }\n"
    "extern int ticks;\n");
  EXPECT_FALSE(c.diags.has_errors());
  ASSERT_NE(c.find("twice"), nullptr);
  EXPECT_TRUE(c.find("twice")->as<FunctionInfo>()->isDefinition);
  const Symbol * ticks = c.find("ticks");
  ASSERT_NE(ticks, nullptr);
  EXPECT_TRUE(ticks->as<cnext::VariableInfo>()->isExtern);
}

TEST(CHeaderCollector, UnreadableDeclarationIsReportedAndSkipped)
{
  const auto c = collect_c("int ok_before(void);\n@@@ garbage;\nint ok_after(void);\n");
  EXPECT_TRUE(c.diags.has_code("E0201"));
  EXPECT_NE(c.find("ok_before"), nullptr);
  EXPECT_NE(c.find("ok_after"), nullptr);
}

TEST(CHeaderCollector, AnonymousNestedStructFieldKeepsItsFields)
{
  const auto c = collect_c(
    "#include <stdint.h>\n"
    "typedef struct {\n"
    "  struct { uint8_t a; uint8_t b; } inner;\n"
    "  uint16_t crc;\n"
    "} Dev_t;\n");
  EXPECT_FALSE(c.diags.has_errors());

  const Symbol * dev = c.find("Dev_t");
  ASSERT_NE(dev, nullptr);
  const StructInfo * info = dev->as<StructInfo>();
  ASSERT_NE(info, nullptr);
  const cnext::FieldInfo * inner = info->find_field("inner");
  ASSERT_NE(inner, nullptr);
  EXPECT_EQ(inner->type.kind, TypeKind::Struct);

  const Symbol * nested = c.find(inner->type.baseType);
  ASSERT_NE(nested, nullptr);
  EXPECT_EQ(nested->name.rfind("(anonymous struct at ", 0), 0U);
  const StructInfo * nested_info = nested->as<StructInfo>();
  ASSERT_NE(nested_info, nullptr);
  ASSERT_EQ(nested_info->fields.size(), 2U);
  EXPECT_EQ(nested_info->fields[0].name, "a");
  EXPECT_EQ(nested_info->fields[0].type.bitWidth, 8U);
}

TEST(CHeaderCollector, UntaggedUnionMemberFieldsJoinTheRecord)
{
  const auto c = collect_c(
    "struct reg {\n"
    "  union { unsigned int word; unsigned char bytes[4]; };\n"
    "  unsigned int mode : 3;\n"
    "};\n");
  const Symbol * reg = c.find("reg");
  ASSERT_NE(reg, nullptr);
  const StructInfo * info = reg->as<StructInfo>();
  ASSERT_NE(info, nullptr);
  ASSERT_NE(info->find_field("word"), nullptr);
  ASSERT_NE(info->find_field("bytes"), nullptr);
  ASSERT_NE(info->find_field("mode"), nullptr);
  EXPECT_EQ(info->find_field("mode")->type.bitWidth, 3U);
}

TEST(CHeaderCollector, ArrayBoundsFoldMacrosAndEnumerators)
{
  const auto c = collect_c(
    "#define ROWS (2 * 2)\n"
    "enum { COLS = ROWS + 1 };\n"
    "extern unsigned char grid[ROWS][COLS];\n");
  const Symbol * grid = c.find("grid");
  ASSERT_NE(grid, nullptr);
  EXPECT_EQ(grid->type.arrayDims, (std::vector<uint32_t>{4, 5}));
  const Symbol * cols = c.find("COLS");
  ASSERT_NE(cols, nullptr);
  EXPECT_EQ(cols->as<MacroInfo>()->intValue, 5);
}

TEST(CHeaderCollector, CplusplusGroupsAreNotReadAsC)
{
  const auto c = collect_c(
    "#ifdef __cplusplus\n"
    "extern \"C\" {\n"
    "#endif\n"
    "void hal_start(void);\n"
    "#ifdef __cplusplus\n"
    "}\n"
    "#endif\n");
  EXPECT_FALSE(c.diags.has_errors());
  EXPECT_NE(c.find("hal_start"), nullptr);
}

TEST(CHeaderCollector, FunctionPointerFieldsAreOpaqueHandles)
{
  const auto c = collect_c(
    "struct ops {\n"
    "  void (*on_tick)(int ticks);\n"
    "  int *counter;\n"
    "};\n");
  const Symbol * ops = c.find("ops");
  ASSERT_NE(ops, nullptr);
  const StructInfo * info = ops->as<StructInfo>();
  ASSERT_NE(info, nullptr);
  ASSERT_EQ(info->fields.size(), 2U);
  EXPECT_EQ(info->fields[0].name, "on_tick");
  EXPECT_EQ(info->fields[0].type.kind, TypeKind::Opaque);
  EXPECT_TRUE(info->fields[0].type.isPointer);
  EXPECT_TRUE(info->fields[1].type.isPointer);
}

// ============================================================================
// C++ headers
// ============================================================================

TEST(CppHeaderCollector, NamespacesQualifyNames)
{
  const auto c = collect_cpp(
    "namespace hal {\n"
    "int read_pin(int pin);\n"
    "}\n"
    "extern \"C\" {\n"
    "void c_entry(void);\n"
    "}\n");
  EXPECT_NE(c.find("hal::read_pin"), nullptr);
  ASSERT_NE(c.find("c_entry"), nullptr);
  EXPECT_EQ(c.find("c_entry")->language, cnext::SourceLanguage::Cpp);
}

TEST(CppHeaderCollector, OverloadsAreAllCollected)
{
  const auto c = collect_cpp("int scale(int v);\ndouble scale(double v);\n");
  size_t count = 0;
  for (const auto & s : c.symbols) {
    if (s.name == "scale") ++count;
  }
  EXPECT_EQ(count, 2U);
}

TEST(CppHeaderCollector, TemplatesAreSkipped)
{
  const auto c = collect_cpp(
    "template <typename T>\n"
    "T clamp(T v, T lo, T hi) { return v < lo ? lo : (v > hi ? hi : v); }\n"
    "int after(void);\n");
  EXPECT_NE(c.find("after"), nullptr);
}

TEST(CppHeaderCollector, ClassesExposeOnlyPublicFields)
{
  const auto c = collect_cpp(
    "namespace hal {\n"
    "class Pin {\n"
    "  int secret;\n"
    "public:\n"
    "  Pin();\n"
    "  int number;\n"
    "  int read() const;\n"
    "};\n"
    "enum class Mode : unsigned char { Off, On = 4 };\n"
    "using Handle = Pin;\n"
    "}\n");
  EXPECT_FALSE(c.diags.has_errors());
  const Symbol * pin = c.find("hal::Pin");
  ASSERT_NE(pin, nullptr);
  const StructInfo * info = pin->as<StructInfo>();
  ASSERT_NE(info, nullptr);
  ASSERT_EQ(info->fields.size(), 1U);
  EXPECT_EQ(info->fields[0].name, "number");

  const Symbol * mode = c.find("hal::Mode");
  ASSERT_NE(mode, nullptr);
  EXPECT_EQ(mode->type.bitWidth, 8U);
  EXPECT_EQ(mode->as<cnext::EnumInfo>()->members[1].value, 4);

  EXPECT_NE(c.find("hal::Handle"), nullptr);
}

// ============================================================================
// Foreign types reach C-Next
// ============================================================================

TEST(CHeaderCollector, ForeignFieldWidthFlowsIntoGeneratedCode)
{
  TestModule m;
  m.add_system_header("stdint.h");
  m.add_c_header("frame.h", "typedef struct { uint32_t word; } frame_t;\n");
  ASSERT_TRUE(m.analyze(R"(
    u32 word_bits(frame_t f) {
      return f.word.length;
    }
  )"));
  EXPECT_NE(m.c_source().find("return 32U;"), std::string::npos);
}

TEST(CHeaderCollector, AnonymousNestedStructMembersAreReachable)
{
  TestModule m;
  m.add_system_header("stdint.h");
  m.add_c_header(
    "dev.h", "typedef struct { struct { uint8_t a; uint8_t b; } inner; } Dev_t;\n");
  ASSERT_TRUE(m.analyze(R"(
    u8 first(Dev_t d) {
      return d.inner.a;
    }
  )"));
  EXPECT_NE(m.c_source().find("return d.inner.a;"), std::string::npos);
}
