// tests/unit/symbols/test_symbol_table.cpp - Unit tests for the cross-language symbol table
//
#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "cnext/symbols/symbol_collector.hpp"
#include "cnext/symbols/symbol_table.hpp"
#include "cnext/symbols/system_headers.hpp"

using cnext::FunctionInfo;
using cnext::InsertOutcome;
using cnext::MacroInfo;
using cnext::ParamInfo;
using cnext::SourceLanguage;
using cnext::Symbol;
using cnext::SymbolKind;
using cnext::SymbolTable;
using cnext::VariableInfo;

namespace
{

Symbol function(
  const std::string & name, SourceLanguage lang, const std::vector<std::string> & params,
  bool definition = false)
{
  Symbol sym;
  sym.name = name;
  sym.language = lang;
  sym.originFile = lang == SourceLanguage::CNext ? "main.cnx" : "api.h";
  sym.type = cnext::builtin_c_type("int");
  FunctionInfo fn;
  fn.returnType = sym.type;
  for (const auto & p : params) {
    ParamInfo param;
    param.type = cnext::builtin_c_type(p);
    fn.params.push_back(param);
  }
  fn.isDefinition = definition;
  sym.details = fn;
  return sym;
}

Symbol variable(const std::string & name, SourceLanguage lang, bool is_extern)
{
  Symbol sym;
  sym.name = name;
  sym.language = lang;
  sym.originFile = "globals.h";
  sym.type = cnext::builtin_c_type("uint32_t");
  VariableInfo var;
  var.isExtern = is_extern;
  sym.details = var;
  return sym;
}

Symbol macro(const std::string & name, const std::string & value)
{
  Symbol sym;
  sym.name = name;
  sym.language = SourceLanguage::C;
  sym.originFile = "config.h";
  MacroInfo info;
  info.value = value;
  sym.details = info;
  return sym;
}

}  // namespace

TEST(SymbolTable, InsertAndLookup)
{
  SymbolTable table;
  EXPECT_EQ(table.insert(function("init", SourceLanguage::C, {})).outcome, InsertOutcome::Inserted);

  const Symbol * sym = table.lookup("init");
  ASSERT_NE(sym, nullptr);
  EXPECT_EQ(sym->kind(), SymbolKind::Function);
  EXPECT_TRUE(sym->is_foreign());
  EXPECT_EQ(table.lookup("missing"), nullptr);
  EXPECT_EQ(table.size(), 1U);
}

TEST(SymbolTable, RepeatedPrototypesMerge)
{
  SymbolTable table;
  ASSERT_TRUE(table.insert(function("read", SourceLanguage::C, {"int"})).ok());
  const auto again = table.insert(function("read", SourceLanguage::C, {"int"}));
  EXPECT_EQ(again.outcome, InsertOutcome::Merged);
  EXPECT_EQ(table.size(), 1U);
}

TEST(SymbolTable, PrototypeThenDefinitionMerges)
{
  SymbolTable table;
  ASSERT_TRUE(table.insert(function("read", SourceLanguage::C, {"int"})).ok());
  const auto def = table.insert(function("read", SourceLanguage::C, {"int"}, true));
  ASSERT_EQ(def.outcome, InsertOutcome::Merged);
  EXPECT_TRUE(def.symbol->as<FunctionInfo>()->isDefinition);
}

TEST(SymbolTable, TwoDefinitionsConflict)
{
  SymbolTable table;
  ASSERT_TRUE(table.insert(function("read", SourceLanguage::C, {"int"}, true)).ok());
  EXPECT_EQ(
    table.insert(function("read", SourceLanguage::C, {"int"}, true)).outcome,
    InsertOutcome::Conflict);
}

TEST(SymbolTable, CppOverloadsCoexist)
{
  SymbolTable table;
  ASSERT_TRUE(table.insert(function("scale", SourceLanguage::Cpp, {"int"})).ok());
  EXPECT_EQ(
    table.insert(function("scale", SourceLanguage::Cpp, {"double"})).outcome,
    InsertOutcome::Overload);
  EXPECT_EQ(table.lookup_all("scale").size(), 2U);
}

TEST(SymbolTable, COverloadIsConflict)
{
  SymbolTable table;
  ASSERT_TRUE(table.insert(function("scale", SourceLanguage::C, {"int"})).ok());
  EXPECT_EQ(
    table.insert(function("scale", SourceLanguage::C, {"double"})).outcome,
    InsertOutcome::Conflict);
}

TEST(SymbolTable, RepeatedExternVariablesMerge)
{
  SymbolTable table;
  ASSERT_TRUE(table.insert(variable("ticks", SourceLanguage::C, true)).ok());
  EXPECT_EQ(
    table.insert(variable("ticks", SourceLanguage::C, true)).outcome, InsertOutcome::Merged);
}

TEST(SymbolTable, IdenticalMacrosMergeAndDifferentOnesConflict)
{
  SymbolTable table;
  ASSERT_TRUE(table.insert(macro("BUF_SIZE", "64")).ok());
  EXPECT_EQ(table.insert(macro("BUF_SIZE", "64")).outcome, InsertOutcome::Merged);
  EXPECT_EQ(table.insert(macro("BUF_SIZE", "128")).outcome, InsertOutcome::Conflict);
}

TEST(SymbolTable, CrossLanguageConflictReportsE0301)
{
  SymbolTable table;
  cnext::DiagnosticBag diags;
  ASSERT_TRUE(cnext::insert_symbol(
    table, diags, function("update", SourceLanguage::C, {}), cnext::SourceRange{}));
  EXPECT_FALSE(cnext::insert_symbol(
    table, diags, function("update", SourceLanguage::CNext, {}), cnext::SourceRange{}));
  EXPECT_EQ(diags.count_code("E0301"), 1U);
}

TEST(SymbolTable, SameLanguageDuplicateReportsE0302)
{
  SymbolTable table;
  cnext::DiagnosticBag diags;
  ASSERT_TRUE(cnext::insert_symbol(
    table, diags, variable("count", SourceLanguage::C, false), cnext::SourceRange{}));
  EXPECT_FALSE(cnext::insert_symbol(
    table, diags, variable("count", SourceLanguage::C, false), cnext::SourceRange{}));
  EXPECT_EQ(diags.count_code("E0302"), 1U);
}

TEST(SymbolTable, SymbolsFromFileKeepInsertionOrder)
{
  SymbolTable table;
  ASSERT_TRUE(table.insert(function("b", SourceLanguage::C, {})).ok());
  ASSERT_TRUE(table.insert(function("a", SourceLanguage::C, {})).ok());
  ASSERT_TRUE(table.insert(variable("g", SourceLanguage::C, true)).ok());

  const auto from_api = table.symbols_from("api.h");
  ASSERT_EQ(from_api.size(), 2U);
  EXPECT_EQ(from_api[0]->name, "b");
  EXPECT_EQ(from_api[1]->name, "a");
}

TEST(SymbolTable, BuiltinHeadersProvideSymbols)
{
  EXPECT_TRUE(cnext::is_builtin_system_header("stdio.h"));
  EXPECT_FALSE(cnext::is_builtin_system_header("hal.h"));

  SymbolTable table;
  for (auto & sym : cnext::builtin_header_symbols("stdio.h")) {
    (void)table.insert(std::move(sym));
  }
  const Symbol * printf_sym = table.lookup_kind("printf", SymbolKind::Function);
  ASSERT_NE(printf_sym, nullptr);
  EXPECT_TRUE(printf_sym->as<FunctionInfo>()->isVariadic);
}

TEST(SymbolTable, StdintLimitsFoldWithTheirCTypes)
{
  SymbolTable table;
  for (auto & sym : cnext::builtin_header_symbols("stdint.h")) {
    (void)table.insert(std::move(sym));
  }

  const Symbol * int16_min = table.lookup_kind("INT16_MIN", SymbolKind::Macro);
  const Symbol * int32_min = table.lookup_kind("INT32_MIN", SymbolKind::Macro);
  const Symbol * int64_min = table.lookup_kind("INT64_MIN", SymbolKind::Macro);
  const Symbol * int64_max = table.lookup_kind("INT64_MAX", SymbolKind::Macro);
  const Symbol * uint32_max = table.lookup_kind("UINT32_MAX", SymbolKind::Macro);
  const Symbol * uint64_max = table.lookup_kind("UINT64_MAX", SymbolKind::Macro);
  ASSERT_TRUE(int16_min && int32_min && int64_min && int64_max && uint32_max && uint64_max);

  EXPECT_EQ(int16_min->as<MacroInfo>()->intValue, std::optional<int64_t>(-32768));
  EXPECT_EQ(int16_min->type.bitWidth, 32U);
  EXPECT_EQ(int32_min->as<MacroInfo>()->intValue, std::optional<int64_t>(INT32_MIN));

  EXPECT_EQ(int64_min->as<MacroInfo>()->intValue, std::optional<int64_t>(INT64_MIN));
  EXPECT_EQ(int64_min->type.bitWidth, 64U);
  EXPECT_TRUE(int64_min->type.isSigned);
  EXPECT_EQ(int64_max->as<MacroInfo>()->intValue, std::optional<int64_t>(INT64_MAX));

  EXPECT_EQ(uint32_max->as<MacroInfo>()->intValue, std::optional<int64_t>(4294967295LL));
  EXPECT_FALSE(uint32_max->type.isSigned);

  // Beyond int64_t: typed, but not folded
  EXPECT_FALSE(uint64_max->as<MacroInfo>()->intValue.has_value());
  EXPECT_EQ(uint64_max->type.kind, cnext::TypeKind::Integer);
  EXPECT_EQ(uint64_max->type.bitWidth, 64U);
  EXPECT_FALSE(uint64_max->type.isSigned);
}
