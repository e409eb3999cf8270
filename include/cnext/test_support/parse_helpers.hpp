// cnext/test_support/parse_helpers.hpp - helpers for unit/integration tests
//
// These helpers provide a lightweight single-file pipeline for tests: parse
// inline C-Next text, declare foreign header text in the symbol table, and
// run the semantic passes the compiler driver runs.
//
#pragma once

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <utility>

#include "cnext/ast/ast_context.hpp"
#include "cnext/basic/diagnostic.hpp"
#include "cnext/basic/source_manager.hpp"
#include "cnext/codegen/c_generator.hpp"
#include "cnext/codegen/header_generator.hpp"
#include "cnext/driver/compiler.hpp"
#include "cnext/sema/resolution/module_info.hpp"
#include "cnext/sema/resolution/name_resolver.hpp"
#include "cnext/sema/types/type_checker.hpp"
#include "cnext/symbols/c_collector.hpp"
#include "cnext/symbols/cpp_collector.hpp"
#include "cnext/symbols/symbol_collector.hpp"
#include "cnext/symbols/symbol_table.hpp"
#include "cnext/symbols/system_headers.hpp"
#include "cnext/syntax/frontend.hpp"

namespace cnext::test_support
{

struct TestParseUnit
{
  SourceRegistry sources;
  FileId file_id = FileId::invalid();
  std::unique_ptr<AstContext> ast;
  DiagnosticBag diags;
  Program * program = nullptr;

  [[nodiscard]] std::string_view slice(SourceRange r) const noexcept
  {
    return sources.get_slice(r);
  }
};

[[nodiscard]] inline std::unique_ptr<TestParseUnit> parse(
  std::string src, const std::filesystem::path & virtual_path = "test.cnx")
{
  auto out = std::make_unique<TestParseUnit>();
  out->ast = std::make_unique<AstContext>();

  // Note: parse_source registers/updates the file content in the registry.
  const ParseOutput parsed =
    parse_source(out->sources, virtual_path, std::move(src), *out->ast, out->diags);
  out->file_id = parsed.file_id;
  out->program = parsed.program;
  return out;
}

/**
 * One C-Next module analyzed against a symbol table that tests may
 * pre-populate with foreign headers.
 *
 * Usage:
 *   TestModule m;
 *   m.add_c_header("hal.h", "typedef struct { uint32_t x; } Reg;");
 *   m.analyze("...");
 *   EXPECT_TRUE(m.diags.has_code("E0381"));
 */
struct TestModule
{
  SourceRegistry sources;
  SymbolTable table;
  DiagnosticBag diags;
  std::unique_ptr<ModuleInfo> module;

  /// Collect a C header from text into the symbol table.
  void add_c_header(const std::filesystem::path & path, std::string text)
  {
    const FileId id = sources.register_file(path, std::move(text));
    CHeaderCollector collector(*sources.get_file(id), id, table, diags);
    for (auto & sym : collector.collect()) {
      const uint32_t line = sym.line;
      (void)insert_symbol(table, diags, std::move(sym), range_of_line(sources, id, line));
    }
  }

  /// Collect a C++ header from text into the symbol table.
  void add_cpp_header(const std::filesystem::path & path, std::string text)
  {
    const FileId id = sources.register_file(path, std::move(text));
    CppHeaderCollector collector(*sources.get_file(id), id, table, diags);
    for (auto & sym : collector.collect()) {
      const uint32_t line = sym.line;
      (void)insert_symbol(table, diags, std::move(sym), range_of_line(sources, id, line));
    }
  }

  /// Declare the built-in knowledge of a system header such as "stdio.h".
  void add_system_header(std::string_view name)
  {
    for (auto & sym : builtin_header_symbols(name)) {
      (void)insert_symbol(table, diags, std::move(sym), SourceRange{});
    }
  }

  /// Parse `src`; false on syntax errors.
  bool parse(std::string src, const std::filesystem::path & path = "test.cnx")
  {
    module = std::make_unique<ModuleInfo>();
    module->ast = std::make_unique<AstContext>();
    const ParseOutput parsed = parse_source(sources, path, std::move(src), *module->ast, diags);
    module->file_id = parsed.file_id;
    module->path = path;
    module->source = sources.get_file(parsed.file_id);
    module->program = parsed.program;
    module->visibleFiles.insert(module->origin());
    return module->program != nullptr && !diags.has_errors();
  }

  /// Parse, resolve names and check types only.
  bool resolve(std::string src, const std::filesystem::path & path = "test.cnx")
  {
    if (!parse(std::move(src), path)) {
      return false;
    }
    NameResolver resolver(*module, table, diags);
    const bool resolved = resolver.resolve();
    TypeChecker checker(*module, table, diags);
    const bool typed = checker.check();
    return resolved && typed;
  }

  /// Parse and run every semantic pass the compiler runs.
  bool analyze(std::string src, const std::filesystem::path & path = "test.cnx")
  {
    if (!parse(std::move(src), path)) {
      return false;
    }
    return Compiler::run_semantic_analysis(*module, table, diags);
  }

  [[nodiscard]] Program * program() const noexcept
  {
    return module ? module->program : nullptr;
  }

  /// Generated `.c` text of the analyzed module.
  [[nodiscard]] std::string c_source() const
  {
    CGenerator gen(*module);
    return gen.generate();
  }

  /// Generated `.h` text of the analyzed module.
  [[nodiscard]] std::string c_header() const
  {
    HeaderGenerator gen(*module);
    return gen.generate();
  }
};

/// Scratch directory removed when the test ends.
class TempDir
{
public:
  TempDir()
  {
    namespace fs = std::filesystem;
    const fs::path base = fs::temp_directory_path();
    for (int i = 0;; ++i) {
      path_ = base / ("cnext_test_" + std::to_string(counter()++) + "_" + std::to_string(i));
      if (fs::create_directories(path_)) {
        break;
      }
    }
    path_ = fs::canonical(path_);
  }

  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;

  [[nodiscard]] const std::filesystem::path & path() const noexcept { return path_; }

  /// Write `text` to `relative` (parent directories are created).
  std::filesystem::path write(const std::filesystem::path & relative, const std::string & text) const
  {
    const std::filesystem::path full = path_ / relative;
    std::filesystem::create_directories(full.parent_path());
    std::ofstream out(full, std::ios::binary);
    out << text;
    return full;
  }

  /// Whole contents of `relative`, empty when missing.
  [[nodiscard]] std::string read(const std::filesystem::path & relative) const
  {
    return read_file_text(path_ / relative).value_or("");
  }

private:
  static int & counter()
  {
    static int next = 0;
    return next;
  }

  std::filesystem::path path_;
};

}  // namespace cnext::test_support
