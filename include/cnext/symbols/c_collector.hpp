// cnext/symbols/c_collector.hpp - Declaration extractor for C headers
#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cnext/basic/diagnostic.hpp"
#include "cnext/basic/source_manager.hpp"
#include "cnext/symbols/symbol_table.hpp"
#include "cnext/symbols/ts_ll.hpp"

namespace cnext
{

/**
 * Extracts the declarations C-Next code can reference from a C header:
 * object-like macros, structs and unions (with field types), enums,
 * typedefs, function prototypes and extern variables.
 *
 * The header is parsed with tree-sitter-c and the concrete syntax tree is
 * walked; function bodies are never entered. Both branches of every
 * preprocessor conditional are read, except `__cplusplus` groups, which
 * are masked out before parsing (kept, minus their directives, for C++).
 * Syntax errors are reported as E0201 and the declarations around them
 * are still collected.
 *
 * Type names are resolved against the header's own earlier typedefs and
 * the symbols already collected from the headers it includes. A struct
 * or union without a tag used directly by a field or variable becomes a
 * symbol of its own, named "(anonymous struct at FILE:LINE:COL)".
 */
class CHeaderCollector
{
public:
  CHeaderCollector(
    const SourceFile & file, FileId file_id, const SymbolTable & known, DiagnosticBag & diags);
  virtual ~CHeaderCollector() = default;

  CHeaderCollector(const CHeaderCollector &) = delete;
  CHeaderCollector & operator=(const CHeaderCollector &) = delete;

  /// Runs the collector. Symbols come back in declaration order.
  [[nodiscard]] std::vector<Symbol> collect();

  [[nodiscard]] size_t error_count() const noexcept { return errors_; }

protected:
  // Parsed pieces of a declaration
  struct BaseSpec
  {
    TypeInfo type;
    bool isConst = false;
    bool isExtern = false;
    bool isTypedef = false;
    bool isStatic = false;
    /// Tag named by this specifier, qualified (`X` of `struct X`)
    std::string tagName;
    /// Tag declared by this specifier (`struct X {...}`, `enum E {...}`)
    std::optional<Symbol> tagDef;
    bool hasBody = false;
    /// Start of the struct/union/enum specifier
    uint32_t tagOffset = 0;
    std::string_view tagKeyword;
  };

  struct Declarator
  {
    std::string name;
    uint32_t line = 0;
    int pointerDepth = 0;
    bool isReference = false;
    bool isFunctionPointer = false;
    std::vector<uint32_t> dims;
    bool isFunction = false;
    std::vector<ParamInfo> params;
    bool isVariadic = false;
  };

  [[nodiscard]] virtual const TSLanguage * grammar() const { return ts_ll::tree_sitter_c(); }
  [[nodiscard]] virtual SourceLanguage language() const noexcept { return SourceLanguage::C; }
  /// Spelling of a tag type in generated C (`struct X` for C, `X` for C++).
  [[nodiscard]] virtual std::string tag_spelling(std::string_view keyword, std::string_view name) const;

  /// Hook for top-level constructs only another language has.
  virtual void read_extension(ts_ll::Node /*item*/) {}
  /// Hook for struct/class members other than fields.
  virtual void read_member_extension(ts_ll::Node /*member*/, bool & /*public_access*/) {}

  [[nodiscard]] std::string_view text(ts_ll::Node n) const noexcept { return n.text(source_); }
  /// Name text without whitespace (`hal :: Pin` -> `hal::Pin`).
  [[nodiscard]] static std::string compact(std::string_view text);
  [[nodiscard]] uint32_t line_of(ts_ll::Node n) const noexcept;
  void error(ts_ll::Node at, std::string message);
  void report_syntax_errors(ts_ll::Node n);

  /// Name as stored in the table (namespace-qualified for C++).
  [[nodiscard]] std::string qualify(std::string_view name) const;

  void read_item(ts_ll::Node item);
  void read_items(ts_ll::Node container);
  void read_macro(ts_ll::Node def);
  void read_declaration(ts_ll::Node decl);
  void read_type_definition(ts_ll::Node def);
  void read_function_definition(ts_ll::Node def);
  void read_bare_specifier(ts_ll::Node spec);

  std::optional<BaseSpec> read_base_spec(ts_ll::Node owner);
  bool read_type_specifier(ts_ll::Node type, BaseSpec & spec);
  std::optional<Symbol> read_record(ts_ll::Node spec, std::string_view keyword, bool & has_body);
  void read_record_body(ts_ll::Node body, std::string_view keyword, StructInfo & info, bool & public_access);
  void read_field(ts_ll::Node field, StructInfo & info, bool public_access);
  std::optional<Symbol> read_enum(ts_ll::Node spec, bool & has_body);
  void read_enum_body(ts_ll::Node body, EnumInfo & info, int64_t & next);
  [[nodiscard]] Declarator read_declarator(ts_ll::Node n);
  void read_params(ts_ll::Node list, Declarator & decl);

  /// Gives an untagged struct/union used by a declarator its own symbol.
  void adopt_anonymous_record(BaseSpec & spec);
  void emit_tag_definition(const BaseSpec & spec);
  void emit_function(const BaseSpec & spec, Declarator decl, bool is_definition);

  /// Type named by an identifier, from local typedefs, included headers or C scalars.
  [[nodiscard]] TypeInfo lookup_type_name(const std::string & name) const;
  [[nodiscard]] static TypeInfo apply_declarator(const BaseSpec & base, const Declarator & decl);
  /// Folds an integer constant expression of the parsed header.
  [[nodiscard]] std::optional<int64_t> eval_expr(ts_ll::Node e, std::string_view source) const;
  /// Folds a macro replacement list by parsing it as an initializer.
  [[nodiscard]] std::optional<int64_t> eval_int(std::string_view text) const;
  [[nodiscard]] std::optional<int64_t> lookup_constant(std::string_view name) const;

  void emit(Symbol sym);
  void emit_typedef(const BaseSpec & base, const Declarator & decl);
  [[nodiscard]] Symbol make_symbol(std::string name, uint32_t line) const;

  const SourceFile & file_;
  FileId file_id_;
  const SymbolTable & known_;
  DiagnosticBag & diags_;

  /// Header text with inactive language groups blanked; offsets match the file.
  std::string source_;
  std::unique_ptr<ts_ll::Parser> parser_;
  size_t errors_ = 0;
  std::vector<std::string> namespaces_;

  std::vector<Symbol> out_;
  std::map<std::string, TypeInfo, std::less<>> local_types_;
  std::map<std::string, int64_t, std::less<>> local_constants_;
  std::map<std::string, StructInfo, std::less<>> local_structs_;
};

}  // namespace cnext
