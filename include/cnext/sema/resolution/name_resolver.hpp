// cnext/sema/resolution/name_resolver.hpp - Declaration registration and name lookup
//
// Walks one module in source order. Each declaration is entered into the
// shared SymbolTable when the walk reaches its end, so any reference to a
// C-Next symbol declared further down the file is caught as
// use-before-definition.
//
#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cnext/ast/ast.hpp"
#include "cnext/ast/visitor.hpp"
#include "cnext/basic/diagnostic.hpp"
#include "cnext/sema/resolution/module_info.hpp"
#include "cnext/symbols/symbol_table.hpp"

namespace cnext
{

/**
 * Name resolution pass.
 *
 * Registers every C-Next declaration (structs, enums, bitmaps, registers,
 * scopes, functions, globals) and resolves:
 * - PrimaryType names to TypeInfo (E0303 unknown type)
 * - VarRefExpr to locals, parameters, globals and foreign symbols
 * - qualified MemberExpr forms: `this.x`, `global.x`, `Scope.x`,
 *   `Enum.X`, `REG.FIELD`, `T.MIN`, `T.MAX`
 *
 * Scope rules: inside `scope S`, members are reached through `this.` and
 * file-level C-Next symbols through `global.` (E0423); outside, a private
 * member is unreachable (E0422). Bare enum members are rejected (E0424),
 * as are `ns::name` C++ symbols that generated C cannot reference (E0425).
 */
class NameResolver : public RecursiveAstVisitor<NameResolver>
{
public:
  NameResolver(ModuleInfo & module, SymbolTable & table, DiagnosticBag & diags)
  : module_(module), table_(table), diags_(diags)
  {
  }

  /// Resolves the whole module. Returns true if no errors occurred.
  bool resolve();

  // Visitor hooks
  bool visit_var_ref_expr(VarRefExpr * node);
  bool visit_member_expr(MemberExpr * node);
  bool visit_call_expr(CallExpr * node);
  bool visit_cast_expr(CastExpr * node);
  bool visit_var_decl_stmt(VarDeclStmt * node);
  bool visit_block_stmt(BlockStmt * node);
  bool visit_for_stmt(ForStmt * node);

  [[nodiscard]] bool has_errors() const noexcept { return errorCount_ > 0; }
  [[nodiscard]] size_t error_count() const noexcept { return errorCount_; }

private:
  struct LocalBinding
  {
    const AstNode * decl = nullptr;
    const TypeInfo * type = nullptr;
  };

  // Declarations
  void collect_pending();
  void declare(Decl * decl);
  void declare_struct(StructDecl * node);
  void declare_enum(EnumDecl * node);
  void declare_bitmap(BitmapDecl * node);
  void declare_register(RegisterDecl * node);
  void declare_scope(ScopeDecl * node);
  void declare_function(FunctionDecl * node);
  void declare_global(GlobalVarDecl * node);
  void register_symbol(Symbol sym, const Decl * decl);

  // Types
  [[nodiscard]] std::optional<TypeInfo> type_from_name(const PrimaryType * type);
  const TypeInfo * resolve_type(const PrimaryType * type, gsl::span<Expr *> dims, bool is_const);

  // Lookup
  [[nodiscard]] const Symbol * lookup_visible(std::string_view name) const;
  [[nodiscard]] const LocalBinding * lookup_local(std::string_view name) const;
  void bind_local(std::string_view name, const AstNode * decl, const TypeInfo * type);
  bool resolve_qualified(MemberExpr * node, const VarRefExpr * base);
  void resolve_scope_member(
    MemberExpr * node, std::string_view scope, std::string_view member, bool via_this);
  void report_unresolved(std::string_view name, SourceRange range);

  void report(SourceRange range, std::string code, std::string message, std::string help = "");

  ModuleInfo & module_;
  SymbolTable & table_;
  DiagnosticBag & diags_;

  /// C-Next names declared in this file but not yet reached by the walk
  std::map<std::string, const AstNode *, std::less<>> pending_;
  std::vector<std::map<std::string_view, LocalBinding>> locals_;

  std::string_view currentScope_;
  const FunctionDecl * currentFunction_ = nullptr;
  size_t errorCount_ = 0;
};

}  // namespace cnext
