// cnext/sema/analysis/init_checker.hpp - Definite initialization analysis
//
// Checks that every local variable is assigned on every path before it is
// read. Struct locals are tracked per field.
//
// Runs after TypeChecker in the semantic analysis pipeline.
//
#pragma once

#include <map>
#include <set>
#include <string_view>
#include <utility>

#include "cnext/ast/ast.hpp"
#include "cnext/basic/diagnostic.hpp"
#include "cnext/sema/analysis/cfg.hpp"
#include "cnext/sema/resolution/module_info.hpp"
#include "cnext/symbols/symbol_table.hpp"

namespace cnext
{

// ============================================================================
// Initialization State
// ============================================================================

/**
 * Set of definitely initialized locals at a program point.
 *
 * A tracked variable is keyed by its VarDeclStmt. `fields` records struct
 * fields assigned one by one; a struct whose every field is assigned is
 * promoted into `vars`.
 */
struct InitState
{
  std::set<const VarDeclStmt *> vars;
  std::set<std::pair<const VarDeclStmt *, std::string_view>> fields;

  /// Meet: keep what is initialized on both paths. Returns true if this changed.
  bool meet(const InitState & other);
};

// ============================================================================
// Initialization Checker
// ============================================================================

/**
 * Definite initialization checker (E0381).
 *
 * Scalars and structs declared without an initializer start uninitialized.
 * Arrays and strings are zero-filled at their declaration and are never
 * tracked. Parameters and globals are always initialized.
 *
 * ## Usage
 * ```cpp
 * InitializationChecker checker(table, diags);
 * bool ok = checker.check(*module.program);
 * ```
 */
class InitializationChecker
{
public:
  InitializationChecker(const SymbolTable & table, DiagnosticBag & diags);

  // ===========================================================================
  // Entry Point
  // ===========================================================================

  /// Returns true if no errors occurred.
  bool check(const Program & program);

  /// Check one function using its CFG.
  void check(const FunctionDecl * fn, const CFG & cfg);

  [[nodiscard]] bool has_errors() const noexcept { return errorCount_ > 0; }
  [[nodiscard]] size_t error_count() const noexcept { return errorCount_; }

private:
  void check_decl(const Decl * decl);

  /// Run forward data-flow analysis on CFG
  void analyze_data_flow(const CFG & cfg);

  /// Transfer function for a basic block
  void transfer_block(const BasicBlock * block, InitState & state, bool report_errors);
  void transfer_stmt(const Stmt * stmt, InitState & state, bool report_errors);

  /// Record a write to `target`; reads implied by partial writes are checked too.
  void write_target(const Expr * target, InitState & state, bool report_errors);

  /// Check an expression for uninitialized reads
  void check_expr(const Expr * expr, const InitState & state, bool report_errors);
  void check_read(
    const VarDeclStmt * var, std::string_view field, const Expr * at, const InitState & state,
    bool report_errors);

  /// Arguments bound to foreign out-pointers are written, not read.
  [[nodiscard]] static bool is_out_argument(const CallExpr * call, size_t index);
  static void mark_out_arguments(const Expr * expr, InitState & state);

  [[nodiscard]] static const VarDeclStmt * tracked_var(const Expr * expr);
  [[nodiscard]] size_t field_count(const VarDeclStmt * var) const;

  const SymbolTable & table_;
  DiagnosticBag & diags_;

  std::set<const AstNode *> reported_;
  size_t errorCount_ = 0;
};

}  // namespace cnext
