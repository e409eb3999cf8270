// cnext/sema/analysis/null_checker.hpp - NULL safety for foreign interop
//
// C-Next values are never NULL. The only exception is the result of a
// closed set of C library functions that report failure with NULL; such
// results must be stored in `c_`-prefixed variables that are checked
// against NULL before every use.
//
// Runs after InitializationChecker.
//
#pragma once

#include <set>
#include <string_view>

#include "cnext/ast/ast.hpp"
#include "cnext/basic/diagnostic.hpp"
#include "cnext/sema/analysis/cfg.hpp"

namespace cnext
{

/// True for C library functions whose pointer result signals failure with NULL.
[[nodiscard]] bool is_nullable_c_function(std::string_view name) noexcept;

/// True for malloc/calloc/realloc/free.
[[nodiscard]] bool is_forbidden_allocation(std::string_view name) noexcept;

/// True for a declaration name carrying the `c_` interop prefix.
[[nodiscard]] bool has_interop_prefix(std::string_view name) noexcept;

/**
 * Null Safety State.
 * Tracks `c_` variables that are *known to be non-null*.
 */
using NullStateSet = std::set<const AstNode *>;

/**
 * Null safety checker (E0901 to E0908).
 *
 * Placement rules are checked on the syntax tree; the NULL-check dominance
 * rule (E0908) is a forward must-analysis over the function CFG where a
 * comparison against NULL narrows its variable on the proving edge.
 */
class NullChecker
{
public:
  explicit NullChecker(DiagnosticBag & diags) : diags_(diags) {}

  // ===========================================================================
  // Entry Point
  // ===========================================================================

  bool check(const Program & program);
  void check(const FunctionDecl * fn, const CFG & cfg);

  [[nodiscard]] bool has_errors() const noexcept { return errorCount_ > 0; }
  [[nodiscard]] size_t error_count() const noexcept { return errorCount_; }

private:
  // ===========================================================================
  // Placement rules
  // ===========================================================================

  void check_decl(const Decl * decl);
  void check_stmt(const Stmt * stmt);
  void check_prefix(std::string_view name, const TypeInfo * type, const AstNode * decl);
  void check_expr(const Expr * expr);
  /// `lhs = NULL` / `lhs != NULL`
  void check_null_comparison(const BinaryExpr * bin);

  [[nodiscard]] bool is_nullable_call(const Expr * expr) const;

  // ===========================================================================
  // Dominance analysis
  // ===========================================================================

  void analyze_data_flow(const CFG & cfg);
  void transfer_block(const BasicBlock * block, NullStateSet & state, bool report_errors);
  void transfer_stmt(const Stmt * stmt, NullStateSet & state, bool report_errors);
  static void transfer_edge(const BasicBlock::Edge & edge, NullStateSet & state);

  /// Adds the variables proven non-null when `cond` evaluates to `truth`.
  static void narrow(const Expr * cond, bool truth, NullStateSet & state);

  /// Reports uses of unchecked `c_` variables inside `expr`.
  void check_uses(const Expr * expr, const NullStateSet & state, bool report_errors);

  /// The `c_` declaration `expr` names, or nullptr.
  [[nodiscard]] static const AstNode * interop_var(const Expr * expr);

  void report(SourceRange range, std::string code, std::string message, std::string help);

  DiagnosticBag & diags_;

  std::set<const AstNode *> reported_;
  size_t errorCount_ = 0;
};

}  // namespace cnext
