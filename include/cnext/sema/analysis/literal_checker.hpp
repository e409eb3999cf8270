// cnext/sema/analysis/literal_checker.hpp - Integer literal range checks
//
// Runs after TypeChecker, which gives every integer literal the type of
// its context.
//
#pragma once

#include "cnext/ast/ast.hpp"
#include "cnext/ast/visitor.hpp"
#include "cnext/basic/diagnostic.hpp"

namespace cnext
{

/**
 * Literal checker (E0701, E0702).
 *
 * - E0701: a decimal literal spelling the exact MAX of its type, or the
 *   MIN of a signed type. The boundary constant (`i32.MIN`) is required
 *   instead; it compiles to the `<stdint.h>` macro, which sidesteps the C
 *   rule that `-2147483648` is a negated long literal. Hex, octal and
 *   binary literals are bit patterns and exempt.
 * - E0702: a literal that does not fit its type at all.
 */
class LiteralChecker : public ConstRecursiveAstVisitor<LiteralChecker>
{
public:
  explicit LiteralChecker(DiagnosticBag & diags) : diags_(diags) {}

  /// Returns true if no errors occurred.
  bool check(const Program & program);

  [[nodiscard]] size_t error_count() const noexcept { return errorCount_; }

  // Visitor hooks
  bool visit_int_literal_expr(const IntLiteralExpr * node);
  bool visit_unary_expr(const UnaryExpr * node);

private:
  /// `negative` is set for `-literal`; `at` spans the whole signed literal.
  void check_literal(const IntLiteralExpr * lit, bool negative, const Expr * at);

  DiagnosticBag & diags_;
  size_t errorCount_ = 0;
};

}  // namespace cnext
