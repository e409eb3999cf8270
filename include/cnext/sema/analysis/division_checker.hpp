// cnext/sema/analysis/division_checker.hpp - Constant division by zero
//
// Runs after TypeChecker and name resolution, so divisors that name
// constants can be folded.
//
#pragma once

#include "cnext/ast/ast.hpp"
#include "cnext/ast/visitor.hpp"
#include "cnext/basic/diagnostic.hpp"

namespace cnext
{

/**
 * Division checker (E0703).
 *
 * Rejects `/`, `%`, `/<-` and `%<-` whose right operand folds to zero at
 * compile time: a literal, a const global or local, an enum member or a
 * foreign macro. Divisors only known at run time are left alone.
 */
class DivisionChecker : public ConstRecursiveAstVisitor<DivisionChecker>
{
public:
  explicit DivisionChecker(DiagnosticBag & diags) : diags_(diags) {}

  /// Returns true if no errors occurred.
  bool check(const Program & program);

  [[nodiscard]] size_t error_count() const noexcept { return errorCount_; }

  // Visitor hooks
  bool visit_binary_expr(const BinaryExpr * node);
  bool visit_assign_stmt(const AssignStmt * node);

private:
  void check_divisor(const Expr * divisor, bool modulo, const AstNode * at);

  DiagnosticBag & diags_;
  size_t errorCount_ = 0;
};

}  // namespace cnext
