// cnext/sema/analysis/register_checker.hpp - Register field access modes
#pragma once

#include "cnext/ast/ast.hpp"
#include "cnext/ast/visitor.hpp"
#include "cnext/basic/diagnostic.hpp"

namespace cnext
{

/**
 * Register access checker (E1001 to E1003).
 *
 * | access        | read  | full write | bit / compound write |
 * |---------------|-------|------------|----------------------|
 * | rw            | ok    | ok         | ok                   |
 * | ro            | ok    | E1002      | E1002                |
 * | wo, w1c, w1s  | E1001 | ok         | E1003                |
 *
 * A bit or compound write compiles to a read-modify-write of the whole
 * register, so on write-only fields it is rejected like any other read.
 */
class RegisterChecker : public ConstRecursiveAstVisitor<RegisterChecker>
{
public:
  explicit RegisterChecker(DiagnosticBag & diags) : diags_(diags) {}

  /// Returns true if no errors occurred.
  bool check(const Program & program);

  [[nodiscard]] size_t error_count() const noexcept { return errorCount_; }

  // Visitor hooks
  bool visit_assign_stmt(const AssignStmt * node);
  bool visit_member_expr(const MemberExpr * node);

private:
  DiagnosticBag & diags_;
  /// Register field written by the assignment being visited
  const MemberExpr * writeTarget_ = nullptr;
  size_t errorCount_ = 0;
};

}  // namespace cnext
