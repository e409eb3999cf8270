// cnext/sema/analysis/const_checker.hpp - Const enforcement and parameter const inference
//
// Rejects writes to const variables and parameters, and decides for every
// unqualified parameter whether the function mutates it. Unmutated
// parameters are emitted const in both the header and the source.
//
// Runs after TypeChecker. Modules must be checked leaves-first and
// functions in source order, so that a callee's parameters are decided
// before its callers are checked.
//
#pragma once

#include "cnext/ast/ast.hpp"
#include "cnext/ast/visitor.hpp"
#include "cnext/basic/diagnostic.hpp"

namespace cnext
{

/**
 * Const checker (E0384) and ParamDecl::isMutated inference.
 *
 * A parameter is mutated when it is the root of an assignment target
 * (`p <- 1`, `p[i] <- 1`, `p.x +<- 1`, `p[3, 2] <- 0`) or when it is passed
 * to a parameter that is itself mutated: a C-Next parameter decided
 * earlier, or a foreign pointer parameter that is not pointer-to-const.
 */
class ConstChecker : public RecursiveAstVisitor<ConstChecker>
{
public:
  explicit ConstChecker(DiagnosticBag & diags) : diags_(diags) {}

  /// Returns true if no errors occurred.
  bool check(Program & program);

  [[nodiscard]] size_t error_count() const noexcept { return errorCount_; }

  // Visitor hooks
  bool visit_function_decl(FunctionDecl * node);
  bool visit_assign_stmt(AssignStmt * node);
  bool visit_call_expr(CallExpr * node);

  /// Declaration written through `target`, or nullptr for temporaries and registers.
  [[nodiscard]] static const AstNode * written_entity(const Expr * target);

  /// True if argument `index` of `call` may be written by the callee.
  [[nodiscard]] static bool is_mutating_argument(const CallExpr * call, size_t index);

private:
  void mark_written(const AstNode * entity);
  void report_const_write(const Expr * target, const AstNode * entity, const CallExpr * via);

  DiagnosticBag & diags_;
  FunctionDecl * currentFunction_ = nullptr;
  size_t errorCount_ = 0;
};

}  // namespace cnext
