// cnext/sema/division_checker.cpp - Division checker implementation
//
#include "cnext/sema/analysis/division_checker.hpp"

#include <fmt/format.h>

#include <optional>

#include "cnext/basic/casting.hpp"
#include "cnext/sema/types/const_evaluator.hpp"

namespace cnext
{

namespace
{

/// Like evaluate_constant(), but also follows `const` locals.
std::optional<int64_t> divisor_value(const Expr * e, int depth = 0)
{
  if (e == nullptr || depth > 16) return std::nullopt;
  if (const auto * ref = dyn_cast<VarRefExpr>(e)) {
    if (const auto * local = dyn_cast<VarDeclStmt>(ref->resolvedDecl)) {
      if (local->isConst && local->dims.empty() && local->init != nullptr) {
        return divisor_value(local->init, depth + 1);
      }
      return std::nullopt;
    }
  }
  return evaluate_constant(e);
}

}  // namespace

bool DivisionChecker::check(const Program & program)
{
  errorCount_ = 0;
  visit(&program);
  return errorCount_ == 0;
}

bool DivisionChecker::visit_binary_expr(const BinaryExpr * node)
{
  if (node->op == BinaryOp::Div || node->op == BinaryOp::Mod) {
    check_divisor(node->rhs, node->op == BinaryOp::Mod, node);
  }
  return ConstRecursiveAstVisitor<DivisionChecker>::visit_binary_expr(node);
}

bool DivisionChecker::visit_assign_stmt(const AssignStmt * node)
{
  if (node->op == AssignOp::DivAssign || node->op == AssignOp::ModAssign) {
    check_divisor(node->value, node->op == AssignOp::ModAssign, node);
  }
  return ConstRecursiveAstVisitor<DivisionChecker>::visit_assign_stmt(node);
}

void DivisionChecker::check_divisor(const Expr * divisor, bool modulo, const AstNode * at)
{
  const TypeInfo * t = divisor != nullptr ? divisor->resolvedType : nullptr;
  if (t != nullptr && t->kind == TypeKind::Float) {
    return;
  }
  const auto value = divisor_value(divisor);
  if (!value || *value != 0) {
    return;
  }
  diags_.report_error(
    at->get_range(),
    fmt::format("{} by constant zero", modulo ? "modulo" : "division"))
    .with_code("E0703")
    .with_help("guard the divisor or use a non-zero constant");
  ++errorCount_;
}

}  // namespace cnext
