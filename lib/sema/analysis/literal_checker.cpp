// cnext/sema/literal_checker.cpp - Literal checker implementation
//
#include "cnext/sema/analysis/literal_checker.hpp"

#include <fmt/format.h>

#include "cnext/basic/casting.hpp"
#include "cnext/symbols/type_info.hpp"

namespace cnext
{

bool LiteralChecker::check(const Program & program)
{
  errorCount_ = 0;
  visit(&program);
  return errorCount_ == 0;
}

bool LiteralChecker::visit_int_literal_expr(const IntLiteralExpr * node)
{
  check_literal(node, false, node);
  return true;
}

bool LiteralChecker::visit_unary_expr(const UnaryExpr * node)
{
  if (node->op == UnaryOp::Neg) {
    if (const auto * lit = dyn_cast<IntLiteralExpr>(node->operand)) {
      check_literal(lit, true, node);
      return true;
    }
  }
  return ConstRecursiveAstVisitor<LiteralChecker>::visit_unary_expr(node);
}

void LiteralChecker::check_literal(const IntLiteralExpr * lit, bool negative, const Expr * at)
{
  const TypeInfo * t = at->resolvedType;
  if (t == nullptr || t->isArray || t->isPointer ||
      (t->kind != TypeKind::Integer && t->kind != TypeKind::Bitmap)) {
    return;
  }

  const IntegerRange range = integer_range(*t);
  const uint64_t magnitude = lit->value;
  // |min| computed without overflowing int64
  const uint64_t min_magnitude =
    range.min < 0 ? static_cast<uint64_t>(-(range.min + 1)) + 1 : 0;
  const std::string spelled = fmt::format("{}{}", negative ? "-" : "", lit->text);

  const bool out_of_range =
    negative ? (magnitude > min_magnitude) : (magnitude > range.max);
  if (out_of_range) {
    diags_.report_error(
      at->get_range(),
      fmt::format("literal {} does not fit in '{}'", spelled, t->to_string()))
      .with_code("E0702")
      .with_help(fmt::format(
        "'{}' holds {} to {}", t->to_string(), range.min, range.max));
    ++errorCount_;
    return;
  }

  if (!lit->is_decimal() || magnitude == 0) {
    return;
  }
  const bool is_min = negative && t->isSigned && magnitude == min_magnitude;
  const bool is_max = !negative && magnitude == range.max;
  if (!is_min && !is_max) {
    return;
  }

  // Only C-Next primitives have a spellable boundary constant.
  const std::string constant =
    fmt::format("{}.{}", t->baseType, is_max ? "MAX" : "MIN");
  const bool has_constant = t->kind == TypeKind::Integer && primitive_type(t->baseType).has_value();

  auto diag = diags_.report_error(
    at->get_range(),
    fmt::format("literal {} is the {} of '{}'", spelled, is_max ? "maximum" : "minimum",
                t->to_string()));
  diag.with_code("E0701");
  if (has_constant) {
    diag.with_help(fmt::format("write '{}' instead", constant))
      .with_fixit(at->get_range(), constant);
  } else {
    diag.with_help(fmt::format("write '{}' instead", boundary_macro(*t, is_max)));
  }
  ++errorCount_;
}

}  // namespace cnext
