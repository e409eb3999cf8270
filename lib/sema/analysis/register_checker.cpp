// cnext/sema/register_checker.cpp - Register access checker implementation
//
#include "cnext/sema/analysis/register_checker.hpp"

#include <fmt/format.h>

#include "cnext/basic/casting.hpp"

namespace cnext
{

namespace
{

/// The register field an assignment target writes, and whether the write
/// touches only some bits.
const MemberExpr * written_register_field(const Expr * target, bool & partial)
{
  partial = false;
  if (const auto * idx = dyn_cast<IndexExpr>(target)) {
    if (idx->accessKind != IndexAccessKind::BitIndex &&
        idx->accessKind != IndexAccessKind::BitRange) {
      return nullptr;
    }
    partial = true;
    target = idx->base;
  }
  const auto * mem = dyn_cast<MemberExpr>(target);
  if (mem == nullptr || mem->accessKind != MemberAccessKind::RegisterField) {
    return nullptr;
  }
  return mem;
}

}  // namespace

bool RegisterChecker::check(const Program & program)
{
  errorCount_ = 0;
  visit(&program);
  return errorCount_ == 0;
}

bool RegisterChecker::visit_assign_stmt(const AssignStmt * node)
{
  bool partial = false;
  const MemberExpr * field = written_register_field(node->target, partial);
  if (field == nullptr) {
    return ConstRecursiveAstVisitor<RegisterChecker>::visit_assign_stmt(node);
  }

  const bool rmw = partial || node->op != AssignOp::Assign;
  const RegisterAccess access = field->registerAccess;
  if (access == RegisterAccess::ReadOnly) {
    diags_.report_error(
      node->target->get_range(), fmt::format("cannot write read-only register field '{}'",
                                               field->cName))
      .with_code("E1002")
      .with_help("the field is declared 'ro'");
    ++errorCount_;
  } else if (rmw && is_write_only(access)) {
    diags_.report_error(
      node->target->get_range(),
      fmt::format("{} of '{}' reads a '{}' register field",
                  partial ? "bit write" : "compound assignment", field->cName, to_string(access)))
      .with_code("E1003")
      .with_help(fmt::format("write the whole field: {} <- value", field->cName));
    ++errorCount_;
  }

  writeTarget_ = field;
  visit(node->target);
  writeTarget_ = nullptr;
  visit(node->value);
  return true;
}

bool RegisterChecker::visit_member_expr(const MemberExpr * node)
{
  if (
    node->accessKind == MemberAccessKind::RegisterField && node != writeTarget_ &&
    is_write_only(node->registerAccess)) {
    diags_.report_error(
      node->get_range(),
      fmt::format("cannot read '{}' register field '{}'", to_string(node->registerAccess),
                  node->cName))
      .with_code("E1001")
      .with_help("write-only fields read back undefined or side-effecting values");
    ++errorCount_;
  }
  return ConstRecursiveAstVisitor<RegisterChecker>::visit_member_expr(node);
}

}  // namespace cnext
