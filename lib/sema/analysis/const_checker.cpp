// cnext/sema/const_checker.cpp - Const checker implementation
//
#include "cnext/sema/analysis/const_checker.hpp"

#include <fmt/format.h>

#include "cnext/basic/casting.hpp"
#include "cnext/symbols/symbol.hpp"

namespace cnext
{

namespace
{

bool is_const_entity(const AstNode * entity)
{
  if (const auto * param = dyn_cast<ParamDecl>(entity)) return param->isConst;
  if (const auto * local = dyn_cast<VarDeclStmt>(entity)) return local->isConst;
  if (const auto * global = dyn_cast<GlobalVarDecl>(entity)) return global->isConst;
  return false;
}

std::string_view entity_name(const AstNode * entity)
{
  if (const auto * param = dyn_cast<ParamDecl>(entity)) return param->name;
  if (const auto * local = dyn_cast<VarDeclStmt>(entity)) return local->name;
  if (const auto * global = dyn_cast<GlobalVarDecl>(entity)) return global->name;
  return {};
}

}  // namespace

bool ConstChecker::check(Program & program)
{
  errorCount_ = 0;
  visit(&program);
  return errorCount_ == 0;
}

// ============================================================================
// Visitor hooks
// ============================================================================

bool ConstChecker::visit_function_decl(FunctionDecl * node)
{
  currentFunction_ = node;
  const bool result = RecursiveAstVisitor::visit_function_decl(node);
  currentFunction_ = nullptr;
  return result;
}

bool ConstChecker::visit_assign_stmt(AssignStmt * node)
{
  const AstNode * entity = written_entity(node->target);
  if (entity != nullptr) {
    if (is_const_entity(entity)) {
      report_const_write(node->target, entity, nullptr);
    } else {
      mark_written(entity);
    }
  }
  return RecursiveAstVisitor::visit_assign_stmt(node);
}

bool ConstChecker::visit_call_expr(CallExpr * node)
{
  for (size_t i = 0; i < node->args.size(); ++i) {
    if (!is_mutating_argument(node, i)) continue;
    const AstNode * entity = written_entity(node->args[i]);
    if (entity == nullptr) continue;
    if (is_const_entity(entity)) {
      report_const_write(node->args[i], entity, node);
    } else {
      mark_written(entity);
    }
  }
  return RecursiveAstVisitor::visit_call_expr(node);
}

// ============================================================================
// Helpers
// ============================================================================

const AstNode * ConstChecker::written_entity(const Expr * target)
{
  while (target != nullptr) {
    if (const auto * ref = dyn_cast<VarRefExpr>(target)) {
      return ref->resolvedDecl;
    }
    if (const auto * idx = dyn_cast<IndexExpr>(target)) {
      target = idx->base;
      continue;
    }
    if (const auto * mem = dyn_cast<MemberExpr>(target)) {
      switch (mem->accessKind) {
        case MemberAccessKind::Field:
        case MemberAccessKind::BitmapField:
          target = mem->base;
          continue;
        case MemberAccessKind::Symbol:
          return mem->resolvedDecl;
        default:
          return nullptr;
      }
    }
    return nullptr;
  }
  return nullptr;
}

bool ConstChecker::is_mutating_argument(const CallExpr * call, size_t index)
{
  const Symbol * sym = call->resolvedSymbol;
  if (sym == nullptr) return false;

  if (const auto * fn = dyn_cast<FunctionDecl>(sym->decl)) {
    return index < fn->params.size() && fn->params[index]->isMutated;
  }
  const auto * info = sym->as<FunctionInfo>();
  return info != nullptr && index < info->params.size() &&
         info->params[index].writesThroughPointer;
}

void ConstChecker::mark_written(const AstNode * entity)
{
  if (currentFunction_ == nullptr) return;
  for (ParamDecl * param : currentFunction_->params) {
    if (param == entity) {
      param->isMutated = true;
      return;
    }
  }
}

void ConstChecker::report_const_write(
  const Expr * target, const AstNode * entity, const CallExpr * via)
{
  const std::string_view name = entity_name(entity);
  const bool is_param = isa<ParamDecl>(entity);

  std::string message;
  if (via != nullptr) {
    message = fmt::format(
      "const '{}' is passed to a parameter that modifies it", name);
  } else {
    message = fmt::format("cannot assign to const {} '{}'", is_param ? "parameter" : "variable",
                          name);
  }

  auto diag = diags_.report_error(target->get_range(), std::move(message));
  diag.with_code("E0384").with_secondary_label(entity->get_range(), "declared const here");
  if (via != nullptr && via->resolvedSymbol != nullptr) {
    diag.with_help(fmt::format(
      "'{}' writes to this argument; pass a non-const copy", via->resolvedSymbol->name));
  } else {
    diag.with_help(fmt::format("remove 'const' from '{}' or write to a copy", name));
  }
  ++errorCount_;
}

}  // namespace cnext
