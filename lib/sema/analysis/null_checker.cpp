// cnext/sema/null_checker.cpp - Null safety checker implementation
//
#include "cnext/sema/analysis/null_checker.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <deque>
#include <vector>

#include "cnext/basic/casting.hpp"
#include "cnext/sema/analysis/cfg_builder.hpp"
#include "cnext/symbols/symbol.hpp"

namespace cnext
{

namespace
{

constexpr std::array<std::string_view, 10> k_nullable_functions = {
  "fopen", "freopen", "tmpfile", "fgets", "gets", "strstr", "strchr", "strrchr", "memchr", "getenv",
};

constexpr std::array<std::string_view, 4> k_forbidden_functions = {
  "malloc", "calloc", "realloc", "free",
};

bool is_null(const Expr * e) { return isa<NullLiteralExpr>(e); }

/// The non-NULL side of `x = NULL` / `NULL != x`, or nullptr.
const Expr * null_compared_operand(const Expr * e, BinaryOp * op = nullptr)
{
  const auto * bin = dyn_cast<BinaryExpr>(e);
  if (bin == nullptr || (bin->op != BinaryOp::Eq && bin->op != BinaryOp::Ne)) return nullptr;
  if (op != nullptr) *op = bin->op;
  if (is_null(bin->rhs)) return bin->lhs;
  if (is_null(bin->lhs)) return bin->rhs;
  return nullptr;
}

std::string_view callee_name(const CallExpr * call)
{
  if (const auto * ref = dyn_cast<VarRefExpr>(call->callee)) return ref->name;
  return {};
}

std::pair<std::string_view, const TypeInfo *> decl_name_and_type(const AstNode * decl)
{
  if (const auto * v = dyn_cast<VarDeclStmt>(decl)) return {v->name, v->resolvedType};
  if (const auto * p = dyn_cast<ParamDecl>(decl)) return {p->name, p->resolvedType};
  if (const auto * g = dyn_cast<GlobalVarDecl>(decl)) return {g->name, g->resolvedType};
  return {{}, nullptr};
}

}  // namespace

bool is_nullable_c_function(std::string_view name) noexcept
{
  return std::find(k_nullable_functions.begin(), k_nullable_functions.end(), name) !=
         k_nullable_functions.end();
}

bool is_forbidden_allocation(std::string_view name) noexcept
{
  return std::find(k_forbidden_functions.begin(), k_forbidden_functions.end(), name) !=
         k_forbidden_functions.end();
}

bool has_interop_prefix(std::string_view name) noexcept
{
  return name.size() > 2 && name.substr(0, 2) == "c_";
}

// ============================================================================
// Entry Point
// ============================================================================

bool NullChecker::check(const Program & program)
{
  for (const Decl * decl : program.decls) {
    check_decl(decl);
  }
  return !has_errors();
}

void NullChecker::check_decl(const Decl * decl)
{
  if (const auto * scope = dyn_cast<ScopeDecl>(decl)) {
    for (const Decl * member : scope->members) {
      check_decl(member);
    }
    return;
  }

  if (const auto * global = dyn_cast<GlobalVarDecl>(decl)) {
    check_prefix(global->name, global->resolvedType, global);
    check_expr(global->init);
    return;
  }

  if (const auto * fn = dyn_cast<FunctionDecl>(decl)) {
    for (const ParamDecl * param : fn->params) {
      check_prefix(param->name, param->resolvedType, param);
    }
    if (fn->body == nullptr) return;
    check_stmt(fn->body);

    CFGBuilder builder;
    if (auto cfg = builder.build(fn)) {
      check(fn, *cfg);
    }
  }
}

void NullChecker::check(const FunctionDecl * fn, const CFG & cfg)
{
  if (fn == nullptr) return;
  analyze_data_flow(cfg);
}

// ============================================================================
// Placement rules
// ============================================================================

void NullChecker::check_stmt(const Stmt * stmt)
{
  if (stmt == nullptr) return;

  switch (stmt->get_kind()) {
    case NodeKind::VarDeclStmt: {
      const auto * decl = cast<VarDeclStmt>(stmt);
      check_prefix(decl->name, decl->resolvedType, decl);
      if (is_nullable_call(decl->init)) {
        const auto * call = cast<CallExpr>(decl->init);
        if (!has_interop_prefix(decl->name)) {
          report(
            decl->get_range(), "E0905",
            fmt::format("'{}' holds the result of '{}', which can be NULL", decl->name,
                        callee_name(call)),
            fmt::format("rename it to 'c_{}' and compare it with NULL before use", decl->name));
        }
        for (const Expr * arg : call->args) check_expr(arg);
      } else {
        check_expr(decl->init);
      }
      break;
    }

    case NodeKind::AssignStmt: {
      const auto * assign = cast<AssignStmt>(stmt);
      if (is_nullable_call(assign->value)) {
        const auto * call = cast<CallExpr>(assign->value);
        if (interop_var(assign->target) == nullptr || assign->op != AssignOp::Assign) {
          report(
            assign->get_range(), "E0904",
            fmt::format("the result of '{}' can be NULL and may only be stored in a c_ variable",
                        callee_name(call)),
            "assign it to a variable whose name starts with 'c_'");
        }
        for (const Expr * arg : call->args) check_expr(arg);
      } else {
        check_expr(assign->value);
      }
      check_expr(assign->target);
      break;
    }

    case NodeKind::ExprStmt:
      check_expr(cast<ExprStmt>(stmt)->expr);
      break;

    case NodeKind::ReturnStmt:
      check_expr(cast<ReturnStmt>(stmt)->value);
      break;

    case NodeKind::BlockStmt:
      for (const Stmt * s : cast<BlockStmt>(stmt)->stmts) check_stmt(s);
      break;

    case NodeKind::IfStmt: {
      const auto * s = cast<IfStmt>(stmt);
      check_expr(s->condition);
      check_stmt(s->thenBlock);
      check_stmt(s->elseStmt);
      break;
    }

    case NodeKind::WhileStmt: {
      const auto * s = cast<WhileStmt>(stmt);
      check_expr(s->condition);
      check_stmt(s->body);
      break;
    }

    case NodeKind::DoWhileStmt: {
      const auto * s = cast<DoWhileStmt>(stmt);
      check_stmt(s->body);
      check_expr(s->condition);
      break;
    }

    case NodeKind::ForStmt: {
      const auto * s = cast<ForStmt>(stmt);
      check_stmt(s->init);
      check_expr(s->condition);
      check_stmt(s->update);
      check_stmt(s->body);
      break;
    }

    case NodeKind::SwitchStmt: {
      const auto * s = cast<SwitchStmt>(stmt);
      check_expr(s->subject);
      for (const SwitchCase * c : s->cases) {
        for (const Expr * label : c->labels) check_expr(label);
        check_stmt(c->body);
      }
      if (s->defaultCase != nullptr) check_stmt(s->defaultCase->body);
      break;
    }

    default:
      break;
  }
}

void NullChecker::check_prefix(std::string_view name, const TypeInfo * type, const AstNode * decl)
{
  if (!has_interop_prefix(name) || type == nullptr || type->is_nullable()) return;
  report(
    decl->get_range(), "E0906",
    fmt::format("'{}' has the c_ prefix but its type '{}' can never be NULL", name,
                type->to_string()),
    fmt::format("the c_ prefix is reserved for nullable C results; rename it to '{}'",
                name.substr(2)));
}

void NullChecker::check_expr(const Expr * expr)
{
  if (expr == nullptr) return;

  switch (expr->get_kind()) {
    case NodeKind::NullLiteral:
      report(
        expr->get_range(), "E0903", "NULL may only appear in a comparison",
        "C-Next values are never NULL; compare a c_ variable with '= NULL' or '!= NULL'");
      break;

    case NodeKind::BinaryExpr: {
      const auto * bin = cast<BinaryExpr>(expr);
      if (null_compared_operand(bin) != nullptr) {
        check_null_comparison(bin);
      } else {
        check_expr(bin->lhs);
        check_expr(bin->rhs);
      }
      break;
    }

    case NodeKind::CallExpr: {
      const auto * call = cast<CallExpr>(expr);
      const std::string_view name = callee_name(call);
      if (is_forbidden_allocation(name)) {
        report(
          call->get_range(), "E0902", fmt::format("dynamic allocation is not allowed: '{}'", name),
          "use a fixed-size array or a statically allocated buffer");
      } else if (is_nullable_call(call)) {
        report(
          call->get_range(), "E0901",
          fmt::format("the result of '{}' can be NULL and must be checked before use", name),
          fmt::format("store it in a c_ variable and compare it with NULL, or compare "
                      "'{}(...) != NULL' directly", name));
      }
      for (const Expr * arg : call->args) check_expr(arg);
      if (!isa<VarRefExpr>(call->callee)) check_expr(call->callee);
      break;
    }

    case NodeKind::UnaryExpr:
      check_expr(cast<UnaryExpr>(expr)->operand);
      break;

    case NodeKind::TernaryExpr: {
      const auto * tern = cast<TernaryExpr>(expr);
      check_expr(tern->condition);
      check_expr(tern->thenExpr);
      check_expr(tern->elseExpr);
      break;
    }

    case NodeKind::CastExpr:
      check_expr(cast<CastExpr>(expr)->expr);
      break;

    case NodeKind::IndexExpr: {
      const auto * idx = cast<IndexExpr>(expr);
      check_expr(idx->base);
      check_expr(idx->index);
      check_expr(idx->width);
      break;
    }

    case NodeKind::MemberExpr:
      check_expr(cast<MemberExpr>(expr)->base);
      break;

    case NodeKind::ArrayLiteralExpr:
      for (const Expr * e : cast<ArrayLiteralExpr>(expr)->elements) check_expr(e);
      break;

    case NodeKind::StructLiteralExpr:
      for (const FieldInit * f : cast<StructLiteralExpr>(expr)->fields) check_expr(f->value);
      break;

    default:
      break;
  }
}

void NullChecker::check_null_comparison(const BinaryExpr * bin)
{
  const Expr * other = null_compared_operand(bin);
  if (is_null(other)) {
    report(bin->get_range(), "E0907", "comparing NULL with NULL", "");
    return;
  }
  if (is_nullable_call(other)) {
    for (const Expr * arg : cast<CallExpr>(other)->args) check_expr(arg);
    return;
  }

  const TypeInfo * t = other->resolvedType;
  if (t != nullptr && !t->is_nullable()) {
    report(
      bin->get_range(), "E0907",
      fmt::format("a value of type '{}' can never be NULL", t->to_string()),
      "only c_ variables holding nullable C results are compared with NULL");
  }
  check_expr(other);
}

bool NullChecker::is_nullable_call(const Expr * expr) const
{
  const auto * call = dyn_cast<CallExpr>(expr);
  if (call == nullptr || call->resolvedSymbol == nullptr || !call->resolvedSymbol->is_foreign()) {
    return false;
  }
  return is_nullable_c_function(call->resolvedSymbol->name);
}

// ============================================================================
// Dominance analysis
// ============================================================================

namespace
{

bool intersect(NullStateSet & target, const NullStateSet & source)
{
  bool changed = false;
  for (auto it = target.begin(); it != target.end();) {
    if (source.count(*it) == 0) {
      it = target.erase(it);
      changed = true;
    } else {
      ++it;
    }
  }
  return changed;
}

}  // namespace

void NullChecker::analyze_data_flow(const CFG & cfg)
{
  if (cfg.blocks.empty() || cfg.entry == nullptr) return;

  std::vector<NullStateSet> block_in_states(cfg.blocks.size());
  std::vector<bool> visited(cfg.blocks.size(), false);

  std::deque<BasicBlock *> worklist;
  worklist.push_back(cfg.entry);
  visited[cfg.entry->id] = true;

  while (!worklist.empty()) {
    BasicBlock * block = worklist.front();
    worklist.pop_front();

    NullStateSet out_state = block_in_states[block->id];
    transfer_block(block, out_state, false);

    for (const auto & edge : block->successors) {
      BasicBlock * succ = edge.target;
      if (succ == nullptr) continue;

      NullStateSet after_edge = out_state;
      transfer_edge(edge, after_edge);

      if (!visited[succ->id]) {
        block_in_states[succ->id] = std::move(after_edge);
        visited[succ->id] = true;
        worklist.push_back(succ);
      } else if (intersect(block_in_states[succ->id], after_edge)) {
        worklist.push_back(succ);
      }
    }
  }

  for (const auto & unique_block : cfg.blocks) {
    const BasicBlock * block = unique_block.get();
    if (visited[block->id]) {
      NullStateSet state = block_in_states[block->id];
      transfer_block(block, state, true);
    }
  }
}

void NullChecker::transfer_block(const BasicBlock * block, NullStateSet & state, bool report_errors)
{
  for (const Stmt * stmt : block->stmts) {
    transfer_stmt(stmt, state, report_errors);
  }
  if (block->condition != nullptr) {
    check_uses(block->condition, state, report_errors);
  }
}

void NullChecker::transfer_stmt(const Stmt * stmt, NullStateSet & state, bool report_errors)
{
  switch (stmt->get_kind()) {
    case NodeKind::VarDeclStmt: {
      const auto * decl = cast<VarDeclStmt>(stmt);
      check_uses(decl->init, state, report_errors);
      state.erase(decl);
      break;
    }

    case NodeKind::AssignStmt: {
      const auto * assign = cast<AssignStmt>(stmt);
      check_uses(assign->value, state, report_errors);
      if (const AstNode * var = interop_var(assign->target)) {
        // A fresh value is unchecked again.
        state.erase(var);
      } else {
        check_uses(assign->target, state, report_errors);
      }
      break;
    }

    case NodeKind::ExprStmt:
      check_uses(cast<ExprStmt>(stmt)->expr, state, report_errors);
      break;

    case NodeKind::ReturnStmt:
      check_uses(cast<ReturnStmt>(stmt)->value, state, report_errors);
      break;

    default:
      break;
  }
}

void NullChecker::transfer_edge(const BasicBlock::Edge & edge, NullStateSet & state)
{
  if (edge.condition == nullptr) return;
  if (edge.kind == CFGEdgeKind::True) {
    narrow(edge.condition, true, state);
  } else if (edge.kind == CFGEdgeKind::False) {
    narrow(edge.condition, false, state);
  }
}

void NullChecker::narrow(const Expr * cond, bool truth, NullStateSet & state)
{
  if (cond == nullptr) return;

  BinaryOp op = BinaryOp::Eq;
  if (const Expr * operand = null_compared_operand(cond, &op)) {
    const AstNode * var = interop_var(operand);
    // `x != NULL` proves non-null when true, `x = NULL` when false.
    if (var != nullptr && truth == (op == BinaryOp::Ne)) {
      state.insert(var);
    }
    return;
  }

  if (const auto * un = dyn_cast<UnaryExpr>(cond); un != nullptr && un->op == UnaryOp::Not) {
    narrow(un->operand, !truth, state);
    return;
  }

  if (const auto * bin = dyn_cast<BinaryExpr>(cond)) {
    if (bin->op == BinaryOp::And && truth) {
      narrow(bin->lhs, true, state);
      narrow(bin->rhs, true, state);
    } else if (bin->op == BinaryOp::Or && !truth) {
      narrow(bin->lhs, false, state);
      narrow(bin->rhs, false, state);
    }
  }
}

void NullChecker::check_uses(const Expr * expr, const NullStateSet & state, bool report_errors)
{
  if (expr == nullptr) return;

  if (const AstNode * var = interop_var(expr)) {
    if (state.count(var) == 0 && report_errors && reported_.insert(expr).second) {
      const std::string_view name = decl_name_and_type(var).first;
      report(
        expr->get_range(), "E0908", fmt::format("'{}' may be NULL here", name),
        fmt::format("check '{} != NULL' on every path before this use", name));
    }
    return;
  }

  if (null_compared_operand(expr) != nullptr) {
    // The comparison itself is the check.
    const Expr * operand = null_compared_operand(expr);
    if (interop_var(operand) == nullptr) check_uses(operand, state, report_errors);
    return;
  }

  switch (expr->get_kind()) {
    case NodeKind::BinaryExpr: {
      const auto * bin = cast<BinaryExpr>(expr);
      check_uses(bin->lhs, state, report_errors);
      if (bin->op == BinaryOp::And || bin->op == BinaryOp::Or) {
        // Short-circuit: the right side only runs when the left decided nothing.
        NullStateSet narrowed = state;
        narrow(bin->lhs, bin->op == BinaryOp::And, narrowed);
        check_uses(bin->rhs, narrowed, report_errors);
      } else {
        check_uses(bin->rhs, state, report_errors);
      }
      break;
    }

    case NodeKind::TernaryExpr: {
      const auto * tern = cast<TernaryExpr>(expr);
      check_uses(tern->condition, state, report_errors);
      NullStateSet when_true = state;
      narrow(tern->condition, true, when_true);
      check_uses(tern->thenExpr, when_true, report_errors);
      NullStateSet when_false = state;
      narrow(tern->condition, false, when_false);
      check_uses(tern->elseExpr, when_false, report_errors);
      break;
    }

    case NodeKind::UnaryExpr:
      check_uses(cast<UnaryExpr>(expr)->operand, state, report_errors);
      break;

    case NodeKind::CastExpr:
      check_uses(cast<CastExpr>(expr)->expr, state, report_errors);
      break;

    case NodeKind::CallExpr:
      for (const Expr * arg : cast<CallExpr>(expr)->args) {
        check_uses(arg, state, report_errors);
      }
      break;

    case NodeKind::IndexExpr: {
      const auto * idx = cast<IndexExpr>(expr);
      check_uses(idx->base, state, report_errors);
      check_uses(idx->index, state, report_errors);
      check_uses(idx->width, state, report_errors);
      break;
    }

    case NodeKind::MemberExpr: {
      const auto * mem = cast<MemberExpr>(expr);
      if (mem->accessKind != MemberAccessKind::Symbol) {
        check_uses(mem->base, state, report_errors);
      }
      break;
    }

    case NodeKind::ArrayLiteralExpr:
      for (const Expr * e : cast<ArrayLiteralExpr>(expr)->elements) {
        check_uses(e, state, report_errors);
      }
      break;

    case NodeKind::StructLiteralExpr:
      for (const FieldInit * f : cast<StructLiteralExpr>(expr)->fields) {
        check_uses(f->value, state, report_errors);
      }
      break;

    default:
      break;
  }
}

const AstNode * NullChecker::interop_var(const Expr * expr)
{
  const AstNode * decl = nullptr;
  if (const auto * ref = dyn_cast<VarRefExpr>(expr)) {
    decl = ref->resolvedDecl;
  } else if (const auto * mem = dyn_cast<MemberExpr>(expr);
             mem != nullptr && mem->accessKind == MemberAccessKind::Symbol) {
    decl = mem->resolvedDecl;
  }
  if (decl == nullptr) return nullptr;

  const auto [name, type] = decl_name_and_type(decl);
  if (!has_interop_prefix(name) || type == nullptr || !type->is_nullable()) return nullptr;
  return decl;
}

void NullChecker::report(SourceRange range, std::string code, std::string message, std::string help)
{
  auto diag = diags_.report_error(range, std::move(message));
  diag.with_code(std::move(code));
  if (!help.empty()) {
    diag.with_help(std::move(help));
  }
  ++errorCount_;
}

}  // namespace cnext
