// cnext/sema/init_checker.cpp - Definite initialization checker implementation
//
#include "cnext/sema/analysis/init_checker.hpp"

#include <fmt/format.h>

#include <deque>
#include <iterator>
#include <vector>

#include "cnext/basic/casting.hpp"
#include "cnext/sema/analysis/cfg_builder.hpp"

namespace cnext
{

bool InitState::meet(const InitState & other)
{
  bool changed = false;
  for (auto it = vars.begin(); it != vars.end();) {
    if (other.vars.count(*it) == 0) {
      it = vars.erase(it);
      changed = true;
    } else {
      ++it;
    }
  }
  for (auto it = fields.begin(); it != fields.end();) {
    if (other.fields.count(*it) == 0 && other.vars.count(it->first) == 0) {
      it = fields.erase(it);
      changed = true;
    } else {
      ++it;
    }
  }
  return changed;
}

// ============================================================================
// Constructor
// ============================================================================

InitializationChecker::InitializationChecker(const SymbolTable & table, DiagnosticBag & diags)
: table_(table), diags_(diags)
{
}

// ============================================================================
// Entry Point
// ============================================================================

bool InitializationChecker::check(const Program & program)
{
  for (const Decl * decl : program.decls) {
    check_decl(decl);
  }
  return !has_errors();
}

void InitializationChecker::check_decl(const Decl * decl)
{
  if (const auto * scope = dyn_cast<ScopeDecl>(decl)) {
    for (const Decl * member : scope->members) {
      check_decl(member);
    }
    return;
  }
  if (const auto * fn = dyn_cast<FunctionDecl>(decl)) {
    CFGBuilder builder;
    auto cfg = builder.build(fn);
    if (cfg != nullptr) {
      check(fn, *cfg);
    }
  }
}

void InitializationChecker::check(const FunctionDecl * fn, const CFG & cfg)
{
  if (fn == nullptr) return;
  analyze_data_flow(cfg);
}

// ============================================================================
// Data Flow Analysis
// ============================================================================

void InitializationChecker::analyze_data_flow(const CFG & cfg)
{
  if (cfg.blocks.empty() || cfg.entry == nullptr) return;

  std::vector<InitState> block_in_states(cfg.blocks.size());
  std::vector<bool> visited(cfg.blocks.size(), false);

  std::deque<BasicBlock *> worklist;
  worklist.push_back(cfg.entry);
  visited[cfg.entry->id] = true;

  // Phase 1: fixed point, no reporting
  while (!worklist.empty()) {
    BasicBlock * block = worklist.front();
    worklist.pop_front();

    InitState out_state = block_in_states[block->id];
    transfer_block(block, out_state, false);

    for (const auto & edge : block->successors) {
      BasicBlock * succ = edge.target;
      if (succ == nullptr) continue;

      InitState & succ_in = block_in_states[succ->id];
      if (!visited[succ->id]) {
        succ_in = out_state;
        visited[succ->id] = true;
        worklist.push_back(succ);
      } else if (succ_in.meet(out_state)) {
        worklist.push_back(succ);
      }
    }
  }

  // Phase 2: report against the stable in-states
  for (const auto & unique_block : cfg.blocks) {
    const BasicBlock * block = unique_block.get();
    if (visited[block->id]) {
      InitState state = block_in_states[block->id];
      transfer_block(block, state, true);
    }
  }
}

void InitializationChecker::transfer_block(
  const BasicBlock * block, InitState & state, bool report_errors)
{
  for (const Stmt * stmt : block->stmts) {
    transfer_stmt(stmt, state, report_errors);
  }
  if (block->condition != nullptr) {
    check_expr(block->condition, state, report_errors);
  }
}

void InitializationChecker::transfer_stmt(const Stmt * stmt, InitState & state, bool report_errors)
{
  switch (stmt->get_kind()) {
    case NodeKind::VarDeclStmt: {
      const auto * decl = cast<VarDeclStmt>(stmt);
      if (decl->init != nullptr) {
        check_expr(decl->init, state, report_errors);
        mark_out_arguments(decl->init, state);
      } else {
        // Re-entering a loop body starts the variable over.
        state.vars.erase(decl);
        for (auto it = state.fields.begin(); it != state.fields.end();) {
          it = it->first == decl ? state.fields.erase(it) : std::next(it);
        }
      }
      break;
    }

    case NodeKind::AssignStmt: {
      const auto * assign = cast<AssignStmt>(stmt);
      check_expr(assign->value, state, report_errors);
      mark_out_arguments(assign->value, state);
      if (assign->op != AssignOp::Assign) {
        check_expr(assign->target, state, report_errors);
      }
      write_target(assign->target, state, report_errors);
      break;
    }

    case NodeKind::ExprStmt: {
      const auto * es = cast<ExprStmt>(stmt);
      check_expr(es->expr, state, report_errors);
      mark_out_arguments(es->expr, state);
      break;
    }

    case NodeKind::ReturnStmt:
      check_expr(cast<ReturnStmt>(stmt)->value, state, report_errors);
      break;

    default:
      break;
  }
}

void InitializationChecker::write_target(
  const Expr * target, InitState & state, bool report_errors)
{
  if (const VarDeclStmt * var = tracked_var(target)) {
    state.vars.insert(var);
    return;
  }

  if (const auto * mem = dyn_cast<MemberExpr>(target)) {
    if (mem->accessKind == MemberAccessKind::Field) {
      if (const VarDeclStmt * var = tracked_var(mem->base)) {
        state.fields.emplace(var, mem->member);
        size_t assigned = 0;
        for (const auto & [owner, name] : state.fields) {
          if (owner == var) ++assigned;
        }
        if (assigned == field_count(var)) {
          state.vars.insert(var);
        }
        return;
      }
    }
    // Bitmap fields and nested members keep the rest of the object.
    check_expr(mem->base, state, report_errors);
    return;
  }

  if (const auto * idx = dyn_cast<IndexExpr>(target)) {
    check_expr(idx->index, state, report_errors);
    check_expr(idx->width, state, report_errors);
    // A bit write keeps the other bits, so the operand must already hold a value.
    check_expr(idx->base, state, report_errors);
  }
}

void InitializationChecker::check_expr(
  const Expr * expr, const InitState & state, bool report_errors)
{
  if (expr == nullptr) return;

  switch (expr->get_kind()) {
    case NodeKind::VarRef:
      if (const VarDeclStmt * var = tracked_var(expr)) {
        check_read(var, {}, expr, state, report_errors);
      }
      break;

    case NodeKind::MemberExpr: {
      const auto * mem = cast<MemberExpr>(expr);
      switch (mem->accessKind) {
        case MemberAccessKind::Field:
          if (const VarDeclStmt * var = tracked_var(mem->base)) {
            check_read(var, mem->member, mem, state, report_errors);
          } else {
            check_expr(mem->base, state, report_errors);
          }
          break;
        case MemberAccessKind::BitmapField:
        case MemberAccessKind::Unresolved:
          check_expr(mem->base, state, report_errors);
          break;
        case MemberAccessKind::Length: {
          // Only a string's length reads its contents.
          const TypeInfo * base = mem->base->resolvedType;
          if (base != nullptr && !base->isArray &&
              (base->kind == TypeKind::String || base->kind == TypeKind::CString)) {
            check_expr(mem->base, state, report_errors);
          }
          break;
        }
        default:
          break;
      }
      break;
    }

    case NodeKind::IndexExpr: {
      const auto * idx = cast<IndexExpr>(expr);
      check_expr(idx->base, state, report_errors);
      check_expr(idx->index, state, report_errors);
      check_expr(idx->width, state, report_errors);
      break;
    }

    case NodeKind::CallExpr: {
      const auto * call = cast<CallExpr>(expr);
      if (!isa<VarRefExpr>(call->callee)) {
        check_expr(call->callee, state, report_errors);
      }
      for (size_t i = 0; i < call->args.size(); ++i) {
        if (is_out_argument(call, i) && tracked_var(call->args[i]) != nullptr) {
          continue;
        }
        check_expr(call->args[i], state, report_errors);
      }
      break;
    }

    case NodeKind::BinaryExpr: {
      const auto * bin = cast<BinaryExpr>(expr);
      check_expr(bin->lhs, state, report_errors);
      check_expr(bin->rhs, state, report_errors);
      break;
    }

    case NodeKind::UnaryExpr:
      check_expr(cast<UnaryExpr>(expr)->operand, state, report_errors);
      break;

    case NodeKind::TernaryExpr: {
      const auto * tern = cast<TernaryExpr>(expr);
      check_expr(tern->condition, state, report_errors);
      check_expr(tern->thenExpr, state, report_errors);
      check_expr(tern->elseExpr, state, report_errors);
      break;
    }

    case NodeKind::CastExpr:
      check_expr(cast<CastExpr>(expr)->expr, state, report_errors);
      break;

    case NodeKind::ArrayLiteralExpr:
      for (const Expr * e : cast<ArrayLiteralExpr>(expr)->elements) {
        check_expr(e, state, report_errors);
      }
      break;

    case NodeKind::StructLiteralExpr:
      for (const FieldInit * f : cast<StructLiteralExpr>(expr)->fields) {
        check_expr(f->value, state, report_errors);
      }
      break;

    default:
      break;
  }
}

void InitializationChecker::check_read(
  const VarDeclStmt * var, std::string_view field, const Expr * at, const InitState & state,
  bool report_errors)
{
  if (state.vars.count(var) > 0) return;
  if (!field.empty() && state.fields.count({var, field}) > 0) return;
  if (!report_errors) return;

  if (!reported_.insert(at).second) return;

  const std::string what =
    field.empty() ? fmt::format("variable '{}'", var->name)
                  : fmt::format("field '{}.{}'", var->name, field);
  diags_.report_error(at->get_range(), fmt::format("use of possibly-uninitialized {}", what))
    .with_code("E0381")
    .with_secondary_label(var->get_range(), "declared here without a value")
    .with_help(fmt::format(
      "assign {} on every path before this read, or give '{}' an initializer", what,
      var->name));
  ++errorCount_;
}

// ============================================================================
// Helper Methods
// ============================================================================

bool InitializationChecker::is_out_argument(const CallExpr * call, size_t index)
{
  const Symbol * sym = call->resolvedSymbol;
  if (sym == nullptr || !sym->is_foreign()) return false;
  const auto * fn = sym->as<FunctionInfo>();
  return fn != nullptr && index < fn->params.size() && fn->params[index].writesThroughPointer;
}

void InitializationChecker::mark_out_arguments(const Expr * expr, InitState & state)
{
  const auto * call = dyn_cast<CallExpr>(expr);
  if (call == nullptr) return;
  for (size_t i = 0; i < call->args.size(); ++i) {
    if (!is_out_argument(call, i)) continue;
    if (const VarDeclStmt * var = tracked_var(call->args[i])) {
      state.vars.insert(var);
    }
  }
}

const VarDeclStmt * InitializationChecker::tracked_var(const Expr * expr)
{
  const auto * ref = dyn_cast<VarRefExpr>(expr);
  if (ref == nullptr) return nullptr;
  const auto * decl = dyn_cast<VarDeclStmt>(ref->resolvedDecl);
  if (decl == nullptr || decl->init != nullptr || decl->resolvedType == nullptr) return nullptr;
  const TypeInfo & t = *decl->resolvedType;
  if (t.isArray || t.kind == TypeKind::String) return nullptr;
  return decl;
}

size_t InitializationChecker::field_count(const VarDeclStmt * var) const
{
  if (const StructInfo * info = table_.find_struct(*var->resolvedType)) {
    return info->fields.size();
  }
  return 0;
}

}  // namespace cnext
