// cnext/sema/cfg_builder.cpp - CFG Builder implementation
//
#include "cnext/sema/analysis/cfg_builder.hpp"

#include "cnext/basic/casting.hpp"
#include "cnext/symbols/type_info.hpp"

namespace cnext
{

// ============================================================================
// Entry Point
// ============================================================================

std::unique_ptr<CFG> CFGBuilder::build(const FunctionDecl * fn)
{
  if (fn == nullptr || fn->body == nullptr) {
    return nullptr;
  }

  auto cfg = std::make_unique<CFG>();
  cfg->function = fn;
  cfg->entry = cfg->create_block();
  cfg->exit = cfg->create_block();

  BasicBlock * current = build_block(fn->body, *cfg, cfg->entry);
  current->add_successor(cfg->exit);

  return cfg;
}

// ============================================================================
// Statement Building
// ============================================================================

BasicBlock * CFGBuilder::build_block(const BlockStmt * block, CFG & cfg, BasicBlock * current)
{
  if (block == nullptr) {
    return current;
  }
  for (const Stmt * stmt : block->stmts) {
    current = build_statement(stmt, cfg, current);
  }
  return current;
}

BasicBlock * CFGBuilder::build_statement(const Stmt * stmt, CFG & cfg, BasicBlock * current)
{
  if (stmt == nullptr) {
    return current;
  }

  switch (stmt->get_kind()) {
    case NodeKind::BlockStmt:
      return build_block(cast<BlockStmt>(stmt), cfg, current);

    case NodeKind::IfStmt:
      return build_if(cast<IfStmt>(stmt), cfg, current);

    case NodeKind::WhileStmt: {
      const auto * loop = cast<WhileStmt>(stmt);
      return build_loop(loop->condition, loop->body, nullptr, true, cfg, current);
    }

    case NodeKind::DoWhileStmt: {
      const auto * loop = cast<DoWhileStmt>(stmt);
      return build_loop(loop->condition, loop->body, nullptr, false, cfg, current);
    }

    case NodeKind::ForStmt: {
      const auto * loop = cast<ForStmt>(stmt);
      current = build_statement(loop->init, cfg, current);
      return build_loop(loop->condition, loop->body, loop->update, true, cfg, current);
    }

    case NodeKind::SwitchStmt:
      return build_switch(cast<SwitchStmt>(stmt), cfg, current);

    case NodeKind::ReturnStmt: {
      CFG::add_stmt(current, stmt);
      current->add_successor(cfg.exit);
      // Code after a return has no predecessors.
      return cfg.create_block();
    }

    default:
      CFG::add_stmt(current, stmt);
      return current;
  }
}

BasicBlock * CFGBuilder::build_if(const IfStmt * stmt, CFG & cfg, BasicBlock * current)
{
  current->condition = stmt->condition;

  BasicBlock * then_entry = cfg.create_block();
  BasicBlock * join = cfg.create_block();
  current->add_successor(then_entry, CFGEdgeKind::True, stmt->condition);

  BasicBlock * then_exit = build_block(stmt->thenBlock, cfg, then_entry);
  then_exit->add_successor(join);

  if (stmt->elseStmt != nullptr) {
    BasicBlock * else_entry = cfg.create_block();
    current->add_successor(else_entry, CFGEdgeKind::False, stmt->condition);
    BasicBlock * else_exit = build_statement(stmt->elseStmt, cfg, else_entry);
    else_exit->add_successor(join);
  } else {
    current->add_successor(join, CFGEdgeKind::False, stmt->condition);
  }
  return join;
}

BasicBlock * CFGBuilder::build_loop(
  const Expr * condition, const BlockStmt * body, const Stmt * update, bool test_first, CFG & cfg,
  BasicBlock * current)
{
  BasicBlock * head = cfg.create_block();
  BasicBlock * body_entry = cfg.create_block();
  BasicBlock * after = cfg.create_block();

  if (test_first) {
    current->add_successor(head);
    head->condition = condition;
    if (condition != nullptr) {
      head->add_successor(body_entry, CFGEdgeKind::True, condition);
      head->add_successor(after, CFGEdgeKind::False, condition);
    } else {
      // for (;;) only leaves through return
      head->add_successor(body_entry);
    }
    BasicBlock * body_exit = build_block(body, cfg, body_entry);
    body_exit = build_statement(update, cfg, body_exit);
    body_exit->add_successor(head);
    return after;
  }

  // do { body } while (condition);
  current->add_successor(body_entry);
  BasicBlock * body_exit = build_block(body, cfg, body_entry);
  body_exit->add_successor(head);
  head->condition = condition;
  head->add_successor(body_entry, CFGEdgeKind::True, condition);
  head->add_successor(after, CFGEdgeKind::False, condition);
  return after;
}

BasicBlock * CFGBuilder::build_switch(const SwitchStmt * stmt, CFG & cfg, BasicBlock * current)
{
  current->condition = stmt->subject;
  BasicBlock * join = cfg.create_block();

  for (const SwitchCase * c : stmt->cases) {
    BasicBlock * arm = cfg.create_block();
    current->add_successor(arm);
    build_block(c->body, cfg, arm)->add_successor(join);
  }

  if (stmt->defaultCase != nullptr) {
    BasicBlock * arm = cfg.create_block();
    current->add_successor(arm);
    build_block(stmt->defaultCase->body, cfg, arm)->add_successor(join);
  } else if (
    stmt->subject->resolvedType == nullptr || stmt->subject->resolvedType->kind != TypeKind::Enum) {
    current->add_successor(join);
  }
  // An enum switch without default covers every variant (SwitchChecker enforces it).
  return join;
}

}  // namespace cnext
