// cnext/sema/analysis/cfg_builder.hpp - CFG Builder for C-Next functions
//
// Builds a Control Flow Graph from a function body. C-Next has no
// break, continue or goto, so every construct is single-entry and
// single-exit apart from `return`.
//
#pragma once

#include <memory>

#include "cnext/sema/analysis/cfg.hpp"

namespace cnext
{

/**
 * Builds CFG from AST for a single FunctionDecl.
 *
 * ## Usage
 * ```cpp
 * CFGBuilder builder;
 * auto cfg = builder.build(fn);
 * ```
 */
class CFGBuilder
{
public:
  CFGBuilder() = default;

  /**
   * Build CFG for a function definition.
   * @return The constructed CFG, or nullptr for a function without body
   */
  std::unique_ptr<CFG> build(const FunctionDecl * fn);

private:
  /**
   * Build blocks for a statement.
   * @return Block to continue from after this statement (unreachable after `return`)
   */
  BasicBlock * build_statement(const Stmt * stmt, CFG & cfg, BasicBlock * current);

  BasicBlock * build_block(const BlockStmt * block, CFG & cfg, BasicBlock * current);
  BasicBlock * build_if(const IfStmt * stmt, CFG & cfg, BasicBlock * current);
  BasicBlock * build_loop(
    const Expr * condition, const BlockStmt * body, const Stmt * update, bool test_first,
    CFG & cfg, BasicBlock * current);
  BasicBlock * build_switch(const SwitchStmt * stmt, CFG & cfg, BasicBlock * current);
};

}  // namespace cnext
