// cnext/sema/analysis/cfg.hpp - Control Flow Graph for C-Next functions
//
// CFG data structures for forward data-flow analysis (definite
// initialization, NULL-check dominance).
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "cnext/ast/ast.hpp"

namespace cnext
{

// ============================================================================
// CFG Edge Kinds
// ============================================================================

enum class CFGEdgeKind : uint8_t {
  Unconditional,  ///< Always taken (sequential flow, loop back edges, switch arms)
  True,           ///< Block condition evaluated to true
  False,          ///< Block condition evaluated to false
};

// ============================================================================
// Basic Block
// ============================================================================

/**
 * A basic block in the CFG.
 *
 * Simple statements (declarations, assignments, call statements, returns)
 * execute in order; `condition`, when set, is evaluated after them and
 * selects between the True and False successors. A switch head stores the
 * subject in `condition` and branches Unconditionally to every arm.
 */
struct BasicBlock
{
  /// Unique identifier within the CFG
  size_t id = 0;

  /// Statements in this block (executed sequentially)
  std::vector<const Stmt *> stmts;

  /// Branch condition or switch subject read at the end of the block
  const Expr * condition = nullptr;

  struct Edge
  {
    BasicBlock * target = nullptr;
    CFGEdgeKind kind = CFGEdgeKind::Unconditional;
    const Expr * condition = nullptr;  ///< For True/False edges: the condition expression
  };

  std::vector<Edge> successors;
  std::vector<BasicBlock *> predecessors;

  void add_successor(
    BasicBlock * target, CFGEdgeKind kind = CFGEdgeKind::Unconditional,
    const Expr * cond = nullptr)
  {
    successors.push_back({target, kind, cond});
    if (target != nullptr) {
      target->predecessors.push_back(this);
    }
  }
};

// ============================================================================
// Control Flow Graph
// ============================================================================

/**
 * Control Flow Graph for a single FunctionDecl.
 */
class CFG
{
public:
  CFG() = default;

  CFG(const CFG &) = delete;
  CFG & operator=(const CFG &) = delete;
  CFG(CFG &&) = default;
  CFG & operator=(CFG &&) = default;

  BasicBlock * entry = nullptr;
  /// Reached by `return` and by falling off the end of the body
  BasicBlock * exit = nullptr;

  std::vector<std::unique_ptr<BasicBlock>> blocks;

  const FunctionDecl * function = nullptr;

  BasicBlock * create_block()
  {
    auto block = std::make_unique<BasicBlock>();
    block->id = blocks.size();
    BasicBlock * ptr = block.get();
    blocks.push_back(std::move(block));
    return ptr;
  }

  static void add_stmt(BasicBlock * block, const Stmt * stmt)
  {
    if (block != nullptr && stmt != nullptr) {
      block->stmts.push_back(stmt);
    }
  }

  [[nodiscard]] size_t size() const noexcept { return blocks.size(); }
  [[nodiscard]] bool empty() const noexcept { return blocks.empty(); }
};

}  // namespace cnext
