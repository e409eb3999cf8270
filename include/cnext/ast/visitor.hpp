// cnext/ast/visitor.hpp - CRTP visitors for AST traversal
#pragma once

#include <type_traits>

#include "cnext/ast/ast.hpp"
#include "cnext/ast/ast_enums.hpp"
#include "cnext/basic/casting.hpp"

namespace cnext
{

namespace detail
{

/// Propagates the constness of NodePtrT onto DerivedNode.
template <typename NodePtrT, typename DerivedNode>
using propagate_const_t = std::conditional_t<
  std::is_const_v<std::remove_pointer_t<NodePtrT>>, const DerivedNode *, DerivedNode *>;

}  // namespace detail

// ============================================================================
// AstVisitor
// ============================================================================

/**
 * CRTP visitor with one `visit_<snake_name>` hook per node kind.
 *
 * Unhandled kinds fall back to the category hook (visit_expr, visit_stmt,
 * visit_decl, visit_type_node) and then to visit_node.
 *
 * @code
 *   class CallCounter : public ConstAstVisitor<CallCounter> {
 *   public:
 *     void visit_call_expr(const CallExpr *) { ++calls; }
 *     int calls = 0;
 *   };
 * @endcode
 */
template <typename Derived, typename ReturnType = void, typename NodePtrT = AstNode *>
class AstVisitor
{
public:
  template <typename T>
  using NodePtr = detail::propagate_const_t<NodePtrT, T>;

  [[nodiscard]] Derived & get_derived() { return static_cast<Derived &>(*this); }

  ReturnType visit(NodePtrT node)
  {
    if (!node) {
      return ReturnType();
    }

    switch (node->kind) {
#define CNEXT_VISIT_CASE(Class, Kind, Snake) \
  case NodeKind::Kind:                       \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_EXPR CNEXT_VISIT_CASE
#define AST_NODE_TYPE CNEXT_VISIT_CASE
#define AST_NODE_STMT CNEXT_VISIT_CASE
#define AST_NODE_DECL CNEXT_VISIT_CASE
#define AST_NODE_SUPPORT CNEXT_VISIT_CASE
#define AST_NODE_TOP CNEXT_VISIT_CASE
#include "cnext/ast/ast_nodes.def"
#undef CNEXT_VISIT_CASE
    }
    return ReturnType();
  }

#define AST_NODE_EXPR(Class, Kind, Snake) \
  ReturnType visit_##Snake(NodePtr<Class> node) { return get_derived().visit_expr(node); }
#define AST_NODE_TYPE(Class, Kind, Snake) \
  ReturnType visit_##Snake(NodePtr<Class> node) { return get_derived().visit_type_node(node); }
#define AST_NODE_STMT(Class, Kind, Snake) \
  ReturnType visit_##Snake(NodePtr<Class> node) { return get_derived().visit_stmt(node); }
#define AST_NODE_DECL(Class, Kind, Snake) \
  ReturnType visit_##Snake(NodePtr<Class> node) { return get_derived().visit_decl(node); }
#define AST_NODE_SUPPORT(Class, Kind, Snake) \
  ReturnType visit_##Snake(NodePtr<Class> node) { return get_derived().visit_node(node); }
#define AST_NODE_TOP(Class, Kind, Snake) \
  ReturnType visit_##Snake(NodePtr<Class> node) { return get_derived().visit_node(node); }
#include "cnext/ast/ast_nodes.def"

  ReturnType visit_expr(NodePtr<Expr> node) { return get_derived().visit_node(node); }
  ReturnType visit_type_node(NodePtr<TypeNode> node) { return get_derived().visit_node(node); }
  ReturnType visit_stmt(NodePtr<Stmt> node) { return get_derived().visit_node(node); }
  ReturnType visit_decl(NodePtr<Decl> node) { return get_derived().visit_node(node); }

  ReturnType visit_node(NodePtrT /*node*/) { return ReturnType(); }
};

template <typename Derived, typename ReturnType = void>
using ConstAstVisitor = AstVisitor<Derived, ReturnType, const AstNode *>;

// ============================================================================
// RecursiveAstVisitor
// ============================================================================

/**
 * Visitor that walks into every child.
 *
 * Overrides return false to stop the whole traversal. An override that
 * wants to keep descending calls the RecursiveAstVisitor version.
 */
template <typename Derived, typename NodePtrT = AstNode *>
class RecursiveAstVisitor : public AstVisitor<Derived, bool, NodePtrT>
{
  using Base = AstVisitor<Derived, bool, NodePtrT>;

public:
  using Base::get_derived;
  template <typename T>
  using NodePtr = typename Base::template NodePtr<T>;

  bool visit_node(NodePtrT /*node*/) { return true; }

  // Expressions
  bool visit_binary_expr(NodePtr<BinaryExpr> node)
  {
    return get_derived().visit(node->lhs) && get_derived().visit(node->rhs);
  }

  bool visit_unary_expr(NodePtr<UnaryExpr> node) { return get_derived().visit(node->operand); }

  bool visit_ternary_expr(NodePtr<TernaryExpr> node)
  {
    return get_derived().visit(node->condition) && get_derived().visit(node->thenExpr) &&
           get_derived().visit(node->elseExpr);
  }

  bool visit_cast_expr(NodePtr<CastExpr> node)
  {
    return get_derived().visit(node->targetType) && get_derived().visit(node->expr);
  }

  bool visit_index_expr(NodePtr<IndexExpr> node)
  {
    if (!get_derived().visit(node->base)) return false;
    if (!get_derived().visit(node->index)) return false;
    return !node->width || get_derived().visit(node->width);
  }

  bool visit_member_expr(NodePtr<MemberExpr> node) { return get_derived().visit(node->base); }

  bool visit_call_expr(NodePtr<CallExpr> node)
  {
    if (!get_derived().visit(node->callee)) return false;
    for (auto * arg : node->args) {
      if (!get_derived().visit(arg)) return false;
    }
    return true;
  }

  bool visit_array_literal_expr(NodePtr<ArrayLiteralExpr> node)
  {
    for (auto * elem : node->elements) {
      if (!get_derived().visit(elem)) return false;
    }
    return true;
  }

  bool visit_struct_literal_expr(NodePtr<StructLiteralExpr> node)
  {
    for (auto * field : node->fields) {
      if (!get_derived().visit(field)) return false;
    }
    return true;
  }

  // Supporting nodes
  bool visit_field_init(NodePtr<FieldInit> node) { return get_derived().visit(node->value); }

  bool visit_param_decl(NodePtr<ParamDecl> node)
  {
    if (!get_derived().visit(node->type)) return false;
    for (auto * d : node->dims) {
      if (!get_derived().visit(d)) return false;
    }
    return true;
  }

  bool visit_field_decl(NodePtr<FieldDecl> node)
  {
    if (!get_derived().visit(node->type)) return false;
    for (auto * d : node->dims) {
      if (!get_derived().visit(d)) return false;
    }
    return true;
  }

  bool visit_enum_member(NodePtr<EnumMember> node)
  {
    return !node->value || get_derived().visit(node->value);
  }

  bool visit_register_field(NodePtr<RegisterField> node)
  {
    return get_derived().visit(node->type) && get_derived().visit(node->offset);
  }

  bool visit_switch_case(NodePtr<SwitchCase> node)
  {
    for (auto * label : node->labels) {
      if (!get_derived().visit(label)) return false;
    }
    return get_derived().visit(node->body);
  }

  bool visit_default_case(NodePtr<DefaultCase> node) { return get_derived().visit(node->body); }

  // Statements
  bool visit_var_decl_stmt(NodePtr<VarDeclStmt> node)
  {
    if (!get_derived().visit(node->type)) return false;
    for (auto * d : node->dims) {
      if (!get_derived().visit(d)) return false;
    }
    return !node->init || get_derived().visit(node->init);
  }

  bool visit_assign_stmt(NodePtr<AssignStmt> node)
  {
    return get_derived().visit(node->target) && get_derived().visit(node->value);
  }

  bool visit_expr_stmt(NodePtr<ExprStmt> node) { return get_derived().visit(node->expr); }

  bool visit_block_stmt(NodePtr<BlockStmt> node)
  {
    for (auto * s : node->stmts) {
      if (!get_derived().visit(s)) return false;
    }
    return true;
  }

  bool visit_if_stmt(NodePtr<IfStmt> node)
  {
    if (!get_derived().visit(node->condition)) return false;
    if (!get_derived().visit(node->thenBlock)) return false;
    return !node->elseStmt || get_derived().visit(node->elseStmt);
  }

  bool visit_while_stmt(NodePtr<WhileStmt> node)
  {
    return get_derived().visit(node->condition) && get_derived().visit(node->body);
  }

  bool visit_do_while_stmt(NodePtr<DoWhileStmt> node)
  {
    return get_derived().visit(node->body) && get_derived().visit(node->condition);
  }

  bool visit_for_stmt(NodePtr<ForStmt> node)
  {
    if (node->init && !get_derived().visit(node->init)) return false;
    if (node->condition && !get_derived().visit(node->condition)) return false;
    if (node->update && !get_derived().visit(node->update)) return false;
    return get_derived().visit(node->body);
  }

  bool visit_switch_stmt(NodePtr<SwitchStmt> node)
  {
    if (!get_derived().visit(node->subject)) return false;
    for (auto * c : node->cases) {
      if (!get_derived().visit(c)) return false;
    }
    return !node->defaultCase || get_derived().visit(node->defaultCase);
  }

  bool visit_return_stmt(NodePtr<ReturnStmt> node)
  {
    return !node->value || get_derived().visit(node->value);
  }

  // Declarations
  bool visit_struct_decl(NodePtr<StructDecl> node)
  {
    for (auto * f : node->fields) {
      if (!get_derived().visit(f)) return false;
    }
    return true;
  }

  bool visit_enum_decl(NodePtr<EnumDecl> node)
  {
    for (auto * m : node->members) {
      if (!get_derived().visit(m)) return false;
    }
    return true;
  }

  bool visit_register_decl(NodePtr<RegisterDecl> node)
  {
    if (!get_derived().visit(node->baseAddress)) return false;
    for (auto * f : node->fields) {
      if (!get_derived().visit(f)) return false;
    }
    return true;
  }

  bool visit_scope_decl(NodePtr<ScopeDecl> node)
  {
    for (auto * m : node->members) {
      if (!get_derived().visit(m)) return false;
    }
    return true;
  }

  bool visit_function_decl(NodePtr<FunctionDecl> node)
  {
    if (!get_derived().visit(node->returnType)) return false;
    for (auto * p : node->params) {
      if (!get_derived().visit(p)) return false;
    }
    return !node->body || get_derived().visit(node->body);
  }

  bool visit_global_var_decl(NodePtr<GlobalVarDecl> node)
  {
    if (!get_derived().visit(node->type)) return false;
    for (auto * d : node->dims) {
      if (!get_derived().visit(d)) return false;
    }
    return !node->init || get_derived().visit(node->init);
  }

  bool visit_program(NodePtr<Program> node)
  {
    for (auto * d : node->decls) {
      if (!get_derived().visit(d)) return false;
    }
    return true;
  }
};

template <typename Derived>
using ConstRecursiveAstVisitor = RecursiveAstVisitor<Derived, const AstNode *>;

}  // namespace cnext
