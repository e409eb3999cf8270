// cnext/ast/ast.hpp - AST node class definitions for C-Next
//
// LLVM/Clang style nodes with classof() for RTTI. Nodes live in an
// AstContext arena and must stay trivially destructible, so they hold
// string_views and gsl::spans rather than owning containers.
//
#pragma once

#include <cstdint>
#include <gsl/span>
#include <string_view>

#include "cnext/ast/ast_enums.hpp"
#include "cnext/basic/casting.hpp"
#include "cnext/basic/source_manager.hpp"

namespace cnext
{

// Sema-side types referenced by annotations
struct TypeInfo;
struct Symbol;

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all AST nodes.
 *
 * Nodes are non-copyable and owned by AstContext.
 */
class AstNode
{
public:
  const NodeKind kind;
  SourceRange range_;

  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;
  AstNode(AstNode &&) = delete;
  AstNode & operator=(AstNode &&) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }
  [[nodiscard]] SourceRange get_range() const noexcept { return range_; }

protected:
  explicit AstNode(NodeKind k, SourceRange r = {}) : kind(k), range_(r) {}
  ~AstNode() = default;
};

/**
 * CRTP base class that implements classof() for a concrete node.
 */
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  explicit NodeBase(SourceRange r = {}) : Base(K, r) {}
};

class Expr : public AstNode
{
public:
  /// Type computed by TypeResolver (nullptr before resolution or on error).
  const TypeInfo * resolvedType = nullptr;

  static bool classof(const AstNode * node) { return is_expr_kind(node->kind); }

protected:
  explicit Expr(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class TypeNode : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_type_kind(node->kind); }

protected:
  explicit TypeNode(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class Stmt : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_stmt_kind(node->kind); }

protected:
  explicit Stmt(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class Decl : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_decl_kind(node->kind); }

protected:
  explicit Decl(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

// ============================================================================
// Expression Nodes
// ============================================================================

/// Integer literal. Negative values are a UnaryExpr(Neg) around the literal.
class IntLiteralExpr : public NodeBase<IntLiteralExpr, Expr, NodeKind::IntLiteral>
{
public:
  uint64_t value;
  std::string_view text;  ///< Source spelling, e.g. "0xFF"
  uint8_t radix = 10;

  IntLiteralExpr(uint64_t v, std::string_view t, uint8_t rdx, SourceRange r = {})
  : NodeBase(r), value(v), text(t), radix(rdx)
  {
  }

  [[nodiscard]] bool is_decimal() const noexcept { return radix == 10; }
};

class FloatLiteralExpr : public NodeBase<FloatLiteralExpr, Expr, NodeKind::FloatLiteral>
{
public:
  double value;
  std::string_view text;

  FloatLiteralExpr(double v, std::string_view t, SourceRange r = {})
  : NodeBase(r), value(v), text(t)
  {
  }
};

/// String literal. `raw` is the text between the quotes, escapes untouched.
class StringLiteralExpr : public NodeBase<StringLiteralExpr, Expr, NodeKind::StringLiteral>
{
public:
  std::string_view raw;

  explicit StringLiteralExpr(std::string_view v, SourceRange r = {}) : NodeBase(r), raw(v) {}

  /// Length after escape decoding.
  [[nodiscard]] uint32_t decoded_length() const noexcept
  {
    uint32_t n = 0;
    for (size_t i = 0; i < raw.size(); ++i) {
      if (raw[i] == '\\' && i + 1 < raw.size()) {
        ++i;
      }
      ++n;
    }
    return n;
  }
};

class CharLiteralExpr : public NodeBase<CharLiteralExpr, Expr, NodeKind::CharLiteral>
{
public:
  std::string_view raw;  ///< Text between the quotes
  char value;

  CharLiteralExpr(std::string_view t, char v, SourceRange r = {}) : NodeBase(r), raw(t), value(v) {}
};

class BoolLiteralExpr : public NodeBase<BoolLiteralExpr, Expr, NodeKind::BoolLiteral>
{
public:
  bool value;

  explicit BoolLiteralExpr(bool v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

class NullLiteralExpr : public NodeBase<NullLiteralExpr, Expr, NodeKind::NullLiteral>
{
public:
  explicit NullLiteralExpr(SourceRange r = {}) : NodeBase(r) {}
};

/**
 * Bare identifier. `this` and `global` also parse as VarRefExpr and only
 * appear as the base of a MemberExpr.
 */
class VarRefExpr : public NodeBase<VarRefExpr, Expr, NodeKind::VarRef>
{
public:
  std::string_view name;

  /// Global or foreign symbol (set by NameResolver).
  const Symbol * resolvedSymbol = nullptr;
  /// Declaring node: VarDeclStmt/ParamDecl for locals, symbol decl for DSL globals.
  const AstNode * resolvedDecl = nullptr;
  /// Name to emit in C.
  std::string_view cName;

  explicit VarRefExpr(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}

  [[nodiscard]] bool is_this() const noexcept { return name == "this"; }
  [[nodiscard]] bool is_global() const noexcept { return name == "global"; }
};

/// Parser recovery placeholder.
class MissingExpr : public NodeBase<MissingExpr, Expr, NodeKind::MissingExpr>
{
public:
  explicit MissingExpr(SourceRange r = {}) : NodeBase(r) {}
};

class BinaryExpr : public NodeBase<BinaryExpr, Expr, NodeKind::BinaryExpr>
{
public:
  Expr * lhs;
  BinaryOp op;
  Expr * rhs;

  BinaryExpr(Expr * l, BinaryOp o, Expr * r, SourceRange range = {})
  : NodeBase(range), lhs(l), op(o), rhs(r)
  {
  }
};

class UnaryExpr : public NodeBase<UnaryExpr, Expr, NodeKind::UnaryExpr>
{
public:
  UnaryOp op;
  Expr * operand;

  UnaryExpr(UnaryOp o, Expr * e, SourceRange r = {}) : NodeBase(r), op(o), operand(e) {}
};

/// (cond) ? a : b
class TernaryExpr : public NodeBase<TernaryExpr, Expr, NodeKind::TernaryExpr>
{
public:
  Expr * condition;
  Expr * thenExpr;
  Expr * elseExpr;

  TernaryExpr(Expr * c, Expr * t, Expr * e, SourceRange r = {})
  : NodeBase(r), condition(c), thenExpr(t), elseExpr(e)
  {
  }
};

/// (T)expr
class CastExpr : public NodeBase<CastExpr, Expr, NodeKind::CastExpr>
{
public:
  TypeNode * targetType;
  Expr * expr;

  CastExpr(TypeNode * t, Expr * e, SourceRange r = {}) : NodeBase(r), targetType(t), expr(e) {}
};

/**
 * base[index] or base[index, width].
 *
 * The meaning depends on the base type and is recorded in `accessKind`.
 */
class IndexExpr : public NodeBase<IndexExpr, Expr, NodeKind::IndexExpr>
{
public:
  Expr * base;
  Expr * index;
  Expr * width = nullptr;  ///< Second operand of [a, b], nullptr for [a]
  IndexAccessKind accessKind = IndexAccessKind::Unresolved;

  IndexExpr(Expr * b, Expr * i, Expr * w, SourceRange r = {})
  : NodeBase(r), base(b), index(i), width(w)
  {
  }
};

/**
 * base.member
 *
 * Covers struct fields, qualified names (this.x, global.x, Scope.x,
 * Enum.X, REG.FIELD), bitmap fields and the .length/.capacity/.MIN/.MAX
 * properties. NameResolver and TypeResolver fill in the annotations.
 */
class MemberExpr : public NodeBase<MemberExpr, Expr, NodeKind::MemberExpr>
{
public:
  Expr * base;
  std::string_view member;
  MemberAccessKind accessKind = MemberAccessKind::Unresolved;

  const Symbol * resolvedSymbol = nullptr;
  const AstNode * resolvedDecl = nullptr;
  std::string_view cName;  ///< Emitted name for Symbol/EnumMember/RegisterField

  // BitmapField
  uint32_t bitOffset = 0;
  uint32_t bitCount = 0;

  // RegisterField
  RegisterAccess registerAccess = RegisterAccess::ReadWrite;

  MemberExpr(Expr * b, std::string_view m, SourceRange r = {}) : NodeBase(r), base(b), member(m) {}
};

class CallExpr : public NodeBase<CallExpr, Expr, NodeKind::CallExpr>
{
public:
  Expr * callee;
  gsl::span<Expr *> args;

  /// Function symbol (set by NameResolver).
  const Symbol * resolvedSymbol = nullptr;

  CallExpr(Expr * c, gsl::span<Expr *> a, SourceRange r = {}) : NodeBase(r), callee(c), args(a) {}
};

/// [a, b, c]
class ArrayLiteralExpr : public NodeBase<ArrayLiteralExpr, Expr, NodeKind::ArrayLiteralExpr>
{
public:
  gsl::span<Expr *> elements;

  explicit ArrayLiteralExpr(gsl::span<Expr *> elems, SourceRange r = {})
  : NodeBase(r), elements(elems)
  {
  }
};

class FieldInit;

/// {x: 1, y: 2}
class StructLiteralExpr : public NodeBase<StructLiteralExpr, Expr, NodeKind::StructLiteralExpr>
{
public:
  gsl::span<FieldInit *> fields;

  explicit StructLiteralExpr(gsl::span<FieldInit *> f, SourceRange r = {}) : NodeBase(r), fields(f)
  {
  }
};

// ============================================================================
// Type Nodes
// ============================================================================

/**
 * A type name: `u32`, `Point`, `string<32>`, `ns::Widget`.
 */
class PrimaryType : public NodeBase<PrimaryType, TypeNode, NodeKind::PrimaryType>
{
public:
  std::string_view name;
  uint32_t stringCapacity = 0;  ///< N of string<N>
  bool hasCapacity = false;

  explicit PrimaryType(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}

  PrimaryType(std::string_view n, uint32_t capacity, SourceRange r = {})
  : NodeBase(r), name(n), stringCapacity(capacity), hasCapacity(true)
  {
  }
};

// ============================================================================
// Supporting Nodes
// ============================================================================

class ParamDecl : public NodeBase<ParamDecl, AstNode, NodeKind::ParamDecl>
{
public:
  std::string_view name;
  bool isConst = false;  ///< Explicit `const`
  PrimaryType * type;
  gsl::span<Expr *> dims;

  const TypeInfo * resolvedType = nullptr;
  /// Set by const inference: assigned in the body, directly or via a callee.
  bool isMutated = false;

  ParamDecl(std::string_view n, bool c, PrimaryType * t, SourceRange r = {})
  : NodeBase(r), name(n), isConst(c), type(t)
  {
  }
};

class FieldDecl : public NodeBase<FieldDecl, AstNode, NodeKind::FieldDecl>
{
public:
  std::string_view name;
  PrimaryType * type;
  gsl::span<Expr *> dims;
  const TypeInfo * resolvedType = nullptr;

  FieldDecl(std::string_view n, PrimaryType * t, SourceRange r = {}) : NodeBase(r), name(n), type(t)
  {
  }
};

class EnumMember : public NodeBase<EnumMember, AstNode, NodeKind::EnumMember>
{
public:
  std::string_view name;
  Expr * value = nullptr;  ///< Explicit `<- value`, or nullptr
  int64_t resolvedValue = 0;

  EnumMember(std::string_view n, Expr * v, SourceRange r = {}) : NodeBase(r), name(n), value(v) {}
};

/// `flag` (1 bit) or `field[3]` inside a bitmap.
class BitmapField : public NodeBase<BitmapField, AstNode, NodeKind::BitmapField>
{
public:
  std::string_view name;
  uint32_t width = 1;
  uint32_t offset = 0;  ///< Computed from declaration order

  BitmapField(std::string_view n, uint32_t w, SourceRange r = {}) : NodeBase(r), name(n), width(w) {}
};

/// `FIELD: T access @ offset`
class RegisterField : public NodeBase<RegisterField, AstNode, NodeKind::RegisterField>
{
public:
  std::string_view name;
  PrimaryType * type;
  RegisterAccess access;
  Expr * offset;
  const TypeInfo * resolvedType = nullptr;

  RegisterField(
    std::string_view n, PrimaryType * t, RegisterAccess a, Expr * off, SourceRange r = {})
  : NodeBase(r), name(n), type(t), access(a), offset(off)
  {
  }
};

class BlockStmt;

/// `case A || B { ... }`
class SwitchCase : public NodeBase<SwitchCase, AstNode, NodeKind::SwitchCase>
{
public:
  gsl::span<Expr *> labels;
  BlockStmt * body;

  SwitchCase(gsl::span<Expr *> l, BlockStmt * b, SourceRange r = {})
  : NodeBase(r), labels(l), body(b)
  {
  }
};

/// `default { ... }` or `default(n) { ... }`
class DefaultCase : public NodeBase<DefaultCase, AstNode, NodeKind::DefaultCase>
{
public:
  BlockStmt * body;
  bool hasCount = false;
  int64_t count = 0;

  explicit DefaultCase(BlockStmt * b, SourceRange r = {}) : NodeBase(r), body(b) {}

  DefaultCase(BlockStmt * b, int64_t n, SourceRange r = {})
  : NodeBase(r), body(b), hasCount(true), count(n)
  {
  }
};

/// `name: value` inside a struct literal.
class FieldInit : public NodeBase<FieldInit, AstNode, NodeKind::FieldInit>
{
public:
  std::string_view name;
  Expr * value;

  FieldInit(std::string_view n, Expr * v, SourceRange r = {}) : NodeBase(r), name(n), value(v) {}
};

// ============================================================================
// Statement Nodes
// ============================================================================

/// `[const] [wrap|clamp] T name[dims] [<- init];`
class VarDeclStmt : public NodeBase<VarDeclStmt, Stmt, NodeKind::VarDeclStmt>
{
public:
  std::string_view name;
  bool isConst = false;
  OverflowMode overflow = OverflowMode::Clamp;
  PrimaryType * type;
  gsl::span<Expr *> dims;
  Expr * init = nullptr;
  const TypeInfo * resolvedType = nullptr;

  VarDeclStmt(std::string_view n, bool c, PrimaryType * t, SourceRange r = {})
  : NodeBase(r), name(n), isConst(c), type(t)
  {
  }
};

/// `target <- value;` and compound forms.
class AssignStmt : public NodeBase<AssignStmt, Stmt, NodeKind::AssignStmt>
{
public:
  Expr * target;
  AssignOp op;
  Expr * value;

  AssignStmt(Expr * t, AssignOp o, Expr * v, SourceRange r = {})
  : NodeBase(r), target(t), op(o), value(v)
  {
  }
};

class ExprStmt : public NodeBase<ExprStmt, Stmt, NodeKind::ExprStmt>
{
public:
  Expr * expr;

  explicit ExprStmt(Expr * e, SourceRange r = {}) : NodeBase(r), expr(e) {}
};

class BlockStmt : public NodeBase<BlockStmt, Stmt, NodeKind::BlockStmt>
{
public:
  gsl::span<Stmt *> stmts;

  explicit BlockStmt(gsl::span<Stmt *> s, SourceRange r = {}) : NodeBase(r), stmts(s) {}
};

class IfStmt : public NodeBase<IfStmt, Stmt, NodeKind::IfStmt>
{
public:
  Expr * condition;
  BlockStmt * thenBlock;
  Stmt * elseStmt = nullptr;  ///< BlockStmt, IfStmt (else if) or nullptr

  IfStmt(Expr * c, BlockStmt * t, Stmt * e, SourceRange r = {})
  : NodeBase(r), condition(c), thenBlock(t), elseStmt(e)
  {
  }
};

class WhileStmt : public NodeBase<WhileStmt, Stmt, NodeKind::WhileStmt>
{
public:
  Expr * condition;
  BlockStmt * body;

  WhileStmt(Expr * c, BlockStmt * b, SourceRange r = {}) : NodeBase(r), condition(c), body(b) {}
};

class DoWhileStmt : public NodeBase<DoWhileStmt, Stmt, NodeKind::DoWhileStmt>
{
public:
  BlockStmt * body;
  Expr * condition;

  DoWhileStmt(BlockStmt * b, Expr * c, SourceRange r = {}) : NodeBase(r), body(b), condition(c) {}
};

/// `for (init; cond; update) { ... }` with every clause optional.
class ForStmt : public NodeBase<ForStmt, Stmt, NodeKind::ForStmt>
{
public:
  Stmt * init = nullptr;
  Expr * condition = nullptr;
  Stmt * update = nullptr;
  BlockStmt * body;

  ForStmt(Stmt * i, Expr * c, Stmt * u, BlockStmt * b, SourceRange r = {})
  : NodeBase(r), init(i), condition(c), update(u), body(b)
  {
  }
};

class SwitchStmt : public NodeBase<SwitchStmt, Stmt, NodeKind::SwitchStmt>
{
public:
  Expr * subject;
  gsl::span<SwitchCase *> cases;
  DefaultCase * defaultCase = nullptr;

  SwitchStmt(Expr * s, gsl::span<SwitchCase *> c, DefaultCase * d, SourceRange r = {})
  : NodeBase(r), subject(s), cases(c), defaultCase(d)
  {
  }
};

class ReturnStmt : public NodeBase<ReturnStmt, Stmt, NodeKind::ReturnStmt>
{
public:
  Expr * value = nullptr;

  explicit ReturnStmt(Expr * v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

// ============================================================================
// Declaration Nodes
// ============================================================================

/// `#include <path>` / `#include "path"`
class IncludeDecl : public NodeBase<IncludeDecl, Decl, NodeKind::IncludeDecl>
{
public:
  std::string_view path;
  bool isSystem;

  IncludeDecl(std::string_view p, bool sys, SourceRange r = {}) : NodeBase(r), path(p), isSystem(sys)
  {
  }
};

/// `#define NAME [value]`; only the flag form is accepted by sema.
class DefineDecl : public NodeBase<DefineDecl, Decl, NodeKind::DefineDecl>
{
public:
  std::string_view name;
  std::string_view value;
  bool isFunctionLike = false;

  DefineDecl(std::string_view n, std::string_view v, bool fn, SourceRange r = {})
  : NodeBase(r), name(n), value(v), isFunctionLike(fn)
  {
  }
};

class StructDecl : public NodeBase<StructDecl, Decl, NodeKind::StructDecl>
{
public:
  std::string_view name;
  gsl::span<FieldDecl *> fields;

  StructDecl(std::string_view n, gsl::span<FieldDecl *> f, SourceRange r = {})
  : NodeBase(r), name(n), fields(f)
  {
  }
};

class EnumDecl : public NodeBase<EnumDecl, Decl, NodeKind::EnumDecl>
{
public:
  std::string_view name;
  gsl::span<EnumMember *> members;

  EnumDecl(std::string_view n, gsl::span<EnumMember *> m, SourceRange r = {})
  : NodeBase(r), name(n), members(m)
  {
  }
};

class BitmapDecl : public NodeBase<BitmapDecl, Decl, NodeKind::BitmapDecl>
{
public:
  std::string_view name;
  uint32_t bitSize;  ///< 8, 16 or 32
  gsl::span<BitmapField *> fields;

  BitmapDecl(std::string_view n, uint32_t bits, gsl::span<BitmapField *> f, SourceRange r = {})
  : NodeBase(r), name(n), bitSize(bits), fields(f)
  {
  }
};

/// `register NAME @ base { FIELD: T access @ offset, ... }`
class RegisterDecl : public NodeBase<RegisterDecl, Decl, NodeKind::RegisterDecl>
{
public:
  std::string_view name;
  Expr * baseAddress;
  gsl::span<RegisterField *> fields;

  RegisterDecl(std::string_view n, Expr * base, gsl::span<RegisterField *> f, SourceRange r = {})
  : NodeBase(r), name(n), baseAddress(base), fields(f)
  {
  }

  [[nodiscard]] const RegisterField * find_field(std::string_view field) const noexcept
  {
    for (const auto * f : fields) {
      if (f->name == field) return f;
    }
    return nullptr;
  }
};

class ScopeDecl : public NodeBase<ScopeDecl, Decl, NodeKind::ScopeDecl>
{
public:
  std::string_view name;
  gsl::span<Decl *> members;  ///< FunctionDecl / GlobalVarDecl

  ScopeDecl(std::string_view n, gsl::span<Decl *> m, SourceRange r = {})
  : NodeBase(r), name(n), members(m)
  {
  }
};

class FunctionDecl : public NodeBase<FunctionDecl, Decl, NodeKind::FunctionDecl>
{
public:
  std::string_view name;
  std::string_view cName;  ///< Flattened name (Scope_name inside a scope)
  PrimaryType * returnType;
  gsl::span<ParamDecl *> params;
  BlockStmt * body = nullptr;

  std::string_view scopeName;  ///< Empty at file level
  bool isPublic = true;

  const TypeInfo * resolvedReturnType = nullptr;

  FunctionDecl(std::string_view n, PrimaryType * ret, SourceRange r = {})
  : NodeBase(r), name(n), cName(n), returnType(ret)
  {
  }

  [[nodiscard]] bool in_scope() const noexcept { return !scopeName.empty(); }
};

class GlobalVarDecl : public NodeBase<GlobalVarDecl, Decl, NodeKind::GlobalVarDecl>
{
public:
  std::string_view name;
  std::string_view cName;
  bool isConst = false;
  OverflowMode overflow = OverflowMode::Clamp;
  PrimaryType * type;
  gsl::span<Expr *> dims;
  Expr * init = nullptr;

  std::string_view scopeName;
  bool isPublic = true;

  const TypeInfo * resolvedType = nullptr;

  GlobalVarDecl(std::string_view n, bool c, PrimaryType * t, SourceRange r = {})
  : NodeBase(r), name(n), cName(n), isConst(c), type(t)
  {
  }

  [[nodiscard]] bool in_scope() const noexcept { return !scopeName.empty(); }
};

// ============================================================================
// Program (Root Node)
// ============================================================================

/// A `//` or `/* */` comment; `text` includes the delimiters.
struct Comment
{
  SourceRange range;
  std::string_view text;
};

class Program : public NodeBase<Program, AstNode, NodeKind::Program>
{
public:
  gsl::span<IncludeDecl *> includes;
  gsl::span<DefineDecl *> defines;
  /// Declarations in source order (structs, enums, bitmaps, registers,
  /// scopes, functions, globals).
  gsl::span<Decl *> decls;
  /// Every comment of the file, in source order.
  gsl::span<Comment> comments;

  explicit Program(SourceRange r = {}) : NodeBase(r) {}
};

// ============================================================================
// Helper Functions
// ============================================================================

[[nodiscard]] inline SourceRange get_range(const AstNode * node) noexcept
{
  return node ? node->get_range() : SourceRange{};
}

/// Strips Index/Member wrappers and returns the root VarRefExpr, if any.
/// Qualified names (this.x, Scope.x) return nullptr: the MemberExpr itself
/// carries the resolved symbol.
[[nodiscard]] inline const VarRefExpr * root_var_ref(const Expr * e) noexcept
{
  while (e != nullptr) {
    if (const auto * ref = dyn_cast<VarRefExpr>(e)) {
      return ref;
    }
    if (const auto * idx = dyn_cast<IndexExpr>(e)) {
      e = idx->base;
      continue;
    }
    if (const auto * mem = dyn_cast<MemberExpr>(e)) {
      if (mem->accessKind != MemberAccessKind::Field &&
          mem->accessKind != MemberAccessKind::BitmapField) {
        return nullptr;
      }
      e = mem->base;
      continue;
    }
    return nullptr;
  }
  return nullptr;
}

}  // namespace cnext
