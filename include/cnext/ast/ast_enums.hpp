// cnext/ast/ast_enums.hpp - AST enumeration definitions
//
// Node kinds, operators and the access classifications that semantic
// analysis attaches to index/member expressions.
//
#pragma once

#include <cstdint>
#include <string_view>

namespace cnext
{

// ============================================================================
// NodeKind
// ============================================================================

/**
 * Node kind enumeration for LLVM-style RTTI.
 * Grouped by category so classof() checks are range comparisons.
 */
enum class NodeKind : uint8_t {
#define AST_NODE_EXPR(Class, Kind, Snake) Kind,
#include "cnext/ast/ast_nodes.def"

#define AST_NODE_TYPE(Class, Kind, Snake) Kind,
#include "cnext/ast/ast_nodes.def"

#define AST_NODE_STMT(Class, Kind, Snake) Kind,
#include "cnext/ast/ast_nodes.def"

#define AST_NODE_DECL(Class, Kind, Snake) Kind,
#include "cnext/ast/ast_nodes.def"

#define AST_NODE_SUPPORT(Class, Kind, Snake) Kind,
#include "cnext/ast/ast_nodes.def"

#define AST_NODE_TOP(Class, Kind, Snake) Kind,
#include "cnext/ast/ast_nodes.def"
};

// ============================================================================
// Operators
// ============================================================================

/**
 * Binary operators, listed in source spelling.
 *
 * Equality is spelled `=` in C-Next and emitted as `==`.
 */
enum class BinaryOp : uint8_t {
  Add,     ///< +
  Sub,     ///< -
  Mul,     ///< *
  Div,     ///< /
  Mod,     ///< %
  Eq,      ///< =
  Ne,      ///< !=
  Lt,      ///< <
  Le,      ///< <=
  Gt,      ///< >
  Ge,      ///< >=
  And,     ///< &&
  Or,      ///< ||
  BitAnd,  ///< &
  BitXor,  ///< ^
  BitOr,   ///< |
  Shl,     ///< <<
  Shr,     ///< >>
};

enum class UnaryOp : uint8_t {
  Not,     ///< !
  Neg,     ///< -
  BitNot,  ///< ~
};

/**
 * Assignment operators. Every form ends in `<-`.
 */
enum class AssignOp : uint8_t {
  Assign,     ///< <-
  AddAssign,  ///< +<-
  SubAssign,  ///< -<-
  MulAssign,  ///< *<-
  DivAssign,  ///< /<-
  ModAssign,  ///< %<-
  AndAssign,  ///< &<-
  OrAssign,   ///< |<-
  XorAssign,  ///< ^<-
  ShlAssign,  ///< <<<-
  ShrAssign,  ///< >><-
};

/// Integer overflow behaviour of a variable's compound `+<-`, `-<-`, `*<-`.
enum class OverflowMode : uint8_t {
  Clamp,  ///< default: saturate at the type's MIN / MAX
  Wrap,   ///< `wrap`: plain C modular arithmetic
};

// ============================================================================
// Semantic classifications (filled by Sema)
// ============================================================================

/// What an IndexExpr denotes once the base type is known.
enum class IndexAccessKind : uint8_t {
  Unresolved,
  ArrayElement,  ///< arr[i]
  BitIndex,      ///< x[i] on an integer
  BitRange,      ///< x[start, width] on an integer
  Slice,         ///< arr[offset, length] on an array (write only)
};

/// What a MemberExpr denotes once names and types are resolved.
enum class MemberAccessKind : uint8_t {
  Unresolved,
  Field,          ///< struct field
  Symbol,         ///< flattened scope member or global (this.x, global.x, Scope.x)
  EnumMember,     ///< Enum.MEMBER
  RegisterField,  ///< REG.FIELD
  BitmapField,    ///< bitmap flag or multi-bit field
  Length,         ///< .length property
  Capacity,       ///< .capacity property
  TypeMin,        ///< u8.MIN
  TypeMax,        ///< u8.MAX
};

/// Register field access mode.
enum class RegisterAccess : uint8_t {
  ReadWrite,     ///< rw
  ReadOnly,      ///< ro
  WriteOnly,     ///< wo
  WriteOneClear, ///< w1c
  WriteOneSet,   ///< w1s
};

// ============================================================================
// to_string()
// ============================================================================

[[nodiscard]] constexpr std::string_view to_string(BinaryOp op) noexcept
{
  switch (op) {
    case BinaryOp::Add:
      return "+";
    case BinaryOp::Sub:
      return "-";
    case BinaryOp::Mul:
      return "*";
    case BinaryOp::Div:
      return "/";
    case BinaryOp::Mod:
      return "%";
    case BinaryOp::Eq:
      return "=";
    case BinaryOp::Ne:
      return "!=";
    case BinaryOp::Lt:
      return "<";
    case BinaryOp::Le:
      return "<=";
    case BinaryOp::Gt:
      return ">";
    case BinaryOp::Ge:
      return ">=";
    case BinaryOp::And:
      return "&&";
    case BinaryOp::Or:
      return "||";
    case BinaryOp::BitAnd:
      return "&";
    case BinaryOp::BitXor:
      return "^";
    case BinaryOp::BitOr:
      return "|";
    case BinaryOp::Shl:
      return "<<";
    case BinaryOp::Shr:
      return ">>";
  }
  return "";
}

/// C spelling of a binary operator.
[[nodiscard]] constexpr std::string_view to_c_string(BinaryOp op) noexcept
{
  return op == BinaryOp::Eq ? "==" : to_string(op);
}

[[nodiscard]] constexpr std::string_view to_string(UnaryOp op) noexcept
{
  switch (op) {
    case UnaryOp::Not:
      return "!";
    case UnaryOp::Neg:
      return "-";
    case UnaryOp::BitNot:
      return "~";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(AssignOp op) noexcept
{
  switch (op) {
    case AssignOp::Assign:
      return "<-";
    case AssignOp::AddAssign:
      return "+<-";
    case AssignOp::SubAssign:
      return "-<-";
    case AssignOp::MulAssign:
      return "*<-";
    case AssignOp::DivAssign:
      return "/<-";
    case AssignOp::ModAssign:
      return "%<-";
    case AssignOp::AndAssign:
      return "&<-";
    case AssignOp::OrAssign:
      return "|<-";
    case AssignOp::XorAssign:
      return "^<-";
    case AssignOp::ShlAssign:
      return "<<<-";
    case AssignOp::ShrAssign:
      return ">><-";
  }
  return "";
}

/// C spelling of an assignment operator ("=", "+=", ...).
[[nodiscard]] constexpr std::string_view to_c_string(AssignOp op) noexcept
{
  switch (op) {
    case AssignOp::Assign:
      return "=";
    case AssignOp::AddAssign:
      return "+=";
    case AssignOp::SubAssign:
      return "-=";
    case AssignOp::MulAssign:
      return "*=";
    case AssignOp::DivAssign:
      return "/=";
    case AssignOp::ModAssign:
      return "%=";
    case AssignOp::AndAssign:
      return "&=";
    case AssignOp::OrAssign:
      return "|=";
    case AssignOp::XorAssign:
      return "^=";
    case AssignOp::ShlAssign:
      return "<<=";
    case AssignOp::ShrAssign:
      return ">>=";
  }
  return "=";
}

[[nodiscard]] constexpr std::string_view to_string(RegisterAccess access) noexcept
{
  switch (access) {
    case RegisterAccess::ReadWrite:
      return "rw";
    case RegisterAccess::ReadOnly:
      return "ro";
    case RegisterAccess::WriteOnly:
      return "wo";
    case RegisterAccess::WriteOneClear:
      return "w1c";
    case RegisterAccess::WriteOneSet:
      return "w1s";
  }
  return "";
}

/// True for modes whose hardware read value is meaningless (wo, w1c, w1s).
[[nodiscard]] constexpr bool is_write_only(RegisterAccess access) noexcept
{
  return access == RegisterAccess::WriteOnly || access == RegisterAccess::WriteOneClear ||
         access == RegisterAccess::WriteOneSet;
}

// ============================================================================
// NodeKind Range Helpers
// ============================================================================

namespace detail
{

inline constexpr NodeKind k_first_expr_kind = NodeKind::IntLiteral;
inline constexpr NodeKind k_last_expr_kind = NodeKind::StructLiteralExpr;

inline constexpr NodeKind k_first_type_kind = NodeKind::PrimaryType;
inline constexpr NodeKind k_last_type_kind = NodeKind::PrimaryType;

inline constexpr NodeKind k_first_stmt_kind = NodeKind::VarDeclStmt;
inline constexpr NodeKind k_last_stmt_kind = NodeKind::BlockStmt;

inline constexpr NodeKind k_first_decl_kind = NodeKind::IncludeDecl;
inline constexpr NodeKind k_last_decl_kind = NodeKind::GlobalVarDecl;

}  // namespace detail

[[nodiscard]] constexpr bool is_expr_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_expr_kind && kind <= detail::k_last_expr_kind;
}

[[nodiscard]] constexpr bool is_type_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_type_kind && kind <= detail::k_last_type_kind;
}

[[nodiscard]] constexpr bool is_stmt_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_stmt_kind && kind <= detail::k_last_stmt_kind;
}

[[nodiscard]] constexpr bool is_decl_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_decl_kind && kind <= detail::k_last_decl_kind;
}

}  // namespace cnext
