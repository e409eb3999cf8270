// cnext/sema/const_evaluator.cpp - Constant evaluator implementation

#include "cnext/sema/types/const_evaluator.hpp"

#include <limits>

#include "cnext/symbols/symbol.hpp"

namespace cnext
{

namespace
{

constexpr int k_max_depth = 32;

std::optional<int64_t> eval(const Expr * expr, int depth);

std::optional<int64_t> eval_binary(const BinaryExpr * bin, int depth)
{
  const auto l = eval(bin->lhs, depth + 1);
  const auto r = eval(bin->rhs, depth + 1);
  if (!l || !r) {
    return std::nullopt;
  }
  const int64_t a = *l;
  const int64_t b = *r;
  switch (bin->op) {
    case BinaryOp::Add:
      return static_cast<int64_t>(static_cast<uint64_t>(a) + static_cast<uint64_t>(b));
    case BinaryOp::Sub:
      return static_cast<int64_t>(static_cast<uint64_t>(a) - static_cast<uint64_t>(b));
    case BinaryOp::Mul:
      return static_cast<int64_t>(static_cast<uint64_t>(a) * static_cast<uint64_t>(b));
    case BinaryOp::Div:
      if (b == 0 || (a == std::numeric_limits<int64_t>::min() && b == -1)) return std::nullopt;
      return a / b;
    case BinaryOp::Mod:
      if (b == 0 || (a == std::numeric_limits<int64_t>::min() && b == -1)) return std::nullopt;
      return a % b;
    case BinaryOp::BitAnd:
      return a & b;
    case BinaryOp::BitOr:
      return a | b;
    case BinaryOp::BitXor:
      return a ^ b;
    case BinaryOp::Shl:
      if (b < 0 || b > 63) return std::nullopt;
      return static_cast<int64_t>(static_cast<uint64_t>(a) << b);
    case BinaryOp::Shr:
      if (b < 0 || b > 63) return std::nullopt;
      return a >> b;
    default:
      return std::nullopt;
  }
}

std::optional<int64_t> eval_symbol(const Symbol * sym, const AstNode * decl, int depth)
{
  if (sym != nullptr) {
    if (const auto * macro = sym->as<MacroInfo>()) {
      return macro->intValue;
    }
  }
  if (const auto * global = dyn_cast<GlobalVarDecl>(decl)) {
    if (global->isConst && global->dims.empty() && global->init != nullptr) {
      return eval(global->init, depth + 1);
    }
  }
  return std::nullopt;
}

std::optional<int64_t> eval_member(const MemberExpr * mem, int depth)
{
  switch (mem->accessKind) {
    case MemberAccessKind::EnumMember:
      if (mem->resolvedSymbol != nullptr) {
        if (const auto * info = mem->resolvedSymbol->as<EnumInfo>()) {
          if (const auto * m = info->find_member(mem->member)) {
            return m->value;
          }
        }
      }
      return std::nullopt;
    case MemberAccessKind::Symbol:
      return eval_symbol(mem->resolvedSymbol, mem->resolvedDecl, depth);
    case MemberAccessKind::TypeMin:
    case MemberAccessKind::TypeMax:
      if (mem->resolvedType != nullptr) {
        const IntegerRange range = integer_range(*mem->resolvedType);
        if (mem->accessKind == MemberAccessKind::TypeMin) {
          return range.min;
        }
        if (range.max > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
          return std::nullopt;
        }
        return static_cast<int64_t>(range.max);
      }
      return std::nullopt;
    default:
      return std::nullopt;
  }
}

std::optional<int64_t> eval(const Expr * expr, int depth)
{
  if (expr == nullptr || depth > k_max_depth) {
    return std::nullopt;
  }

  if (const auto * lit = dyn_cast<IntLiteralExpr>(expr)) {
    if (lit->value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
      return std::nullopt;
    }
    return static_cast<int64_t>(lit->value);
  }
  if (const auto * ch = dyn_cast<CharLiteralExpr>(expr)) {
    return static_cast<int64_t>(static_cast<unsigned char>(ch->value));
  }
  if (const auto * b = dyn_cast<BoolLiteralExpr>(expr)) {
    return b->value ? 1 : 0;
  }
  if (const auto * un = dyn_cast<UnaryExpr>(expr)) {
    const auto v = eval(un->operand, depth + 1);
    if (!v) return std::nullopt;
    switch (un->op) {
      case UnaryOp::Neg:
        return static_cast<int64_t>(0 - static_cast<uint64_t>(*v));
      case UnaryOp::BitNot:
        return ~*v;
      case UnaryOp::Not:
        return *v == 0 ? 1 : 0;
    }
    return std::nullopt;
  }
  if (const auto * bin = dyn_cast<BinaryExpr>(expr)) {
    return eval_binary(bin, depth);
  }
  if (const auto * cast_expr = dyn_cast<CastExpr>(expr)) {
    return eval(cast_expr->expr, depth + 1);
  }
  if (const auto * ref = dyn_cast<VarRefExpr>(expr)) {
    if (ref->resolvedSymbol != nullptr) {
      // Bare C enumerator
      if (const auto * info = ref->resolvedSymbol->as<EnumInfo>()) {
        const auto * m = info->find_member(ref->name);
        return m != nullptr ? std::optional<int64_t>(m->value) : std::nullopt;
      }
    }
    return eval_symbol(ref->resolvedSymbol, ref->resolvedDecl, depth);
  }
  if (const auto * mem = dyn_cast<MemberExpr>(expr)) {
    return eval_member(mem, depth);
  }
  return std::nullopt;
}

}  // namespace

std::optional<int64_t> evaluate_constant(const Expr * expr) { return eval(expr, 0); }

std::optional<int64_t> literal_value(const Expr * expr)
{
  if (const auto * un = dyn_cast<UnaryExpr>(expr)) {
    if (un->op == UnaryOp::Neg) {
      if (const auto * lit = dyn_cast<IntLiteralExpr>(un->operand)) {
        if (lit->value <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
          return -static_cast<int64_t>(lit->value);
        }
      }
    }
    return std::nullopt;
  }
  if (const auto * lit = dyn_cast<IntLiteralExpr>(expr)) {
    if (lit->value <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
      return static_cast<int64_t>(lit->value);
    }
  }
  return std::nullopt;
}

}  // namespace cnext
