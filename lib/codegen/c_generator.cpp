// cnext/codegen/c_generator.cpp - C implementation file generator
//
#include "cnext/codegen/c_generator.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <vector>

#include "cnext/basic/casting.hpp"
#include "cnext/codegen/c_types.hpp"
#include "cnext/sema/types/const_evaluator.hpp"
#include "cnext/symbols/symbol.hpp"
#include "cnext/symbols/type_info.hpp"

namespace cnext
{

namespace
{

/// Drops one pair of parentheses wrapping the whole text.
std::string strip_parens(std::string text)
{
  if (text.size() < 2 || text.front() != '(' || text.back() != ')') {
    return text;
  }
  int depth = 0;
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '(') {
      ++depth;
    } else if (text[i] == ')') {
      --depth;
      if (depth == 0 && i + 1 != text.size()) {
        return text;
      }
    }
  }
  return text.substr(1, text.size() - 2);
}

/// "+" for "+=", "<<" for "<<=".
std::string_view binary_part(AssignOp op)
{
  const std::string_view full = to_c_string(op);
  return full.substr(0, full.size() - 1);
}

uint32_t operand_bits(const TypeInfo * t) { return t == nullptr || t->bitWidth == 0 ? 32 : t->bitWidth; }

bool is_bounded_string(const TypeInfo * t)
{
  return t != nullptr && t->kind == TypeKind::String && !t->isArray;
}

bool returns_value(const Expr * e)
{
  return e->resolvedType != nullptr && e->resolvedType->kind != TypeKind::Void;
}

}  // namespace

std::string CGenerator::generate()
{
  out_ = CodeWriter{};
  headers_.clear();
  clampHelpers_.clear();
  comments_ = CommentCursor{};

  if (module_.program != nullptr) {
    comments_ = CommentCursor(module_.program->comments);
    for (const Decl * decl : module_.program->decls) {
      emit_decl(decl);
    }
    comments_.write_before(out_, module_.program->get_range().get_end().offset() + 1);
  }
  std::string body = out_.take();

  CodeWriter head;
  head.line(fmt::format(
    "/* Generated by cnextc from {}. Do not edit. */", module_.path.filename().string()));
  head.line(fmt::format("#include \"{}.h\"", module_.stem()));
  for (const auto & h : headers_) {
    head.line(fmt::format("#include <{}>", h));
  }
  head.line("");
  emit_clamp_helpers(head);
  return head.take() + body;
}

// ============================================================================
// Declarations
// ============================================================================

void CGenerator::emit_decl(const Decl * decl)
{
  if (const auto * g = dyn_cast<GlobalVarDecl>(decl)) {
    emit_comments_before(g);
    emit_global(g);
  } else if (const auto * fn = dyn_cast<FunctionDecl>(decl)) {
    emit_comments_before(fn);
    emit_function(fn);
  } else if (const auto * scope = dyn_cast<ScopeDecl>(decl)) {
    for (const Decl * member : scope->members) {
      emit_decl(member);
    }
  } else {
    // Structs, enums, bitmaps and registers live in the header.
    comments_.skip_before(decl->get_range().get_end().offset());
  }
}

void CGenerator::emit_comments_before(const AstNode * node)
{
  comments_.write_before(out_, node->get_range().get_begin().offset());
}

void CGenerator::emit_global(const GlobalVarDecl * global)
{
  if (global->resolvedType == nullptr) return;
  const TypeInfo & t = *global->resolvedType;
  const std::string init = global->init != nullptr ? initializer(global->init) : c_zero_value(t);
  out_.line(fmt::format(
    "{}{} = {};", global->isPublic ? "" : "static ", c_declarator(t, global->cName), init));
  out_.blank();
}

void CGenerator::emit_function(const FunctionDecl * fn)
{
  out_.open(c_function_prototype(*fn));
  if (fn->body != nullptr) {
    emit_block_body(fn->body);
  }
  out_.close();
  out_.blank();
}

// ============================================================================
// Statements
// ============================================================================

void CGenerator::emit_block_body(const BlockStmt * block)
{
  if (block == nullptr) return;
  for (const Stmt * stmt : block->stmts) {
    emit_comments_before(stmt);
    emit_stmt(stmt);
  }
  // Comments after the last statement, before the closing brace
  const uint32_t end = block->get_range().get_end().offset();
  comments_.write_before(out_, end > 0 ? end - 1 : 0);
}

void CGenerator::emit_stmt(const Stmt * stmt)
{
  switch (stmt->get_kind()) {
    case NodeKind::VarDeclStmt:
    case NodeKind::AssignStmt:
    case NodeKind::ExprStmt:
      out_.line(simple_stmt(stmt) + ";");
      break;
    case NodeKind::BlockStmt:
      out_.line("{");
      out_.indent();
      emit_block_body(cast<BlockStmt>(stmt));
      out_.close();
      break;
    case NodeKind::IfStmt:
      emit_if(cast<IfStmt>(stmt));
      break;
    case NodeKind::WhileStmt: {
      const auto * w = cast<WhileStmt>(stmt);
      out_.open(fmt::format("while ({})", strip_parens(expr(w->condition))));
      emit_block_body(w->body);
      out_.close();
      break;
    }
    case NodeKind::DoWhileStmt: {
      const auto * d = cast<DoWhileStmt>(stmt);
      out_.open("do");
      emit_block_body(d->body);
      out_.close(fmt::format(" while ({});", strip_parens(expr(d->condition))));
      break;
    }
    case NodeKind::ForStmt: {
      const auto * f = cast<ForStmt>(stmt);
      out_.open(fmt::format(
        "for ({}; {}; {})", f->init != nullptr ? simple_stmt(f->init) : "",
        f->condition != nullptr ? strip_parens(expr(f->condition)) : "",
        f->update != nullptr ? simple_stmt(f->update) : ""));
      emit_block_body(f->body);
      out_.close();
      break;
    }
    case NodeKind::SwitchStmt:
      emit_switch(cast<SwitchStmt>(stmt));
      break;
    case NodeKind::ReturnStmt: {
      const auto * r = cast<ReturnStmt>(stmt);
      out_.line(r->value != nullptr ? fmt::format("return {};", strip_parens(expr(r->value)))
                                    : std::string("return;"));
      break;
    }
    default:
      break;
  }
}

void CGenerator::emit_if(const IfStmt * stmt)
{
  out_.open(fmt::format("if ({})", strip_parens(expr(stmt->condition))));
  emit_block_body(stmt->thenBlock);

  const Stmt * next = stmt->elseStmt;
  while (next != nullptr) {
    out_.dedent();
    if (const auto * elif = dyn_cast<IfStmt>(next)) {
      out_.open(fmt::format("}} else if ({})", strip_parens(expr(elif->condition))));
      emit_block_body(elif->thenBlock);
      next = elif->elseStmt;
    } else {
      out_.open("} else");
      emit_block_body(dyn_cast<BlockStmt>(next));
      next = nullptr;
    }
  }
  out_.close();
}

void CGenerator::emit_switch(const SwitchStmt * stmt)
{
  out_.open(fmt::format("switch ({})", strip_parens(expr(stmt->subject))));
  for (const SwitchCase * c : stmt->cases) {
    if (c->labels.empty()) continue;
    for (size_t i = 0; i + 1 < c->labels.size(); ++i) {
      out_.line(fmt::format("case {}:", expr(c->labels[i])));
    }
    out_.open(fmt::format("case {}:", expr(c->labels[c->labels.size() - 1])));
    emit_case_body(c->body);
  }
  // Enum switches without a default are exhaustive; C still gets one.
  out_.open("default:");
  emit_case_body(stmt->defaultCase != nullptr ? stmt->defaultCase->body : nullptr);
  out_.close();
}

void CGenerator::emit_case_body(const BlockStmt * body)
{
  emit_block_body(body);
  out_.line("break;");
  out_.close();
}

std::string CGenerator::simple_stmt(const Stmt * stmt)
{
  if (const auto * decl = dyn_cast<VarDeclStmt>(stmt)) {
    return var_decl(decl);
  }
  if (const auto * assign = dyn_cast<AssignStmt>(stmt)) {
    return assignment(assign);
  }
  if (const auto * es = dyn_cast<ExprStmt>(stmt)) {
    std::string text = strip_parens(expr(es->expr));
    if (isa<CallExpr>(es->expr) && returns_value(es->expr)) {
      return "(void)" + text;
    }
    return text;
  }
  return {};
}

std::string CGenerator::var_decl(const VarDeclStmt * decl)
{
  if (decl->resolvedType == nullptr) return {};
  const TypeInfo & t = *decl->resolvedType;
  const std::string declarator = c_declarator(t, decl->name);

  if (decl->init == nullptr) {
    // Arrays and strings start zero-filled; scalars are assigned before use.
    if (t.isArray || t.kind == TypeKind::String) {
      return fmt::format("{} = {{0}}", declarator);
    }
    return declarator;
  }

  if (is_bounded_string(&t) && !isa<StringLiteralExpr>(decl->init)) {
    require("stdio.h");
    return fmt::format(
      "{} = {{0}}; (void)snprintf({}, {}U, \"%s\", {})", declarator, decl->name,
      t.stringCapacity + 1, expr(decl->init));
  }
  return fmt::format("{} = {}", declarator, strip_parens(initializer(decl->init)));
}

std::string CGenerator::assignment(const AssignStmt * stmt)
{
  const Expr * target = stmt->target;
  const Expr * value = stmt->value;

  if (const auto * idx = dyn_cast<IndexExpr>(target)) {
    const TypeInfo * base_type = idx->base->resolvedType;
    const uint32_t bits = operand_bits(base_type);
    switch (idx->accessKind) {
      case IndexAccessKind::Slice:
        return slice_write(idx, value);
      case IndexAccessKind::BitIndex: {
        const std::string bit_value =
          stmt->op == AssignOp::Assign
            ? expr(value)
            : fmt::format("({} {} {})", index(idx), binary_part(stmt->op), expr(value));
        return bit_write(
          expr(idx->base), *base_type, expr(idx->index), bits == 64 ? "1ULL" : "1U",
          fmt::format("(({}) ? 1U : 0U)", strip_parens(bit_value)));
      }
      case IndexAccessKind::BitRange: {
        const std::string field_value =
          stmt->op == AssignOp::Assign
            ? expr(value)
            : fmt::format("({} {} {})", index(idx), binary_part(stmt->op), expr(value));
        return bit_write(
          expr(idx->base), *base_type, expr(idx->index), bit_range_mask(idx->width, bits),
          field_value);
      }
      default:
        break;
    }
  }

  if (const auto * mem = dyn_cast<MemberExpr>(target)) {
    if (mem->accessKind == MemberAccessKind::BitmapField) {
      const TypeInfo * base_type = mem->base->resolvedType;
      const uint32_t bits = operand_bits(base_type);
      std::string field_value =
        stmt->op == AssignOp::Assign
          ? expr(value)
          : fmt::format("({} {} {})", member(mem), binary_part(stmt->op), expr(value));
      if (mem->bitCount == 1) {
        field_value = fmt::format("(({}) ? 1U : 0U)", strip_parens(field_value));
      }
      return bit_write(
        expr(mem->base), *base_type, fmt::format("{}U", mem->bitOffset),
        c_bit_mask(mem->bitCount, bits), field_value);
    }
  }

  const TypeInfo * target_type = target->resolvedType;
  if (is_bounded_string(target_type)) {
    return string_assign(target, value);
  }
  if (const TypeInfo * clamped = clamp_target(stmt)) {
    return clamped_assign(stmt, *clamped);
  }
  if (target_type != nullptr && target_type->isArray && isa<ArrayLiteralExpr>(value)) {
    require("string.h");
    const std::string dst = expr(target);
    return fmt::format("(void)memcpy({}, {}, sizeof({}))", dst, expr(value), dst);
  }

  return fmt::format(
    "{} {} {}", expr(target), to_c_string(stmt->op), strip_parens(expr(value)));
}

const TypeInfo * CGenerator::clamp_target(const AssignStmt * stmt)
{
  if (stmt->op != AssignOp::AddAssign && stmt->op != AssignOp::SubAssign &&
      stmt->op != AssignOp::MulAssign) {
    return nullptr;
  }
  const AstNode * decl = nullptr;
  if (const auto * ref = dyn_cast<VarRefExpr>(stmt->target)) {
    decl = ref->resolvedDecl;
  } else if (const auto * mem = dyn_cast<MemberExpr>(stmt->target)) {
    if (mem->accessKind == MemberAccessKind::Symbol) {
      decl = mem->resolvedDecl;
    }
  }

  OverflowMode mode = OverflowMode::Wrap;
  if (const auto * local = dyn_cast<VarDeclStmt>(decl)) {
    mode = local->overflow;
  } else if (const auto * global = dyn_cast<GlobalVarDecl>(decl)) {
    mode = global->overflow;
  }
  const TypeInfo * t = stmt->target->resolvedType;
  if (mode != OverflowMode::Clamp || t == nullptr || t->kind != TypeKind::Integer ||
      t->isArray || t->isPointer || !primitive_type(t->baseType)) {
    return nullptr;
  }
  return t;
}

std::string CGenerator::clamped_assign(const AssignStmt * stmt, const TypeInfo & type)
{
  std::string op;
  switch (stmt->op) {
    case AssignOp::AddAssign:
      op = "add";
      break;
    case AssignOp::SubAssign:
      op = "sub";
      break;
    default:
      op = "mul";
      break;
  }
  clampHelpers_.emplace(op, type.baseType);
  const std::string target = expr(stmt->target);
  return fmt::format(
    "{0} = cnx_clamp_{1}_{2}({0}, {3})", target, op, type.baseType,
    strip_parens(expr(stmt->value)));
}

void CGenerator::emit_clamp_helpers(CodeWriter & w) const
{
  for (const auto & [op, cnx_type] : clampHelpers_) {
    const auto prim = primitive_type(cnx_type);
    if (!prim) continue;
    const TypeInfo & t = *prim;
    const std::string tn = c_type_name(t);
    const std::string max = boundary_macro(t, true);
    const std::string min = boundary_macro(t, false);

    w.open(fmt::format("static inline {0} cnx_clamp_{1}_{2}({0} a, {0} b)", tn, op, cnx_type));
    if (!t.isSigned) {
      if (op == "add") {
        w.line(fmt::format("return (b > ({0})({1} - a)) ? {1} : ({0})(a + b);", tn, max));
      } else if (op == "sub") {
        w.line(fmt::format("return (b > a) ? 0U : ({0})(a - b);", tn));
      } else {
        w.line(fmt::format("return (b != 0U && a > {1} / b) ? {1} : ({0})(a * b);", tn, max));
      }
    } else if (op == "add") {
      w.line(fmt::format("if (b > 0 && a > {} - b) return {};", max, max));
      w.line(fmt::format("if (b < 0 && a < {} - b) return {};", min, min));
      w.line(fmt::format("return ({})(a + b);", tn));
    } else if (op == "sub") {
      w.line(fmt::format("if (b < 0 && a > {} + b) return {};", max, max));
      w.line(fmt::format("if (b > 0 && a < {} + b) return {};", min, min));
      w.line(fmt::format("return ({})(a - b);", tn));
    } else {
      w.line("if (a == 0 || b == 0) return 0;");
      w.line(fmt::format("if (a > 0 && b > 0 && a > {0} / b) return {0};", max));
      w.line(fmt::format("if (a < 0 && b < 0 && a < {0} / b) return {0};", max));
      w.line(fmt::format("if (a > 0 && b < 0 && b < {0} / a) return {0};", min));
      w.line(fmt::format("if (a < 0 && b > 0 && a < {0} / b) return {0};", min));
      w.line(fmt::format("return ({})(a * b);", tn));
    }
    w.close();
    w.blank();
  }
}

std::string CGenerator::bit_write(
  const std::string & operand, const TypeInfo & operand_type, const std::string & start,
  const std::string & mask, const std::string & value)
{
  const std::string tn = c_type_name(operand_type.scalar_type());
  return fmt::format(
    "{0} = ({1})(({0} & ~({2} << {3})) | ((({1})({4}) & {2}) << {3}))", operand, tn, mask,
    start, value);
}

std::string CGenerator::bit_range_mask(const Expr * width, uint32_t bits)
{
  if (const auto w = evaluate_constant(width)) {
    return c_bit_mask(static_cast<uint32_t>(*w), bits);
  }
  return fmt::format("((1ULL << ({})) - 1ULL)", strip_parens(expr(width)));
}

std::string CGenerator::slice_write(const IndexExpr * slice, const Expr * value)
{
  require("string.h");
  const TypeInfo * vt = value->resolvedType;
  std::string source;
  if (vt == nullptr || vt->isArray || vt->kind == TypeKind::String || vt->kind == TypeKind::CString) {
    source = expr(value);
  } else {
    source = address_of(value, *vt);
  }
  return fmt::format(
    "(void)memcpy((uint8_t *){} + {}, {}, {})", expr(slice->base), expr(slice->index), source,
    expr(slice->width));
}

std::string CGenerator::string_assign(const Expr * target, const Expr * value)
{
  const std::string dst = expr(target);
  if (const auto * lit = dyn_cast<StringLiteralExpr>(value)) {
    require("string.h");
    return fmt::format(
      "(void)memcpy({}, \"{}\", {}U)", dst, lit->raw, lit->decoded_length() + 1);
  }
  require("stdio.h");
  return fmt::format(
    "(void)snprintf({}, {}U, \"%s\", {})", dst, target->resolvedType->stringCapacity + 1,
    expr(value));
}

// ============================================================================
// Expressions
// ============================================================================

std::string CGenerator::expr(const Expr * e)
{
  if (e == nullptr) return {};

  switch (e->get_kind()) {
    case NodeKind::IntLiteral:
      return int_literal(cast<IntLiteralExpr>(e), e->resolvedType);
    case NodeKind::FloatLiteral:
      return float_literal(cast<FloatLiteralExpr>(e));
    case NodeKind::StringLiteral:
      return fmt::format("\"{}\"", cast<StringLiteralExpr>(e)->raw);
    case NodeKind::CharLiteral:
      return fmt::format("'{}'", cast<CharLiteralExpr>(e)->raw);
    case NodeKind::BoolLiteral:
      return cast<BoolLiteralExpr>(e)->value ? "true" : "false";
    case NodeKind::NullLiteral:
      return "NULL";
    case NodeKind::VarRef:
      return var_ref(cast<VarRefExpr>(e));
    case NodeKind::BinaryExpr:
      return binary(cast<BinaryExpr>(e));
    case NodeKind::UnaryExpr:
      return unary(cast<UnaryExpr>(e));
    case NodeKind::TernaryExpr: {
      const auto * t = cast<TernaryExpr>(e);
      return fmt::format(
        "({} ? {} : {})", expr(t->condition), expr(t->thenExpr), expr(t->elseExpr));
    }
    case NodeKind::CastExpr: {
      const auto * c = cast<CastExpr>(e);
      const std::string tn = e->resolvedType != nullptr ? c_type_name(*e->resolvedType) : "int";
      return fmt::format("(({}){})", tn, expr(c->expr));
    }
    case NodeKind::IndexExpr:
      return index(cast<IndexExpr>(e));
    case NodeKind::MemberExpr:
      return member(cast<MemberExpr>(e));
    case NodeKind::CallExpr:
      return call(cast<CallExpr>(e));
    case NodeKind::ArrayLiteralExpr:
      return array_literal(cast<ArrayLiteralExpr>(e), false);
    case NodeKind::StructLiteralExpr:
      return struct_literal(cast<StructLiteralExpr>(e), false);
    default:
      return {};
  }
}

std::string CGenerator::initializer(const Expr * e)
{
  if (const auto * arr = dyn_cast<ArrayLiteralExpr>(e)) {
    return array_literal(arr, true);
  }
  if (const auto * st = dyn_cast<StructLiteralExpr>(e)) {
    return struct_literal(st, true);
  }
  return expr(e);
}

std::string CGenerator::int_literal(const IntLiteralExpr * lit, const TypeInfo * type)
{
  std::string digits;
  switch (lit->radix) {
    case 16:
    case 2:
      // C99 has no binary literals.
      digits = fmt::format("0x{:X}", lit->value);
      break;
    case 8:
      digits = lit->value == 0 ? "0" : fmt::format("0{:o}", lit->value);
      break;
    default:
      digits = fmt::format("{}", lit->value);
      break;
  }
  if (type != nullptr) {
    digits += c_literal_suffix(*type, lit->value);
  }
  return digits;
}

std::string CGenerator::negated_literal(const IntLiteralExpr * lit, const TypeInfo * type)
{
  if (type != nullptr && type->kind == TypeKind::Integer && type->isSigned) {
    const IntegerRange range = integer_range(*type);
    const uint64_t min_magnitude = static_cast<uint64_t>(-(range.min + 1)) + 1;
    if (lit->value == min_magnitude) {
      return boundary(*type, false);
    }
  }
  // Negated hex reads as a bit pattern in C; print the value instead.
  const std::string_view suffix =
    type != nullptr && type->kind == TypeKind::Integer ? c_literal_suffix(*type, lit->value) : "";
  return fmt::format("(-{}{})", lit->value, suffix);
}

std::string CGenerator::float_literal(const FloatLiteralExpr * lit)
{
  std::string text(lit->text);
  const TypeInfo * t = lit->resolvedType;
  const bool has_suffix = !text.empty() && (text.back() == 'f' || text.back() == 'F');
  if (t != nullptr && t->bitWidth == 32 && !has_suffix) {
    if (text.find_first_of(".eE") == std::string::npos) {
      text += ".0";
    }
    text += "f";
  }
  return text;
}

std::string CGenerator::var_ref(const VarRefExpr * ref)
{
  const std::string_view name = ref->cName.empty() ? ref->name : ref->cName;
  if (const auto * param = dyn_cast<ParamDecl>(ref->resolvedDecl)) {
    if (param_passing(*param) == ParamPassing::Pointer) {
      return fmt::format("(*{})", name);
    }
  }
  return std::string(name);
}

std::string CGenerator::binary(const BinaryExpr * bin)
{
  const std::string lhs = expr(bin->lhs);
  const std::string rhs = expr(bin->rhs);
  if ((bin->op == BinaryOp::Eq || bin->op == BinaryOp::Ne) &&
      (is_bounded_string(bin->lhs->resolvedType) || is_bounded_string(bin->rhs->resolvedType))) {
    require("string.h");
    return fmt::format(
      "(strcmp({}, {}) {} 0)", lhs, rhs, bin->op == BinaryOp::Eq ? "==" : "!=");
  }
  return fmt::format("({} {} {})", lhs, to_c_string(bin->op), rhs);
}

std::string CGenerator::unary(const UnaryExpr * un)
{
  if (un->op == UnaryOp::Neg) {
    if (const auto * lit = dyn_cast<IntLiteralExpr>(un->operand)) {
      return negated_literal(lit, un->resolvedType);
    }
  }
  const std::string operand = expr(un->operand);
  const TypeInfo * t = un->resolvedType;
  if (un->op == UnaryOp::BitNot && t != nullptr && !t->isSigned && t->bitWidth < 32) {
    // Keep the complement inside the narrow type after integer promotion.
    return fmt::format("(({})~{})", c_type_name(t->scalar_type()), operand);
  }
  return fmt::format("({}{})", to_string(un->op), operand);
}

std::string CGenerator::member(const MemberExpr * mem)
{
  switch (mem->accessKind) {
    case MemberAccessKind::Field:
      return fmt::format("{}.{}", expr(mem->base), mem->member);
    case MemberAccessKind::Symbol:
    case MemberAccessKind::EnumMember:
    case MemberAccessKind::RegisterField:
      return std::string(mem->cName);
    case MemberAccessKind::BitmapField: {
      const uint32_t bits = operand_bits(mem->base->resolvedType);
      const std::string shifted = fmt::format("({} >> {}U)", expr(mem->base), mem->bitOffset);
      if (mem->bitCount == 1) {
        return fmt::format("(({} & 1U) != 0U)", shifted);
      }
      return fmt::format(
        "(({})({} & {}))", c_type_name(mem->resolvedType->scalar_type()), shifted,
        c_bit_mask(mem->bitCount, bits));
    }
    case MemberAccessKind::Length: {
      const TypeInfo * base = mem->base->resolvedType;
      if (base->isArray) {
        return fmt::format("{}U", base->arrayDims.front());
      }
      if (base->kind == TypeKind::String || base->kind == TypeKind::CString) {
        require("string.h");
        return fmt::format("((uint32_t)strlen({}))", expr(mem->base));
      }
      return fmt::format("{}U", base->bitWidth);
    }
    case MemberAccessKind::Capacity:
      return fmt::format("{}U", mem->base->resolvedType->stringCapacity);
    case MemberAccessKind::TypeMin:
    case MemberAccessKind::TypeMax:
      return boundary(*mem->resolvedType, mem->accessKind == MemberAccessKind::TypeMax);
    case MemberAccessKind::Unresolved:
      break;
  }
  return fmt::format("{}.{}", expr(mem->base), mem->member);
}

std::string CGenerator::index(const IndexExpr * idx)
{
  const uint32_t bits = operand_bits(idx->base->resolvedType);
  switch (idx->accessKind) {
    case IndexAccessKind::ArrayElement:
      return fmt::format("{}[{}]", expr(idx->base), strip_parens(expr(idx->index)));
    case IndexAccessKind::BitIndex:
      return fmt::format(
        "((({} >> {}) & {}) != 0U)", expr(idx->base), expr(idx->index),
        bits == 64 ? "1ULL" : "1U");
    case IndexAccessKind::BitRange: {
      const std::string tn =
        idx->resolvedType != nullptr ? c_type_name(idx->resolvedType->scalar_type()) : "uint32_t";
      return fmt::format(
        "(({})(({} >> {}) & {}))", tn, expr(idx->base), expr(idx->index),
        bit_range_mask(idx->width, bits));
    }
    case IndexAccessKind::Slice:
    case IndexAccessKind::Unresolved:
      break;
  }
  return fmt::format("{}[{}]", expr(idx->base), strip_parens(expr(idx->index)));
}

std::string CGenerator::call(const CallExpr * call)
{
  std::string callee;
  if (const auto * ref = dyn_cast<VarRefExpr>(call->callee)) {
    callee = std::string(ref->cName.empty() ? ref->name : ref->cName);
  } else if (const auto * mem = dyn_cast<MemberExpr>(call->callee)) {
    callee = std::string(mem->cName);
  } else {
    callee = expr(call->callee);
  }

  std::vector<std::string> args;
  args.reserve(call->args.size());
  for (size_t i = 0; i < call->args.size(); ++i) {
    args.push_back(call_argument(call, i));
  }
  return fmt::format("{}({})", callee, fmt::join(args, ", "));
}

std::string CGenerator::call_argument(const CallExpr * call, size_t i)
{
  const Expr * arg = call->args[i];
  const Symbol * sym = call->resolvedSymbol;
  if (sym == nullptr) {
    return strip_parens(expr(arg));
  }

  if (!sym->is_foreign()) {
    const auto * fn = dyn_cast<FunctionDecl>(sym->decl);
    if (fn != nullptr && i < fn->params.size()) {
      const ParamDecl * param = fn->params[i];
      if (param_passing(*param) == ParamPassing::Pointer && param->resolvedType != nullptr) {
        return address_of(arg, *param->resolvedType);
      }
    }
    return strip_parens(initializer(arg));
  }

  // Foreign `T *out` parameters take the address of a C-Next scalar or struct.
  const auto * info = sym->as<FunctionInfo>();
  const TypeInfo * at = arg->resolvedType;
  if (info != nullptr && i < info->params.size() && at != nullptr) {
    const TypeInfo & pt = info->params[i].type;
    const bool by_address = pt.isPointer && !at->isPointer && !at->isArray &&
                            at->kind != TypeKind::String && at->kind != TypeKind::CString;
    if (by_address && is_lvalue(arg)) {
      return "&" + expr(arg);
    }
  }
  return strip_parens(expr(arg));
}

std::string CGenerator::array_literal(const ArrayLiteralExpr * lit, bool braces_only)
{
  std::vector<std::string> elems;
  elems.reserve(lit->elements.size());
  for (const Expr * e : lit->elements) {
    elems.push_back(strip_parens(initializer(e)));
  }
  const std::string braces = fmt::format("{{{}}}", fmt::join(elems, ", "));
  if (braces_only || lit->resolvedType == nullptr) {
    return braces;
  }
  TypeInfo t = *lit->resolvedType;
  t.isConst = false;
  return fmt::format("({}){}", c_declarator(t, ""), braces);
}

std::string CGenerator::struct_literal(const StructLiteralExpr * lit, bool braces_only)
{
  std::vector<std::string> fields;
  fields.reserve(lit->fields.size());
  for (const FieldInit * f : lit->fields) {
    fields.push_back(fmt::format(".{} = {}", f->name, strip_parens(initializer(f->value))));
  }
  const std::string braces = fmt::format("{{{}}}", fmt::join(fields, ", "));
  if (braces_only || lit->resolvedType == nullptr) {
    return braces;
  }
  return fmt::format("({}){}", c_type_name(lit->resolvedType->scalar_type()), braces);
}

std::string CGenerator::boundary(const TypeInfo & t, bool is_max)
{
  if (t.kind == TypeKind::Float) {
    require("float.h");
    const std::string_view macro = t.bitWidth == 32 ? "FLT_MAX" : "DBL_MAX";
    return is_max ? std::string(macro) : fmt::format("(-{})", macro);
  }
  return boundary_macro(t, is_max);
}

std::string CGenerator::address_of(const Expr * value, const TypeInfo & type)
{
  if (is_lvalue(value)) {
    return "&" + expr(value);
  }
  const std::string tn = c_type_name(type.scalar_type());
  if (isa<StructLiteralExpr>(value) || isa<ArrayLiteralExpr>(value)) {
    return fmt::format("&({}){}", tn, initializer(value));
  }
  return fmt::format("&({}){{{}}}", tn, strip_parens(expr(value)));
}

bool CGenerator::is_lvalue(const Expr * e)
{
  if (const auto * ref = dyn_cast<VarRefExpr>(e)) {
    if (ref->resolvedDecl != nullptr) {
      return isa<VarDeclStmt>(ref->resolvedDecl) || isa<ParamDecl>(ref->resolvedDecl) ||
             isa<GlobalVarDecl>(ref->resolvedDecl);
    }
    return ref->resolvedSymbol != nullptr && ref->resolvedSymbol->kind() == SymbolKind::Variable;
  }
  if (const auto * mem = dyn_cast<MemberExpr>(e)) {
    switch (mem->accessKind) {
      case MemberAccessKind::Field:
        return is_lvalue(mem->base);
      case MemberAccessKind::RegisterField:
        return true;
      case MemberAccessKind::Symbol:
        return mem->resolvedSymbol != nullptr &&
               mem->resolvedSymbol->kind() == SymbolKind::Variable;
      default:
        return false;
    }
  }
  if (const auto * idx = dyn_cast<IndexExpr>(e)) {
    return idx->accessKind == IndexAccessKind::ArrayElement;
  }
  return false;
}

}  // namespace cnext
