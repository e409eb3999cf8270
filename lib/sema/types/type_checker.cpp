// cnext/sema/type_checker.cpp - Expression and statement type checker implementation

#include "cnext/sema/types/type_checker.hpp"

#include <fmt/format.h>

#include <limits>
#include <set>

#include "cnext/basic/casting.hpp"

namespace cnext
{

namespace
{

std::string_view tag_free(std::string_view name)
{
  for (const std::string_view prefix : {"struct ", "union ", "enum "}) {
    if (name.substr(0, prefix.size()) == prefix) {
      name.remove_prefix(prefix.size());
    }
  }
  return name;
}

bool is_literal(const Expr * e)
{
  if (const auto * un = dyn_cast<UnaryExpr>(e); un != nullptr && un->op == UnaryOp::Neg) {
    e = un->operand;
  }
  return isa<IntLiteralExpr>(e) || isa<FloatLiteralExpr>(e) || isa<CharLiteralExpr>(e);
}

bool is_bool(const TypeInfo * t) { return t != nullptr && !t->isArray && t->kind == TypeKind::Bool; }

bool is_int_like(const TypeInfo * t)
{
  return t != nullptr && !t->isArray && !t->isPointer &&
         (t->kind == TypeKind::Integer || t->kind == TypeKind::Bitmap);
}

}  // namespace

// ============================================================================
// Entry Point
// ============================================================================

bool TypeChecker::check()
{
  errorCount_ = 0;
  if (module_.program == nullptr) {
    return true;
  }
  for (Decl * decl : module_.program->decls) {
    check_decl(decl);
  }
  return errorCount_ == 0;
}

void TypeChecker::check_decl(Decl * decl)
{
  if (auto * scope = dyn_cast<ScopeDecl>(decl)) {
    for (Decl * member : scope->members) {
      check_decl(member);
    }
  } else if (auto * fn = dyn_cast<FunctionDecl>(decl)) {
    check_function(fn);
  } else if (auto * global = dyn_cast<GlobalVarDecl>(decl)) {
    if (global->init != nullptr && global->resolvedType != nullptr) {
      check_value(*global->resolvedType, global->init, "initializer");
    } else if (global->init != nullptr) {
      infer(global->init);
    } else if (global->isConst) {
      report(
        global->get_range(), "E0304",
        fmt::format("const '{}' needs an initializer", global->name));
    }
  } else if (auto * reg = dyn_cast<RegisterDecl>(decl)) {
    infer(reg->baseAddress);
    for (RegisterField * field : reg->fields) {
      infer(field->offset);
    }
  }
}

void TypeChecker::check_function(FunctionDecl * fn)
{
  currentFunction_ = fn;
  if (fn->body != nullptr) {
    check_block(fn->body);
  }
  currentFunction_ = nullptr;
}

// ============================================================================
// Statements
// ============================================================================

void TypeChecker::check_block(BlockStmt * block)
{
  if (block == nullptr) return;
  for (Stmt * stmt : block->stmts) {
    check_stmt(stmt);
  }
}

void TypeChecker::check_condition(Expr * cond)
{
  const TypeInfo * t = infer(cond);
  if (t != nullptr && !is_bool(t)) {
    report(
      cond->get_range(), "E0304",
      fmt::format("condition must be 'bool', found '{}'", t->to_string()),
      "compare explicitly, e.g. 'x != 0'");
  }
}

void TypeChecker::check_stmt(Stmt * stmt)
{
  if (stmt == nullptr) return;

  if (auto * decl = dyn_cast<VarDeclStmt>(stmt)) {
    if (decl->init != nullptr) {
      if (decl->resolvedType != nullptr) {
        check_value(*decl->resolvedType, decl->init, "initializer");
      } else {
        infer(decl->init);
      }
    } else if (decl->isConst) {
      report(
        decl->get_range(), "E0304", fmt::format("const '{}' needs an initializer", decl->name));
    }
  } else if (auto * assign = dyn_cast<AssignStmt>(stmt)) {
    check_assign(assign);
  } else if (auto * es = dyn_cast<ExprStmt>(stmt)) {
    infer(es->expr);
  } else if (auto * block = dyn_cast<BlockStmt>(stmt)) {
    check_block(block);
  } else if (auto * if_stmt = dyn_cast<IfStmt>(stmt)) {
    check_condition(if_stmt->condition);
    check_block(if_stmt->thenBlock);
    check_stmt(if_stmt->elseStmt);
  } else if (auto * while_stmt = dyn_cast<WhileStmt>(stmt)) {
    check_condition(while_stmt->condition);
    check_block(while_stmt->body);
  } else if (auto * do_stmt = dyn_cast<DoWhileStmt>(stmt)) {
    check_block(do_stmt->body);
    check_condition(do_stmt->condition);
  } else if (auto * for_stmt = dyn_cast<ForStmt>(stmt)) {
    check_stmt(for_stmt->init);
    if (for_stmt->condition != nullptr) {
      check_condition(for_stmt->condition);
    }
    check_stmt(for_stmt->update);
    check_block(for_stmt->body);
  } else if (auto * sw = dyn_cast<SwitchStmt>(stmt)) {
    check_switch(sw);
  } else if (auto * ret = dyn_cast<ReturnStmt>(stmt)) {
    check_return(ret);
  }
}

void TypeChecker::check_assign(AssignStmt * stmt)
{
  const TypeInfo * target = infer(stmt->target);

  if (const auto * mem = dyn_cast<MemberExpr>(stmt->target)) {
    switch (mem->accessKind) {
      case MemberAccessKind::EnumMember:
      case MemberAccessKind::Length:
      case MemberAccessKind::Capacity:
      case MemberAccessKind::TypeMin:
      case MemberAccessKind::TypeMax:
        report(stmt->target->get_range(), "E0304", "cannot assign to a constant expression");
        infer(stmt->value);
        return;
      default:
        break;
    }
  } else if (!isa<VarRefExpr>(stmt->target) && !isa<IndexExpr>(stmt->target)) {
    report(stmt->target->get_range(), "E0304", "left side of '<-' is not assignable");
    infer(stmt->value);
    return;
  }

  if (const auto * idx = dyn_cast<IndexExpr>(stmt->target);
      idx != nullptr && idx->accessKind == IndexAccessKind::Slice) {
    // Any value; its size is checked against the slice length.
    infer(stmt->value);
    return;
  }

  if (target == nullptr) {
    infer(stmt->value);
    return;
  }

  if (stmt->op == AssignOp::Assign) {
    check_value(*target, stmt->value, "assignment");
    return;
  }

  const TypeInfo * value = infer(stmt->value, target);
  const bool integer_only = stmt->op == AssignOp::ModAssign || stmt->op == AssignOp::AndAssign ||
                            stmt->op == AssignOp::OrAssign || stmt->op == AssignOp::XorAssign ||
                            stmt->op == AssignOp::ShlAssign || stmt->op == AssignOp::ShrAssign;
  const bool target_ok = integer_only ? is_int_like(target) : target->is_numeric();
  if (!target_ok) {
    report(
      stmt->target->get_range(), "E0304",
      fmt::format("'{}' cannot be applied to '{}'", to_string(stmt->op), target->to_string()));
    return;
  }
  if (value != nullptr && !(integer_only ? is_int_like(value) : value->is_numeric())) {
    report(
      stmt->value->get_range(), "E0304",
      fmt::format("'{}' needs a numeric operand, found '{}'", to_string(stmt->op),
                  value->to_string()));
  }
}

void TypeChecker::check_return(ReturnStmt * stmt)
{
  const TypeInfo * ret = currentFunction_ != nullptr ? currentFunction_->resolvedReturnType
                                                     : nullptr;
  if (ret == nullptr) {
    if (stmt->value != nullptr) infer(stmt->value);
    return;
  }
  if (ret->kind == TypeKind::Void) {
    if (stmt->value != nullptr) {
      infer(stmt->value);
      report(stmt->value->get_range(), "E0304", "a void function cannot return a value");
    }
    return;
  }
  if (stmt->value == nullptr) {
    report(
      stmt->get_range(), "E0304",
      fmt::format("function must return a value of type '{}'", ret->to_string()));
    return;
  }
  check_value(*ret, stmt->value, "return value");
}

void TypeChecker::check_switch(SwitchStmt * stmt)
{
  const TypeInfo * subject = infer(stmt->subject);
  if (subject != nullptr && !subject->is_integer()) {
    report(
      stmt->subject->get_range(), "E0304",
      fmt::format("switch needs an integer or enum subject, found '{}'", subject->to_string()));
    subject = nullptr;
  }
  for (SwitchCase * c : stmt->cases) {
    for (Expr * label : c->labels) {
      const TypeInfo * t = infer(label, subject);
      if (subject != nullptr && t != nullptr && !compatible(*subject, *t)) {
        report(
          label->get_range(), "E0304",
          fmt::format("case label of type '{}' does not match switch subject '{}'",
                      t->to_string(), subject->to_string()));
      }
    }
    check_block(c->body);
  }
  if (stmt->defaultCase != nullptr) {
    check_block(stmt->defaultCase->body);
  }
}

// ============================================================================
// Compatibility
// ============================================================================

bool TypeChecker::compatible(const TypeInfo & target, const TypeInfo & value) const
{
  if (target.arrayDims != value.arrayDims) {
    return false;
  }
  // NULL placement is checked by NullChecker.
  if ((value.kind == TypeKind::Opaque && value.baseType == "NULL") ||
      (target.kind == TypeKind::Opaque && target.baseType == "NULL")) {
    return true;
  }
  if (target.isPointer || value.isPointer) {
    return target.isPointer == value.isPointer && tag_free(target.baseType) ==
                                                     tag_free(value.baseType);
  }

  switch (target.kind) {
    case TypeKind::Integer:
    case TypeKind::Bitmap:
      if (target.kind == TypeKind::Bitmap && value.kind == TypeKind::Bitmap) {
        return target.baseType == value.baseType;
      }
      return value.kind == TypeKind::Integer || value.kind == TypeKind::Bitmap;
    case TypeKind::Float:
      return value.kind == TypeKind::Float || value.kind == TypeKind::Integer;
    case TypeKind::Bool:
      return value.kind == TypeKind::Bool;
    case TypeKind::Enum:
      return value.kind == TypeKind::Enum && tag_free(value.baseType) == tag_free(target.baseType);
    case TypeKind::Struct:
      return value.kind == TypeKind::Struct &&
             tag_free(value.baseType) == tag_free(target.baseType);
    case TypeKind::String:
    case TypeKind::CString:
      return value.kind == TypeKind::String || value.kind == TypeKind::CString;
    case TypeKind::Opaque:
      return value.kind == TypeKind::Opaque && value.baseType == target.baseType;
    case TypeKind::Void:
      return false;
  }
  return false;
}

void TypeChecker::check_value(const TypeInfo & target, Expr * value, std::string_view what)
{
  if (auto * arr = dyn_cast<ArrayLiteralExpr>(value)) {
    check_array_literal(arr, target);
    return;
  }
  if (auto * lit = dyn_cast<StructLiteralExpr>(value)) {
    check_struct_literal(lit, target);
    return;
  }

  const TypeInfo * t = infer(value, &target);
  if (t == nullptr) {
    return;
  }

  if (const auto * str = dyn_cast<StringLiteralExpr>(value);
      str != nullptr && target.kind == TypeKind::String && !target.isArray) {
    const uint32_t len = str->decoded_length();
    if (len > target.stringCapacity) {
      diags_.report_error(
        value->get_range(),
        fmt::format("string literal of length {} does not fit in string<{}>", len,
                    target.stringCapacity))
        .with_code("E0306")
        .with_help(fmt::format("use string<{}> or shorten the literal", len));
      ++errorCount_;
    }
    return;
  }

  if (target.isArray && !t->isArray) {
    report(
      value->get_range(), "E0304",
      fmt::format("{} of array '{}' needs an array literal", what, target.to_string()));
    return;
  }
  if (target.isArray && t->isArray) {
    report(
      value->get_range(), "E0304", "arrays cannot be copied by assignment; copy the elements");
    return;
  }

  if (!compatible(target.scalar_type(), t->scalar_type())) {
    std::string help;
    if (target.is_numeric() && t->is_numeric()) {
      help = fmt::format("convert explicitly: ({})value", target.baseType);
    }
    report(
      value->get_range(), "E0304",
      fmt::format("mismatched types in {}: expected '{}', found '{}'", what,
                  target.scalar_type().to_string(), t->scalar_type().to_string()),
      help);
  }
}

void TypeChecker::check_array_literal(ArrayLiteralExpr * lit, const TypeInfo & target)
{
  if (!target.isArray) {
    report(
      lit->get_range(), "E0304",
      fmt::format("array literal cannot initialize '{}'", target.to_string()));
    for (Expr * e : lit->elements) infer(e);
    return;
  }
  lit->resolvedType = store(target);
  if (lit->elements.size() > target.arrayDims.front()) {
    report(
      lit->get_range(), "E0304",
      fmt::format(
        "array literal has {} elements but '{}' holds {}", lit->elements.size(),
        target.to_string(), target.arrayDims.front()));
  }
  const TypeInfo element = target.element_type();
  for (Expr * e : lit->elements) {
    check_value(element, e, "element");
  }
}

void TypeChecker::check_struct_literal(StructLiteralExpr * lit, const TypeInfo & target)
{
  const StructInfo * info = target.isArray ? nullptr : table_.find_struct(target);
  if (info == nullptr) {
    report(
      lit->get_range(), "E0304",
      fmt::format("struct literal cannot initialize '{}'", target.to_string()));
    for (FieldInit * f : lit->fields) infer(f->value);
    return;
  }
  lit->resolvedType = store(target);

  std::set<std::string_view> seen;
  for (FieldInit * f : lit->fields) {
    const FieldInfo * field = info->find_field(f->name);
    if (field == nullptr) {
      report(
        f->get_range(), "E0304",
        fmt::format("struct '{}' has no field '{}'", target.baseType, f->name));
      infer(f->value);
      continue;
    }
    if (!seen.insert(f->name).second) {
      report(f->get_range(), "E0304", fmt::format("field '{}' is initialized twice", f->name));
    }
    check_value(field->type, f->value, "field initializer");
  }
}

// ============================================================================
// Expressions
// ============================================================================

const TypeInfo * TypeChecker::named_primitive(std::string_view name)
{
  auto it = primitives_.find(name);
  if (it != primitives_.end()) {
    return it->second;
  }
  auto t = primitive_type(name);
  if (!t) {
    t = c_scalar_type(name);
  }
  const TypeInfo * stored = t ? store(std::move(*t)) : nullptr;
  primitives_.emplace(std::string(name), stored);
  return stored;
}

const TypeInfo * TypeChecker::decl_type(const AstNode * decl)
{
  if (const auto * v = dyn_cast<VarDeclStmt>(decl)) return v->resolvedType;
  if (const auto * p = dyn_cast<ParamDecl>(decl)) return p->resolvedType;
  if (const auto * g = dyn_cast<GlobalVarDecl>(decl)) return g->resolvedType;
  return nullptr;
}

const TypeInfo * TypeChecker::infer(Expr * expr, const TypeInfo * expected)
{
  if (expr == nullptr) {
    return nullptr;
  }

  const TypeInfo * t = nullptr;
  if (auto * lit = dyn_cast<IntLiteralExpr>(expr)) {
    t = infer_int_literal(lit, expected);
  } else if (isa<FloatLiteralExpr>(expr)) {
    t = expected != nullptr && expected->kind == TypeKind::Float ? store(expected->scalar_type())
                                                                 : named_primitive("f64");
  } else if (isa<BoolLiteralExpr>(expr)) {
    t = named_primitive("bool");
  } else if (isa<CharLiteralExpr>(expr)) {
    t = expected != nullptr && is_int_like(expected) ? store(expected->scalar_type())
                                                      : named_primitive("u8");
  } else if (isa<StringLiteralExpr>(expr)) {
    t = named_primitive("cstring");
  } else if (isa<NullLiteralExpr>(expr)) {
    TypeInfo null_type = make_named_type(TypeKind::Opaque, "NULL");
    null_type.isPointer = true;
    t = store(std::move(null_type));
  } else if (auto * ref = dyn_cast<VarRefExpr>(expr)) {
    t = infer_ref(ref);
  } else if (auto * bin = dyn_cast<BinaryExpr>(expr)) {
    t = infer_binary(bin, expected);
  } else if (auto * un = dyn_cast<UnaryExpr>(expr)) {
    t = infer_unary(un, expected);
  } else if (auto * tern = dyn_cast<TernaryExpr>(expr)) {
    check_condition(tern->condition);
    const TypeInfo * a = infer(tern->thenExpr, expected);
    const TypeInfo * b = infer(tern->elseExpr, expected != nullptr ? expected : a);
    if (a != nullptr && b != nullptr && !compatible(*a, *b) && !compatible(*b, *a)) {
      report(
        tern->get_range(), "E0304",
        fmt::format("ternary branches have different types: '{}' and '{}'", a->to_string(),
                    b->to_string()));
    }
    t = a != nullptr && is_literal(tern->thenExpr) && b != nullptr ? b : a;
  } else if (auto * cast_expr = dyn_cast<CastExpr>(expr)) {
    const TypeInfo * from = infer(cast_expr->expr);
    t = cast_expr->resolvedType;
    if (from != nullptr && t != nullptr) {
      const bool ok = (from->is_numeric() || from->is_integer() || from->kind == TypeKind::Bool ||
                       from->kind == TypeKind::Bitmap) &&
                      (t->is_numeric() || t->kind == TypeKind::Bool);
      if (!ok) {
        report(
          cast_expr->get_range(), "E0304",
          fmt::format("cannot cast '{}' to '{}'", from->to_string(), t->to_string()));
      }
    }
  } else if (auto * idx = dyn_cast<IndexExpr>(expr)) {
    t = infer_index(idx);
  } else if (auto * mem = dyn_cast<MemberExpr>(expr)) {
    t = infer_member(mem);
  } else if (auto * call = dyn_cast<CallExpr>(expr)) {
    t = infer_call(call);
  } else if (auto * arr = dyn_cast<ArrayLiteralExpr>(expr)) {
    if (expected != nullptr) {
      check_array_literal(arr, *expected);
    } else {
      report(arr->get_range(), "E0304", "array literal needs a declared array type");
    }
    t = arr->resolvedType;
  } else if (auto * st = dyn_cast<StructLiteralExpr>(expr)) {
    if (expected != nullptr) {
      check_struct_literal(st, *expected);
    } else {
      report(st->get_range(), "E0304", "struct literal needs a declared struct type");
    }
    t = st->resolvedType;
  }

  expr->resolvedType = t;
  return t;
}

const TypeInfo * TypeChecker::infer_int_literal(IntLiteralExpr * lit, const TypeInfo * expected)
{
  if (expected != nullptr && (expected->is_numeric() || expected->kind == TypeKind::Bitmap)) {
    return store(expected->scalar_type());
  }
  if (lit->value <= static_cast<uint64_t>(std::numeric_limits<int32_t>::max())) {
    return named_primitive("i32");
  }
  if (lit->value <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
    return named_primitive("i64");
  }
  return named_primitive("u64");
}

const TypeInfo * TypeChecker::infer_ref(VarRefExpr * ref)
{
  if (const TypeInfo * t = decl_type(ref->resolvedDecl)) {
    return t;
  }
  const Symbol * sym = ref->resolvedSymbol;
  if (sym == nullptr) {
    return nullptr;
  }
  switch (sym->kind()) {
    case SymbolKind::Variable:
    case SymbolKind::Enum:
      return &sym->type;
    case SymbolKind::Macro: {
      const auto * macro = sym->as<MacroInfo>();
      const TypeInfo & declared = sym->type;
      if (macro != nullptr && declared.kind == TypeKind::Integer && declared.bitWidth > 0) {
        // The macro's C type, unless its value does not fit that type
        const IntegerRange range = integer_range(declared);
        const bool fits =
          !macro->intValue || (*macro->intValue >= range.min &&
                               (*macro->intValue < 0 ||
                                static_cast<uint64_t>(*macro->intValue) <= range.max));
        if (fits) {
          return named_primitive(
            fmt::format("{}{}", declared.isSigned ? "i" : "u", declared.bitWidth));
        }
      }
      if (macro != nullptr && macro->intValue) {
        const int64_t v = *macro->intValue;
        return named_primitive(
          v >= std::numeric_limits<int32_t>::min() && v <= std::numeric_limits<int32_t>::max()
            ? "i32"
            : "i64");
      }
      return nullptr;
    }
    case SymbolKind::Function:
      report(
        ref->get_range(), "E0304",
        fmt::format("function '{}' must be called", ref->name), "add '()'");
      return nullptr;
    case SymbolKind::Struct:
    case SymbolKind::Typedef:
      report(
        ref->get_range(), "E0304", fmt::format("type '{}' used as a value", ref->name));
      return nullptr;
  }
  return nullptr;
}

const TypeInfo * TypeChecker::infer_binary(BinaryExpr * bin, const TypeInfo * expected)
{
  // Type the non-literal side first so a literal can adopt its type.
  const bool lhs_literal = is_literal(bin->lhs);
  const bool arithmetic = bin->op == BinaryOp::Add || bin->op == BinaryOp::Sub ||
                          bin->op == BinaryOp::Mul || bin->op == BinaryOp::Div ||
                          bin->op == BinaryOp::Mod;
  const bool bitwise = bin->op == BinaryOp::BitAnd || bin->op == BinaryOp::BitOr ||
                       bin->op == BinaryOp::BitXor || bin->op == BinaryOp::Shl ||
                       bin->op == BinaryOp::Shr;
  const TypeInfo * context = arithmetic || bitwise ? expected : nullptr;

  const TypeInfo * l = nullptr;
  const TypeInfo * r = nullptr;
  if (lhs_literal && !is_literal(bin->rhs)) {
    r = infer(bin->rhs, context);
    l = infer(bin->lhs, r != nullptr ? r : context);
  } else {
    l = infer(bin->lhs, context);
    r = infer(bin->rhs, l != nullptr ? l : context);
  }
  if (l == nullptr || r == nullptr) {
    return bin->op == BinaryOp::And || bin->op == BinaryOp::Or || bin->op == BinaryOp::Eq ||
               bin->op == BinaryOp::Ne || bin->op == BinaryOp::Lt || bin->op == BinaryOp::Le ||
               bin->op == BinaryOp::Gt || bin->op == BinaryOp::Ge
             ? named_primitive("bool")
             : nullptr;
  }

  const auto mismatch = [&](std::string_view need) {
    report(
      bin->get_range(), "E0304",
      fmt::format("'{}' needs {} operands, found '{}' and '{}'", to_string(bin->op), need,
                  l->to_string(), r->to_string()));
  };

  switch (bin->op) {
    case BinaryOp::And:
    case BinaryOp::Or:
      if (!is_bool(l) || !is_bool(r)) mismatch("bool");
      return named_primitive("bool");

    case BinaryOp::Eq:
    case BinaryOp::Ne:
      if (l->isArray || r->isArray || l->kind == TypeKind::Struct ||
          r->kind == TypeKind::Struct || (!compatible(*l, *r) && !compatible(*r, *l))) {
        mismatch("comparable");
      }
      return named_primitive("bool");

    case BinaryOp::Lt:
    case BinaryOp::Le:
    case BinaryOp::Gt:
    case BinaryOp::Ge:
      if (!(l->is_numeric() || is_int_like(l)) || !(r->is_numeric() || is_int_like(r))) {
        mismatch("numeric");
      }
      return named_primitive("bool");

    case BinaryOp::Add:
    case BinaryOp::Sub:
    case BinaryOp::Mul:
    case BinaryOp::Div:
    case BinaryOp::Mod: {
      if (!l->is_numeric() || !r->is_numeric()) {
        mismatch("numeric");
        return nullptr;
      }
      if (bin->op == BinaryOp::Mod &&
          (l->kind == TypeKind::Float || r->kind == TypeKind::Float)) {
        mismatch("integer");
        return nullptr;
      }
      if (l->kind == TypeKind::Float || r->kind == TypeKind::Float) {
        if (l->kind != r->kind) return l->kind == TypeKind::Float ? l : r;
        return l->bitWidth >= r->bitWidth ? l : r;
      }
      if (lhs_literal) return r;
      if (is_literal(bin->rhs)) return l;
      return l->bitWidth >= r->bitWidth ? l : r;
    }

    case BinaryOp::BitAnd:
    case BinaryOp::BitOr:
    case BinaryOp::BitXor:
    case BinaryOp::Shl:
    case BinaryOp::Shr:
      if (!is_int_like(l) || !is_int_like(r)) {
        mismatch("integer");
        return nullptr;
      }
      if (bin->op == BinaryOp::Shl || bin->op == BinaryOp::Shr) return l;
      return lhs_literal ? r : l;
  }
  return nullptr;
}

const TypeInfo * TypeChecker::infer_unary(UnaryExpr * un, const TypeInfo * expected)
{
  const TypeInfo * t = infer(un->operand, un->op == UnaryOp::Not ? nullptr : expected);
  if (t == nullptr) {
    return un->op == UnaryOp::Not ? named_primitive("bool") : nullptr;
  }
  switch (un->op) {
    case UnaryOp::Not:
      if (!is_bool(t)) {
        report(
          un->get_range(), "E0304",
          fmt::format("'!' needs a bool operand, found '{}'", t->to_string()));
      }
      return named_primitive("bool");
    case UnaryOp::Neg:
      if (!t->is_numeric()) {
        report(
          un->get_range(), "E0304",
          fmt::format("'-' needs a numeric operand, found '{}'", t->to_string()));
        return nullptr;
      }
      return t;
    case UnaryOp::BitNot:
      if (!is_int_like(t)) {
        report(
          un->get_range(), "E0304",
          fmt::format("'~' needs an integer operand, found '{}'", t->to_string()));
        return nullptr;
      }
      return t;
  }
  return t;
}

const TypeInfo * TypeChecker::infer_member(MemberExpr * mem)
{
  switch (mem->accessKind) {
    case MemberAccessKind::Symbol: {
      if (const TypeInfo * t = decl_type(mem->resolvedDecl)) return t;
      if (mem->resolvedSymbol == nullptr) return nullptr;
      if (mem->resolvedSymbol->kind() == SymbolKind::Function) {
        // Callee position; the call supplies the type.
        return nullptr;
      }
      return &mem->resolvedSymbol->type;
    }
    case MemberAccessKind::EnumMember:
      return mem->resolvedSymbol != nullptr ? &mem->resolvedSymbol->type : nullptr;
    case MemberAccessKind::RegisterField:
    case MemberAccessKind::TypeMin:
    case MemberAccessKind::TypeMax:
      return mem->resolvedType;
    default:
      break;
  }

  const TypeInfo * base = infer(mem->base);
  if (base == nullptr) {
    return nullptr;
  }

  if (mem->member == "length") {
    if (base->isArray || base->is_numeric() || base->kind == TypeKind::String ||
        base->kind == TypeKind::CString || base->kind == TypeKind::Bitmap) {
      mem->accessKind = MemberAccessKind::Length;
      return named_primitive("u32");
    }
  }
  if (mem->member == "capacity" && base->kind == TypeKind::String && !base->isArray) {
    mem->accessKind = MemberAccessKind::Capacity;
    return named_primitive("u32");
  }

  if (!base->isArray && !base->isPointer) {
    if (const StructInfo * info = table_.find_struct(*base)) {
      if (const FieldInfo * field = info->find_field(mem->member)) {
        mem->accessKind = MemberAccessKind::Field;
        return &field->type;
      }
      report(
        mem->get_range(), "E0304",
        fmt::format("struct '{}' has no field '{}'", tag_free(base->baseType), mem->member));
      return nullptr;
    }
    if (const TypedefInfo * bitmap = table_.find_bitmap(*base)) {
      if (const BitmapFieldInfo * field = bitmap->find_bitmap_field(mem->member)) {
        mem->accessKind = MemberAccessKind::BitmapField;
        mem->bitOffset = field->offset;
        mem->bitCount = field->width;
        if (field->width == 1) {
          return named_primitive("bool");
        }
        return named_primitive(field->width <= 8    ? "u8"
                               : field->width <= 16 ? "u16"
                                                    : "u32");
      }
      report(
        mem->get_range(), "E0304",
        fmt::format("bitmap '{}' has no field '{}'", base->baseType, mem->member));
      return nullptr;
    }
  }

  report(
    mem->get_range(), "E0304",
    fmt::format("type '{}' has no member '{}'", base->to_string(), mem->member));
  return nullptr;
}

const TypeInfo * TypeChecker::infer_index(IndexExpr * idx)
{
  const TypeInfo * base = infer(idx->base);
  const TypeInfo * index = infer(idx->index, named_primitive("u32"));
  if (idx->width != nullptr) {
    infer(idx->width, named_primitive("u32"));
  }

  if (index != nullptr && !index->is_integer()) {
    report(
      idx->index->get_range(), "E0304",
      fmt::format("index must be an integer, found '{}'", index->to_string()));
  }
  if (base == nullptr) {
    return nullptr;
  }

  if (base->isArray) {
    if (idx->width != nullptr) {
      idx->accessKind = IndexAccessKind::Slice;
      return nullptr;
    }
    idx->accessKind = IndexAccessKind::ArrayElement;
    return store(base->element_type());
  }
  if ((base->kind == TypeKind::String || base->kind == TypeKind::CString) &&
      idx->width == nullptr) {
    idx->accessKind = IndexAccessKind::ArrayElement;
    return named_primitive("char");
  }
  if (base->is_bit_addressable()) {
    if (idx->width == nullptr) {
      idx->accessKind = IndexAccessKind::BitIndex;
      return named_primitive("bool");
    }
    idx->accessKind = IndexAccessKind::BitRange;
    const uint32_t w = base->bitWidth == 0 ? 32 : base->bitWidth;
    return named_primitive(fmt::format("u{}", w));
  }
  // Left Unresolved: BitAccessChecker reports bit access on a non-integer.
  return nullptr;
}

const TypeInfo * TypeChecker::infer_call(CallExpr * call)
{
  if (auto * mem = dyn_cast<MemberExpr>(call->callee)) {
    infer(mem);
  }

  const Symbol * sym = call->resolvedSymbol;
  if (sym == nullptr) {
    bool resolved = false;
    if (const auto * ref = dyn_cast<VarRefExpr>(call->callee)) {
      resolved = ref->resolvedSymbol != nullptr || ref->resolvedDecl != nullptr;
    } else if (const auto * mem = dyn_cast<MemberExpr>(call->callee)) {
      resolved = mem->accessKind != MemberAccessKind::Unresolved;
    }
    if (resolved) {
      report(call->callee->get_range(), "E0304", "called expression is not a function");
    }
    for (Expr * arg : call->args) infer(arg);
    return nullptr;
  }

  const auto * fn = sym->as<FunctionInfo>();
  const auto * decl = dyn_cast<FunctionDecl>(sym->decl);
  const size_t expected = fn->params.size();
  const size_t given = call->args.size();
  if ((fn->isVariadic && given < expected) || (!fn->isVariadic && given != expected)) {
    diags_.report_error(
      call->get_range(),
      fmt::format("'{}' takes {}{} argument{} but {} {} given", sym->name,
                  fn->isVariadic ? "at least " : "", expected, expected == 1 ? "" : "s", given,
                  given == 1 ? "was" : "were"))
      .with_code("E0307")
      .with_help(fmt::format("signature: {}{}", sym->name, sym->signature()));
    ++errorCount_;
  }

  for (size_t i = 0; i < given; ++i) {
    Expr * arg = call->args[i];
    if (i >= expected) {
      infer(arg);
      continue;
    }
    const TypeInfo * param_type =
      decl != nullptr && i < decl->params.size() ? decl->params[i]->resolvedType : nullptr;
    if (param_type == nullptr) {
      param_type = &fn->params[i].type;
    }
    if (sym->is_foreign()) {
      // Foreign prototypes only pin literals and initializers.
      infer(arg, param_type);
      continue;
    }
    check_value(*param_type, arg, "argument");
  }

  if (decl != nullptr && decl->resolvedReturnType != nullptr) {
    return decl->resolvedReturnType;
  }
  return &fn->returnType;
}

void TypeChecker::report(SourceRange range, std::string code, std::string message, std::string help)
{
  auto diag = diags_.report_error(range, std::move(message));
  diag.with_code(std::move(code));
  if (!help.empty()) {
    diag.with_help(std::move(help));
  }
  ++errorCount_;
}

}  // namespace cnext
