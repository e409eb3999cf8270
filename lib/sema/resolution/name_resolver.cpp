// cnext/sema/name_resolver.cpp - Name resolution implementation

#include "cnext/sema/resolution/name_resolver.hpp"

#include <fmt/format.h>

#include <set>

#include "cnext/basic/casting.hpp"
#include "cnext/sema/types/const_evaluator.hpp"
#include "cnext/symbols/symbol_collector.hpp"

namespace cnext
{

namespace
{

std::string flatten(std::string_view scope, std::string_view member)
{
  return fmt::format("{}_{}", scope, member);
}

bool is_namespaced(std::string_view name) { return name.find("::") != std::string_view::npos; }

// Opaque foreign types (FILE) only exist behind a pointer; a C-Next
// variable of such a type holds the handle.
TypeInfo as_handle(TypeInfo t)
{
  if (t.kind == TypeKind::Opaque && !t.isPointer) {
    t.isPointer = true;
  }
  return t;
}

}  // namespace

// ============================================================================
// Entry Point
// ============================================================================

bool NameResolver::resolve()
{
  errorCount_ = 0;
  if (module_.program == nullptr) {
    return true;
  }

  collect_pending();
  for (Decl * decl : module_.program->decls) {
    declare(decl);
  }
  return errorCount_ == 0;
}

void NameResolver::collect_pending()
{
  for (const Decl * decl : module_.program->decls) {
    if (const auto * s = dyn_cast<StructDecl>(decl)) {
      pending_.emplace(std::string(s->name), s);
    } else if (const auto * e = dyn_cast<EnumDecl>(decl)) {
      pending_.emplace(std::string(e->name), e);
    } else if (const auto * b = dyn_cast<BitmapDecl>(decl)) {
      pending_.emplace(std::string(b->name), b);
    } else if (const auto * r = dyn_cast<RegisterDecl>(decl)) {
      pending_.emplace(std::string(r->name), r);
    } else if (const auto * f = dyn_cast<FunctionDecl>(decl)) {
      pending_.emplace(std::string(f->cName), f);
    } else if (const auto * g = dyn_cast<GlobalVarDecl>(decl)) {
      pending_.emplace(std::string(g->cName), g);
    } else if (const auto * scope = dyn_cast<ScopeDecl>(decl)) {
      // Scope names are usable from the start: `Scope.member` reports on the member.
      table_.add_scope_name(scope->name);
      for (const Decl * member : scope->members) {
        if (const auto * mf = dyn_cast<FunctionDecl>(member)) {
          pending_.emplace(std::string(mf->cName), mf);
        } else if (const auto * mg = dyn_cast<GlobalVarDecl>(member)) {
          pending_.emplace(std::string(mg->cName), mg);
        }
      }
    }
  }
}

// ============================================================================
// Declarations
// ============================================================================

void NameResolver::declare(Decl * decl)
{
  if (auto * s = dyn_cast<StructDecl>(decl)) {
    declare_struct(s);
  } else if (auto * e = dyn_cast<EnumDecl>(decl)) {
    declare_enum(e);
  } else if (auto * b = dyn_cast<BitmapDecl>(decl)) {
    declare_bitmap(b);
  } else if (auto * r = dyn_cast<RegisterDecl>(decl)) {
    declare_register(r);
  } else if (auto * scope = dyn_cast<ScopeDecl>(decl)) {
    declare_scope(scope);
  } else if (auto * f = dyn_cast<FunctionDecl>(decl)) {
    declare_function(f);
  } else if (auto * g = dyn_cast<GlobalVarDecl>(decl)) {
    declare_global(g);
  }
}

void NameResolver::register_symbol(Symbol sym, const Decl * decl)
{
  sym.language = SourceLanguage::CNext;
  sym.originFile = module_.origin();
  sym.line = module_.line_of(decl->get_range());
  sym.decl = decl;
  pending_.erase(sym.name);
  if (!insert_symbol(table_, diags_, std::move(sym), decl->get_range())) {
    ++errorCount_;
  }
}

void NameResolver::declare_struct(StructDecl * node)
{
  StructInfo info;
  std::set<std::string_view> seen;
  for (FieldDecl * field : node->fields) {
    field->resolvedType = resolve_type(field->type, field->dims, false);
    if (!seen.insert(field->name).second) {
      report(
        field->get_range(), "E0302",
        fmt::format("field '{}' is declared twice in struct '{}'", field->name, node->name));
      continue;
    }
    if (field->resolvedType != nullptr) {
      info.fields.push_back({std::string(field->name), *field->resolvedType});
    }
  }

  Symbol sym;
  sym.name = std::string(node->name);
  sym.type = make_named_type(TypeKind::Struct, sym.name);
  sym.details = std::move(info);
  register_symbol(std::move(sym), node);
}

void NameResolver::declare_enum(EnumDecl * node)
{
  EnumInfo info;
  std::set<std::string_view> seen;
  int64_t next = 0;
  for (EnumMember * member : node->members) {
    if (member->value != nullptr) {
      visit(member->value);
      if (auto v = evaluate_constant(member->value)) {
        next = *v;
      } else {
        report(
          member->value->get_range(), "E0304",
          fmt::format("value of '{}.{}' is not a compile-time constant", node->name, member->name));
      }
    }
    member->resolvedValue = next;
    if (!seen.insert(member->name).second) {
      report(
        member->get_range(), "E0302",
        fmt::format("enum '{}' declares '{}' twice", node->name, member->name));
    } else {
      info.members.push_back({std::string(member->name), next});
    }
    ++next;
  }

  Symbol sym;
  sym.name = std::string(node->name);
  sym.type = make_named_type(TypeKind::Enum, sym.name);
  sym.details = std::move(info);
  register_symbol(std::move(sym), node);
}

void NameResolver::declare_bitmap(BitmapDecl * node)
{
  TypedefInfo info;
  info.aliased = *primitive_type(fmt::format("u{}", node->bitSize));

  std::set<std::string_view> seen;
  uint32_t offset = 0;
  for (BitmapField * field : node->fields) {
    field->offset = offset;
    if (!seen.insert(field->name).second) {
      report(
        field->get_range(), "E0302",
        fmt::format("bitmap '{}' declares '{}' twice", node->name, field->name));
    } else {
      info.bitmapFields.push_back({std::string(field->name), offset, field->width});
    }
    offset += field->width;
  }

  if (offset != node->bitSize) {
    report(
      node->get_range(), "E0305",
      fmt::format(
        "bitmap '{}' fields use {} of {} bits", node->name, offset, node->bitSize),
      offset < node->bitSize ? "add a reserved field to cover the remaining bits"
                             : "remove fields or use a wider bitmap");
  }

  Symbol sym;
  sym.name = std::string(node->name);
  sym.type = make_named_type(TypeKind::Bitmap, sym.name);
  sym.type.bitWidth = node->bitSize;
  sym.details = std::move(info);
  register_symbol(std::move(sym), node);
}

void NameResolver::declare_register(RegisterDecl * node)
{
  visit(node->baseAddress);

  RegisterBinding binding;
  binding.name = std::string(node->name);
  binding.baseAddressText = std::string(module_.text_of(node->baseAddress->get_range()));

  std::set<std::string_view> seen;
  for (RegisterField * field : node->fields) {
    visit(field->offset);
    field->resolvedType = resolve_type(field->type, {}, false);
    if (field->resolvedType != nullptr && !field->resolvedType->is_integer()) {
      report(
        field->type->get_range(), "E0304",
        fmt::format(
          "register field '{}.{}' must have an integer type, found '{}'", node->name, field->name,
          field->resolvedType->to_string()));
    }
    if (!seen.insert(field->name).second) {
      report(
        field->get_range(), "E0302",
        fmt::format("register '{}' declares '{}' twice", node->name, field->name));
      continue;
    }
    RegisterFieldInfo info;
    info.name = std::string(field->name);
    if (field->resolvedType != nullptr) {
      info.type = *field->resolvedType;
    }
    info.access = field->access;
    info.offsetText = std::string(module_.text_of(field->offset->get_range()));
    binding.fields.push_back(std::move(info));
  }

  Symbol sym;
  sym.name = std::string(node->name);
  sym.type = make_named_type(TypeKind::Opaque, sym.name);
  VariableInfo var;
  var.registerBinding = std::move(binding);
  sym.details = std::move(var);
  register_symbol(std::move(sym), node);
}

void NameResolver::declare_scope(ScopeDecl * node)
{
  currentScope_ = node->name;
  for (Decl * member : node->members) {
    declare(member);
  }
  currentScope_ = {};
}

void NameResolver::declare_function(FunctionDecl * node)
{
  currentFunction_ = node;
  node->resolvedReturnType = resolve_type(node->returnType, {}, false);

  FunctionInfo info;
  if (node->resolvedReturnType != nullptr) {
    info.returnType = *node->resolvedReturnType;
  }
  info.isDefinition = true;

  locals_.emplace_back();
  for (ParamDecl * param : node->params) {
    param->resolvedType = resolve_type(param->type, param->dims, param->isConst);
    if (lookup_local(param->name) != nullptr) {
      report(
        param->get_range(), "E0302",
        fmt::format("parameter '{}' is declared twice", param->name));
    }
    bind_local(param->name, param, param->resolvedType);
    ParamInfo p;
    p.name = std::string(param->name);
    if (param->resolvedType != nullptr) {
      p.type = *param->resolvedType;
    }
    info.params.push_back(std::move(p));
  }

  if (node->body != nullptr) {
    // The body's own frame sits on top of the parameter frame.
    visit(node->body);
  }
  locals_.pop_back();
  currentFunction_ = nullptr;

  Symbol sym;
  sym.name = std::string(node->cName);
  sym.type = info.returnType;
  sym.details = std::move(info);
  sym.scopeName = std::string(node->scopeName);
  sym.isPublic = node->isPublic;
  register_symbol(std::move(sym), node);
}

void NameResolver::declare_global(GlobalVarDecl * node)
{
  node->resolvedType = resolve_type(node->type, node->dims, node->isConst);
  if (node->init != nullptr) {
    visit(node->init);
  }

  Symbol sym;
  sym.name = std::string(node->cName);
  if (node->resolvedType != nullptr) {
    sym.type = *node->resolvedType;
  }
  sym.details = VariableInfo{};
  sym.scopeName = std::string(node->scopeName);
  sym.isPublic = node->isPublic;
  register_symbol(std::move(sym), node);
}

// ============================================================================
// Types
// ============================================================================

std::optional<TypeInfo> NameResolver::type_from_name(const PrimaryType * type)
{
  if (type == nullptr || type->name == "<error>") {
    return std::nullopt;
  }
  if (type->hasCapacity) {
    return make_string_type(type->stringCapacity);
  }
  if (auto prim = primitive_type(type->name)) {
    return prim;
  }

  if (const Symbol * sym = lookup_visible(type->name)) {
    const SymbolKind kind = sym->kind();
    if (kind == SymbolKind::Struct || kind == SymbolKind::Enum || kind == SymbolKind::Typedef) {
      if (sym->language == SourceLanguage::Cpp && is_namespaced(type->name)) {
        report(
          type->get_range(), "E0425",
          fmt::format("C++ type '{}' cannot be named from generated C", type->name),
          "declare a C-compatible typedef outside the namespace");
        return std::nullopt;
      }
      return as_handle(sym->type);
    }
  }
  if (const Symbol * sym = table_.lookup_type(type->name); sym != nullptr && sym->is_foreign()) {
    return as_handle(sym->type);
  }

  if (auto it = pending_.find(type->name); it != pending_.end()) {
    diags_.report_error(
      type->get_range(), fmt::format("type '{}' is used before its definition", type->name))
      .with_code("E0421")
      .with_secondary_label(it->second->get_range(), "defined here")
      .with_help("move the definition above its first use");
    ++errorCount_;
    return std::nullopt;
  }

  report(
    type->get_range(), "E0303", fmt::format("unknown type '{}'", type->name),
    "declare it in C-Next or include the header that defines it");
  return std::nullopt;
}

const TypeInfo * NameResolver::resolve_type(
  const PrimaryType * type, gsl::span<Expr *> dims, bool is_const)
{
  auto t = type_from_name(type);
  if (!t) {
    return nullptr;
  }

  for (Expr * dim : dims) {
    visit(dim);
    const auto n = evaluate_constant(dim);
    if (!n || *n <= 0) {
      report(
        dim->get_range(), "E0304", "array dimension must be a positive compile-time constant");
      return nullptr;
    }
    t->arrayDims.push_back(static_cast<uint32_t>(*n));
  }
  t->isArray = !t->arrayDims.empty();
  if (is_const) {
    t->isConst = true;
  }
  return module_.types.add(std::move(*t));
}

// ============================================================================
// Lookup
// ============================================================================

const Symbol * NameResolver::lookup_visible(std::string_view name) const
{
  for (const Symbol * sym : table_.lookup_all(name)) {
    if (sym->is_foreign() || module_.visibleFiles.count(sym->originFile) > 0) {
      return sym;
    }
  }
  return nullptr;
}

const NameResolver::LocalBinding * NameResolver::lookup_local(std::string_view name) const
{
  for (auto it = locals_.rbegin(); it != locals_.rend(); ++it) {
    if (auto found = it->find(name); found != it->end()) {
      return &found->second;
    }
  }
  return nullptr;
}

void NameResolver::bind_local(std::string_view name, const AstNode * decl, const TypeInfo * type)
{
  if (locals_.empty()) {
    locals_.emplace_back();
  }
  locals_.back()[name] = LocalBinding{decl, type};
}

void NameResolver::report_unresolved(std::string_view name, SourceRange range)
{
  if (auto it = pending_.find(name); it != pending_.end()) {
    const bool recursive = currentFunction_ != nullptr && it->second == currentFunction_;
    auto diag = diags_.report_error(
      range, recursive ? fmt::format("'{}' calls itself; recursion is not allowed", name)
                       : fmt::format("'{}' is used before its definition", name));
    diag.with_code("E0421");
    if (!recursive) {
      diag.with_secondary_label(it->second->get_range(), "defined here")
        .with_help("C-Next has no forward declarations; move the definition above its first use");
    }
    ++errorCount_;
    return;
  }

  // A C-Next symbol from a file this module does not include.
  if (const Symbol * hidden = table_.lookup(name); hidden != nullptr && !hidden->is_foreign()) {
    report(
      range, "E0420", fmt::format("cannot find '{}' in this file", name),
      fmt::format(
        "'{}' is declared in {}; add #include \"{}\"", name, hidden->originFile,
        std::filesystem::path(hidden->originFile).filename().string()));
    return;
  }

  report(range, "E0420", fmt::format("cannot find '{}' in this scope", name));
}

bool NameResolver::visit_var_ref_expr(VarRefExpr * node)
{
  if (node->is_this() || node->is_global()) {
    report(
      node->get_range(), "E0420",
      fmt::format("'{}' must be followed by '.member'", node->name));
    return true;
  }

  if (const LocalBinding * local = lookup_local(node->name)) {
    node->resolvedDecl = local->decl;
    node->cName = node->name;
    return true;
  }

  if (!currentScope_.empty()) {
    const std::string member = flatten(currentScope_, node->name);
    if (pending_.count(member) > 0 || lookup_visible(member) != nullptr) {
      diags_.report_error(
        node->get_range(),
        fmt::format("scope member '{}' must be referenced as 'this.{}'", node->name, node->name))
        .with_code("E0423")
        .with_fixit(node->get_range(), fmt::format("this.{}", node->name));
      ++errorCount_;
      return true;
    }
  }

  if (const Symbol * sym = lookup_visible(node->name)) {
    if (sym->language == SourceLanguage::Cpp && is_namespaced(node->name)) {
      report(
        node->get_range(), "E0425",
        fmt::format("C++ symbol '{}' cannot be referenced from generated C", node->name),
        "wrap it in an extern \"C\" function outside the namespace");
      return true;
    }
    if (!currentScope_.empty() && !sym->is_foreign() && sym->scopeName.empty() &&
        (sym->kind() == SymbolKind::Variable || sym->kind() == SymbolKind::Function)) {
      diags_.report_error(
        node->get_range(),
        fmt::format("global '{}' must be referenced as 'global.{}' inside a scope", node->name,
                    node->name))
        .with_code("E0423")
        .with_fixit(node->get_range(), fmt::format("global.{}", node->name));
      ++errorCount_;
      return true;
    }
    if (!sym->is_foreign() && !sym->scopeName.empty()) {
      // Flattened scope member spelled out by hand (Motor_speed).
      report(
        node->get_range(), "E0420", fmt::format("cannot find '{}' in this scope", node->name),
        fmt::format("write {}.{}", sym->scopeName,
                    node->name.substr(sym->scopeName.size() + 1)));
      return true;
    }
    node->resolvedSymbol = sym;
    node->resolvedDecl = sym->decl;
    node->cName = node->name;
    return true;
  }

  if (const Symbol * owner = table_.find_enumerator_owner(node->name)) {
    if (owner->is_foreign()) {
      // C enumerators live in the global namespace.
      node->resolvedSymbol = owner;
      node->cName = node->name;
      return true;
    }
    diags_.report_error(
      node->get_range(), fmt::format("enum member '{}' must be qualified", node->name))
      .with_code("E0424")
      .with_fixit(node->get_range(), fmt::format("{}.{}", owner->name, node->name))
      .with_help(fmt::format("did you mean {}.{}", owner->name, node->name));
    ++errorCount_;
    return true;
  }

  report_unresolved(node->name, node->get_range());
  return true;
}

// ============================================================================
// Qualified names
// ============================================================================

void NameResolver::resolve_scope_member(
  MemberExpr * node, std::string_view scope, std::string_view member, bool via_this)
{
  const std::string flat = flatten(scope, member);
  const Symbol * sym = lookup_visible(flat);
  if (sym == nullptr) {
    if (pending_.count(flat) > 0) {
      report_unresolved(flat, node->get_range());
    } else {
      report(
        node->get_range(), "E0420", fmt::format("scope '{}' has no member '{}'", scope, member));
    }
    return;
  }
  if (!via_this && !sym->isPublic && currentScope_ != scope) {
    diags_.report_error(
      node->get_range(), fmt::format("'{}.{}' is private to scope '{}'", scope, member, scope))
      .with_code("E0422")
      .with_secondary_label(get_range(sym->decl), "declared here")
      .with_help("mark the member 'public' to use it outside its scope");
    ++errorCount_;
    return;
  }
  node->accessKind = MemberAccessKind::Symbol;
  node->resolvedSymbol = sym;
  node->resolvedDecl = sym->decl;
  node->cName = sym->name;
}

bool NameResolver::resolve_qualified(MemberExpr * node, const VarRefExpr * base)
{
  const std::string_view name = base->name;

  if (base->is_this()) {
    if (currentScope_.empty()) {
      report(node->get_range(), "E0420", "'this' can only be used inside a scope");
      return true;
    }
    resolve_scope_member(node, currentScope_, node->member, true);
    return true;
  }

  if (base->is_global()) {
    if (const Symbol * sym = lookup_visible(node->member)) {
      node->accessKind = MemberAccessKind::Symbol;
      node->resolvedSymbol = sym;
      node->resolvedDecl = sym->decl;
      node->cName = sym->name;
      if (const auto * info = sym->as<VariableInfo>(); info != nullptr && info->registerBinding) {
        report(
          node->get_range(), "E0304",
          fmt::format("register '{}' needs a field: {}.FIELD", sym->name, sym->name));
      }
      return true;
    }
    report_unresolved(node->member, node->get_range());
    return true;
  }

  if (lookup_local(name) != nullptr) {
    return false;
  }

  if (table_.is_scope_name(name)) {
    resolve_scope_member(node, name, node->member, name == currentScope_);
    return true;
  }

  // T.MIN / T.MAX on integer types
  std::optional<TypeInfo> as_type = primitive_type(name);
  const Symbol * sym = lookup_visible(name);
  if (!as_type && sym != nullptr && sym->kind() == SymbolKind::Typedef &&
      sym->type.is_integer()) {
    as_type = sym->type;
  }
  if (as_type) {
    if (!as_type->is_integer() || (node->member != "MIN" && node->member != "MAX")) {
      report(
        node->get_range(), "E0420",
        fmt::format("type '{}' has no constant '{}'", name, node->member),
        "integer types provide MIN and MAX");
      return true;
    }
    node->accessKind =
      node->member == "MIN" ? MemberAccessKind::TypeMin : MemberAccessKind::TypeMax;
    node->resolvedType = module_.types.add(as_type->scalar_type());
    return true;
  }

  if (sym == nullptr) {
    if (pending_.count(name) > 0) {
      report_unresolved(name, base->get_range());
      return true;
    }
    return false;
  }

  if (const auto * info = sym->as<EnumInfo>()) {
    if (info->find_member(node->member) == nullptr) {
      report(
        node->get_range(), "E0420",
        fmt::format("enum '{}' has no member '{}'", name, node->member));
      return true;
    }
    node->accessKind = MemberAccessKind::EnumMember;
    node->resolvedSymbol = sym;
    node->resolvedDecl = sym->decl;
    node->cName = sym->is_foreign()
                    ? node->member
                    : module_.ast->intern(flatten(name, node->member));
    return true;
  }

  if (const auto * var = sym->as<VariableInfo>(); var != nullptr && var->registerBinding) {
    const RegisterFieldInfo * field = var->registerBinding->find_field(node->member);
    if (field == nullptr) {
      report(
        node->get_range(), "E0420",
        fmt::format("register '{}' has no field '{}'", name, node->member));
      return true;
    }
    node->accessKind = MemberAccessKind::RegisterField;
    node->resolvedSymbol = sym;
    node->resolvedDecl = sym->decl;
    node->registerAccess = field->access;
    node->cName = module_.ast->intern(flatten(name, node->member));
    node->resolvedType = module_.types.add(field->type);
    return true;
  }

  return false;
}

bool NameResolver::visit_member_expr(MemberExpr * node)
{
  if (auto * base = dyn_cast<VarRefExpr>(node->base)) {
    if (resolve_qualified(node, base)) {
      return true;
    }
  }
  return visit(node->base);
}

bool NameResolver::visit_call_expr(CallExpr * node)
{
  visit(node->callee);
  for (Expr * arg : node->args) {
    visit(arg);
  }

  const Symbol * sym = nullptr;
  if (const auto * ref = dyn_cast<VarRefExpr>(node->callee)) {
    sym = ref->resolvedSymbol;
  } else if (const auto * mem = dyn_cast<MemberExpr>(node->callee)) {
    sym = mem->resolvedSymbol;
  }
  if (sym != nullptr && sym->kind() == SymbolKind::Function) {
    node->resolvedSymbol = sym;
  }
  return true;
}

bool NameResolver::visit_cast_expr(CastExpr * node)
{
  if (const auto * type = dyn_cast<PrimaryType>(node->targetType)) {
    if (auto t = type_from_name(type)) {
      node->resolvedType = module_.types.add(std::move(*t));
    }
  }
  return visit(node->expr);
}

// ============================================================================
// Statements
// ============================================================================

bool NameResolver::visit_var_decl_stmt(VarDeclStmt * node)
{
  node->resolvedType = resolve_type(node->type, node->dims, node->isConst);
  if (node->init != nullptr) {
    visit(node->init);
  }
  if (!locals_.empty()) {
    if (auto it = locals_.back().find(node->name); it != locals_.back().end()) {
      diags_.report_error(
        node->get_range(), fmt::format("'{}' is already declared in this block", node->name))
        .with_code("E0302")
        .with_secondary_label(get_range(it->second.decl), "first declared here");
      ++errorCount_;
    }
  }
  bind_local(node->name, node, node->resolvedType);
  return true;
}

bool NameResolver::visit_block_stmt(BlockStmt * node)
{
  locals_.emplace_back();
  for (Stmt * stmt : node->stmts) {
    visit(stmt);
  }
  locals_.pop_back();
  return true;
}

bool NameResolver::visit_for_stmt(ForStmt * node)
{
  locals_.emplace_back();
  if (node->init != nullptr) visit(node->init);
  if (node->condition != nullptr) visit(node->condition);
  if (node->update != nullptr) visit(node->update);
  visit(node->body);
  locals_.pop_back();
  return true;
}

void NameResolver::report(SourceRange range, std::string code, std::string message, std::string help)
{
  auto diag = diags_.report_error(range, std::move(message));
  diag.with_code(std::move(code));
  if (!help.empty()) {
    diag.with_help(std::move(help));
  }
  ++errorCount_;
}

}  // namespace cnext
