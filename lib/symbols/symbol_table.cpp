// cnext/symbols/symbol_table.cpp - Unified cross-language symbol table

#include "cnext/symbols/symbol_table.hpp"

namespace cnext
{

namespace
{

bool both_foreign(const Symbol & a, const Symbol & b) noexcept
{
  return a.is_foreign() && b.is_foreign();
}

bool same_fields(const StructInfo & a, const StructInfo & b)
{
  if (a.fields.size() != b.fields.size()) return false;
  for (size_t i = 0; i < a.fields.size(); ++i) {
    if (a.fields[i].name != b.fields[i].name || !a.fields[i].type.same_shape(b.fields[i].type)) {
      return false;
    }
  }
  return true;
}

bool same_members(const EnumInfo & a, const EnumInfo & b)
{
  if (a.members.size() != b.members.size()) return false;
  for (size_t i = 0; i < a.members.size(); ++i) {
    if (a.members[i].name != b.members[i].name || a.members[i].value != b.members[i].value) {
      return false;
    }
  }
  return true;
}

/// `typedef struct X X;` style alias of a struct spelled the same way.
bool is_struct_alias(const Symbol & td, const Symbol & st)
{
  const auto * info = td.as<TypedefInfo>();
  return info != nullptr && st.kind() == SymbolKind::Struct &&
         info->aliased.kind == TypeKind::Struct && info->aliased.baseType == st.name;
}

}  // namespace

InsertOutcome SymbolTable::classify(const Symbol & existing, const Symbol & incoming)
{
  const SymbolKind ek = existing.kind();
  const SymbolKind ik = incoming.kind();

  if (ek == SymbolKind::Function && ik == SymbolKind::Function) {
    const auto & ef = *existing.as<FunctionInfo>();
    const auto & inf = *incoming.as<FunctionInfo>();
    if (existing.signature() == incoming.signature()) {
      if (both_foreign(existing, incoming) && !(ef.isDefinition && inf.isDefinition) &&
          existing.type.same_shape(incoming.type)) {
        return InsertOutcome::Merged;
      }
      return InsertOutcome::Conflict;
    }
    if (
      existing.language == SourceLanguage::Cpp && incoming.language == SourceLanguage::Cpp) {
      return InsertOutcome::Overload;
    }
    return InsertOutcome::Conflict;
  }

  if (!both_foreign(existing, incoming)) {
    return InsertOutcome::Conflict;
  }

  if (ek == SymbolKind::Macro && ik == SymbolKind::Macro) {
    return existing.as<MacroInfo>()->value == incoming.as<MacroInfo>()->value
             ? InsertOutcome::Merged
             : InsertOutcome::Conflict;
  }

  if (ek == SymbolKind::Struct && ik == SymbolKind::Struct) {
    const auto & es = *existing.as<StructInfo>();
    const auto & is = *incoming.as<StructInfo>();
    if (!es.isComplete || !is.isComplete || same_fields(es, is)) {
      return InsertOutcome::Merged;
    }
    return InsertOutcome::Conflict;
  }

  if (is_struct_alias(existing, incoming) || is_struct_alias(incoming, existing)) {
    return InsertOutcome::Merged;
  }

  if (ek == SymbolKind::Enum && ik == SymbolKind::Enum) {
    return same_members(*existing.as<EnumInfo>(), *incoming.as<EnumInfo>())
             ? InsertOutcome::Merged
             : InsertOutcome::Conflict;
  }

  if (ek == SymbolKind::Typedef && ik == SymbolKind::Typedef) {
    return existing.as<TypedefInfo>()->aliased.same_shape(incoming.as<TypedefInfo>()->aliased)
             ? InsertOutcome::Merged
             : InsertOutcome::Conflict;
  }

  if (ek == SymbolKind::Variable && ik == SymbolKind::Variable) {
    const bool any_extern =
      existing.as<VariableInfo>()->isExtern || incoming.as<VariableInfo>()->isExtern;
    return any_extern && existing.type.same_shape(incoming.type) ? InsertOutcome::Merged
                                                                 : InsertOutcome::Conflict;
  }

  return InsertOutcome::Conflict;
}

InsertResult SymbolTable::insert(Symbol sym)
{
  auto it = by_name_.find(sym.name);
  if (it == by_name_.end()) {
    storage_.push_back(std::move(sym));
    Symbol * stored = &storage_.back();
    by_name_[stored->name].push_back(stored);
    index_enumerators(*stored);
    return {InsertOutcome::Inserted, stored};
  }

  bool overload = false;
  for (Symbol * existing : it->second) {
    switch (classify(*existing, sym)) {
      case InsertOutcome::Conflict:
        return {InsertOutcome::Conflict, existing};
      case InsertOutcome::Merged:
        // Keep the most complete form: a struct over its alias, a
        // definition over a forward declaration or prototype.
        if (existing->kind() == SymbolKind::Typedef && sym.kind() == SymbolKind::Struct) {
          *existing = std::move(sym);
        } else if (
          existing->kind() == SymbolKind::Struct && sym.kind() == SymbolKind::Struct &&
          !existing->as<StructInfo>()->isComplete && sym.as<StructInfo>()->isComplete) {
          existing->details = std::move(sym.details);
          existing->originFile = std::move(sym.originFile);
          existing->line = sym.line;
        } else if (
          existing->kind() == SymbolKind::Function && sym.as<FunctionInfo>() != nullptr &&
          sym.as<FunctionInfo>()->isDefinition) {
          existing->as<FunctionInfo>()->isDefinition = true;
        }
        index_enumerators(*existing);
        return {InsertOutcome::Merged, existing};
      case InsertOutcome::Overload:
        overload = true;
        break;
      case InsertOutcome::Inserted:
        break;
    }
  }

  storage_.push_back(std::move(sym));
  Symbol * stored = &storage_.back();
  it->second.push_back(stored);
  return {overload ? InsertOutcome::Overload : InsertOutcome::Inserted, stored};
}

void SymbolTable::index_enumerators(const Symbol & sym)
{
  const auto * info = sym.as<EnumInfo>();
  if (info == nullptr) return;
  for (const auto & m : info->members) {
    enumerators_.emplace(m.name, &sym);
  }
}

const Symbol * SymbolTable::lookup(std::string_view name) const
{
  auto it = by_name_.find(name);
  if (it == by_name_.end() || it->second.empty()) return nullptr;
  return it->second.front();
}

std::vector<const Symbol *> SymbolTable::lookup_all(std::string_view name) const
{
  std::vector<const Symbol *> out;
  if (auto it = by_name_.find(name); it != by_name_.end()) {
    out.assign(it->second.begin(), it->second.end());
  }
  return out;
}

const Symbol * SymbolTable::lookup_kind(std::string_view name, SymbolKind kind) const
{
  auto it = by_name_.find(name);
  if (it == by_name_.end()) return nullptr;
  for (const Symbol * s : it->second) {
    if (s->kind() == kind) return s;
  }
  return nullptr;
}

const Symbol * SymbolTable::lookup_type(std::string_view name) const
{
  auto it = by_name_.find(name);
  if (it == by_name_.end()) return nullptr;
  for (const Symbol * s : it->second) {
    const SymbolKind k = s->kind();
    if (k == SymbolKind::Struct || k == SymbolKind::Enum || k == SymbolKind::Typedef) {
      return s;
    }
  }
  return nullptr;
}

const StructInfo * SymbolTable::find_struct(const TypeInfo & t) const
{
  if (t.kind != TypeKind::Struct) return nullptr;
  std::string_view name = t.baseType;
  for (const std::string_view prefix : {"struct ", "union "}) {
    if (name.substr(0, prefix.size()) == prefix) {
      name.remove_prefix(prefix.size());
    }
  }
  const Symbol * sym = lookup_type(name);
  return sym != nullptr ? sym->as<StructInfo>() : nullptr;
}

const TypedefInfo * SymbolTable::find_bitmap(const TypeInfo & t) const
{
  if (t.kind != TypeKind::Bitmap) return nullptr;
  const Symbol * sym = lookup_type(t.baseType);
  return sym != nullptr ? sym->as<TypedefInfo>() : nullptr;
}

const Symbol * SymbolTable::find_enumerator_owner(std::string_view member) const
{
  auto it = enumerators_.find(member);
  return it == enumerators_.end() ? nullptr : it->second;
}

void SymbolTable::add_scope_name(std::string_view scope) { scopes_.emplace(scope); }

bool SymbolTable::is_scope_name(std::string_view name) const
{
  return scopes_.find(name) != scopes_.end();
}

std::vector<const Symbol *> SymbolTable::symbols_from(std::string_view file) const
{
  std::vector<const Symbol *> out;
  for (const auto & s : storage_) {
    if (s.originFile == file) out.push_back(&s);
  }
  return out;
}

}  // namespace cnext
