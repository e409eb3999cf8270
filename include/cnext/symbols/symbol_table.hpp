// cnext/symbols/symbol_table.hpp - Unified cross-language symbol table
#pragma once

#include <deque>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "cnext/symbols/symbol.hpp"

namespace cnext
{

enum class InsertOutcome : uint8_t {
  Inserted,  ///< new name
  Merged,    ///< compatible redeclaration folded into the existing entry
  Overload,  ///< C++ overload with a disjoint signature, stored alongside
  Conflict,  ///< rejected
};

struct InsertResult
{
  InsertOutcome outcome = InsertOutcome::Inserted;
  /// The stored symbol (new or merged-into); the rejected one's rival on Conflict
  const Symbol * symbol = nullptr;

  [[nodiscard]] bool ok() const noexcept { return outcome != InsertOutcome::Conflict; }
};

/**
 * Name -> Symbol mapping shared by every stage of one run.
 *
 * Conflict policy on a name that already exists:
 * - function redeclarations with identical signatures merge as long as at
 *   most one of them is a definition (repeated `extern` prototypes);
 * - C++ functions with different signatures are overloads;
 * - identical macros, a typedef naming a same-named struct, a forward
 *   `struct X;` next to its definition, and repeated identical `extern`
 *   variables merge;
 * - anything else is a conflict (E0301 across languages, E0302 within one,
 *   reported by the caller).
 *
 * Symbols are never removed. Pointers returned by lookups stay valid for the
 * table's lifetime.
 */
class SymbolTable
{
public:
  SymbolTable() = default;

  SymbolTable(const SymbolTable &) = delete;
  SymbolTable & operator=(const SymbolTable &) = delete;
  SymbolTable(SymbolTable &&) = default;
  SymbolTable & operator=(SymbolTable &&) = default;

  InsertResult insert(Symbol sym);

  [[nodiscard]] const Symbol * lookup(std::string_view name) const;
  [[nodiscard]] std::vector<const Symbol *> lookup_all(std::string_view name) const;
  [[nodiscard]] const Symbol * lookup_kind(std::string_view name, SymbolKind kind) const;

  /// A type-naming symbol (struct, enum, typedef) called `name`.
  [[nodiscard]] const Symbol * lookup_type(std::string_view name) const;

  /// Field layout of the struct `t` names ("Point", "struct point"), or nullptr.
  [[nodiscard]] const StructInfo * find_struct(const TypeInfo & t) const;

  /// Field table of the C-Next bitmap `t` names, or nullptr.
  [[nodiscard]] const TypedefInfo * find_bitmap(const TypeInfo & t) const;

  /// Enum symbol declaring an enumerator called `member`, if any.
  [[nodiscard]] const Symbol * find_enumerator_owner(std::string_view member) const;

  void add_scope_name(std::string_view scope);
  [[nodiscard]] bool is_scope_name(std::string_view name) const;

  [[nodiscard]] size_t size() const noexcept { return storage_.size(); }
  [[nodiscard]] const std::deque<Symbol> & all() const noexcept { return storage_; }

  /// Symbols whose origin is `file` (generic path string), in insertion order.
  [[nodiscard]] std::vector<const Symbol *> symbols_from(std::string_view file) const;

private:
  [[nodiscard]] static InsertOutcome classify(const Symbol & existing, const Symbol & incoming);
  void index_enumerators(const Symbol & sym);

  std::deque<Symbol> storage_;
  std::map<std::string, std::vector<Symbol *>, std::less<>> by_name_;
  std::map<std::string, const Symbol *, std::less<>> enumerators_;
  std::set<std::string, std::less<>> scopes_;
};

}  // namespace cnext
