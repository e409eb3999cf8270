// cnext/sema/resolution/module_info.hpp - Per-file state shared by the sema passes
#pragma once

#include <deque>
#include <filesystem>
#include <memory>
#include <set>
#include <string>
#include <string_view>

#include "cnext/ast/ast.hpp"
#include "cnext/ast/ast_context.hpp"
#include "cnext/basic/source_manager.hpp"
#include "cnext/symbols/type_info.hpp"

namespace cnext
{

/**
 * Owns the TypeInfo objects that AST annotations point at.
 *
 * `resolvedType` fields hold raw pointers into this store; the store never
 * moves or frees an entry, so the pointers stay valid for its lifetime.
 */
class TypeStore
{
public:
  TypeStore() = default;

  TypeStore(const TypeStore &) = delete;
  TypeStore & operator=(const TypeStore &) = delete;
  TypeStore(TypeStore &&) = default;
  TypeStore & operator=(TypeStore &&) = default;

  const TypeInfo * add(TypeInfo t)
  {
    types_.push_back(std::move(t));
    return &types_.back();
  }

  [[nodiscard]] size_t size() const noexcept { return types_.size(); }

private:
  std::deque<TypeInfo> types_;
};

// ============================================================================
// Module Info
// ============================================================================

/**
 * One .cnx source file and everything the passes attach to it.
 */
struct ModuleInfo
{
  FileId file_id = FileId::invalid();
  std::filesystem::path path;
  /// Text of the file (owned by the SourceRegistry)
  const SourceFile * source = nullptr;

  /// Parsed AST (non-movable, owned by this module)
  std::unique_ptr<AstContext> ast;
  Program * program = nullptr;

  TypeStore types;

  /// Generic path strings of this file and every .cnx file it includes,
  /// directly or not. C-Next symbols from other files are only visible when
  /// their origin is listed here.
  std::set<std::string, std::less<>> visibleFiles;

  /// Set when parsing or analysis reported an error for this file.
  bool failed = false;

  [[nodiscard]] std::string origin() const { return path.generic_string(); }

  /// Output stem: "motor" for ".../motor.cnx".
  [[nodiscard]] std::string stem() const { return path.stem().string(); }

  /// 1-based line of `range`, 0 when unknown.
  [[nodiscard]] uint32_t line_of(SourceRange range) const noexcept
  {
    if (source == nullptr || range.is_invalid()) return 0;
    return source->get_line_column(range.get_begin().offset()).line;
  }

  /// Source text covered by `range`.
  [[nodiscard]] std::string_view text_of(SourceRange range) const noexcept
  {
    if (source == nullptr || range.is_invalid()) return {};
    return source->content().substr(range.get_begin().offset(), range.size());
  }
};

}  // namespace cnext
