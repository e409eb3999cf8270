// cnext/symbols/symbol.hpp - Cross-language symbol records
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "cnext/ast/ast_enums.hpp"
#include "cnext/symbols/type_info.hpp"

namespace cnext
{

class AstNode;

enum class SourceLanguage : uint8_t {
  CNext,
  C,
  Cpp,
};

[[nodiscard]] std::string_view to_string(SourceLanguage lang) noexcept;

// ============================================================================
// Per-kind payloads
// ============================================================================

struct ParamInfo
{
  std::string name;
  TypeInfo type;
  /// Foreign pointer parameter whose pointee may be written (`int *out`)
  bool writesThroughPointer = false;
};

struct FunctionInfo
{
  TypeInfo returnType;
  std::vector<ParamInfo> params;
  bool isDefinition = false;
  bool isVariadic = false;
};

struct FieldInfo
{
  std::string name;
  TypeInfo type;
};

struct StructInfo
{
  std::vector<FieldInfo> fields;  ///< declaration order
  bool isComplete = true;         ///< false for `struct X;`

  [[nodiscard]] const FieldInfo * find_field(std::string_view field) const noexcept
  {
    for (const auto & f : fields) {
      if (f.name == field) return &f;
    }
    return nullptr;
  }
};

struct EnumeratorInfo
{
  std::string name;
  int64_t value = 0;
};

struct EnumInfo
{
  std::vector<EnumeratorInfo> members;

  [[nodiscard]] const EnumeratorInfo * find_member(std::string_view member) const noexcept
  {
    for (const auto & m : members) {
      if (m.name == member) return &m;
    }
    return nullptr;
  }
};

struct BitmapFieldInfo
{
  std::string name;
  uint32_t offset = 0;
  uint32_t width = 1;
};

/// Foreign typedef, or a C-Next bitmap over its backing integer.
struct TypedefInfo
{
  TypeInfo aliased;
  std::vector<BitmapFieldInfo> bitmapFields;

  [[nodiscard]] const BitmapFieldInfo * find_bitmap_field(std::string_view f) const noexcept
  {
    for (const auto & b : bitmapFields) {
      if (b.name == f) return &b;
    }
    return nullptr;
  }
};

struct MacroInfo
{
  std::string value;
  std::optional<int64_t> intValue;
};

struct RegisterFieldInfo
{
  std::string name;
  TypeInfo type;
  RegisterAccess access = RegisterAccess::ReadWrite;
  std::string offsetText;
};

struct RegisterBinding
{
  std::string name;
  std::string baseAddressText;
  std::vector<RegisterFieldInfo> fields;

  [[nodiscard]] const RegisterFieldInfo * find_field(std::string_view f) const noexcept
  {
    for (const auto & r : fields) {
      if (r.name == f) return &r;
    }
    return nullptr;
  }
};

struct VariableInfo
{
  bool isExtern = false;
  std::optional<RegisterBinding> registerBinding;
};

/// Index order matches SymbolKind.
using SymbolDetails =
  std::variant<FunctionInfo, StructInfo, EnumInfo, TypedefInfo, MacroInfo, VariableInfo>;

enum class SymbolKind : uint8_t {
  Function,
  Struct,
  Enum,
  Typedef,
  Macro,
  Variable,
};

[[nodiscard]] std::string_view to_string(SymbolKind kind) noexcept;

// ============================================================================
// Symbol
// ============================================================================

/**
 * One named entity known to the compiler, from any language.
 *
 * `name` is the lookup key: C++ names are namespace-qualified ("hal::Pin"),
 * C-Next scope members are flattened ("Motor_speed"). `type` is the
 * variable type, the function return type, or the type the symbol names.
 */
struct Symbol
{
  std::string name;
  SourceLanguage language = SourceLanguage::C;
  std::string originFile;
  uint32_t line = 0;

  TypeInfo type;
  SymbolDetails details;

  /// Declaring node for C-Next symbols; nullptr for foreign ones
  const AstNode * decl = nullptr;
  /// Owning scope for C-Next scope members
  std::string scopeName;
  bool isPublic = true;

  [[nodiscard]] SymbolKind kind() const noexcept
  {
    return static_cast<SymbolKind>(details.index());
  }

  template <typename T>
  [[nodiscard]] const T * as() const noexcept
  {
    return std::get_if<T>(&details);
  }

  template <typename T>
  [[nodiscard]] T * as() noexcept
  {
    return std::get_if<T>(&details);
  }

  [[nodiscard]] bool is_foreign() const noexcept { return language != SourceLanguage::CNext; }

  /// Parameter type list, e.g. "(uint32_t, const char*)"; empty for non-functions.
  [[nodiscard]] std::string signature() const;
};

}  // namespace cnext
