// cnext/symbols/type_info.hpp - Cross-language type descriptions
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cnext
{

enum class TypeKind : uint8_t {
  Void,
  Bool,
  Integer,
  Float,
  CString,  ///< `const char *` / `char *`
  String,   ///< bounded string<N>
  Struct,
  Enum,
  Bitmap,
  Opaque,  ///< foreign type whose layout is unknown (FILE, function pointers)
};

/**
 * Type of a variable, field, parameter or expression.
 *
 * Scalars carry their width in `bitWidth` (8/16/32/64; 1 for bool).
 * Arrays keep the element type in the scalar fields and list their
 * dimensions outermost first in `arrayDims`.
 */
struct TypeInfo
{
  TypeKind kind = TypeKind::Opaque;
  /// C-Next spelling ("u32", "Point") or foreign spelling ("uint32_t", "FILE")
  std::string baseType;
  uint32_t bitWidth = 0;
  bool isSigned = false;

  bool isArray = false;
  std::vector<uint32_t> arrayDims;

  bool isConst = false;
  /// Const decided by inference rather than written by the user
  bool isAutoConst = false;

  bool isString = false;
  uint32_t stringCapacity = 0;

  /// Foreign pointer (the pointee is described by the other fields)
  bool isPointer = false;

  [[nodiscard]] bool is_integer() const noexcept
  {
    return !isArray && !isPointer && (kind == TypeKind::Integer || kind == TypeKind::Enum);
  }
  [[nodiscard]] bool is_bit_addressable() const noexcept
  {
    return !isArray && !isPointer && (kind == TypeKind::Integer || kind == TypeKind::Bitmap);
  }
  [[nodiscard]] bool is_numeric() const noexcept
  {
    return !isArray && !isPointer && (kind == TypeKind::Integer || kind == TypeKind::Float);
  }
  [[nodiscard]] bool is_nullable() const noexcept
  {
    return !isArray && (kind == TypeKind::CString || isPointer);
  }
  [[nodiscard]] bool is_aggregate() const noexcept
  {
    return isArray || kind == TypeKind::Struct || kind == TypeKind::String;
  }

  /// Number of scalar elements (1 for non-arrays).
  [[nodiscard]] uint64_t element_count() const noexcept;
  /// bitWidth times element_count().
  [[nodiscard]] uint64_t storage_bits() const noexcept;
  /// Size in bytes of the whole object, 0 when unknown.
  [[nodiscard]] uint64_t storage_bytes() const noexcept;

  /// The type of `x[i]` for an array `x`.
  [[nodiscard]] TypeInfo element_type() const;
  /// Same type without array dimensions or qualifiers.
  [[nodiscard]] TypeInfo scalar_type() const;

  /// Human-readable spelling for diagnostics, e.g. "u8[16]".
  [[nodiscard]] std::string to_string() const;

  /// Structural equality ignoring const and auto-const.
  [[nodiscard]] bool same_shape(const TypeInfo & other) const noexcept;
};

/// Range of values an integer type can hold.
struct IntegerRange
{
  int64_t min = 0;
  uint64_t max = 0;
};

[[nodiscard]] IntegerRange integer_range(const TypeInfo & t) noexcept;

/// Type for a C-Next primitive name (u8..u64, i8..i64, f32, f64, bool, void, cstring).
[[nodiscard]] std::optional<TypeInfo> primitive_type(std::string_view name);

/// Type for a C scalar spelling ("uint32_t", "unsigned int", "char", "double", ...).
/// Widths follow LP64.
[[nodiscard]] std::optional<TypeInfo> c_scalar_type(std::string_view spelling);

[[nodiscard]] TypeInfo make_string_type(uint32_t capacity);
[[nodiscard]] TypeInfo make_named_type(TypeKind kind, std::string name);

/// C spelling of the element type: "uint32_t", "const char*", "Point", "FILE*".
[[nodiscard]] std::string c_type_name(const TypeInfo & t);

/// `<stdint.h>` macro for T.MIN / T.MAX, e.g. "INT32_MIN", "UINT8_MAX".
[[nodiscard]] std::string boundary_macro(const TypeInfo & t, bool is_max);

}  // namespace cnext
