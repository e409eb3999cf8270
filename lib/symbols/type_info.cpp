#include "cnext/symbols/type_info.hpp"

#include <fmt/format.h>

#include <limits>
#include <unordered_map>

namespace cnext
{

uint64_t TypeInfo::element_count() const noexcept
{
  uint64_t n = 1;
  for (const uint32_t d : arrayDims) {
    n *= d;
  }
  return n;
}

uint64_t TypeInfo::storage_bits() const noexcept
{
  return static_cast<uint64_t>(bitWidth) * element_count();
}

uint64_t TypeInfo::storage_bytes() const noexcept
{
  if (kind == TypeKind::String) {
    return static_cast<uint64_t>(stringCapacity + 1) * element_count();
  }
  if (kind == TypeKind::Bool) {
    return element_count();
  }
  return storage_bits() / 8;
}

TypeInfo TypeInfo::element_type() const
{
  TypeInfo e = *this;
  if (!e.arrayDims.empty()) {
    e.arrayDims.erase(e.arrayDims.begin());
  }
  e.isArray = !e.arrayDims.empty();
  return e;
}

TypeInfo TypeInfo::scalar_type() const
{
  TypeInfo e = *this;
  e.arrayDims.clear();
  e.isArray = false;
  e.isConst = false;
  e.isAutoConst = false;
  return e;
}

std::string TypeInfo::to_string() const
{
  std::string s;
  if (isConst) s += "const ";
  if (kind == TypeKind::String) {
    s += fmt::format("string<{}>", stringCapacity);
  } else {
    s += baseType.empty() ? "<unknown>" : baseType;
  }
  if (isPointer) s += "*";
  for (const uint32_t d : arrayDims) {
    s += fmt::format("[{}]", d);
  }
  return s;
}

bool TypeInfo::same_shape(const TypeInfo & other) const noexcept
{
  return kind == other.kind && baseType == other.baseType && bitWidth == other.bitWidth &&
         isSigned == other.isSigned && arrayDims == other.arrayDims &&
         stringCapacity == other.stringCapacity && isPointer == other.isPointer;
}

IntegerRange integer_range(const TypeInfo & t) noexcept
{
  if (t.kind == TypeKind::Bool) {
    return {0, 1};
  }
  const uint32_t w = t.bitWidth == 0 ? 32 : t.bitWidth;
  if (t.isSigned) {
    if (w >= 64) {
      return {std::numeric_limits<int64_t>::min(),
              static_cast<uint64_t>(std::numeric_limits<int64_t>::max())};
    }
    const int64_t max = (int64_t{1} << (w - 1)) - 1;
    return {-max - 1, static_cast<uint64_t>(max)};
  }
  if (w >= 64) {
    return {0, std::numeric_limits<uint64_t>::max()};
  }
  return {0, (uint64_t{1} << w) - 1};
}

namespace
{

TypeInfo scalar(TypeKind kind, std::string name, uint32_t width, bool is_signed)
{
  TypeInfo t;
  t.kind = kind;
  t.baseType = std::move(name);
  t.bitWidth = width;
  t.isSigned = is_signed;
  return t;
}

}  // namespace

std::optional<TypeInfo> primitive_type(std::string_view name)
{
  if (name == "u8") return scalar(TypeKind::Integer, "u8", 8, false);
  if (name == "u16") return scalar(TypeKind::Integer, "u16", 16, false);
  if (name == "u32") return scalar(TypeKind::Integer, "u32", 32, false);
  if (name == "u64") return scalar(TypeKind::Integer, "u64", 64, false);
  if (name == "i8") return scalar(TypeKind::Integer, "i8", 8, true);
  if (name == "i16") return scalar(TypeKind::Integer, "i16", 16, true);
  if (name == "i32") return scalar(TypeKind::Integer, "i32", 32, true);
  if (name == "i64") return scalar(TypeKind::Integer, "i64", 64, true);
  if (name == "f32") return scalar(TypeKind::Float, "f32", 32, true);
  if (name == "f64") return scalar(TypeKind::Float, "f64", 64, true);
  if (name == "bool") return scalar(TypeKind::Bool, "bool", 1, false);
  if (name == "void") return scalar(TypeKind::Void, "void", 0, false);
  if (name == "cstring") {
    TypeInfo t = scalar(TypeKind::CString, "cstring", 8, true);
    t.isConst = true;
    return t;
  }
  return std::nullopt;
}

std::optional<TypeInfo> c_scalar_type(std::string_view spelling)
{
  struct Entry
  {
    TypeKind kind;
    uint32_t width;
    bool is_signed;
  };
  static const std::unordered_map<std::string_view, Entry> k_table = {
    {"uint8_t", {TypeKind::Integer, 8, false}},
    {"uint16_t", {TypeKind::Integer, 16, false}},
    {"uint32_t", {TypeKind::Integer, 32, false}},
    {"uint64_t", {TypeKind::Integer, 64, false}},
    {"int8_t", {TypeKind::Integer, 8, true}},
    {"int16_t", {TypeKind::Integer, 16, true}},
    {"int32_t", {TypeKind::Integer, 32, true}},
    {"int64_t", {TypeKind::Integer, 64, true}},
    {"uintptr_t", {TypeKind::Integer, 64, false}},
    {"intptr_t", {TypeKind::Integer, 64, true}},
    {"size_t", {TypeKind::Integer, 64, false}},
    {"ssize_t", {TypeKind::Integer, 64, true}},
    {"ptrdiff_t", {TypeKind::Integer, 64, true}},
    {"char", {TypeKind::Integer, 8, true}},
    {"signed char", {TypeKind::Integer, 8, true}},
    {"unsigned char", {TypeKind::Integer, 8, false}},
    {"short", {TypeKind::Integer, 16, true}},
    {"short int", {TypeKind::Integer, 16, true}},
    {"signed short", {TypeKind::Integer, 16, true}},
    {"unsigned short", {TypeKind::Integer, 16, false}},
    {"unsigned short int", {TypeKind::Integer, 16, false}},
    {"int", {TypeKind::Integer, 32, true}},
    {"signed", {TypeKind::Integer, 32, true}},
    {"signed int", {TypeKind::Integer, 32, true}},
    {"unsigned", {TypeKind::Integer, 32, false}},
    {"unsigned int", {TypeKind::Integer, 32, false}},
    {"long", {TypeKind::Integer, 64, true}},
    {"long int", {TypeKind::Integer, 64, true}},
    {"signed long", {TypeKind::Integer, 64, true}},
    {"unsigned long", {TypeKind::Integer, 64, false}},
    {"unsigned long int", {TypeKind::Integer, 64, false}},
    {"long long", {TypeKind::Integer, 64, true}},
    {"long long int", {TypeKind::Integer, 64, true}},
    {"unsigned long long", {TypeKind::Integer, 64, false}},
    {"unsigned long long int", {TypeKind::Integer, 64, false}},
    {"float", {TypeKind::Float, 32, true}},
    {"double", {TypeKind::Float, 64, true}},
    {"long double", {TypeKind::Float, 64, true}},
    {"bool", {TypeKind::Bool, 1, false}},
    {"_Bool", {TypeKind::Bool, 1, false}},
    {"void", {TypeKind::Void, 0, false}},
  };

  if (auto it = k_table.find(spelling); it != k_table.end()) {
    return scalar(it->second.kind, std::string(spelling), it->second.width, it->second.is_signed);
  }
  return std::nullopt;
}

TypeInfo make_string_type(uint32_t capacity)
{
  TypeInfo t = scalar(TypeKind::String, "string", 8, true);
  t.isString = true;
  t.stringCapacity = capacity;
  return t;
}

TypeInfo make_named_type(TypeKind kind, std::string name)
{
  TypeInfo t;
  t.kind = kind;
  t.baseType = std::move(name);
  if (kind == TypeKind::Enum) {
    t.bitWidth = 32;
    t.isSigned = true;
  }
  return t;
}

std::string c_type_name(const TypeInfo & t)
{
  std::string base;
  switch (t.kind) {
    case TypeKind::Void:
      base = "void";
      break;
    case TypeKind::Bool:
      base = "bool";
      break;
    case TypeKind::Integer:
    case TypeKind::Float:
      if (t.baseType.size() >= 2 && (t.baseType[0] == 'u' || t.baseType[0] == 'i') &&
          primitive_type(t.baseType)) {
        base = fmt::format("{}int{}_t", t.baseType[0] == 'u' ? "u" : "", t.bitWidth);
      } else if (t.baseType == "f32") {
        base = "float";
      } else if (t.baseType == "f64") {
        base = "double";
      } else {
        base = t.baseType;
      }
      break;
    case TypeKind::CString:
      if (t.baseType == "cstring") {
        return "const char*";
      }
      return t.isConst ? "const char*" : "char*";
    case TypeKind::String:
      base = "char";
      break;
    case TypeKind::Struct:
    case TypeKind::Enum:
    case TypeKind::Bitmap:
    case TypeKind::Opaque:
      base = t.baseType;
      break;
  }
  if (t.isPointer) {
    return base + "*";
  }
  return base;
}

std::string boundary_macro(const TypeInfo & t, bool is_max)
{
  const uint32_t w = t.bitWidth == 0 ? 32 : t.bitWidth;
  if (t.isSigned) {
    return fmt::format("INT{}_{}", w, is_max ? "MAX" : "MIN");
  }
  if (is_max) {
    return fmt::format("UINT{}_MAX", w);
  }
  return fmt::format("((uint{}_t)0)", w);
}

}  // namespace cnext
