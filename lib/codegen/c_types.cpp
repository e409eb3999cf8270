// cnext/codegen/c_types.cpp - C spellings implementation
//
#include "cnext/codegen/c_types.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <cctype>
#include <limits>
#include <vector>

namespace cnext
{

namespace
{

bool is_pointer_like(const TypeInfo & t) noexcept
{
  return t.isPointer || t.kind == TypeKind::CString;
}

std::string dims_suffix(const TypeInfo & t)
{
  std::string s;
  for (const uint32_t d : t.arrayDims) {
    s += fmt::format("[{}]", d);
  }
  if (t.kind == TypeKind::String) {
    s += fmt::format("[{}]", t.stringCapacity + 1);
  }
  return s;
}

}  // namespace

ParamPassing param_passing(const ParamDecl & param) noexcept
{
  const TypeInfo * t = param.resolvedType;
  if (t == nullptr) {
    return ParamPassing::Value;
  }
  if (t->isArray || t->kind == TypeKind::String) {
    return ParamPassing::Array;
  }
  if (t->kind == TypeKind::Struct) {
    return ParamPassing::Pointer;
  }
  if (!is_const_param(param) && !is_pointer_like(*t)) {
    return ParamPassing::Pointer;
  }
  return ParamPassing::Value;
}

std::string c_declarator(const TypeInfo & t, std::string_view name)
{
  const std::string base = t.kind == TypeKind::String ? "char" : c_type_name(t);
  if (is_pointer_like(t)) {
    // The pointee of a cstring is already const; qualify the pointer itself.
    return fmt::format("{}{} {}{}", base, t.isConst ? " const" : "", name, dims_suffix(t));
  }
  return fmt::format("{}{} {}{}", t.isConst ? "const " : "", base, name, dims_suffix(t));
}

std::string c_param_declaration(const ParamDecl & param)
{
  if (param.resolvedType == nullptr) {
    return fmt::format("int {}", param.name);
  }
  TypeInfo t = *param.resolvedType;
  const bool immutable = is_const_param(param);

  switch (param_passing(param)) {
    case ParamPassing::Array:
      if (t.kind == TypeKind::String && !t.isArray) {
        return fmt::format("{}char *{}", immutable ? "const " : "", param.name);
      }
      t.isConst = immutable;
      return c_declarator(t, param.name);
    case ParamPassing::Pointer:
      return fmt::format("{}{} *{}", immutable ? "const " : "", c_type_name(t), param.name);
    case ParamPassing::Value:
      t.isConst = immutable && !is_pointer_like(t);
      return c_declarator(t, param.name);
  }
  return c_declarator(t, param.name);
}

bool is_entry_point(const FunctionDecl & fn) noexcept
{
  return fn.name == "main" && !fn.in_scope();
}

std::string c_function_prototype(const FunctionDecl & fn)
{
  std::string ret = "void";
  if (is_entry_point(fn)) {
    ret = "int";
  } else if (fn.resolvedReturnType != nullptr) {
    ret = c_type_name(*fn.resolvedReturnType);
  }

  std::vector<std::string> params;
  params.reserve(fn.params.size());
  for (const ParamDecl * p : fn.params) {
    params.push_back(c_param_declaration(*p));
  }

  return fmt::format(
    "{}{} {}({})", fn.isPublic ? "" : "static ", ret, fn.cName,
    params.empty() ? std::string("void") : fmt::format("{}", fmt::join(params, ", ")));
}

std::string c_zero_value(const TypeInfo & t)
{
  if (t.isArray || t.kind == TypeKind::Struct || t.kind == TypeKind::String) {
    return "{0}";
  }
  if (is_pointer_like(t)) {
    return "NULL";
  }
  switch (t.kind) {
    case TypeKind::Bool:
      return "false";
    case TypeKind::Float:
      return t.bitWidth == 32 ? "0.0f" : "0.0";
    case TypeKind::Integer:
    case TypeKind::Bitmap:
      return t.isSigned ? "0" : "0U";
    default:
      return "0";
  }
}

std::string_view c_literal_suffix(const TypeInfo & t, uint64_t value) noexcept
{
  const bool wide = value > std::numeric_limits<uint32_t>::max() ||
                    (t.isSigned && value > static_cast<uint64_t>(std::numeric_limits<int32_t>::max()));
  if (t.kind != TypeKind::Integer && t.kind != TypeKind::Bitmap) {
    return wide ? "LL" : "";
  }
  if (!t.isSigned) {
    return t.bitWidth == 64 && wide ? "ULL" : "U";
  }
  return wide ? "LL" : "";
}

std::string c_bit_mask(uint32_t width, uint32_t bits)
{
  const std::string_view suffix = bits == 64 ? "ULL" : "U";
  if (width >= 64) {
    return "0xFFFFFFFFFFFFFFFFULL";
  }
  return fmt::format("0x{:X}{}", (uint64_t{1} << width) - 1, suffix);
}

std::string include_guard(std::string_view stem)
{
  std::string guard;
  guard.reserve(stem.size() + 2);
  for (const char c : stem) {
    guard.push_back(
      std::isalnum(static_cast<unsigned char>(c)) != 0
        ? static_cast<char>(std::toupper(static_cast<unsigned char>(c)))
        : '_');
  }
  if (guard.empty() || std::isdigit(static_cast<unsigned char>(guard.front())) != 0) {
    guard.insert(guard.begin(), '_');
  }
  return guard + "_H";
}

void CommentCursor::write_before(CodeWriter & w, uint32_t offset)
{
  for (; next_ < comments_.size(); ++next_) {
    const Comment & c = comments_[next_];
    if (c.range.get_begin().offset() >= offset) {
      return;
    }
    std::string_view text = c.text;
    bool first = true;
    while (!text.empty()) {
      const size_t nl = text.find('\n');
      std::string_view line = text.substr(0, nl);
      text = nl == std::string_view::npos ? std::string_view{} : text.substr(nl + 1);
      while (!line.empty() && line.back() == '\r') line.remove_suffix(1);
      if (!first) {
        // Continuation lines of a block comment follow the new indentation.
        while (!line.empty() && (line.front() == ' ' || line.front() == '\t')) {
          line.remove_prefix(1);
        }
        if (!line.empty() && line.front() == '*') {
          w.line(" " + std::string(line));
          continue;
        }
      }
      w.line(line);
      first = false;
    }
  }
}

void CommentCursor::skip_before(uint32_t offset)
{
  while (next_ < comments_.size() && comments_[next_].range.get_begin().offset() < offset) {
    ++next_;
  }
}

}  // namespace cnext
