#include "cnext/symbols/symbol.hpp"

namespace cnext
{

std::string_view to_string(SourceLanguage lang) noexcept
{
  switch (lang) {
    case SourceLanguage::CNext:
      return "C-Next";
    case SourceLanguage::C:
      return "C";
    case SourceLanguage::Cpp:
      return "C++";
  }
  return "C";
}

std::string_view to_string(SymbolKind kind) noexcept
{
  switch (kind) {
    case SymbolKind::Function:
      return "function";
    case SymbolKind::Struct:
      return "struct";
    case SymbolKind::Enum:
      return "enum";
    case SymbolKind::Typedef:
      return "typedef";
    case SymbolKind::Macro:
      return "macro";
    case SymbolKind::Variable:
      return "variable";
  }
  return "symbol";
}

std::string Symbol::signature() const
{
  const auto * fn = as<FunctionInfo>();
  if (fn == nullptr) {
    return {};
  }
  std::string out = "(";
  for (size_t i = 0; i < fn->params.size(); ++i) {
    if (i > 0) out += ", ";
    out += c_type_name(fn->params[i].type);
    for (const uint32_t d : fn->params[i].type.arrayDims) {
      out += "[" + std::to_string(d) + "]";
    }
  }
  if (fn->isVariadic) {
    out += fn->params.empty() ? "..." : ", ...";
  }
  out += ")";
  return out;
}

}  // namespace cnext
