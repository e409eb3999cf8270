// cnext/symbols/system_headers.hpp - Built-in knowledge of standard C headers
//
// Standard headers are never read from disk. Their types, macros and the
// functions generated code commonly calls come from tables compiled into
// the binary.
//
#pragma once

#include <string_view>
#include <vector>

#include "cnext/symbols/symbol.hpp"

namespace cnext
{

/// True for `<stdint.h>`, `<stdio.h>`, ... (the name as written between `<>`).
[[nodiscard]] bool is_builtin_system_header(std::string_view name) noexcept;

/**
 * Symbols provided by a built-in header, with originFile `<name>`.
 *
 * Unknown names yield an empty list.
 */
[[nodiscard]] std::vector<Symbol> builtin_header_symbols(std::string_view name);

/**
 * Type for a simple C spelling such as "const char *", "FILE*", "size_t"
 * or "uint8_t". Pointers to anything but char become `isPointer` types.
 */
[[nodiscard]] TypeInfo builtin_c_type(std::string_view spelling);

}  // namespace cnext
