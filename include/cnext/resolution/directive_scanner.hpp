// cnext/resolution/directive_scanner.hpp - Lightweight #include extraction
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace cnext
{

/// One `#include` line found in a source or header file.
struct IncludeDirective
{
  std::string path;       ///< Text between the delimiters
  bool isSystem = false;  ///< `<...>` form
  uint32_t offset = 0;    ///< Offset of the `#`
  uint32_t end = 0;       ///< Offset one past the directive line
  uint32_t line = 0;      ///< 1-based

  friend bool operator==(const IncludeDirective & a, const IncludeDirective & b)
  {
    return a.path == b.path && a.isSystem == b.isSystem && a.offset == b.offset;
  }
};

/**
 * Finds `#include` directives without running a preprocessor.
 *
 * Comments are ignored and conditional blocks are not evaluated, so both
 * branches of an `#ifdef` contribute their includes.
 */
[[nodiscard]] std::vector<IncludeDirective> scan_includes(std::string_view text);

}  // namespace cnext
