// cnext/resolution/language.hpp - Source language classification
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace cnext
{

enum class FileLanguage : uint8_t {
  CNext,
  C,
  Cpp,
  SystemHeader,  ///< Known standard header; never parsed
};

[[nodiscard]] std::string_view to_string(FileLanguage lang) noexcept;
[[nodiscard]] std::optional<FileLanguage> language_from_string(std::string_view s) noexcept;

/// Source text with `//` and `/* */` comments replaced by spaces (offsets kept).
[[nodiscard]] std::string strip_comments(std::string_view text);

/**
 * True when header text uses constructs only C++ accepts: templates,
 * namespaces, classes, `enum class`, typed enums (`enum X : T`), access
 * specifiers or the `::` scope operator.
 */
[[nodiscard]] bool looks_like_cpp(std::string_view text);

/**
 * Classifies a file by extension, falling back to content for `.h`.
 *
 * `.cnx` is C-Next, `.c` is C, `.hpp/.hh/.hxx/.cpp/.cc/.cxx` are C++,
 * and `.h` is C unless looks_like_cpp() says otherwise.
 */
[[nodiscard]] FileLanguage detect_language(
  const std::filesystem::path & path, std::string_view content);

}  // namespace cnext
