#include "cnext/resolution/language.hpp"

#include <cctype>
#include <regex>

namespace cnext
{

std::string_view to_string(FileLanguage lang) noexcept
{
  switch (lang) {
    case FileLanguage::CNext:
      return "cnext";
    case FileLanguage::C:
      return "c";
    case FileLanguage::Cpp:
      return "cpp";
    case FileLanguage::SystemHeader:
      return "system";
  }
  return "c";
}

std::optional<FileLanguage> language_from_string(std::string_view s) noexcept
{
  if (s == "cnext") return FileLanguage::CNext;
  if (s == "c") return FileLanguage::C;
  if (s == "cpp") return FileLanguage::Cpp;
  if (s == "system") return FileLanguage::SystemHeader;
  return std::nullopt;
}

std::string strip_comments(std::string_view text)
{
  std::string out(text);
  size_t i = 0;
  while (i < out.size()) {
    const char c = out[i];
    if (c == '"' || c == '\'') {
      // Skip literals so that "//" inside a string survives.
      const char quote = c;
      ++i;
      while (i < out.size() && out[i] != quote && out[i] != '\n') {
        if (out[i] == '\\') ++i;
        ++i;
      }
      ++i;
      continue;
    }
    if (c == '/' && i + 1 < out.size() && out[i + 1] == '/') {
      while (i < out.size() && out[i] != '\n') {
        out[i++] = ' ';
      }
      continue;
    }
    if (c == '/' && i + 1 < out.size() && out[i + 1] == '*') {
      out[i++] = ' ';
      out[i++] = ' ';
      while (i < out.size() && !(out[i] == '*' && i + 1 < out.size() && out[i + 1] == '/')) {
        if (out[i] != '\n') out[i] = ' ';
        ++i;
      }
      if (i < out.size()) {
        out[i++] = ' ';
        out[i++] = ' ';
      }
      continue;
    }
    ++i;
  }
  return out;
}

bool looks_like_cpp(std::string_view text)
{
  const std::string code = strip_comments(text);

  static const std::regex k_cpp_markers(
    R"(\btemplate\s*<|\bnamespace\s+\w+|\bnamespace\s*\{|\bclass\s+\w+|\benum\s+(class|struct)\b|)"
    R"(\benum\s+\w+\s*:\s*\w+|\b(public|private|protected)\s*:|\w::\w|\bextern\s+"C\+\+")");
  return std::regex_search(code, k_cpp_markers);
}

FileLanguage detect_language(const std::filesystem::path & path, std::string_view content)
{
  std::string ext = path.extension().string();
  for (auto & ch : ext) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }

  if (ext == ".cnx") return FileLanguage::CNext;
  if (ext == ".c") return FileLanguage::C;
  if (ext == ".hpp" || ext == ".hh" || ext == ".hxx" || ext == ".cpp" || ext == ".cc" ||
      ext == ".cxx") {
    return FileLanguage::Cpp;
  }
  return looks_like_cpp(content) ? FileLanguage::Cpp : FileLanguage::C;
}

}  // namespace cnext
