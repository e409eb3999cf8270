#include "cnext/resolution/directive_scanner.hpp"

#include "cnext/resolution/language.hpp"

namespace cnext
{

std::vector<IncludeDirective> scan_includes(std::string_view text)
{
  const std::string code = strip_comments(text);
  std::vector<IncludeDirective> out;

  size_t pos = 0;
  uint32_t line = 1;
  while (pos < code.size()) {
    const size_t eol = code.find('\n', pos);
    const size_t line_end = eol == std::string::npos ? code.size() : eol;
    const std::string_view l(code.data() + pos, line_end - pos);

    size_t i = 0;
    while (i < l.size() && (l[i] == ' ' || l[i] == '\t')) ++i;
    if (i < l.size() && l[i] == '#') {
      const size_t hash = i;
      ++i;
      while (i < l.size() && (l[i] == ' ' || l[i] == '\t')) ++i;
      if (l.substr(i, 7) == "include") {
        i += 7;
        while (i < l.size() && (l[i] == ' ' || l[i] == '\t')) ++i;
        if (i < l.size() && (l[i] == '<' || l[i] == '"')) {
          const char close = l[i] == '<' ? '>' : '"';
          const size_t close_pos = l.find(close, i + 1);
          if (close_pos != std::string_view::npos && close_pos > i + 1) {
            IncludeDirective d;
            d.path = std::string(l.substr(i + 1, close_pos - i - 1));
            d.isSystem = close == '>';
            d.offset = static_cast<uint32_t>(pos + hash);
            d.end = static_cast<uint32_t>(line_end);
            d.line = line;
            out.push_back(std::move(d));
          }
        }
      }
    }

    if (eol == std::string::npos) break;
    pos = eol + 1;
    ++line;
  }
  return out;
}

}  // namespace cnext
