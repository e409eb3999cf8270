// cnext/codegen/code_writer.hpp - Indented line buffer for generated C
#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace cnext
{

class CodeWriter
{
public:
  static constexpr int k_indent_width = 4;

  void line(std::string_view text)
  {
    if (!text.empty()) {
      out_.append(static_cast<size_t>(depth_ * k_indent_width), ' ');
      out_ += text;
    }
    out_ += '\n';
  }

  void blank()
  {
    if (out_.size() >= 2 && out_.compare(out_.size() - 2, 2, "\n\n") != 0) {
      out_ += '\n';
    }
  }

  /// Writes `text {` and indents.
  void open(std::string_view text)
  {
    line(std::string(text) + " {");
    ++depth_;
  }

  /// Dedents and writes `}` followed by `suffix`.
  void close(std::string_view suffix = "")
  {
    --depth_;
    line(std::string("}") + std::string(suffix));
  }

  void indent() { ++depth_; }
  void dedent() { --depth_; }

  [[nodiscard]] const std::string & str() const noexcept { return out_; }
  [[nodiscard]] std::string take() { return std::move(out_); }

private:
  std::string out_;
  int depth_ = 0;
};

}  // namespace cnext
