// cnext/syntax/lexer.hpp - Hand-written lexer for .cnx sources
#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "cnext/ast/ast.hpp"
#include "cnext/syntax/token.hpp"

namespace cnext::syntax
{

/**
 * Converts C-Next source text into tokens.
 *
 * Comments produce no tokens; they are collected in comments() for the
 * generators to copy into the C output. A `#` that starts a line produces one Directive
 * token spanning the rest of that line. `<-` always lexes as assignment,
 * so `a<-1` is an assignment; write `a < -1` for the comparison.
 */
class Lexer
{
public:
  Lexer(FileId file_id, std::string_view src) : file_id_(file_id), src_(src) {}

  [[nodiscard]] std::vector<Token> lex_all();

  /// Comments seen by lex_all(), in source order.
  [[nodiscard]] const std::vector<Comment> & comments() const noexcept { return comments_; }

private:
  [[nodiscard]] Token next_token();

  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }
  [[nodiscard]] bool starts_with(std::string_view s) const noexcept;
  [[nodiscard]] bool at_line_start() const noexcept;

  void advance(size_t n = 1) noexcept { pos_ += n; }

  /// Skips whitespace and records comments.
  void skip_trivia();

  [[nodiscard]] Token lex_identifier();
  [[nodiscard]] Token lex_number();
  [[nodiscard]] Token lex_quoted(char quote);
  [[nodiscard]] Token lex_directive();
  [[nodiscard]] Token lex_operator();

  [[nodiscard]] Token make(TokenKind kind, size_t start) const noexcept
  {
    const auto s = static_cast<uint32_t>(start);
    const auto e = static_cast<uint32_t>(pos_);
    return {kind, {file_id_, s, e}, src_.substr(start, pos_ - start)};
  }

  [[nodiscard]] Comment make_comment(size_t start) const noexcept
  {
    const auto s = static_cast<uint32_t>(start);
    const auto e = static_cast<uint32_t>(pos_);
    return {{file_id_, s, e}, src_.substr(start, pos_ - start)};
  }

  FileId file_id_;
  std::string_view src_;
  size_t pos_ = 0;
  std::vector<Comment> comments_;
};

}  // namespace cnext::syntax
