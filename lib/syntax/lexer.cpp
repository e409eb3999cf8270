#include "cnext/syntax/lexer.hpp"

#include <array>
#include <cctype>
#include <utility>

namespace cnext::syntax
{
namespace
{

bool is_ident_start(unsigned char c) { return (std::isalpha(c) != 0) || c == '_'; }
bool is_ident_continue(unsigned char c) { return (std::isalnum(c) != 0) || c == '_'; }

bool is_hex_digit(unsigned char c)
{
  return (std::isdigit(c) != 0) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

// Longest spellings first so that `<<<-` wins over `<<` and `<-`.
constexpr std::array<std::pair<std::string_view, TokenKind>, 24> k_operators = {{
  {"<<<-", TokenKind::ShlAssign},
  {">><-", TokenKind::ShrAssign},
  {"+<-", TokenKind::PlusAssign},
  {"-<-", TokenKind::MinusAssign},
  {"*<-", TokenKind::StarAssign},
  {"/<-", TokenKind::SlashAssign},
  {"%<-", TokenKind::PercentAssign},
  {"&<-", TokenKind::AmpAssign},
  {"|<-", TokenKind::PipeAssign},
  {"^<-", TokenKind::CaretAssign},
  {"<-", TokenKind::Assign},
  {"<<", TokenKind::Shl},
  {">>", TokenKind::Shr},
  {"<=", TokenKind::Le},
  {">=", TokenKind::Ge},
  {"!=", TokenKind::Ne},
  {"&&", TokenKind::AndAnd},
  {"||", TokenKind::OrOr},
  {"::", TokenKind::ColonColon},
  {"<", TokenKind::Lt},
  {">", TokenKind::Gt},
  {"=", TokenKind::Eq},
  {"&", TokenKind::Amp},
  {"|", TokenKind::Pipe},
}};

}  // namespace

bool Lexer::starts_with(std::string_view s) const noexcept
{
  return src_.size() >= pos_ + s.size() && src_.substr(pos_, s.size()) == s;
}

bool Lexer::at_line_start() const noexcept
{
  size_t i = pos_;
  while (i > 0) {
    const char c = src_[i - 1];
    if (c == '\n') return true;
    if (c != ' ' && c != '\t') return false;
    --i;
  }
  return true;
}

void Lexer::skip_trivia()
{
  while (!eof()) {
    const auto c = static_cast<unsigned char>(peek());
    if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
      advance(1);
      continue;
    }
    const size_t start = pos_;
    if (starts_with("//")) {
      while (!eof() && peek() != '\n' && peek() != '\r') {
        advance(1);
      }
      comments_.push_back(make_comment(start));
      continue;
    }
    if (starts_with("/*")) {
      // Unterminated block comments run to end of file.
      advance(2);
      while (!eof() && !starts_with("*/")) {
        advance(1);
      }
      if (!eof()) advance(2);
      comments_.push_back(make_comment(start));
      continue;
    }
    break;
  }
}

Token Lexer::lex_identifier()
{
  const size_t start = pos_;
  advance(1);
  while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
    advance(1);
  }
  return make(TokenKind::Identifier, start);
}

Token Lexer::lex_number()
{
  const size_t start = pos_;

  // Base-prefixed integers: 0x.. 0b.. 0o..
  if (peek() == '0') {
    const char p1 = peek(1);
    if (p1 == 'x' || p1 == 'X' || p1 == 'b' || p1 == 'B' || p1 == 'o' || p1 == 'O') {
      int base = 8;
      if (p1 == 'x' || p1 == 'X') {
        base = 16;
      } else if (p1 == 'b' || p1 == 'B') {
        base = 2;
      }
      advance(2);

      bool any = false;
      bool invalid = false;
      while (!eof()) {
        const auto c = static_cast<unsigned char>(peek());
        bool ok = false;
        if (base == 16) {
          ok = is_hex_digit(c);
        } else if (base == 8) {
          ok = (c >= '0' && c <= '7');
        } else {
          ok = (c == '0' || c == '1');
        }
        if (ok || c == '_') {
          any = any || ok;
          advance(1);
          continue;
        }
        // Still looks like part of the literal: consume it but mark invalid.
        if (std::isalnum(c) != 0) {
          invalid = true;
          advance(1);
          continue;
        }
        break;
      }
      return make((!any || invalid) ? TokenKind::Unknown : TokenKind::IntLiteral, start);
    }
  }

  while (!eof() && (std::isdigit(static_cast<unsigned char>(peek())) != 0 || peek() == '_')) {
    advance(1);
  }

  bool is_float = false;

  if (peek() == '.' && std::isdigit(static_cast<unsigned char>(peek(1))) != 0) {
    is_float = true;
    advance(1);
    while (!eof() && std::isdigit(static_cast<unsigned char>(peek())) != 0) {
      advance(1);
    }
  }

  if (peek() == 'e' || peek() == 'E') {
    is_float = true;
    advance(1);
    if (peek() == '+' || peek() == '-') {
      advance(1);
    }
    while (!eof() && std::isdigit(static_cast<unsigned char>(peek())) != 0) {
      advance(1);
    }
  }

  // Trailing letters such as `12abc` make the token invalid.
  bool invalid = false;
  while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
    invalid = true;
    advance(1);
  }
  if (invalid) return make(TokenKind::Unknown, start);
  return make(is_float ? TokenKind::FloatLiteral : TokenKind::IntLiteral, start);
}

Token Lexer::lex_quoted(char quote)
{
  const size_t start = pos_;
  advance(1);
  const size_t payload_start = pos_;

  while (!eof()) {
    const char c = peek();
    if (c == quote) break;
    // Raw newlines are not allowed inside literals.
    if (c == '\n' || c == '\r') {
      advance(1);
      return make(TokenKind::Unknown, start);
    }
    if (c == '\\') {
      advance(1);
      if (eof()) break;
    }
    advance(1);
  }

  if (eof()) {
    return make(TokenKind::Unknown, start);
  }
  const size_t payload_end = pos_;
  advance(1);

  Token t = make(quote == '"' ? TokenKind::StringLiteral : TokenKind::CharLiteral, start);
  t.text = src_.substr(payload_start, payload_end - payload_start);
  if (t.kind == TokenKind::CharLiteral && t.text.empty()) {
    t.kind = TokenKind::Unknown;
  }
  return t;
}

Token Lexer::lex_directive()
{
  const size_t start = pos_;
  advance(1);
  const size_t payload_start = pos_;
  // Backslash-newline continues the directive.
  while (!eof() && peek() != '\n') {
    if (peek() == '\\' && (peek(1) == '\n' || (peek(1) == '\r' && peek(2) == '\n'))) {
      advance(peek(1) == '\r' ? 3 : 2);
      continue;
    }
    advance(1);
  }
  size_t payload_end = pos_;
  if (payload_end > payload_start && src_[payload_end - 1] == '\r') {
    --payload_end;
  }
  Token t = make(TokenKind::Directive, start);
  t.text = src_.substr(payload_start, payload_end - payload_start);
  return t;
}

Token Lexer::lex_operator()
{
  const size_t start = pos_;

  for (const auto & [spelling, kind] : k_operators) {
    if (starts_with(spelling)) {
      advance(spelling.size());
      return make(kind, start);
    }
  }

  const char ch = peek();
  advance(1);

  switch (ch) {
    case '(':
      return make(TokenKind::LParen, start);
    case ')':
      return make(TokenKind::RParen, start);
    case '{':
      return make(TokenKind::LBrace, start);
    case '}':
      return make(TokenKind::RBrace, start);
    case '[':
      return make(TokenKind::LBracket, start);
    case ']':
      return make(TokenKind::RBracket, start);
    case ',':
      return make(TokenKind::Comma, start);
    case ':':
      return make(TokenKind::Colon, start);
    case ';':
      return make(TokenKind::Semicolon, start);
    case '.':
      return make(TokenKind::Dot, start);
    case '@':
      return make(TokenKind::At, start);
    case '?':
      return make(TokenKind::Question, start);
    case '!':
      return make(TokenKind::Bang, start);
    case '~':
      return make(TokenKind::Tilde, start);
    case '+':
      return make(TokenKind::Plus, start);
    case '-':
      return make(TokenKind::Minus, start);
    case '*':
      return make(TokenKind::Star, start);
    case '/':
      return make(TokenKind::Slash, start);
    case '%':
      return make(TokenKind::Percent, start);
    case '^':
      return make(TokenKind::Caret, start);
    default:
      break;
  }
  return make(TokenKind::Unknown, start);
}

Token Lexer::next_token()
{
  skip_trivia();

  if (eof()) {
    const size_t at = src_.size();
    return make(TokenKind::Eof, at);
  }

  const auto c = static_cast<unsigned char>(peek());

  if (c == '#' && at_line_start()) {
    return lex_directive();
  }
  if (is_ident_start(c)) {
    return lex_identifier();
  }
  if (std::isdigit(c) != 0) {
    return lex_number();
  }
  if (c == '"' || c == '\'') {
    return lex_quoted(static_cast<char>(c));
  }
  return lex_operator();
}

std::vector<Token> Lexer::lex_all()
{
  std::vector<Token> out;
  while (true) {
    const Token t = next_token();
    out.push_back(t);
    if (t.kind == TokenKind::Eof) {
      break;
    }
  }
  return out;
}

}  // namespace cnext::syntax
