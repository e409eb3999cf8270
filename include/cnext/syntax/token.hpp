// cnext/syntax/token.hpp - Token kinds of the C-Next lexer
#pragma once

#include <cstdint>
#include <string_view>

#include "cnext/basic/source_manager.hpp"

namespace cnext::syntax
{

enum class TokenKind : uint8_t {
  Eof,
  Unknown,

  Identifier,  // keywords are lexed as identifiers
  IntLiteral,
  FloatLiteral,
  StringLiteral,  // text is the contents without quotes
  CharLiteral,    // text is the contents without quotes
  Directive,      // whole `#...` line; text starts after '#'

  LParen,
  RParen,
  LBrace,
  RBrace,
  LBracket,
  RBracket,

  Comma,
  Colon,
  ColonColon,
  Semicolon,
  Dot,
  At,
  Question,

  Bang,
  Tilde,
  Plus,
  Minus,
  Star,
  Slash,
  Percent,
  Amp,
  Pipe,
  Caret,
  Shl,
  Shr,

  AndAnd,
  OrOr,

  Eq,  // `=` is equality
  Ne,
  Lt,
  Le,
  Gt,
  Ge,

  Assign,  // <-
  PlusAssign,
  MinusAssign,
  StarAssign,
  SlashAssign,
  PercentAssign,
  AmpAssign,
  PipeAssign,
  CaretAssign,
  ShlAssign,
  ShrAssign,
};

struct Token
{
  TokenKind kind = TokenKind::Unknown;
  SourceRange range;
  std::string_view text;

  [[nodiscard]] uint32_t begin() const noexcept { return range.get_begin().offset(); }
  [[nodiscard]] uint32_t end() const noexcept { return range.get_end().offset(); }
};

[[nodiscard]] constexpr bool is_assign_op(TokenKind k) noexcept
{
  return k >= TokenKind::Assign && k <= TokenKind::ShrAssign;
}

[[nodiscard]] constexpr std::string_view to_string(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Eof:
      return "<eof>";
    case TokenKind::Unknown:
      return "<unknown>";
    case TokenKind::Identifier:
      return "identifier";
    case TokenKind::IntLiteral:
      return "integer literal";
    case TokenKind::FloatLiteral:
      return "float literal";
    case TokenKind::StringLiteral:
      return "string literal";
    case TokenKind::CharLiteral:
      return "char literal";
    case TokenKind::Directive:
      return "preprocessor directive";
    case TokenKind::LParen:
      return "(";
    case TokenKind::RParen:
      return ")";
    case TokenKind::LBrace:
      return "{";
    case TokenKind::RBrace:
      return "}";
    case TokenKind::LBracket:
      return "[";
    case TokenKind::RBracket:
      return "]";
    case TokenKind::Comma:
      return ",";
    case TokenKind::Colon:
      return ":";
    case TokenKind::ColonColon:
      return "::";
    case TokenKind::Semicolon:
      return ";";
    case TokenKind::Dot:
      return ".";
    case TokenKind::At:
      return "@";
    case TokenKind::Question:
      return "?";
    case TokenKind::Bang:
      return "!";
    case TokenKind::Tilde:
      return "~";
    case TokenKind::Plus:
      return "+";
    case TokenKind::Minus:
      return "-";
    case TokenKind::Star:
      return "*";
    case TokenKind::Slash:
      return "/";
    case TokenKind::Percent:
      return "%";
    case TokenKind::Amp:
      return "&";
    case TokenKind::Pipe:
      return "|";
    case TokenKind::Caret:
      return "^";
    case TokenKind::Shl:
      return "<<";
    case TokenKind::Shr:
      return ">>";
    case TokenKind::AndAnd:
      return "&&";
    case TokenKind::OrOr:
      return "||";
    case TokenKind::Eq:
      return "=";
    case TokenKind::Ne:
      return "!=";
    case TokenKind::Lt:
      return "<";
    case TokenKind::Le:
      return "<=";
    case TokenKind::Gt:
      return ">";
    case TokenKind::Ge:
      return ">=";
    case TokenKind::Assign:
      return "<-";
    case TokenKind::PlusAssign:
      return "+<-";
    case TokenKind::MinusAssign:
      return "-<-";
    case TokenKind::StarAssign:
      return "*<-";
    case TokenKind::SlashAssign:
      return "/<-";
    case TokenKind::PercentAssign:
      return "%<-";
    case TokenKind::AmpAssign:
      return "&<-";
    case TokenKind::PipeAssign:
      return "|<-";
    case TokenKind::CaretAssign:
      return "^<-";
    case TokenKind::ShlAssign:
      return "<<<-";
    case TokenKind::ShrAssign:
      return ">><-";
  }
  return "";
}

}  // namespace cnext::syntax
