// Expression parsing. Precedence follows C.
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <string>

#include "cnext/syntax/parser.hpp"

namespace cnext::syntax
{

Expr * Parser::parse_expr() { return parse_ternary(); }

Expr * Parser::parse_ternary()
{
  Expr * cond = parse_or();
  if (!match(TokenKind::Question)) {
    return cond;
  }
  Expr * then_expr = parse_ternary();
  expect(TokenKind::Colon, "':' in conditional expression");
  Expr * else_expr = parse_ternary();
  return ast_.create<TernaryExpr>(
    cond, then_expr, else_expr, join_ranges(cond->get_range(), else_expr->get_range()));
}

Expr * Parser::parse_or()
{
  Expr * lhs = parse_and();
  while (match(TokenKind::OrOr)) {
    Expr * rhs = parse_and();
    lhs = ast_.create<BinaryExpr>(
      lhs, BinaryOp::Or, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_and()
{
  Expr * lhs = parse_bitor();
  while (match(TokenKind::AndAnd)) {
    Expr * rhs = parse_bitor();
    lhs = ast_.create<BinaryExpr>(
      lhs, BinaryOp::And, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_bitor()
{
  Expr * lhs = parse_bitxor();
  while (match(TokenKind::Pipe)) {
    Expr * rhs = parse_bitxor();
    lhs = ast_.create<BinaryExpr>(
      lhs, BinaryOp::BitOr, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_bitxor()
{
  Expr * lhs = parse_bitand();
  while (match(TokenKind::Caret)) {
    Expr * rhs = parse_bitand();
    lhs = ast_.create<BinaryExpr>(
      lhs, BinaryOp::BitXor, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_bitand()
{
  Expr * lhs = parse_equality();
  while (match(TokenKind::Amp)) {
    Expr * rhs = parse_equality();
    lhs = ast_.create<BinaryExpr>(
      lhs, BinaryOp::BitAnd, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_equality()
{
  Expr * lhs = parse_comparison();
  if (match(TokenKind::Eq) || match(TokenKind::Ne)) {
    const BinaryOp op = (prev().kind == TokenKind::Eq) ? BinaryOp::Eq : BinaryOp::Ne;
    Expr * rhs = parse_comparison();
    Expr * out =
      ast_.create<BinaryExpr>(lhs, op, rhs, join_ranges(lhs->get_range(), rhs->get_range()));

    // Reject chaining: a = b = c
    if (at(TokenKind::Eq) || at(TokenKind::Ne)) {
      error_at(cur(), "chained equality operators are not allowed");
    }
    return out;
  }
  return lhs;
}

Expr * Parser::parse_comparison()
{
  Expr * lhs = parse_shift();
  if (match(TokenKind::Lt) || match(TokenKind::Le) || match(TokenKind::Gt) || match(TokenKind::Ge)) {
    BinaryOp op = BinaryOp::Lt;
    switch (prev().kind) {
      case TokenKind::Le:
        op = BinaryOp::Le;
        break;
      case TokenKind::Gt:
        op = BinaryOp::Gt;
        break;
      case TokenKind::Ge:
        op = BinaryOp::Ge;
        break;
      default:
        break;
    }

    Expr * rhs = parse_shift();
    Expr * out =
      ast_.create<BinaryExpr>(lhs, op, rhs, join_ranges(lhs->get_range(), rhs->get_range()));

    // Reject chaining: a < b < c
    if (at(TokenKind::Lt) || at(TokenKind::Le) || at(TokenKind::Gt) || at(TokenKind::Ge)) {
      error_at(cur(), "chained comparison operators are not allowed");
    }
    return out;
  }
  return lhs;
}

Expr * Parser::parse_shift()
{
  Expr * lhs = parse_add();
  while (match(TokenKind::Shl) || match(TokenKind::Shr)) {
    const BinaryOp op = (prev().kind == TokenKind::Shl) ? BinaryOp::Shl : BinaryOp::Shr;
    Expr * rhs = parse_add();
    lhs = ast_.create<BinaryExpr>(lhs, op, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_add()
{
  Expr * lhs = parse_mul();
  while (match(TokenKind::Plus) || match(TokenKind::Minus)) {
    const BinaryOp op = (prev().kind == TokenKind::Plus) ? BinaryOp::Add : BinaryOp::Sub;
    Expr * rhs = parse_mul();
    lhs = ast_.create<BinaryExpr>(lhs, op, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_mul()
{
  Expr * lhs = parse_unary();
  while (match(TokenKind::Star) || match(TokenKind::Slash) || match(TokenKind::Percent)) {
    BinaryOp op = BinaryOp::Mul;
    if (prev().kind == TokenKind::Slash) {
      op = BinaryOp::Div;
    } else if (prev().kind == TokenKind::Percent) {
      op = BinaryOp::Mod;
    }
    Expr * rhs = parse_unary();
    lhs = ast_.create<BinaryExpr>(lhs, op, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_unary()
{
  const Token op_tok = cur();
  if (match(TokenKind::Bang)) {
    Expr * e = parse_unary();
    return ast_.create<UnaryExpr>(UnaryOp::Not, e, join_ranges(op_tok.range, e->get_range()));
  }
  if (match(TokenKind::Minus)) {
    Expr * e = parse_unary();
    return ast_.create<UnaryExpr>(UnaryOp::Neg, e, join_ranges(op_tok.range, e->get_range()));
  }
  if (match(TokenKind::Tilde)) {
    Expr * e = parse_unary();
    return ast_.create<UnaryExpr>(UnaryOp::BitNot, e, join_ranges(op_tok.range, e->get_range()));
  }

  // (u8)x
  if (
    at(TokenKind::LParen) && cur(1).kind == TokenKind::Identifier &&
    is_primitive_type_name(cur(1).text) && cur(2).kind == TokenKind::RParen) {
    advance();
    const Token & type_tok = advance();
    auto * type = ast_.create<PrimaryType>(ast_.intern(type_tok.text), type_tok.range);
    advance();
    Expr * e = parse_unary();
    return ast_.create<CastExpr>(type, e, join_ranges(op_tok.range, e->get_range()));
  }

  return parse_postfix();
}

Expr * Parser::parse_postfix()
{
  Expr * e = parse_primary();

  while (true) {
    if (match(TokenKind::LBracket)) {
      Expr * idx = parse_expr();
      Expr * width = nullptr;
      if (match(TokenKind::Comma)) {
        width = parse_expr();
      }
      expect(TokenKind::RBracket, "']' after index");
      e = ast_.create<IndexExpr>(e, idx, width, join_ranges(e->get_range(), prev().range));
      continue;
    }

    if (match(TokenKind::Dot)) {
      const Token & name_tok = cur();
      if (name_tok.kind != TokenKind::Identifier) {
        error_at(name_tok, "expected member name after '.'");
        return e;
      }
      advance();
      e = ast_.create<MemberExpr>(
        e, ast_.intern(name_tok.text), join_ranges(e->get_range(), name_tok.range));
      continue;
    }

    if (match(TokenKind::LParen)) {
      std::vector<Expr *> args;
      if (!at(TokenKind::RParen)) {
        while (true) {
          args.push_back(parse_expr());
          if (!match(TokenKind::Comma)) {
            break;
          }
        }
      }
      expect(TokenKind::RParen, "')' after arguments", RecoverySet::Argument);
      e = ast_.create<CallExpr>(
        e, ast_.copy_to_arena(args), join_ranges(e->get_range(), prev().range));
      continue;
    }

    break;
  }

  return e;
}

Expr * Parser::parse_int_literal(const Token & t)
{
  std::string digits;
  digits.reserve(t.text.size());
  for (const char c : t.text) {
    if (c != '_') digits.push_back(c);
  }

  int base = 10;
  size_t skip = 0;
  if (digits.size() > 2 && digits[0] == '0') {
    const char p = static_cast<char>(std::tolower(static_cast<unsigned char>(digits[1])));
    if (p == 'x') {
      base = 16;
      skip = 2;
    } else if (p == 'b') {
      base = 2;
      skip = 2;
    } else if (p == 'o') {
      base = 8;
      skip = 2;
    }
  }

  uint64_t v = 0;
  const char * first = digits.data() + skip;
  const char * last = digits.data() + digits.size();
  const auto [ptr, ec] = std::from_chars(first, last, v, base);
  if (ec != std::errc() || ptr != last) {
    diags_.report_error(t.range, "integer literal '" + std::string(t.text) + "' is out of range")
      .with_code("E0101")
      .with_help("integer literals must fit in 64 bits");
    v = 0;
  }
  return ast_.create<IntLiteralExpr>(
    v, ast_.intern(t.text), static_cast<uint8_t>(base), t.range);
}

Expr * Parser::parse_array_literal()
{
  const Token lb = advance();  // [
  std::vector<Expr *> elems;
  if (!at(TokenKind::RBracket)) {
    while (true) {
      elems.push_back(parse_expr());
      if (!match(TokenKind::Comma) || at(TokenKind::RBracket)) {
        break;
      }
    }
  }
  expect(TokenKind::RBracket, "']' after array literal");
  return ast_.create<ArrayLiteralExpr>(
    ast_.copy_to_arena(elems), join_ranges(lb.range, prev().range));
}

Expr * Parser::parse_struct_literal()
{
  const Token lb = advance();  // {
  std::vector<FieldInit *> fields;
  while (!at(TokenKind::RBrace) && !at_eof()) {
    const Token & name_tok = cur();
    if (name_tok.kind != TokenKind::Identifier) {
      error_at(name_tok, "expected field name in struct literal");
      break;
    }
    advance();
    expect(TokenKind::Colon, "':' after field name");
    Expr * value = parse_expr();
    fields.push_back(ast_.create<FieldInit>(
      ast_.intern(name_tok.text), value, join_ranges(name_tok.range, value->get_range())));
    if (!match(TokenKind::Comma)) {
      break;
    }
  }
  expect(TokenKind::RBrace, "'}' after struct literal", RecoverySet::Block);
  return ast_.create<StructLiteralExpr>(
    ast_.copy_to_arena(fields), join_ranges(lb.range, prev().range));
}

Expr * Parser::parse_primary()
{
  const Token & t = cur();

  switch (t.kind) {
    case TokenKind::IntLiteral:
      advance();
      return parse_int_literal(t);

    case TokenKind::FloatLiteral: {
      advance();
      const std::string tmp(t.text);
      const double v = std::strtod(tmp.c_str(), nullptr);
      return ast_.create<FloatLiteralExpr>(v, ast_.intern(t.text), t.range);
    }

    case TokenKind::StringLiteral:
      advance();
      return ast_.create<StringLiteralExpr>(ast_.intern(t.text), t.range);

    case TokenKind::CharLiteral: {
      advance();
      char value = t.text[0];
      bool ok = t.text.size() == 1;
      if (t.text[0] == '\\' && t.text.size() == 2) {
        ok = true;
        switch (t.text[1]) {
          case 'n':
            value = '\n';
            break;
          case 't':
            value = '\t';
            break;
          case 'r':
            value = '\r';
            break;
          case '0':
            value = '\0';
            break;
          default:
            value = t.text[1];
            break;
        }
      }
      if (!ok) {
        error_at(t, "invalid character literal", "E0101");
      }
      return ast_.create<CharLiteralExpr>(ast_.intern(t.text), value, t.range);
    }

    case TokenKind::LParen: {
      advance();
      Expr * e = parse_expr();
      expect(TokenKind::RParen, "')' after expression");
      return e;
    }

    case TokenKind::LBracket:
      return parse_array_literal();

    case TokenKind::LBrace:
      return parse_struct_literal();

    case TokenKind::Unknown:
      advance();
      if (!t.text.empty() && (std::isdigit(static_cast<unsigned char>(t.text[0])) != 0 ||
                              t.text[0] == '"' || t.text[0] == '\'')) {
        error_at(t, "invalid literal '" + std::string(t.text) + "'", "E0101");
      } else {
        error_at(t, "unexpected character '" + std::string(t.text) + "'");
      }
      return ast_.create<MissingExpr>(t.range);

    default:
      break;
  }

  if (t.kind == TokenKind::Identifier) {
    if (t.text == "true" || t.text == "false") {
      advance();
      return ast_.create<BoolLiteralExpr>(t.text == "true", t.range);
    }
    if (t.text == "NULL") {
      advance();
      return ast_.create<NullLiteralExpr>(t.range);
    }

    advance();
    // ns::name is kept as one qualified identifier.
    if (at(TokenKind::ColonColon) && cur(1).kind == TokenKind::Identifier) {
      std::string name(t.text);
      while (at(TokenKind::ColonColon) && cur(1).kind == TokenKind::Identifier) {
        advance();
        name += "::";
        name += advance().text;
      }
      return ast_.create<VarRefExpr>(ast_.intern(name), join_ranges(t.range, prev().range));
    }
    return ast_.create<VarRefExpr>(ast_.intern(t.text), t.range);
  }

  error_at(t, "expected expression");

  // Leave statement terminators for the caller.
  if (t.kind != TokenKind::Semicolon && t.kind != TokenKind::RBrace &&
      t.kind != TokenKind::RParen && t.kind != TokenKind::Eof) {
    advance();
  }
  return ast_.create<MissingExpr>(t.range);
}

}  // namespace cnext::syntax
