// Statement parsing.
#include <string>

#include "cnext/syntax/parser.hpp"

namespace cnext::syntax
{
namespace
{

[[nodiscard]] AssignOp to_assign_op(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::PlusAssign:
      return AssignOp::AddAssign;
    case TokenKind::MinusAssign:
      return AssignOp::SubAssign;
    case TokenKind::StarAssign:
      return AssignOp::MulAssign;
    case TokenKind::SlashAssign:
      return AssignOp::DivAssign;
    case TokenKind::PercentAssign:
      return AssignOp::ModAssign;
    case TokenKind::AmpAssign:
      return AssignOp::AndAssign;
    case TokenKind::PipeAssign:
      return AssignOp::OrAssign;
    case TokenKind::CaretAssign:
      return AssignOp::XorAssign;
    case TokenKind::ShlAssign:
      return AssignOp::ShlAssign;
    case TokenKind::ShrAssign:
      return AssignOp::ShrAssign;
    default:
      return AssignOp::Assign;
  }
}

}  // namespace

BlockStmt * Parser::parse_block()
{
  const Token start = cur();
  std::vector<Stmt *> stmts;

  if (!expect(TokenKind::LBrace, "'{'")) {
    // Recover with a one-statement block so the caller keeps its shape.
    if (!at_eof() && !at(TokenKind::RBrace)) {
      if (Stmt * s = parse_stmt()) {
        stmts.push_back(s);
      }
    }
    return ast_.create<BlockStmt>(ast_.copy_to_arena(stmts), join_ranges(start.range, prev().range));
  }

  while (!at(TokenKind::RBrace) && !at_eof()) {
    const size_t before = idx_;
    if (Stmt * s = parse_stmt()) {
      stmts.push_back(s);
    }
    if (idx_ == before) {
      // No progress; drop the offending token.
      advance();
    }
  }
  expect(TokenKind::RBrace, "'}' to close block");

  return ast_.create<BlockStmt>(ast_.copy_to_arena(stmts), join_ranges(start.range, prev().range));
}

bool Parser::looks_like_var_decl() const
{
  if (is_kw("const", cur()) || is_kw("wrap", cur()) || is_kw("clamp", cur())) {
    return true;
  }
  if (cur().kind != TokenKind::Identifier || is_reserved_ident(cur().text)) {
    return false;
  }
  if (cur(1).kind == TokenKind::Identifier) {
    return true;
  }
  if (
    cur().text == "string" && cur(1).kind == TokenKind::Lt &&
    cur(2).kind == TokenKind::IntLiteral && cur(3).kind == TokenKind::Gt) {
    return true;
  }
  // ns::Type name
  size_t i = 1;
  while (cur(i).kind == TokenKind::ColonColon && cur(i + 1).kind == TokenKind::Identifier) {
    i += 2;
  }
  return i > 1 && cur(i).kind == TokenKind::Identifier;
}

Stmt * Parser::parse_stmt()
{
  const Token & t = cur();

  if (at(TokenKind::LBrace)) {
    return parse_block();
  }
  if (at(TokenKind::Directive)) {
    error_at(t, "preprocessor directives are only allowed at file level", "E0102");
    advance();
    return nullptr;
  }
  if (is_kw("if", t)) return parse_if_stmt();
  if (is_kw("while", t)) return parse_while_stmt();
  if (is_kw("do", t)) return parse_do_while_stmt();
  if (is_kw("for", t)) return parse_for_stmt();
  if (is_kw("switch", t)) return parse_switch_stmt();
  if (is_kw("return", t)) return parse_return_stmt();

  if (is_kw("else", t) || is_kw("case", t) || is_kw("default", t)) {
    error_at(t, "unexpected '" + std::string(t.text) + "'");
    advance();
    synchronize_skip_block();
    return nullptr;
  }

  if (looks_like_var_decl()) {
    return parse_var_decl(true);
  }

  Stmt * s = parse_simple_stmt();
  if (!expect(TokenKind::Semicolon, "';' after statement", RecoverySet::Statement)) {
    synchronize_to_stmt();
  }
  return s;
}

VarDeclStmt * Parser::parse_var_decl(bool require_semicolon)
{
  const Token start = cur();
  bool is_const = false;
  std::optional<OverflowMode> overflow;
  parse_var_modifiers(is_const, overflow);
  PrimaryType * type = parse_type();
  const std::string_view name = expect_identifier("variable name");

  auto * decl = ast_.create<VarDeclStmt>(name, is_const, type, SourceRange{});
  decl->overflow = overflow.value_or(OverflowMode::Clamp);
  decl->dims = parse_array_dims();
  if (match(TokenKind::Assign)) {
    decl->init = parse_expr();
  } else if (at(TokenKind::Eq)) {
    diags_.report_error(cur().range, "expected '<-' to initialize a variable")
      .with_code("E0100")
      .with_fixit(cur().range, "<-");
    advance();
    decl->init = parse_expr();
  }

  if (require_semicolon &&
      !expect(TokenKind::Semicolon, "';' after variable declaration", RecoverySet::Statement)) {
    synchronize_to_stmt();
  }
  decl->range_ = join_ranges(start.range, prev().range);
  return decl;
}

Stmt * Parser::parse_simple_stmt()
{
  Expr * target = parse_expr();

  if (is_assign_op(cur().kind)) {
    const AssignOp op = to_assign_op(advance().kind);
    Expr * value = parse_expr();
    return ast_.create<AssignStmt>(
      target, op, value, join_ranges(target->get_range(), value->get_range()));
  }

  // `x = 1;` is a comparison in C-Next; almost always a mistyped assignment.
  if (const auto * bin = dyn_cast<BinaryExpr>(target); bin && bin->op == BinaryOp::Eq) {
    diags_.report_error(bin->get_range(), "comparison used as a statement")
      .with_code("E0100")
      .with_help("assignment is written with '<-', e.g. x <- 1;");
  }

  return ast_.create<ExprStmt>(target, target->get_range());
}

IfStmt * Parser::parse_if_stmt()
{
  const Token start = advance();  // if
  expect(TokenKind::LParen, "'(' after 'if'");
  Expr * cond = parse_expr();
  expect(TokenKind::RParen, "')' after if condition", RecoverySet::Argument);
  BlockStmt * then_block = parse_block();

  Stmt * else_stmt = nullptr;
  if (is_kw("else", cur())) {
    advance();
    if (is_kw("if", cur())) {
      else_stmt = parse_if_stmt();
    } else {
      else_stmt = parse_block();
    }
  }
  return ast_.create<IfStmt>(cond, then_block, else_stmt, join_ranges(start.range, prev().range));
}

WhileStmt * Parser::parse_while_stmt()
{
  const Token start = advance();  // while
  expect(TokenKind::LParen, "'(' after 'while'");
  Expr * cond = parse_expr();
  expect(TokenKind::RParen, "')' after while condition", RecoverySet::Argument);
  BlockStmt * body = parse_block();
  return ast_.create<WhileStmt>(cond, body, join_ranges(start.range, prev().range));
}

DoWhileStmt * Parser::parse_do_while_stmt()
{
  const Token start = advance();  // do
  BlockStmt * body = parse_block();
  if (!is_kw("while", cur())) {
    error_at(cur(), "expected 'while' after do block");
  } else {
    advance();
  }
  expect(TokenKind::LParen, "'(' after 'while'");
  Expr * cond = parse_expr();
  expect(TokenKind::RParen, "')' after do-while condition", RecoverySet::Argument);
  expect(TokenKind::Semicolon, "';' after do-while", RecoverySet::Statement);
  return ast_.create<DoWhileStmt>(body, cond, join_ranges(start.range, prev().range));
}

ForStmt * Parser::parse_for_stmt()
{
  const Token start = advance();  // for
  expect(TokenKind::LParen, "'(' after 'for'");

  Stmt * init = nullptr;
  if (!at(TokenKind::Semicolon)) {
    init = looks_like_var_decl() ? static_cast<Stmt *>(parse_var_decl(false)) : parse_simple_stmt();
  }
  expect(TokenKind::Semicolon, "';' after for initializer");

  Expr * cond = nullptr;
  if (!at(TokenKind::Semicolon)) {
    cond = parse_expr();
  }
  expect(TokenKind::Semicolon, "';' after for condition");

  Stmt * update = nullptr;
  if (!at(TokenKind::RParen)) {
    update = parse_simple_stmt();
  }
  expect(TokenKind::RParen, "')' after for clauses", RecoverySet::Argument);

  BlockStmt * body = parse_block();
  return ast_.create<ForStmt>(init, cond, update, body, join_ranges(start.range, prev().range));
}

SwitchStmt * Parser::parse_switch_stmt()
{
  const Token start = advance();  // switch
  expect(TokenKind::LParen, "'(' after 'switch'");
  Expr * subject = parse_expr();
  expect(TokenKind::RParen, "')' after switch subject", RecoverySet::Argument);
  expect(TokenKind::LBrace, "'{' to open switch body");

  std::vector<SwitchCase *> cases;
  DefaultCase * default_case = nullptr;

  while (!at(TokenKind::RBrace) && !at_eof()) {
    const Token case_start = cur();

    if (is_kw("case", cur())) {
      advance();
      // `||` separates labels, so each label is parsed below logical-or.
      std::vector<Expr *> labels;
      labels.push_back(parse_and());
      while (match(TokenKind::OrOr)) {
        labels.push_back(parse_and());
      }
      BlockStmt * body = parse_block();
      cases.push_back(ast_.create<SwitchCase>(
        ast_.copy_to_arena(labels), body, join_ranges(case_start.range, prev().range)));
      continue;
    }

    if (is_kw("default", cur())) {
      advance();
      std::optional<int64_t> count;
      if (match(TokenKind::LParen)) {
        count = parse_const_int_token("remaining variant count");
        expect(TokenKind::RParen, "')' after default count");
      }
      BlockStmt * body = parse_block();
      const SourceRange r = join_ranges(case_start.range, prev().range);
      if (default_case != nullptr) {
        diags_.report_error(r, "switch has more than one default")
          .with_code("E0100")
          .with_secondary_label(default_case->get_range(), "first default here");
        continue;
      }
      default_case = count ? ast_.create<DefaultCase>(body, *count, r)
                           : ast_.create<DefaultCase>(body, r);
      continue;
    }

    diags_.report_error(cur().range, "expected 'case' or 'default' in switch")
      .with_code("E0100")
      .with_help("switch cases are written `case A || B { ... }` and never fall through");
    advance();
    synchronize_skip_block();
  }
  expect(TokenKind::RBrace, "'}' to close switch");

  return ast_.create<SwitchStmt>(
    subject, ast_.copy_to_arena(cases), default_case, join_ranges(start.range, prev().range));
}

ReturnStmt * Parser::parse_return_stmt()
{
  const Token start = advance();  // return
  Expr * value = nullptr;
  if (!at(TokenKind::Semicolon)) {
    value = parse_expr();
  }
  expect(TokenKind::Semicolon, "';' after return", RecoverySet::Statement);
  return ast_.create<ReturnStmt>(value, join_ranges(start.range, prev().range));
}

}  // namespace cnext::syntax
