// cnext/syntax/parser.hpp - Recursive-descent parser for .cnx sources
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cnext/ast/ast.hpp"
#include "cnext/ast/ast_context.hpp"
#include "cnext/basic/diagnostic.hpp"
#include "cnext/basic/source_manager.hpp"
#include "cnext/syntax/token.hpp"

namespace cnext::syntax
{

enum class RecoverySet : uint32_t {
  None = 0,
  Statement = 1 << 0,  // ;
  Block = 1 << 1,      // } or ;
  Argument = 1 << 2,   // ) or ; or {
};

inline RecoverySet operator|(RecoverySet a, RecoverySet b)
{
  return static_cast<RecoverySet>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

inline bool operator&(RecoverySet a, RecoverySet b)
{
  return (static_cast<uint32_t>(a) & static_cast<uint32_t>(b)) != 0;
}

/**
 * Builds the AST of one .cnx file from its token stream.
 *
 * Errors are reported to `diags` with codes E0100 to E0102 (syntax) and
 * E0501/E0502 (`#define` policy); the parser always returns a Program,
 * using MissingExpr placeholders where an expression could not be read.
 */
class Parser
{
public:
  Parser(
    AstContext & ast, FileId file_id, const SourceFile & source, DiagnosticBag & diags,
    std::vector<Token> tokens)
  : ast_(ast), file_id_(file_id), source_(source), diags_(diags), tokens_(std::move(tokens))
  {
  }

  [[nodiscard]] Program * parse_program();

private:
  // Token helpers
  [[nodiscard]] const Token & cur(size_t lookahead = 0) const;
  [[nodiscard]] bool at(TokenKind k) const;
  [[nodiscard]] bool at_eof() const;
  [[nodiscard]] const Token & prev() const;

  const Token & advance();
  bool match(TokenKind k);
  bool expect(TokenKind k, std::string_view what, RecoverySet recovery = RecoverySet::None);

  void error_at(const Token & t, std::string_view msg, std::string code = "E0100");
  void synchronize_to_stmt();
  void synchronize_skip_block();

  [[nodiscard]] static bool is_kw(std::string_view kw, const Token & t);
  [[nodiscard]] static bool is_reserved_ident(std::string_view ident);
  [[nodiscard]] static bool is_primitive_type_name(std::string_view ident);
  [[nodiscard]] std::string_view expect_identifier(std::string_view what);
  /// Consumes `const`, `wrap` and `clamp` in any order.
  void parse_var_modifiers(bool & is_const, std::optional<OverflowMode> & overflow);

  // Top-level
  void parse_directive(std::vector<IncludeDecl *> & includes, std::vector<DefineDecl *> & defines);
  [[nodiscard]] StructDecl * parse_struct_decl();
  [[nodiscard]] EnumDecl * parse_enum_decl();
  [[nodiscard]] BitmapDecl * parse_bitmap_decl();
  [[nodiscard]] RegisterDecl * parse_register_decl();
  [[nodiscard]] ScopeDecl * parse_scope_decl();
  /// `[const] [wrap|clamp] T name ...` at file or scope level: a function or a global.
  [[nodiscard]] Decl * parse_function_or_global(std::string_view scope_name, bool is_public);
  [[nodiscard]] FunctionDecl * parse_function_rest(
    const Token & start, PrimaryType * ret, const Token & name_tok);
  [[nodiscard]] ParamDecl * parse_param_decl();

  // Statements
  [[nodiscard]] Stmt * parse_stmt();
  [[nodiscard]] BlockStmt * parse_block();
  [[nodiscard]] bool looks_like_var_decl() const;
  [[nodiscard]] VarDeclStmt * parse_var_decl(bool require_semicolon);
  /// Assignment or expression statement, without the trailing `;`.
  [[nodiscard]] Stmt * parse_simple_stmt();
  [[nodiscard]] IfStmt * parse_if_stmt();
  [[nodiscard]] WhileStmt * parse_while_stmt();
  [[nodiscard]] DoWhileStmt * parse_do_while_stmt();
  [[nodiscard]] ForStmt * parse_for_stmt();
  [[nodiscard]] SwitchStmt * parse_switch_stmt();
  [[nodiscard]] ReturnStmt * parse_return_stmt();

  // Types and declarators
  [[nodiscard]] PrimaryType * parse_type();
  [[nodiscard]] gsl::span<Expr *> parse_array_dims();

  // Expressions
  [[nodiscard]] Expr * parse_expr();
  [[nodiscard]] Expr * parse_ternary();
  [[nodiscard]] Expr * parse_or();
  [[nodiscard]] Expr * parse_and();
  [[nodiscard]] Expr * parse_bitor();
  [[nodiscard]] Expr * parse_bitxor();
  [[nodiscard]] Expr * parse_bitand();
  [[nodiscard]] Expr * parse_equality();
  [[nodiscard]] Expr * parse_comparison();
  [[nodiscard]] Expr * parse_shift();
  [[nodiscard]] Expr * parse_add();
  [[nodiscard]] Expr * parse_mul();
  [[nodiscard]] Expr * parse_unary();
  [[nodiscard]] Expr * parse_postfix();
  [[nodiscard]] Expr * parse_primary();
  [[nodiscard]] Expr * parse_int_literal(const Token & t);
  [[nodiscard]] Expr * parse_struct_literal();
  [[nodiscard]] Expr * parse_array_literal();

  [[nodiscard]] std::optional<int64_t> parse_const_int_token(std::string_view what);

  AstContext & ast_;
  FileId file_id_;
  const SourceFile & source_;
  DiagnosticBag & diags_;
  std::vector<Token> tokens_;
  size_t idx_ = 0;
};

}  // namespace cnext::syntax
