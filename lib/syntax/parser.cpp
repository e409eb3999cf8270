#include "cnext/syntax/parser.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <string>

namespace cnext::syntax
{
namespace
{

[[nodiscard]] bool is_c_keyword_misuse(std::string_view ident) noexcept
{
  static const std::string_view k_c_only[] = {
    "typedef", "union", "goto", "static", "extern", "volatile", "auto", "class", "namespace"};
  return std::any_of(std::begin(k_c_only), std::end(k_c_only), [&](std::string_view k) {
    return ident == k;
  });
}

[[nodiscard]] std::string_view trim(std::string_view s) noexcept
{
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) {
    s.remove_suffix(1);
  }
  return s;
}

[[nodiscard]] std::optional<RegisterAccess> parse_access_mode(std::string_view s) noexcept
{
  if (s == "rw") return RegisterAccess::ReadWrite;
  if (s == "ro") return RegisterAccess::ReadOnly;
  if (s == "wo") return RegisterAccess::WriteOnly;
  if (s == "w1c") return RegisterAccess::WriteOneClear;
  if (s == "w1s") return RegisterAccess::WriteOneSet;
  return std::nullopt;
}

}  // namespace

// ============================================================================
// Token helpers
// ============================================================================

const Token & Parser::cur(size_t lookahead) const
{
  const size_t i = idx_ + lookahead;
  if (i >= tokens_.size()) {
    return tokens_.back();
  }
  return tokens_[i];
}

bool Parser::at(TokenKind k) const { return cur().kind == k; }

bool Parser::at_eof() const { return at(TokenKind::Eof); }

const Token & Parser::prev() const { return tokens_[idx_ > 0 ? idx_ - 1 : 0]; }

const Token & Parser::advance()
{
  const Token & t = cur();
  if (!at_eof()) {
    ++idx_;
  }
  return t;
}

bool Parser::match(TokenKind k)
{
  if (at(k)) {
    advance();
    return true;
  }
  return false;
}

bool Parser::expect(TokenKind k, std::string_view what, RecoverySet recovery)
{
  if (match(k)) {
    return true;
  }

  // A missing `;` is reported at the end of the previous line when the
  // next token already sits on a new one.
  if (k == TokenKind::Semicolon && idx_ > 0) {
    const Token & p = prev();
    const auto prev_lc = source_.get_line_column(p.end());
    const auto curr_lc = source_.get_line_column(cur().begin());
    if (curr_lc.line > prev_lc.line) {
      diags_.report_error(p.range, "expected " + std::string(what), "expected `;`")
        .with_code("E0100")
        .with_fixit(SourceRange(file_id_, p.end(), p.end()), ";");
    } else {
      diags_.report_error(cur().range, "expected " + std::string(what), "expected `;`")
        .with_code("E0100");
    }
  } else {
    error_at(cur(), "expected " + std::string(what));
  }

  if (recovery == RecoverySet::None) {
    return false;
  }
  while (!at_eof()) {
    if (at(k)) {
      advance();
      return true;
    }
    const TokenKind kind = cur().kind;
    if (kind == TokenKind::Semicolon) {
      return false;
    }
    if (kind == TokenKind::RBrace && (recovery & (RecoverySet::Block | RecoverySet::Argument))) {
      return false;
    }
    if (kind == TokenKind::RParen && (recovery & RecoverySet::Argument)) {
      return false;
    }
    if (kind == TokenKind::LBrace && (recovery & RecoverySet::Argument)) {
      return false;
    }
    advance();
  }
  return false;
}

void Parser::error_at(const Token & t, std::string_view msg, std::string code)
{
  diags_.report_error(t.range, std::string(msg)).with_code(std::move(code));
}

void Parser::synchronize_to_stmt()
{
  while (!at_eof()) {
    if (match(TokenKind::Semicolon)) {
      return;
    }
    if (at(TokenKind::RBrace) || at(TokenKind::Directive)) {
      return;
    }
    advance();
  }
}

void Parser::synchronize_skip_block()
{
  int brace_depth = 0;

  while (!at_eof()) {
    if (at(TokenKind::LBrace)) {
      ++brace_depth;
      advance();
      continue;
    }
    if (at(TokenKind::RBrace)) {
      if (brace_depth > 0) {
        --brace_depth;
        advance();
        if (brace_depth == 0) {
          return;
        }
        continue;
      }
      return;
    }
    if (brace_depth == 0 && match(TokenKind::Semicolon)) {
      return;
    }
    advance();
  }
}

bool Parser::is_kw(std::string_view kw, const Token & t)
{
  return t.kind == TokenKind::Identifier && t.text == kw;
}

bool Parser::is_reserved_ident(std::string_view ident)
{
  // Lexed as identifiers, treated as keywords by the parser.
  static constexpr std::string_view k_reserved[] = {
    "struct", "enum",   "bitmap8", "bitmap16", "bitmap32", "register", "scope",
    "public", "private", "const",  "if",       "else",     "while",    "do",
    "for",    "switch", "case",    "default",  "return",   "true",     "false",
    "NULL",   "wrap",   "clamp",
  };
  return std::any_of(
    std::begin(k_reserved), std::end(k_reserved), [&](std::string_view kw) { return ident == kw; });
}

bool Parser::is_primitive_type_name(std::string_view ident)
{
  static constexpr std::string_view k_primitives[] = {
    "u8", "u16", "u32", "u64", "i8", "i16", "i32", "i64", "f32", "f64", "bool", "cstring",
  };
  return std::any_of(std::begin(k_primitives), std::end(k_primitives), [&](std::string_view p) {
    return ident == p;
  });
}

void Parser::parse_var_modifiers(bool & is_const, std::optional<OverflowMode> & overflow)
{
  while (true) {
    const Token & t = cur();
    if (is_kw("const", t)) {
      is_const = true;
    } else if (is_kw("wrap", t) || is_kw("clamp", t)) {
      if (overflow) {
        error_at(t, "only one of 'wrap' and 'clamp' may be given");
      }
      overflow = is_kw("wrap", t) ? OverflowMode::Wrap : OverflowMode::Clamp;
    } else {
      return;
    }
    advance();
  }
}

std::string_view Parser::expect_identifier(std::string_view what)
{
  const Token & t = cur();
  if (t.kind != TokenKind::Identifier) {
    error_at(t, "expected " + std::string(what));
    return {};
  }
  if (is_reserved_ident(t.text)) {
    error_at(t, "keyword '" + std::string(t.text) + "' cannot be used as " + std::string(what));
  }
  advance();
  return ast_.intern(t.text);
}

std::optional<int64_t> Parser::parse_const_int_token(std::string_view what)
{
  const Token & t = cur();
  if (t.kind != TokenKind::IntLiteral) {
    error_at(t, "expected " + std::string(what));
    return std::nullopt;
  }
  advance();
  int64_t v = 0;
  const auto [ptr, ec] = std::from_chars(t.text.data(), t.text.data() + t.text.size(), v);
  if (ec != std::errc() || ptr != t.text.data() + t.text.size()) {
    error_at(t, "invalid integer '" + std::string(t.text) + "'", "E0101");
    return std::nullopt;
  }
  return v;
}

// ============================================================================
// Program
// ============================================================================

Program * Parser::parse_program()
{
  auto * prog = ast_.create<Program>(
    SourceRange(file_id_, 0, static_cast<uint32_t>(source_.content().size())));

  std::vector<IncludeDecl *> includes;
  std::vector<DefineDecl *> defines;
  std::vector<Decl *> decls;

  while (!at_eof()) {
    if (at(TokenKind::Directive)) {
      parse_directive(includes, defines);
      continue;
    }

    if (is_kw("struct", cur())) {
      decls.push_back(parse_struct_decl());
      continue;
    }
    if (is_kw("enum", cur())) {
      decls.push_back(parse_enum_decl());
      continue;
    }
    if (is_kw("bitmap8", cur()) || is_kw("bitmap16", cur()) || is_kw("bitmap32", cur())) {
      decls.push_back(parse_bitmap_decl());
      continue;
    }
    if (is_kw("register", cur())) {
      decls.push_back(parse_register_decl());
      continue;
    }
    if (is_kw("scope", cur())) {
      decls.push_back(parse_scope_decl());
      continue;
    }

    if (cur().kind == TokenKind::Identifier && is_c_keyword_misuse(cur().text)) {
      const Token & t = cur();
      diags_.report_error(t.range, "unsupported construct '" + std::string(t.text) + "'")
        .with_code("E0102")
        .with_help("C-Next has no '" + std::string(t.text) +
                   "'; declare structs, enums, bitmaps, registers, scopes, functions or "
                   "variables directly");
      advance();
      synchronize_skip_block();
      continue;
    }

    if (cur().kind == TokenKind::Identifier) {
      if (Decl * d = parse_function_or_global({}, true)) {
        decls.push_back(d);
      }
      continue;
    }

    error_at(cur(), "unexpected token at top level", "E0102");
    advance();
    synchronize_to_stmt();
  }

  prog->includes = ast_.copy_to_arena(includes);
  prog->defines = ast_.copy_to_arena(defines);
  prog->decls = ast_.copy_to_arena(decls);
  return prog;
}

void Parser::parse_directive(
  std::vector<IncludeDecl *> & includes, std::vector<DefineDecl *> & defines)
{
  const Token & t = advance();
  std::string_view body = trim(t.text);

  size_t word_end = 0;
  while (word_end < body.size() && body[word_end] != ' ' && body[word_end] != '\t' &&
         body[word_end] != '<' && body[word_end] != '"' && body[word_end] != '(') {
    ++word_end;
  }
  const std::string_view word = body.substr(0, word_end);
  const std::string_view rest = trim(body.substr(word_end));

  if (word == "include") {
    if (rest.size() >= 2 && (rest.front() == '<' || rest.front() == '"')) {
      const char close = rest.front() == '<' ? '>' : '"';
      const size_t end = rest.find(close, 1);
      if (end != std::string_view::npos && end > 1) {
        includes.push_back(ast_.create<IncludeDecl>(
          ast_.intern(rest.substr(1, end - 1)), close == '>', t.range));
        return;
      }
    }
    diags_.report_error(t.range, "malformed #include directive")
      .with_code("E0100")
      .with_help("write #include <file.h> or #include \"file.h\"");
    return;
  }

  if (word == "define") {
    size_t name_end = 0;
    while (name_end < rest.size() &&
           (std::isalnum(static_cast<unsigned char>(rest[name_end])) != 0 ||
            rest[name_end] == '_')) {
      ++name_end;
    }
    if (name_end == 0) {
      error_at(t, "expected macro name after #define");
      return;
    }
    const std::string_view name = rest.substr(0, name_end);
    const bool function_like = name_end < rest.size() && rest[name_end] == '(';
    const std::string_view value = function_like ? rest.substr(name_end) : trim(rest.substr(name_end));

    defines.push_back(
      ast_.create<DefineDecl>(ast_.intern(name), ast_.intern(value), function_like, t.range));

    if (function_like) {
      diags_.report_error(t.range, "function-like macro '" + std::string(name) + "' is not allowed")
        .with_code("E0501")
        .with_help("write a C-Next function instead");
    } else if (!value.empty()) {
      diags_.report_error(t.range, "#define '" + std::string(name) + "' must not carry a value")
        .with_code("E0502")
        .with_help("use 'const' for constants: const u32 " + std::string(name) + " <- " +
                   std::string(value) + ";");
    }
    return;
  }

  diags_.report_error(t.range, "unsupported preprocessor directive '#" + std::string(word) + "'")
    .with_code("E0102")
    .with_help("only #include and flag-only #define are supported");
}

// ============================================================================
// Type declarations
// ============================================================================

StructDecl * Parser::parse_struct_decl()
{
  const Token start = advance();  // struct
  const std::string_view name = expect_identifier("struct name");
  expect(TokenKind::LBrace, "'{' after struct name");

  std::vector<FieldDecl *> fields;
  while (!at(TokenKind::RBrace) && !at_eof()) {
    const Token field_start = cur();
    PrimaryType * type = parse_type();
    const std::string_view fname = expect_identifier("field name");
    auto * field = ast_.create<FieldDecl>(fname, type, SourceRange{});
    field->dims = parse_array_dims();
    field->range_ = join_ranges(field_start.range, prev().range);
    fields.push_back(field);
    if (!expect(TokenKind::Semicolon, "';' after struct field", RecoverySet::Block)) {
      synchronize_to_stmt();
    }
  }
  expect(TokenKind::RBrace, "'}' to close struct");

  return ast_.create<StructDecl>(
    name, ast_.copy_to_arena(fields), join_ranges(start.range, prev().range));
}

EnumDecl * Parser::parse_enum_decl()
{
  const Token start = advance();  // enum
  const std::string_view name = expect_identifier("enum name");
  expect(TokenKind::LBrace, "'{' after enum name");

  std::vector<EnumMember *> members;
  while (!at(TokenKind::RBrace) && !at_eof()) {
    const Token mstart = cur();
    const std::string_view mname = expect_identifier("enum member");
    if (mname.empty()) {
      advance();
      continue;
    }
    Expr * value = nullptr;
    if (match(TokenKind::Assign)) {
      value = parse_expr();
    }
    members.push_back(
      ast_.create<EnumMember>(mname, value, join_ranges(mstart.range, prev().range)));
    if (!match(TokenKind::Comma)) {
      break;
    }
  }
  expect(TokenKind::RBrace, "'}' to close enum");

  return ast_.create<EnumDecl>(
    name, ast_.copy_to_arena(members), join_ranges(start.range, prev().range));
}

BitmapDecl * Parser::parse_bitmap_decl()
{
  const Token start = advance();  // bitmapN
  uint32_t bits = 8;
  if (start.text == "bitmap16") {
    bits = 16;
  } else if (start.text == "bitmap32") {
    bits = 32;
  }
  const std::string_view name = expect_identifier("bitmap name");
  expect(TokenKind::LBrace, "'{' after bitmap name");

  std::vector<BitmapField *> fields;
  uint32_t offset = 0;
  while (!at(TokenKind::RBrace) && !at_eof()) {
    const Token fstart = cur();
    const std::string_view fname = expect_identifier("bitmap field");
    if (fname.empty()) {
      advance();
      continue;
    }
    uint32_t width = 1;
    if (match(TokenKind::LBracket)) {
      if (auto w = parse_const_int_token("bit width")) {
        if (*w <= 0) {
          error_at(prev(), "bitmap field width must be positive", "E0305");
        } else {
          width = static_cast<uint32_t>(*w);
        }
      }
      expect(TokenKind::RBracket, "']' after bit width");
    }
    auto * field = ast_.create<BitmapField>(fname, width, join_ranges(fstart.range, prev().range));
    field->offset = offset;
    offset += width;
    fields.push_back(field);
    if (!match(TokenKind::Comma)) {
      break;
    }
  }
  expect(TokenKind::RBrace, "'}' to close bitmap");

  return ast_.create<BitmapDecl>(
    name, bits, ast_.copy_to_arena(fields), join_ranges(start.range, prev().range));
}

RegisterDecl * Parser::parse_register_decl()
{
  const Token start = advance();  // register
  const std::string_view name = expect_identifier("register name");
  expect(TokenKind::At, "'@' before register base address");
  Expr * base = parse_expr();
  expect(TokenKind::LBrace, "'{' after register base address");

  std::vector<RegisterField *> fields;
  while (!at(TokenKind::RBrace) && !at_eof()) {
    const Token fstart = cur();
    const std::string_view fname = expect_identifier("register field name");
    if (fname.empty()) {
      synchronize_to_stmt();
      continue;
    }
    expect(TokenKind::Colon, "':' after register field name");
    PrimaryType * type = parse_type();

    RegisterAccess access = RegisterAccess::ReadWrite;
    const Token & access_tok = cur();
    if (auto mode = parse_access_mode(access_tok.text);
        access_tok.kind == TokenKind::Identifier && mode) {
      access = *mode;
      advance();
    } else {
      diags_.report_error(access_tok.range, "expected register access mode")
        .with_code("E0100")
        .with_help("one of rw, ro, wo, w1c, w1s");
    }

    expect(TokenKind::At, "'@' before register field offset");
    Expr * offset = parse_expr();
    fields.push_back(ast_.create<RegisterField>(
      fname, type, access, offset, join_ranges(fstart.range, prev().range)));
    if (!match(TokenKind::Comma)) {
      break;
    }
  }
  expect(TokenKind::RBrace, "'}' to close register");

  return ast_.create<RegisterDecl>(
    name, base, ast_.copy_to_arena(fields), join_ranges(start.range, prev().range));
}

ScopeDecl * Parser::parse_scope_decl()
{
  const Token start = advance();  // scope
  const std::string_view name = expect_identifier("scope name");
  expect(TokenKind::LBrace, "'{' after scope name");

  std::vector<Decl *> members;
  while (!at(TokenKind::RBrace) && !at_eof()) {
    bool is_public = false;
    if (is_kw("public", cur())) {
      advance();
      is_public = true;
    } else if (is_kw("private", cur())) {
      advance();
    }
    if (cur().kind != TokenKind::Identifier) {
      error_at(cur(), "expected scope member declaration");
      advance();
      synchronize_to_stmt();
      continue;
    }
    if (Decl * d = parse_function_or_global(name, is_public)) {
      members.push_back(d);
    }
  }
  expect(TokenKind::RBrace, "'}' to close scope");

  return ast_.create<ScopeDecl>(
    name, ast_.copy_to_arena(members), join_ranges(start.range, prev().range));
}

// ============================================================================
// Functions and globals
// ============================================================================

Decl * Parser::parse_function_or_global(std::string_view scope_name, bool is_public)
{
  const Token start = cur();
  bool is_const = false;
  std::optional<OverflowMode> overflow;
  parse_var_modifiers(is_const, overflow);

  PrimaryType * type = parse_type();
  const Token name_tok = cur();
  const std::string_view name = expect_identifier("declaration name");
  if (name.empty()) {
    synchronize_skip_block();
    return nullptr;
  }

  const std::string flattened =
    scope_name.empty() ? std::string(name) : std::string(scope_name) + "_" + std::string(name);

  if (at(TokenKind::LParen)) {
    if (is_const) {
      error_at(start, "functions cannot be declared const");
    }
    if (overflow) {
      error_at(start, "'wrap' and 'clamp' apply to variables only");
    }
    FunctionDecl * fn = parse_function_rest(start, type, name_tok);
    fn->scopeName = scope_name;
    fn->isPublic = is_public;
    fn->cName = ast_.intern(flattened);
    return fn;
  }

  auto * var = ast_.create<GlobalVarDecl>(name, is_const, type, SourceRange{});
  var->overflow = overflow.value_or(OverflowMode::Clamp);
  var->dims = parse_array_dims();
  if (match(TokenKind::Assign)) {
    var->init = parse_expr();
  }
  var->scopeName = scope_name;
  var->isPublic = is_public;
  var->cName = ast_.intern(flattened);
  expect(TokenKind::Semicolon, "';' after variable declaration", RecoverySet::Statement);
  var->range_ = join_ranges(start.range, prev().range);
  return var;
}

FunctionDecl * Parser::parse_function_rest(
  const Token & start, PrimaryType * ret, const Token & name_tok)
{
  auto * fn = ast_.create<FunctionDecl>(ast_.intern(name_tok.text), ret, SourceRange{});

  expect(TokenKind::LParen, "'(' after function name");
  std::vector<ParamDecl *> params;
  if (!at(TokenKind::RParen)) {
    while (true) {
      if (ParamDecl * p = parse_param_decl()) {
        params.push_back(p);
      }
      if (!match(TokenKind::Comma)) {
        break;
      }
    }
  }
  expect(TokenKind::RParen, "')' after parameters", RecoverySet::Argument);
  fn->params = ast_.copy_to_arena(params);

  if (at(TokenKind::LBrace)) {
    fn->body = parse_block();
  } else {
    diags_.report_error(cur().range, "expected function body")
      .with_code("E0100")
      .with_help("C-Next has no prototypes; define the function before its first use");
    synchronize_to_stmt();
  }
  fn->range_ = join_ranges(start.range, prev().range);
  return fn;
}

ParamDecl * Parser::parse_param_decl()
{
  const Token start = cur();
  const bool is_const = is_kw("const", cur());
  if (is_const) {
    advance();
  }
  PrimaryType * type = parse_type();
  const std::string_view name = expect_identifier("parameter name");
  if (name.empty()) {
    return nullptr;
  }
  auto * p = ast_.create<ParamDecl>(name, is_const, type, SourceRange{});
  p->dims = parse_array_dims();
  p->range_ = join_ranges(start.range, prev().range);
  return p;
}

// ============================================================================
// Types
// ============================================================================

PrimaryType * Parser::parse_type()
{
  const Token start = cur();
  if (start.kind != TokenKind::Identifier) {
    error_at(start, "expected type name");
    return ast_.create<PrimaryType>("<error>", start.range);
  }
  advance();

  // string<N>
  if (start.text == "string" && at(TokenKind::Lt)) {
    advance();
    uint32_t capacity = 0;
    if (auto n = parse_const_int_token("string capacity")) {
      if (*n <= 0) {
        error_at(prev(), "string capacity must be positive", "E0101");
      } else {
        capacity = static_cast<uint32_t>(*n);
      }
    }
    expect(TokenKind::Gt, "'>' after string capacity");
    return ast_.create<PrimaryType>("string", capacity, join_ranges(start.range, prev().range));
  }

  // ns::Type
  std::string name(start.text);
  while (at(TokenKind::ColonColon) && cur(1).kind == TokenKind::Identifier) {
    advance();
    name += "::";
    name += advance().text;
  }
  return ast_.create<PrimaryType>(ast_.intern(name), join_ranges(start.range, prev().range));
}

gsl::span<Expr *> Parser::parse_array_dims()
{
  std::vector<Expr *> dims;
  while (match(TokenKind::LBracket)) {
    dims.push_back(parse_expr());
    expect(TokenKind::RBracket, "']' after array dimension");
  }
  return ast_.copy_to_arena(dims);
}

}  // namespace cnext::syntax
