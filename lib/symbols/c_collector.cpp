// cnext/symbols/c_collector.cpp - Declaration extractor for C headers
#include "cnext/symbols/c_collector.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <utility>

#include "cnext/symbols/system_headers.hpp"

namespace cnext
{

namespace
{

/// Canonical spelling for a multiset of builtin type words ("long unsigned" -> "unsigned long").
std::string canonical_builtin(const std::vector<std::string_view> & words)
{
  bool is_unsigned = false;
  bool is_signed = false;
  bool is_short = false;
  int longs = 0;
  std::string_view base;
  for (const auto w : words) {
    if (w == "unsigned") {
      is_unsigned = true;
    } else if (w == "signed") {
      is_signed = true;
    } else if (w == "short") {
      is_short = true;
    } else if (w == "long") {
      ++longs;
    } else {
      base = w;
    }
  }
  std::string out;
  auto add = [&](std::string_view part) {
    if (!out.empty()) out += ' ';
    out += part;
  };
  if (is_unsigned) add("unsigned");
  if (is_signed) add("signed");
  if (is_short) add("short");
  for (int i = 0; i < longs; ++i) add("long");
  if (!base.empty() && !(base == "int" && (is_short || longs > 0 || is_unsigned || is_signed))) {
    add(base);
  }
  return out;
}

std::optional<int64_t> parse_number(std::string_view literal)
{
  std::string digits;
  for (const char c : literal) {
    if (c != '\'') digits += c;
  }
  std::string_view text = digits;
  while (!text.empty() && (text.back() == 'u' || text.back() == 'U' || text.back() == 'l' ||
                           text.back() == 'L')) {
    text.remove_suffix(1);
  }
  int base = 10;
  if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
    base = 16;
    text.remove_prefix(2);
  } else if (text.size() > 2 && text[0] == '0' && (text[1] == 'b' || text[1] == 'B')) {
    base = 2;
    text.remove_prefix(2);
  } else if (text.size() > 1 && text[0] == '0') {
    base = 8;
    text.remove_prefix(1);
  }
  if (text.empty()) return std::nullopt;
  uint64_t value = 0;
  for (const char c : text) {
    int digit = 0;
    if (std::isdigit(static_cast<unsigned char>(c))) {
      digit = c - '0';
    } else if (std::isxdigit(static_cast<unsigned char>(c))) {
      digit = std::tolower(static_cast<unsigned char>(c)) - 'a' + 10;
    } else {
      return std::nullopt;
    }
    if (digit >= base) return std::nullopt;
    value = value * static_cast<uint64_t>(base) + static_cast<uint64_t>(digit);
  }
  return static_cast<int64_t>(value);
}

std::optional<int64_t> parse_char(std::string_view literal)
{
  if (literal.size() < 3 || literal.front() != '\'' || literal.back() != '\'') {
    return std::nullopt;
  }
  const std::string_view body = literal.substr(1, literal.size() - 2);
  if (body.size() == 1) {
    return static_cast<int64_t>(static_cast<unsigned char>(body[0]));
  }
  if (body.size() == 2 && body[0] == '\\') {
    switch (body[1]) {
      case 'n':
        return 10;
      case 't':
        return 9;
      case 'r':
        return 13;
      case '0':
        return 0;
      case '\\':
        return '\\';
      case '\'':
        return '\'';
      default:
        break;
    }
  }
  return std::nullopt;
}

/// Replacement list of `#define NAME ...` with continuations joined and comments removed.
std::string macro_replacement(std::string_view raw)
{
  std::string out;
  char quote = 0;
  for (size_t i = 0; i < raw.size(); ++i) {
    const char c = raw[i];
    if (quote != 0) {
      out += c;
      if (c == '\\' && i + 1 < raw.size()) {
        out += raw[++i];
      } else if (c == quote) {
        quote = 0;
      }
      continue;
    }
    if (c == '"' || c == '\'') {
      quote = c;
      out += c;
      continue;
    }
    if (c == '\\' && i + 1 < raw.size() && (raw[i + 1] == '\n' || raw[i + 1] == '\r')) {
      out += ' ';
      continue;
    }
    if (c == '/' && i + 1 < raw.size() && raw[i + 1] == '/') {
      break;
    }
    if (c == '/' && i + 1 < raw.size() && raw[i + 1] == '*') {
      const size_t close = raw.find("*/", i + 2);
      if (close == std::string_view::npos) break;
      i = close + 1;
      out += ' ';
      continue;
    }
    out += (c == '\n' || c == '\r' || c == '\t') ? ' ' : c;
  }
  const size_t first = out.find_first_not_of(' ');
  if (first == std::string::npos) return {};
  const size_t last = out.find_last_not_of(' ');
  return out.substr(first, last - first + 1);
}

bool is_conditional_group(std::string_view kind)
{
  return kind == "preproc_if" || kind == "preproc_ifdef" || kind == "preproc_else" ||
         kind == "preproc_elif" || kind == "preproc_elifdef";
}

bool is_name_kind(std::string_view kind)
{
  return kind == "identifier" || kind == "field_identifier" || kind == "type_identifier" ||
         kind == "primitive_type" || kind == "qualified_identifier" ||
         kind == "destructor_name" || kind == "operator_name" || kind == "template_function";
}

bool is_pointer_kind(std::string_view kind)
{
  return kind == "pointer_declarator" || kind == "abstract_pointer_declarator" ||
         kind == "pointer_type_declarator";
}

bool is_parenthesized_kind(std::string_view kind)
{
  return kind == "parenthesized_declarator" || kind == "abstract_parenthesized_declarator" ||
         kind == "parenthesized_type_declarator";
}

ts_ll::Node last_named_child(ts_ll::Node n)
{
  const uint32_t count = n.named_child_count();
  return count == 0 ? ts_ll::Node() : n.named_child(count - 1);
}

/// Innermost name of a declarator, through pointers, arrays and parentheses.
ts_ll::Node find_declared_name(ts_ll::Node n)
{
  while (!n.is_null() && !is_name_kind(n.kind())) {
    const ts_ll::Node inner = n.child_by_field("declarator");
    n = inner.is_null() ? last_named_child(n) : inner;
  }
  return n;
}

//------------------------------------------------------------------------------
// Language groups
//------------------------------------------------------------------------------

enum class GroupRole : uint8_t {
  Other,
  CppOnly,
  COnly,
};

GroupRole classify_condition(std::string_view directive, std::string_view condition)
{
  condition = condition.substr(0, std::min(condition.find("//"), condition.find("/*")));
  std::string cond;
  for (const char c : condition) {
    if (!std::isspace(static_cast<unsigned char>(c))) cond += c;
  }
  if (directive == "ifdef") return cond == "__cplusplus" ? GroupRole::CppOnly : GroupRole::Other;
  if (directive == "ifndef") return cond == "__cplusplus" ? GroupRole::COnly : GroupRole::Other;
  if (cond == "__cplusplus" || cond == "defined(__cplusplus)" || cond == "defined__cplusplus") {
    return GroupRole::CppOnly;
  }
  if (cond == "!__cplusplus" || cond == "!defined(__cplusplus)" || cond == "!defined__cplusplus") {
    return GroupRole::COnly;
  }
  return GroupRole::Other;
}

/// Blanks the `#if __cplusplus` groups a compiler of the other language would
/// not see, along with the directives of every such group. Byte offsets and
/// line breaks are preserved.
std::string mask_language_groups(std::string_view text, bool cplusplus)
{
  std::string out(text);
  std::vector<GroupRole> frames;
  auto inactive = [&] {
    return std::any_of(frames.begin(), frames.end(), [&](GroupRole r) {
      return (r == GroupRole::CppOnly && !cplusplus) || (r == GroupRole::COnly && cplusplus);
    });
  };

  size_t pos = 0;
  while (pos < out.size()) {
    size_t eol = out.find('\n', pos);
    if (eol == std::string::npos) eol = out.size();
    const std::string_view line = std::string_view(out).substr(pos, eol - pos);

    bool blank = inactive();
    const size_t hash = line.find_first_not_of(" \t");
    if (hash != std::string_view::npos && line[hash] == '#') {
      std::string_view rest = line.substr(hash + 1);
      rest.remove_prefix(std::min(rest.find_first_not_of(" \t"), rest.size()));
      size_t n = 0;
      while (n < rest.size() && std::isalpha(static_cast<unsigned char>(rest[n]))) ++n;
      const std::string_view word = rest.substr(0, n);

      if (word == "if" || word == "ifdef" || word == "ifndef") {
        frames.push_back(classify_condition(word, rest.substr(n)));
        blank = blank || frames.back() != GroupRole::Other;
      } else if ((word == "else" || word == "elif") && !frames.empty() &&
                 frames.back() != GroupRole::Other) {
        frames.back() =
          frames.back() == GroupRole::CppOnly ? GroupRole::COnly : GroupRole::CppOnly;
        blank = true;
      } else if (word == "endif" && !frames.empty()) {
        blank = blank || frames.back() != GroupRole::Other;
        frames.pop_back();
      }
    }

    if (blank) {
      std::fill(out.begin() + static_cast<std::ptrdiff_t>(pos),
                out.begin() + static_cast<std::ptrdiff_t>(eol), ' ');
    }
    pos = eol + 1;
  }
  return out;
}

}  // namespace

// ============================================================================
// Helpers
// ============================================================================

CHeaderCollector::CHeaderCollector(
  const SourceFile & file, FileId file_id, const SymbolTable & known, DiagnosticBag & diags)
: file_(file), file_id_(file_id), known_(known), diags_(diags)
{
}

std::string CHeaderCollector::compact(std::string_view text)
{
  std::string out;
  for (const char c : text) {
    if (!std::isspace(static_cast<unsigned char>(c))) out += c;
  }
  if (out.rfind("::", 0) == 0) out.erase(0, 2);
  return out;
}

uint32_t CHeaderCollector::line_of(ts_ll::Node n) const noexcept
{
  return file_.get_line_column(n.start_byte()).line;
}

void CHeaderCollector::error(ts_ll::Node at, std::string message)
{
  const uint32_t begin = at.start_byte();
  const uint32_t end = std::max(at.end_byte(), begin + 1);
  diags_.report_error(SourceRange{file_id_, begin, end}, std::move(message))
    .with_code("E0201")
    .with_help("declarations the collector cannot read are skipped; C-Next code cannot use them");
  ++errors_;
}

void CHeaderCollector::report_syntax_errors(ts_ll::Node n)
{
  if (n.is_error()) {
    std::string_view snippet = text(n);
    snippet = snippet.substr(0, std::min<size_t>(snippet.find('\n'), 40));
    error(n, snippet.empty() ? std::string("cannot read this declaration")
                             : fmt::format("cannot read '{}'", snippet));
    return;
  }
  if (n.is_missing()) {
    error(n, fmt::format("expected '{}'", n.kind()));
    return;
  }
  // Function bodies are never read, so their contents are not reported either.
  if (!n.has_error() || n.kind() == "compound_statement") return;
  for (uint32_t i = 0; i < n.child_count(); ++i) {
    report_syntax_errors(n.child(i));
  }
}

std::string CHeaderCollector::qualify(std::string_view name) const
{
  std::string out;
  for (const auto & ns : namespaces_) {
    if (!ns.empty()) {
      out += ns;
      out += "::";
    }
  }
  out += name;
  return out;
}

std::string CHeaderCollector::tag_spelling(std::string_view keyword, std::string_view name) const
{
  return std::string(keyword) + " " + std::string(name);
}

Symbol CHeaderCollector::make_symbol(std::string name, uint32_t line) const
{
  Symbol s;
  s.name = std::move(name);
  s.language = language();
  s.originFile = file_.path().generic_string();
  s.line = line;
  return s;
}

void CHeaderCollector::emit(Symbol sym)
{
  if (const auto * st = sym.as<StructInfo>()) {
    if (st->isComplete || local_structs_.find(sym.name) == local_structs_.end()) {
      local_structs_[sym.name] = *st;
    }
  }
  if (const auto * en = sym.as<EnumInfo>()) {
    for (const auto & m : en->members) {
      local_constants_[m.name] = m.value;
    }
  }
  if (sym.kind() == SymbolKind::Struct || sym.kind() == SymbolKind::Enum ||
      sym.kind() == SymbolKind::Typedef) {
    local_types_[sym.name] = sym.type;
  }
  out_.push_back(std::move(sym));
}

// ============================================================================
// Driver
// ============================================================================

std::vector<Symbol> CHeaderCollector::collect()
{
  source_ = mask_language_groups(file_.content(), language() == SourceLanguage::Cpp);
  parser_ = std::make_unique<ts_ll::Parser>(grammar());

  ts_ll::Tree tree(parser_->parse_string(source_));
  if (tree.is_null()) {
    diags_.report_error(SourceRange{file_id_, 0, 0}, "cannot parse this header")
      .with_code("E0201")
      .with_help("the tree-sitter grammar libraries do not match the tree-sitter runtime");
    ++errors_;
    return {};
  }

  const ts_ll::Node root = tree.root_node();
  report_syntax_errors(root);
  read_items(root);
  return std::move(out_);
}

void CHeaderCollector::read_items(ts_ll::Node container)
{
  ts_ll::for_each_child(container, [this](ts_ll::Node child, std::string_view /*field*/) {
    if (child.is_named()) read_item(child);
  });
}

void CHeaderCollector::read_item(ts_ll::Node item)
{
  const std::string_view kind = item.kind();
  if (kind == "preproc_def") {
    read_macro(item);
  } else if (is_conditional_group(kind)) {
    // Both branches are read.
    ts_ll::for_each_child(item, [this](ts_ll::Node child, std::string_view field) {
      if (child.is_named() && field != "condition" && field != "name") read_item(child);
    });
  } else if (kind == "declaration") {
    read_declaration(item);
  } else if (kind == "type_definition") {
    read_type_definition(item);
  } else if (kind == "function_definition") {
    read_function_definition(item);
  } else if (kind == "struct_specifier" || kind == "union_specifier" ||
             kind == "enum_specifier" || kind == "class_specifier") {
    read_bare_specifier(item);
  } else if (kind == "linkage_specification") {
    const ts_ll::Node body = item.child_by_field("body");
    if (body.kind() == "declaration_list") {
      read_items(body);
    } else {
      read_item(body);
    }
  } else if (kind == "declaration_list" || item.is_error()) {
    // Declarations inside a syntax error are still collected.
    read_items(item);
  } else {
    read_extension(item);
  }
}

void CHeaderCollector::read_macro(ts_ll::Node def)
{
  const ts_ll::Node name = def.child_by_field("name");
  if (name.is_null()) return;

  const ts_ll::Node value_node = def.child_by_field("value");
  const std::string value = value_node.is_null() ? std::string() : macro_replacement(text(value_node));

  Symbol sym = make_symbol(std::string(text(name)), line_of(def));
  MacroInfo info;
  info.value = value;
  info.intValue = value.empty() ? std::nullopt : eval_int(value);
  if (info.intValue) {
    local_constants_[sym.name] = *info.intValue;
    sym.type = *c_scalar_type("int");
  } else {
    sym.type = make_named_type(TypeKind::Opaque, "");
  }
  sym.details = std::move(info);
  emit(std::move(sym));
}

// ============================================================================
// Declarations
// ============================================================================

void CHeaderCollector::read_declaration(ts_ll::Node decl)
{
  auto spec = read_base_spec(decl);
  if (!spec) {
    // Constructors and conversion operators have no declared type.
    if (!decl.child_by_field("type").is_null()) {
      error(decl, "cannot read the type of this declaration");
    }
    return;
  }

  std::vector<ts_ll::Node> declarators;
  ts_ll::for_each_child(decl, [&](ts_ll::Node child, std::string_view field) {
    if (field == "declarator") declarators.push_back(child);
  });
  if (spec->hasBody || declarators.empty()) {
    emit_tag_definition(*spec);
  }
  adopt_anonymous_record(*spec);

  for (const ts_ll::Node node : declarators) {
    Declarator d = read_declarator(node);
    if (d.name.empty()) continue;
    if (d.isFunction) {
      emit_function(*spec, std::move(d), false);
      continue;
    }
    Symbol sym = make_symbol(qualify(d.name), d.line);
    sym.type = apply_declarator(*spec, d);
    VariableInfo var;
    var.isExtern = spec->isExtern;
    sym.details = var;
    emit(std::move(sym));
  }
}

void CHeaderCollector::read_type_definition(ts_ll::Node def)
{
  auto spec = read_base_spec(def);
  if (!spec) {
    error(def, "cannot read the type of this typedef");
    return;
  }
  spec->isTypedef = true;
  if (spec->hasBody) {
    emit_tag_definition(*spec);
  }
  ts_ll::for_each_child(def, [&](ts_ll::Node child, std::string_view field) {
    if (field != "declarator") return;
    const Declarator d = read_declarator(child);
    if (!d.name.empty()) emit_typedef(*spec, d);
  });
}

void CHeaderCollector::read_function_definition(ts_ll::Node def)
{
  auto spec = read_base_spec(def);
  if (!spec) {
    // Out-of-line constructors and destructors.
    return;
  }
  Declarator d = read_declarator(def.child_by_field("declarator"));
  if (!d.isFunction || d.name.empty()) return;
  emit_function(*spec, std::move(d), true);
}

void CHeaderCollector::read_bare_specifier(ts_ll::Node spec)
{
  BaseSpec base;
  if (!read_type_specifier(spec, base)) return;
  emit_tag_definition(base);
}

void CHeaderCollector::emit_tag_definition(const BaseSpec & spec)
{
  if (!spec.tagDef) return;
  if (!spec.tagDef->name.empty()) {
    emit(*spec.tagDef);
    return;
  }
  if (const auto * en = spec.tagDef->as<EnumInfo>(); en && !spec.isTypedef) {
    // Anonymous enum: members are plain integer constants.
    for (const auto & m : en->members) {
      Symbol c = make_symbol(m.name, spec.tagDef->line);
      MacroInfo mi;
      mi.value = std::to_string(m.value);
      mi.intValue = m.value;
      c.type = *c_scalar_type("int");
      c.details = std::move(mi);
      emit(std::move(c));
    }
  }
}

void CHeaderCollector::adopt_anonymous_record(BaseSpec & spec)
{
  if (!spec.tagDef || !spec.hasBody || !spec.tagDef->name.empty() ||
      spec.tagDef->kind() != SymbolKind::Struct) {
    return;
  }
  const LineColumn at = file_.get_line_column(spec.tagOffset);
  const std::string name = fmt::format(
    "(anonymous {} at {}:{}:{})", spec.tagKeyword, file_.path().generic_string(), at.line,
    at.column);
  spec.tagDef->name = name;
  spec.tagDef->type.baseType = name;
  spec.tagName = name;
  spec.type.baseType = name;
  emit(*spec.tagDef);
}

void CHeaderCollector::emit_function(const BaseSpec & spec, Declarator decl, bool is_definition)
{
  Symbol sym = make_symbol(qualify(decl.name), decl.line);
  FunctionInfo fn;
  Declarator ret = decl;
  ret.dims.clear();
  fn.returnType = apply_declarator(spec, ret);
  fn.params = std::move(decl.params);
  fn.isVariadic = decl.isVariadic;
  fn.isDefinition = is_definition;
  sym.type = fn.returnType;
  sym.details = std::move(fn);
  emit(std::move(sym));
}

void CHeaderCollector::emit_typedef(const BaseSpec & base, const Declarator & decl)
{
  const std::string name = qualify(decl.name);
  Symbol sym = make_symbol(name, decl.line);
  const TypeInfo aliased = apply_declarator(base, decl);

  const bool plain = decl.pointerDepth == 0 && !decl.isReference && decl.dims.empty() &&
                     !decl.isFunction && !decl.isFunctionPointer;

  if (plain && (aliased.kind == TypeKind::Struct || aliased.kind == TypeKind::Enum)) {
    // `typedef struct X {...} X;` renames the tag's spelling in place.
    for (auto it = out_.rbegin(); it != out_.rend(); ++it) {
      if (it->name == name && it->kind() != SymbolKind::Macro && it->kind() != SymbolKind::Function) {
        it->type.baseType = name;
        local_types_[name] = it->type;
        return;
      }
    }

    sym.type = aliased;
    sym.type.baseType = name;
    sym.type.isConst = false;
    if (aliased.kind == TypeKind::Struct) {
      StructInfo info;
      info.isComplete = false;
      if (base.tagDef && base.tagDef->as<StructInfo>()) {
        info = *base.tagDef->as<StructInfo>();
      } else if (auto it = local_structs_.find(base.tagName); it != local_structs_.end()) {
        info = it->second;
      } else if (const Symbol * s = known_.lookup_kind(base.tagName, SymbolKind::Struct)) {
        info = *s->as<StructInfo>();
      }
      sym.details = std::move(info);
    } else {
      EnumInfo info;
      if (base.tagDef && base.tagDef->as<EnumInfo>()) {
        info = *base.tagDef->as<EnumInfo>();
      } else if (const Symbol * s = known_.lookup_kind(base.tagName, SymbolKind::Enum)) {
        info = *s->as<EnumInfo>();
      }
      sym.details = std::move(info);
    }
    emit(std::move(sym));
    return;
  }

  TypedefInfo info;
  info.aliased = aliased;
  if (plain && aliased.kind != TypeKind::CString) {
    sym.type = aliased;
    sym.type.baseType = name;
    sym.type.isConst = false;
  } else if (aliased.kind == TypeKind::CString && plain) {
    sym.type = aliased;
  } else {
    // Pointer, array and function typedefs are handles C-Next passes through untouched.
    sym.type = make_named_type(TypeKind::Opaque, name);
  }
  sym.details = std::move(info);
  emit(std::move(sym));
}

// ============================================================================
// Specifiers
// ============================================================================

std::optional<CHeaderCollector::BaseSpec> CHeaderCollector::read_base_spec(ts_ll::Node owner)
{
  BaseSpec spec;
  ts_ll::for_each_child(owner, [&](ts_ll::Node child, std::string_view /*field*/) {
    const std::string_view kind = child.kind();
    if (kind == "storage_class_specifier") {
      spec.isExtern = spec.isExtern || text(child) == "extern";
      spec.isStatic = spec.isStatic || text(child) == "static";
    } else if (kind == "type_qualifier" && text(child) == "const") {
      spec.isConst = true;
    }
  });

  const ts_ll::Node type = owner.child_by_field("type");
  if (type.is_null() || !read_type_specifier(type, spec)) {
    return std::nullopt;
  }
  return spec;
}

bool CHeaderCollector::read_type_specifier(ts_ll::Node type, BaseSpec & spec)
{
  const std::string_view kind = type.kind();

  if (kind == "struct_specifier" || kind == "union_specifier" || kind == "class_specifier") {
    const std::string_view keyword =
      kind == "union_specifier" ? "union" : (kind == "class_specifier" ? "class" : "struct");
    bool has_body = false;
    auto tag = read_record(type, keyword, has_body);
    if (!tag) return false;
    spec.tagName = tag->name;
    spec.type = tag->type;
    spec.hasBody = has_body;
    spec.tagOffset = type.start_byte();
    spec.tagKeyword = keyword == "union" ? "union" : "struct";
    spec.tagDef = std::move(tag);
    return true;
  }

  if (kind == "enum_specifier") {
    bool has_body = false;
    auto tag = read_enum(type, has_body);
    if (!tag) return false;
    spec.tagName = tag->name;
    spec.type = tag->type;
    spec.hasBody = has_body;
    spec.tagOffset = type.start_byte();
    spec.tagKeyword = "enum";
    spec.tagDef = std::move(tag);
    return true;
  }

  if (kind == "sized_type_specifier") {
    std::vector<std::string_view> words;
    ts_ll::for_each_child(type, [&](ts_ll::Node child, std::string_view /*field*/) {
      words.push_back(text(child));
    });
    const std::string spelling = canonical_builtin(words);
    auto scalar = c_scalar_type(spelling);
    if (!scalar) {
      scalar = c_scalar_type(spelling + " int");
    }
    if (!scalar) {
      error(type, fmt::format("unknown integer type '{}'", spelling));
      return false;
    }
    spec.type = *scalar;
    return true;
  }

  if (kind == "template_type") {
    // Template arguments of a C++ type name.
    spec.type = lookup_type_name(compact(text(type.child_by_field("name"))));
    return true;
  }

  if (kind == "primitive_type" || kind == "type_identifier" || kind == "qualified_identifier") {
    spec.type = lookup_type_name(compact(text(type)));
    return true;
  }

  // auto, decltype(...) and macro-spelled types stay opaque.
  spec.type = builtin_c_type(compact(text(type)));
  return true;
}

std::optional<Symbol> CHeaderCollector::read_record(
  ts_ll::Node spec, std::string_view keyword, bool & has_body)
{
  const ts_ll::Node name = spec.child_by_field("name");
  const ts_ll::Node body = spec.child_by_field("body");
  const std::string tag = name.is_null() ? std::string() : qualify(compact(text(name)));
  const std::string_view spelled_keyword = keyword == "class" ? "struct" : keyword;

  Symbol sym = make_symbol(tag, line_of(name.is_null() ? spec : name));
  StructInfo info;
  if (!body.is_null()) {
    has_body = true;
    bool public_access = keyword != "class";
    read_record_body(body, keyword, info, public_access);
    info.isComplete = true;
    sym.type = make_named_type(
      TypeKind::Struct, tag.empty() ? std::string() : tag_spelling(spelled_keyword, tag));
  } else {
    if (tag.empty()) {
      error(spec, "expected a struct name or body");
      return std::nullopt;
    }
    info.isComplete = false;
    // A reference to an already known struct keeps that struct's spelling.
    if (auto it = local_types_.find(tag); it != local_types_.end() && it->second.kind == TypeKind::Struct) {
      sym.type = it->second;
    } else if (const Symbol * s = known_.lookup_kind(tag, SymbolKind::Struct)) {
      sym.type = s->type;
    } else {
      sym.type = make_named_type(TypeKind::Struct, tag_spelling(spelled_keyword, tag));
    }
  }
  sym.details = std::move(info);
  return sym;
}

void CHeaderCollector::read_record_body(
  ts_ll::Node body, std::string_view keyword, StructInfo & info, bool & public_access)
{
  ts_ll::for_each_child(body, [&](ts_ll::Node member, std::string_view field) {
    if (!member.is_named() || field == "condition" || field == "name") return;
    const std::string_view kind = member.kind();
    if (kind == "field_declaration") {
      read_field(member, info, public_access);
    } else if (is_conditional_group(kind)) {
      read_record_body(member, keyword, info, public_access);
    } else if (kind == "preproc_def") {
      read_macro(member);
    } else {
      read_member_extension(member, public_access);
    }
  });
}

void CHeaderCollector::read_field(ts_ll::Node field, StructInfo & info, bool public_access)
{
  auto spec = read_base_spec(field);
  if (!spec) {
    // Constructors and destructors declare no type.
    if (!field.child_by_field("type").is_null()) {
      error(field, "cannot read the type of this field");
    }
    return;
  }
  if (spec->tagDef && spec->hasBody && !spec->tagDef->name.empty()) {
    emit(*spec->tagDef);
  }

  bool has_declarator = false;
  ts_ll::for_each_child(field, [&](ts_ll::Node /*child*/, std::string_view name) {
    has_declarator = has_declarator || name == "declarator";
  });
  if (!has_declarator) {
    // Anonymous struct/union member: its fields belong to the enclosing record.
    if (spec->tagDef && spec->tagDef->name.empty()) {
      if (const auto * inner = spec->tagDef->as<StructInfo>()) {
        info.fields.insert(info.fields.end(), inner->fields.begin(), inner->fields.end());
      }
    }
    return;
  }
  adopt_anonymous_record(*spec);

  std::optional<size_t> last;
  ts_ll::for_each_child(field, [&](ts_ll::Node child, std::string_view name) {
    if (name == "declarator") {
      last.reset();
      const Declarator d = read_declarator(child);
      // Member functions and static members are not part of the layout.
      if (d.isFunction || d.name.empty() || !public_access || spec->isStatic) return;
      info.fields.push_back(FieldInfo{d.name, apply_declarator(*spec, d)});
      last = info.fields.size() - 1;
    } else if (child.kind() == "bitfield_clause" && last) {
      const auto width = eval_expr(child.named_child(0), source_);
      if (width && *width > 0) {
        info.fields[*last].type.bitWidth = static_cast<uint32_t>(*width);
      }
    }
  });
}

std::optional<Symbol> CHeaderCollector::read_enum(ts_ll::Node spec, bool & has_body)
{
  bool scoped = false;
  ts_ll::for_each_child(spec, [&](ts_ll::Node child, std::string_view /*field*/) {
    scoped = scoped || (!child.is_named() && (child.kind() == "class" || child.kind() == "struct"));
  });

  const ts_ll::Node name = spec.child_by_field("name");
  const std::string tag = name.is_null() ? std::string() : qualify(compact(text(name)));
  TypeInfo type = make_named_type(
    TypeKind::Enum, tag.empty() ? std::string() : (scoped ? tag : tag_spelling("enum", tag)));

  ts_ll::Node base = spec.child_by_field("base");
  if (base.is_null()) base = spec.child_by_field("underlying_type");
  if (!base.is_null()) {
    BaseSpec underlying;
    if (!read_type_specifier(base, underlying)) {
      error(base, "cannot read the underlying type of this enum");
      return std::nullopt;
    }
    type.bitWidth = underlying.type.bitWidth;
    type.isSigned = underlying.type.isSigned;
  }

  Symbol sym = make_symbol(tag, line_of(name.is_null() ? spec : name));
  EnumInfo info;
  const ts_ll::Node body = spec.child_by_field("body");
  if (!body.is_null()) {
    has_body = true;
    int64_t next = 0;
    read_enum_body(body, info, next);
  } else if (tag.empty()) {
    error(spec, "expected an enum name or body");
    return std::nullopt;
  } else if (auto it = local_types_.find(tag); it != local_types_.end()) {
    type = it->second;
  } else if (const Symbol * s = known_.lookup_kind(tag, SymbolKind::Enum)) {
    type = s->type;
    info = *s->as<EnumInfo>();
  }
  sym.type = type;
  sym.details = std::move(info);
  return sym;
}

void CHeaderCollector::read_enum_body(ts_ll::Node body, EnumInfo & info, int64_t & next)
{
  ts_ll::for_each_child(body, [&](ts_ll::Node child, std::string_view field) {
    if (field == "condition" || field == "name") return;
    if (child.kind() == "enumerator") {
      EnumeratorInfo e;
      e.name = std::string(text(child.child_by_field("name")));
      const ts_ll::Node value = child.child_by_field("value");
      if (!value.is_null()) {
        next = eval_expr(value, source_).value_or(next);
      }
      e.value = next++;
      local_constants_[e.name] = e.value;
      info.members.push_back(std::move(e));
    } else if (is_conditional_group(child.kind())) {
      read_enum_body(child, info, next);
    }
  });
}

// ============================================================================
// Declarators
// ============================================================================

CHeaderCollector::Declarator CHeaderCollector::read_declarator(ts_ll::Node n)
{
  Declarator d;
  d.line = line_of(n);

  while (!n.is_null()) {
    const std::string_view kind = n.kind();
    if (is_pointer_kind(kind)) {
      ++d.pointerDepth;
      n = n.child_by_field("declarator");
    } else if (kind == "reference_declarator" || kind == "abstract_reference_declarator") {
      d.isReference = true;
      n = n.named_child_count() > 0 ? n.named_child(0) : ts_ll::Node();
    } else if (
      kind == "array_declarator" || kind == "abstract_array_declarator" ||
      kind == "array_type_declarator") {
      uint32_t dim = 0;
      if (const auto v = eval_expr(n.child_by_field("size"), source_); v && *v >= 0) {
        dim = static_cast<uint32_t>(*v);
      }
      // The outermost array node carries the last dimension.
      d.dims.insert(d.dims.begin(), dim);
      n = n.child_by_field("declarator");
    } else if (
      kind == "function_declarator" || kind == "abstract_function_declarator" ||
      kind == "function_type_declarator") {
      const ts_ll::Node inner = n.child_by_field("declarator");
      if (is_parenthesized_kind(inner.kind()) && is_pointer_kind(last_named_child(inner).kind())) {
        // `(*name)(...)`
        d.isFunctionPointer = true;
        n = find_declared_name(inner);
        break;
      }
      d.isFunction = true;
      read_params(n.child_by_field("parameters"), d);
      n = inner;
    } else if (is_parenthesized_kind(kind)) {
      const ts_ll::Node inner = last_named_child(n);
      if (is_pointer_kind(inner.kind())) {
        // `(*name)[N]` and friends are handled like function pointers.
        d.isFunctionPointer = true;
        n = find_declared_name(inner);
        break;
      }
      n = inner;
    } else if (kind == "init_declarator") {
      n = n.child_by_field("declarator");
    } else if (kind == "attributed_declarator") {
      n = n.named_child(0);
    } else {
      break;
    }
  }

  if (!n.is_null() && is_name_kind(n.kind())) {
    d.name = compact(text(n));
    d.line = line_of(n);
  }
  return d;
}

void CHeaderCollector::read_params(ts_ll::Node list, Declarator & decl)
{
  ts_ll::for_each_child(list, [&](ts_ll::Node param, std::string_view /*field*/) {
    const std::string_view kind = param.kind();
    if (kind == "..." || kind == "variadic_parameter") {
      decl.isVariadic = true;
      return;
    }
    if (kind != "parameter_declaration" && kind != "optional_parameter_declaration") return;

    auto spec = read_base_spec(param);
    if (!spec) {
      spec.emplace();
      spec->type = builtin_c_type(compact(text(param.child_by_field("type"))));
    }
    const ts_ll::Node declarator = param.child_by_field("declarator");
    if (declarator.is_null() && spec->type.kind == TypeKind::Void) {
      // `(void)`
      return;
    }

    const Declarator pd = declarator.is_null() ? Declarator{} : read_declarator(declarator);
    ParamInfo p;
    p.name = pd.name;
    p.type = apply_declarator(*spec, pd);
    p.writesThroughPointer =
      (pd.pointerDepth > 0 || pd.isReference || !pd.dims.empty()) && !spec->isConst;
    decl.params.push_back(std::move(p));
  });
}

// ============================================================================
// Types and constants
// ============================================================================

TypeInfo CHeaderCollector::lookup_type_name(const std::string & name) const
{
  // Innermost enclosing namespace first.
  std::vector<std::string> candidates;
  std::string prefix;
  for (const auto & ns : namespaces_) {
    if (!ns.empty()) {
      prefix += ns + "::";
      candidates.insert(candidates.begin(), prefix + name);
    }
  }
  candidates.push_back(name);

  for (const auto & c : candidates) {
    if (auto it = local_types_.find(c); it != local_types_.end()) {
      return it->second;
    }
    if (const Symbol * s = known_.lookup_type(c)) {
      return s->type;
    }
  }
  if (auto scalar = c_scalar_type(name)) {
    return *scalar;
  }
  return builtin_c_type(name);
}

TypeInfo CHeaderCollector::apply_declarator(const BaseSpec & base, const Declarator & decl)
{
  TypeInfo t = base.type;
  t.isConst = base.isConst;

  if (decl.isFunctionPointer || (decl.isFunction && base.isTypedef)) {
    TypeInfo fp = make_named_type(TypeKind::Opaque, "void");
    fp.isPointer = true;
    return fp;
  }

  const int depth = decl.pointerDepth + (decl.isReference ? 1 : 0);
  if (depth == 1 && t.kind == TypeKind::Integer && t.baseType == "char") {
    TypeInfo s = make_named_type(TypeKind::CString, "char");
    s.bitWidth = 8;
    s.isSigned = true;
    s.isConst = base.isConst;
    t = s;
  } else if (depth == 1) {
    t.isPointer = true;
  } else if (depth > 1) {
    t = make_named_type(TypeKind::Opaque, base.type.baseType + std::string(depth - 1, '*'));
    t.isPointer = true;
    t.isConst = base.isConst;
  }

  t.arrayDims = decl.dims;
  t.isArray = !t.arrayDims.empty();
  return t;
}

std::optional<int64_t> CHeaderCollector::lookup_constant(std::string_view name) const
{
  if (auto it = local_constants_.find(name); it != local_constants_.end()) {
    return it->second;
  }
  if (const Symbol * s = known_.lookup_kind(name, SymbolKind::Macro)) {
    return s->as<MacroInfo>()->intValue;
  }
  if (const Symbol * owner = known_.find_enumerator_owner(name)) {
    if (const auto * m = owner->as<EnumInfo>()->find_member(name)) {
      return m->value;
    }
  }
  // `Mode::Fast` names the enumerator `Fast`.
  if (const size_t sep = name.rfind("::"); sep != std::string_view::npos) {
    return lookup_constant(name.substr(sep + 2));
  }
  return std::nullopt;
}

std::optional<int64_t> CHeaderCollector::eval_expr(ts_ll::Node e, std::string_view source) const
{
  const std::string_view kind = e.kind();
  if (kind == "number_literal") {
    return parse_number(e.text(source));
  }
  if (kind == "char_literal") {
    return parse_char(e.text(source));
  }
  if (kind == "true" || kind == "false") {
    return kind == "true" ? 1 : 0;
  }
  if (kind == "identifier" || kind == "qualified_identifier") {
    return lookup_constant(compact(e.text(source)));
  }
  if (kind == "parenthesized_expression") {
    return eval_expr(last_named_child(e), source);
  }
  if (kind == "cast_expression") {
    return eval_expr(e.child_by_field("value"), source);
  }

  if (kind == "unary_expression") {
    const auto v = eval_expr(e.child_by_field("argument"), source);
    if (!v) return std::nullopt;
    const std::string_view op = e.child_by_field("operator").kind();
    if (op == "-") return static_cast<int64_t>(0U - static_cast<uint64_t>(*v));
    if (op == "~") return ~*v;
    if (op == "+") return *v;
    if (op == "!") return *v == 0 ? 1 : 0;
    return std::nullopt;
  }

  if (kind == "binary_expression") {
    const auto lhs = eval_expr(e.child_by_field("left"), source);
    const auto rhs = eval_expr(e.child_by_field("right"), source);
    if (!lhs || !rhs) return std::nullopt;
    const auto a = static_cast<uint64_t>(*lhs);
    const auto b = static_cast<uint64_t>(*rhs);
    const std::string_view op = e.child_by_field("operator").kind();
    if (op == "|") return static_cast<int64_t>(a | b);
    if (op == "&") return static_cast<int64_t>(a & b);
    if (op == "^") return static_cast<int64_t>(a ^ b);
    if (op == "+") return static_cast<int64_t>(a + b);
    if (op == "-") return static_cast<int64_t>(a - b);
    if (op == "*") return static_cast<int64_t>(a * b);
    if (op == "/" || op == "%") {
      if (*rhs == 0) return std::nullopt;
      return op == "/" ? *lhs / *rhs : *lhs % *rhs;
    }
    if (op == "<<" || op == ">>") {
      if (*rhs < 0 || *rhs > 63) return std::nullopt;
      return op == "<<" ? static_cast<int64_t>(a << b) : *lhs >> *rhs;
    }
    return std::nullopt;
  }
  return std::nullopt;
}

std::optional<int64_t> CHeaderCollector::eval_int(std::string_view text) const
{
  if (!parser_) return std::nullopt;
  const std::string snippet = "int cnext_macro_value = (" + std::string(text) + ");\n";
  ts_ll::Tree tree(parser_->parse_string(snippet));
  const ts_ll::Node root = tree.root_node();
  if (root.is_null() || root.has_error()) return std::nullopt;

  const ts_ll::Node decl = root.named_child_count() > 0 ? root.named_child(0) : ts_ll::Node();
  if (decl.kind() != "declaration") return std::nullopt;
  const ts_ll::Node init = decl.child_by_field("declarator");
  if (init.kind() != "init_declarator") return std::nullopt;
  return eval_expr(init.child_by_field("value"), snippet);
}

}  // namespace cnext
