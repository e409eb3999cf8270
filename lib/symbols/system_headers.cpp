#include "cnext/symbols/system_headers.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <optional>
#include <string>

namespace cnext
{

namespace
{

struct MacroEntry
{
  std::string_view name;
  std::string_view value;
  /// Empty for macros that are not integer constants
  std::string_view type = "int";
};

struct HeaderTable
{
  std::string_view name;
  /// Prototypes in C spelling, e.g. "FILE* fopen(const char*, const char*)"
  std::vector<std::string_view> functions;
  /// Typedef name and the C spelling it aliases
  std::vector<std::pair<std::string_view, std::string_view>> typedefs;
  /// Object-like macros, their replacement text and its C type
  std::vector<MacroEntry> macros;
};

const std::vector<HeaderTable> & header_tables()
{
  static const std::vector<HeaderTable> k_tables = {
    {"stdint.h",
     {},
     {{"uint8_t", "unsigned char"},
      {"uint16_t", "unsigned short"},
      {"uint32_t", "unsigned int"},
      {"uint64_t", "unsigned long"},
      {"int8_t", "signed char"},
      {"int16_t", "short"},
      {"int32_t", "int"},
      {"int64_t", "long"},
      {"uintptr_t", "unsigned long"},
      {"intptr_t", "long"}},
     {{"INT8_MIN", "(-128)"},
      {"INT8_MAX", "127"},
      {"UINT8_MAX", "255"},
      {"INT16_MIN", "(-32767-1)"},
      {"INT16_MAX", "32767"},
      {"UINT16_MAX", "65535"},
      {"INT32_MIN", "(-2147483647-1)"},
      {"INT32_MAX", "2147483647"},
      {"UINT32_MAX", "4294967295U", "unsigned int"},
      {"INT64_MIN", "(-9223372036854775807L-1)", "long"},
      {"INT64_MAX", "9223372036854775807L", "long"},
      {"UINT64_MAX", "18446744073709551615UL", "unsigned long"}}},
    {"stdbool.h", {}, {}, {{"true", "1"}, {"false", "0"}}},
    {"stddef.h",
     {},
     {{"size_t", "unsigned long"}, {"ptrdiff_t", "long"}},
     {{"NULL", "((void*)0)", ""}}},
    {"stdio.h",
     {"FILE* fopen(const char*, const char*)",
      "FILE* freopen(const char*, const char*, FILE*)",
      "FILE* tmpfile(void)",
      "int fclose(FILE*)",
      "int fflush(FILE*)",
      "char* fgets(char*, int, FILE*)",
      "int fputs(const char*, FILE*)",
      "int fgetc(FILE*)",
      "int fputc(int, FILE*)",
      "char* gets(char*)",
      "int puts(const char*)",
      "int putchar(int)",
      "int getchar(void)",
      "int printf(const char*, ...)",
      "int fprintf(FILE*, const char*, ...)",
      "int sprintf(char*, const char*, ...)",
      "int snprintf(char*, size_t, const char*, ...)",
      "size_t fread(void*, size_t, size_t, FILE*)",
      "size_t fwrite(const void*, size_t, size_t, FILE*)",
      "int feof(FILE*)",
      "int remove(const char*)"},
     {{"size_t", "unsigned long"}},
     {{"NULL", "((void*)0)", ""}, {"EOF", "(-1)"}}},
    {"string.h",
     {"size_t strlen(const char*)",
      "char* strncpy(char*, const char*, size_t)",
      "char* strncat(char*, const char*, size_t)",
      "int strcmp(const char*, const char*)",
      "int strncmp(const char*, const char*, size_t)",
      "char* strstr(const char*, const char*)",
      "char* strchr(const char*, int)",
      "char* strrchr(const char*, int)",
      "void* memchr(const void*, int, size_t)",
      "void* memcpy(void*, const void*, size_t)",
      "void* memmove(void*, const void*, size_t)",
      "void* memset(void*, int, size_t)",
      "int memcmp(const void*, const void*, size_t)"},
     {{"size_t", "unsigned long"}},
     {{"NULL", "((void*)0)", ""}}},
    {"stdlib.h",
     {"void* malloc(size_t)",
      "void* calloc(size_t, size_t)",
      "void* realloc(void*, size_t)",
      "void free(void*)",
      "char* getenv(const char*)",
      "int abs(int)",
      "long labs(long)",
      "int atoi(const char*)",
      "long strtol(const char*, char**, int)",
      "void exit(int)",
      "void abort(void)"},
     {{"size_t", "unsigned long"}},
     {{"NULL", "((void*)0)", ""}, {"EXIT_SUCCESS", "0"}, {"EXIT_FAILURE", "1"}}},
    {"math.h",
     {"double sqrt(double)", "double fabs(double)", "double sin(double)", "double cos(double)",
      "double tan(double)", "double pow(double, double)", "double floor(double)",
      "double ceil(double)", "double fmod(double, double)", "float sqrtf(float)",
      "float fabsf(float)"},
     {},
     {}},
    {"ctype.h",
     {"int isdigit(int)", "int isalpha(int)", "int isalnum(int)", "int isspace(int)",
      "int isupper(int)", "int islower(int)", "int toupper(int)", "int tolower(int)"},
     {},
     {}},
    {"limits.h",
     {},
     {},
     {{"CHAR_BIT", "8"},
      {"SCHAR_MIN", "(-128)"},
      {"SCHAR_MAX", "127"},
      {"UCHAR_MAX", "255"},
      {"SHRT_MIN", "(-32768)"},
      {"SHRT_MAX", "32767"},
      {"USHRT_MAX", "65535"},
      {"INT_MIN", "(-2147483647-1)"},
      {"INT_MAX", "2147483647"},
      {"UINT_MAX", "4294967295U", "unsigned int"}}},
    {"assert.h", {"void assert(int)"}, {}, {}},
    {"errno.h", {}, {}, {{"EINVAL", "22"}, {"ERANGE", "34"}}},
  };
  return k_tables;
}

const HeaderTable * find_table(std::string_view name)
{
  const auto & tables = header_tables();
  auto it = std::find_if(
    tables.begin(), tables.end(), [&](const HeaderTable & t) { return t.name == name; });
  return it == tables.end() ? nullptr : &*it;
}

std::string_view trim(std::string_view s)
{
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

/**
 * Folds the replacement text of a limits macro: decimal literals with
 * optional U/L suffixes, parentheses, unary minus, binary + and -.
 * Values outside int64_t do not fold.
 */
class MacroFolder
{
public:
  explicit MacroFolder(std::string_view text) : text_(text) {}

  std::optional<int64_t> fold()
  {
    auto v = sum();
    skip_space();
    if (!v || pos_ != text_.size()) return std::nullopt;
    return v;
  }

private:
  std::optional<int64_t> sum()
  {
    auto lhs = operand();
    while (lhs) {
      skip_space();
      const char op = peek();
      if (op != '+' && op != '-') break;
      ++pos_;
      const auto rhs = operand();
      if (!rhs) return std::nullopt;
      lhs = op == '+' ? add(*lhs, *rhs) : add(*lhs, -*rhs);
    }
    return lhs;
  }

  std::optional<int64_t> operand()
  {
    skip_space();
    if (peek() == '(') {
      ++pos_;
      auto v = sum();
      skip_space();
      if (!v || peek() != ')') return std::nullopt;
      ++pos_;
      return v;
    }
    if (peek() == '-') {
      ++pos_;
      auto v = operand();
      if (!v || *v == std::numeric_limits<int64_t>::min()) return std::nullopt;
      return -*v;
    }
    uint64_t value = 0;
    const size_t start = pos_;
    while (std::isdigit(static_cast<unsigned char>(peek()))) {
      const auto digit = static_cast<uint64_t>(peek() - '0');
      if (value > (static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) - digit) / 10) {
        return std::nullopt;
      }
      value = value * 10 + digit;
      ++pos_;
    }
    if (pos_ == start) return std::nullopt;
    while (peek() == 'u' || peek() == 'U' || peek() == 'l' || peek() == 'L') ++pos_;
    return static_cast<int64_t>(value);
  }

  static std::optional<int64_t> add(int64_t a, int64_t b)
  {
    if ((b > 0 && a > std::numeric_limits<int64_t>::max() - b) ||
        (b < 0 && a < std::numeric_limits<int64_t>::min() - b)) {
      return std::nullopt;
    }
    return a + b;
  }

  void skip_space()
  {
    while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) ++pos_;
  }
  [[nodiscard]] char peek() const { return pos_ < text_.size() ? text_[pos_] : '\0'; }

  std::string_view text_;
  size_t pos_ = 0;
};

Symbol make_function(std::string_view proto, std::string_view origin)
{
  const size_t lparen = proto.find('(');
  const size_t rparen = proto.rfind(')');
  std::string_view head = trim(proto.substr(0, lparen));
  size_t name_start = head.size();
  while (name_start > 0 && (std::isalnum(static_cast<unsigned char>(head[name_start - 1])) ||
                            head[name_start - 1] == '_')) {
    --name_start;
  }

  Symbol sym;
  sym.name = std::string(head.substr(name_start));
  sym.language = SourceLanguage::C;
  sym.originFile = std::string(origin);

  FunctionInfo fn;
  fn.returnType = builtin_c_type(head.substr(0, name_start));
  std::string_view params = proto.substr(lparen + 1, rparen - lparen - 1);
  while (!params.empty()) {
    const size_t comma = params.find(',');
    const std::string_view p = trim(params.substr(0, comma));
    params = comma == std::string_view::npos ? std::string_view{} : params.substr(comma + 1);
    if (p == "...") {
      fn.isVariadic = true;
    } else if (p != "void" && !p.empty()) {
      ParamInfo param;
      param.type = builtin_c_type(p);
      param.writesThroughPointer =
        p.find('*') != std::string_view::npos && p.rfind("const", 0) != 0;
      fn.params.push_back(std::move(param));
    }
  }
  sym.type = fn.returnType;
  sym.details = std::move(fn);
  return sym;
}

}  // namespace

TypeInfo builtin_c_type(std::string_view spelling)
{
  std::string_view s = trim(spelling);
  size_t stars = 0;
  while (!s.empty() && s.back() == '*') {
    ++stars;
    s = trim(s.substr(0, s.size() - 1));
  }
  bool is_const = false;
  if (s.rfind("const ", 0) == 0) {
    is_const = true;
    s = trim(s.substr(6));
  }

  if (stars == 1 && s == "char") {
    TypeInfo t = make_named_type(TypeKind::CString, "char");
    t.bitWidth = 8;
    t.isSigned = true;
    t.isConst = is_const;
    return t;
  }

  TypeInfo t;
  if (auto scalar = c_scalar_type(s)) {
    t = *scalar;
  } else if (s == "size_t" || s == "ptrdiff_t") {
    t = *c_scalar_type(s);
  } else {
    t = make_named_type(TypeKind::Opaque, std::string(s));
  }
  if (stars > 0) {
    // Deeper indirection is opaque to the analyses.
    if (stars > 1) {
      t = make_named_type(TypeKind::Opaque, std::string(s) + std::string(stars - 1, '*'));
    }
    t.isPointer = true;
    t.isConst = is_const;
  }
  return t;
}

bool is_builtin_system_header(std::string_view name) noexcept
{
  return find_table(name) != nullptr;
}

std::vector<Symbol> builtin_header_symbols(std::string_view name)
{
  std::vector<Symbol> out;
  const HeaderTable * table = find_table(name);
  if (table == nullptr) return out;

  const std::string origin = "<" + std::string(name) + ">";

  for (const auto & [td_name, aliased] : table->typedefs) {
    Symbol sym;
    sym.name = std::string(td_name);
    sym.language = SourceLanguage::C;
    sym.originFile = origin;
    TypedefInfo info;
    info.aliased = builtin_c_type(aliased);
    info.aliased.baseType = sym.name;
    sym.type = info.aliased;
    sym.details = std::move(info);
    out.push_back(std::move(sym));
  }

  // FILE is an opaque handle only ever used through a pointer.
  if (name == "stdio.h") {
    Symbol file;
    file.name = "FILE";
    file.language = SourceLanguage::C;
    file.originFile = origin;
    TypedefInfo info;
    info.aliased = make_named_type(TypeKind::Opaque, "FILE");
    file.type = info.aliased;
    file.details = std::move(info);
    out.push_back(std::move(file));
  }

  for (const MacroEntry & macro : table->macros) {
    Symbol sym;
    sym.name = std::string(macro.name);
    sym.language = SourceLanguage::C;
    sym.originFile = origin;
    MacroInfo info;
    info.value = std::string(macro.value);
    info.intValue = MacroFolder(macro.value).fold();
    const auto scalar = c_scalar_type(macro.type);
    sym.type = scalar ? *scalar : make_named_type(TypeKind::Opaque, "");
    sym.details = std::move(info);
    out.push_back(std::move(sym));
  }

  for (const std::string_view proto : table->functions) {
    out.push_back(make_function(proto, origin));
  }
  return out;
}

}  // namespace cnext
