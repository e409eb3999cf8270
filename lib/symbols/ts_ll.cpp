// cnext/symbols/ts_ll.cpp - Low-level Tree-sitter wrapper implementation
#include "cnext/symbols/ts_ll.hpp"

namespace cnext::ts_ll
{

Parser::Parser(const TSLanguage * language)
{
  parser_ = ts_parser_new();
  // A grammar built for another ABI version is refused here; callers check
  // is_ready() and report it instead of parsing.
  ready_ = parser_ != nullptr && language != nullptr && ts_parser_set_language(parser_, language);
}

Parser::~Parser()
{
  if (parser_) ts_parser_delete(parser_);
  parser_ = nullptr;
}

TSTree * Parser::parse_string(std::string_view source) const
{
  if (!ready_) return nullptr;
  // Tree-sitter consumes bytes; headers are read as UTF-8.
  return ts_parser_parse_string(
    parser_, /*old_tree*/ nullptr, source.data(), static_cast<uint32_t>(source.size()));
}

}  // namespace cnext::ts_ll
