// cnext/syntax/frontend.hpp - High-level parse pipeline entry point
#pragma once

#include <filesystem>
#include <string>

#include "cnext/ast/ast.hpp"
#include "cnext/ast/ast_context.hpp"
#include "cnext/basic/diagnostic.hpp"
#include "cnext/basic/source_manager.hpp"

namespace cnext
{

struct ParseOutput
{
  FileId file_id = FileId::invalid();
  Program * program = nullptr;
};

// Parse pipeline:
// source -> lexer (token stream) -> recursive-descent parser (AST) -> diagnostics
[[nodiscard]] ParseOutput parse_source(
  SourceRegistry & sources, const std::filesystem::path & path, std::string source_text,
  AstContext & ast, DiagnosticBag & diags);

/// Parses a file already registered in `sources`.
[[nodiscard]] Program * parse_file(
  const SourceRegistry & sources, FileId file_id, AstContext & ast, DiagnosticBag & diags);

}  // namespace cnext
