// cnext/syntax/frontend.cpp - High-level parse pipeline
#include "cnext/syntax/frontend.hpp"

#include <utility>
#include <vector>

#include "cnext/syntax/lexer.hpp"
#include "cnext/syntax/parser.hpp"

namespace cnext
{

Program * parse_file(
  const SourceRegistry & sources, FileId file_id, AstContext & ast, DiagnosticBag & diags)
{
  const SourceFile * file = sources.get_file(file_id);
  if (file == nullptr) {
    return ast.create<Program>();
  }

  syntax::Lexer lexer(file_id, file->content());
  syntax::Parser parser(ast, file_id, *file, diags, lexer.lex_all());
  Program * program = parser.parse_program();

  std::vector<Comment> comments;
  comments.reserve(lexer.comments().size());
  for (const Comment & c : lexer.comments()) {
    comments.push_back({c.range, ast.intern(c.text)});
  }
  program->comments = ast.copy_to_arena(comments);
  return program;
}

ParseOutput parse_source(
  SourceRegistry & sources, const std::filesystem::path & path, std::string source_text,
  AstContext & ast, DiagnosticBag & diags)
{
  ParseOutput out;
  if (auto existing = sources.find_by_path(path)) {
    sources.update_content(*existing, std::move(source_text));
    out.file_id = *existing;
  } else {
    out.file_id = sources.register_file(path, std::move(source_text));
  }
  out.program = parse_file(sources, out.file_id, ast, diags);
  return out;
}

}  // namespace cnext
