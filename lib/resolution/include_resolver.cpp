// cnext/resolution/include_resolver.cpp - Include resolution and graph building
#include "cnext/resolution/include_resolver.hpp"

#include <chrono>
#include <system_error>

#include "cnext/cache/cache_manager.hpp"
#include "cnext/symbols/system_headers.hpp"

namespace cnext
{

namespace fs = std::filesystem;

int64_t file_mtime(const fs::path & path)
{
  std::error_code ec;
  const auto t = fs::last_write_time(path, ec);
  if (ec) {
    return 0;
  }
  return std::chrono::duration_cast<std::chrono::nanoseconds>(t.time_since_epoch()).count();
}

DependencyNode * IncludeResolver::resolve(const fs::path & entry)
{
  DependencyNode * node = visit_file(entry);
  if (node != nullptr) {
    graph_.add_root(node);
  }
  return node;
}

DependencyNode * IncludeResolver::visit_system(std::string_view name)
{
  bool created = false;
  DependencyNode * node = graph_.get_or_add(DependencyGraph::system_key(name), &created);
  if (created) {
    node->language = FileLanguage::SystemHeader;
    node->systemName = std::string(name);
    node->path = fs::path(std::string(name));
  }
  return node;
}

DependencyNode * IncludeResolver::visit_file(const fs::path & path)
{
  bool created = false;
  DependencyNode * node = graph_.get_or_add(DependencyGraph::key_for(path), &created);
  if (!created) {
    // Already visited (or being visited further up an include cycle).
    return node;
  }

  node->path = fs::path(node->key);
  node->mtime = file_mtime(node->path);

  const auto file_id = sources_.load_file(node->path);
  if (!file_id) {
    diags_.report_error(SourceRange{}, "cannot read '" + path.string() + "'")
      .with_code("E0001")
      .with_file(path.string());
    return nullptr;
  }
  node->file_id = *file_id;
  ++files_loaded_;

  const std::string_view content = sources_.get_file(*file_id)->content();
  const CacheEntry * cached = nullptr;
  if (cache_ != nullptr && node->path.extension() != ".cnx") {
    cached = cache_->lookup(node->key, node->mtime);
  }
  if (cached != nullptr) {
    node->language = cached->language;
    node->includes = cached->includes;
    node->fromCache = true;
    ++cache_hits_;
  } else {
    node->language = detect_language(node->path, content);
    node->includes = scan_includes(content);
  }

  const fs::path including_dir = node->path.parent_path();
  const bool is_dsl = node->language == FileLanguage::CNext;

  for (const IncludeDirective & inc : node->includes) {
    if (is_dsl) {
      check_cnx_shadowing(*node, inc, including_dir);
    }

    if (inc.isSystem && is_builtin_system_header(inc.path)) {
      node->children.push_back(visit_system(inc.path));
      continue;
    }

    std::vector<fs::path> tried;
    const auto found = find_include(inc, including_dir, tried);
    if (!found) {
      if (inc.isSystem && !is_dsl) {
        // Toolchain headers reached from foreign code contribute nothing we model.
        node->children.push_back(visit_system(inc.path));
        continue;
      }
      std::string searched;
      for (const auto & t : tried) {
        if (!searched.empty()) searched += ", ";
        searched += t.generic_string();
      }
      const char open = inc.isSystem ? '<' : '"';
      const char close = inc.isSystem ? '>' : '"';
      auto diag = diags_.report_error(
        directive_range(*node, inc), std::string("cannot resolve include ") + open + inc.path + close,
        "not found");
      diag.with_code("E0503");
      diag.with_help(
        searched.empty() ? "no search paths are configured; add one with -I"
                         : "searched: " + searched);
      if (!node->file_id.is_valid()) {
        diag.with_file(node->path.string());
      }
      continue;
    }

    if (DependencyNode * child = visit_file(*found)) {
      node->children.push_back(child);
    }
  }

  return node;
}

std::optional<fs::path> IncludeResolver::find_include(
  const IncludeDirective & inc, const fs::path & including_dir, std::vector<fs::path> & tried) const
{
  std::error_code ec;
  auto try_path = [&](const fs::path & candidate) -> bool {
    tried.push_back(candidate);
    return fs::is_regular_file(candidate, ec);
  };

  if (!inc.isSystem) {
    const fs::path local = including_dir / inc.path;
    if (try_path(local)) return local;
  }
  for (const auto & dir : search_paths_) {
    const fs::path candidate = dir / inc.path;
    if (try_path(candidate)) return candidate;
  }
  return std::nullopt;
}

void IncludeResolver::check_cnx_shadowing(
  const DependencyNode & node, const IncludeDirective & inc, const fs::path & including_dir)
{
  const fs::path header(inc.path);
  if (header.extension() != ".h") {
    return;
  }
  fs::path source = header;
  source.replace_extension(".cnx");

  std::error_code ec;
  bool shadowed = false;
  if (!inc.isSystem) {
    shadowed = fs::is_regular_file(including_dir / source, ec);
  } else {
    for (const auto & dir : search_paths_) {
      if (fs::is_regular_file(dir / source, ec)) {
        shadowed = true;
        break;
      }
    }
  }
  if (!shadowed) {
    return;
  }

  const std::string replacement = inc.isSystem ? "#include <" + source.generic_string() + ">"
                                               : "#include \"" + source.generic_string() + "\"";
  const SourceRange range = directive_range(node, inc);
  diags_
    .report_error(
      range, "include of '" + inc.path + "' refers to the header generated from '" +
               source.generic_string() + "'",
      "generated header")
    .with_code("E0504")
    .with_fixit(range, replacement)
    .with_help("include the C-Next source directly: " + replacement);
}

SourceRange IncludeResolver::directive_range(
  const DependencyNode & node, const IncludeDirective & inc) const
{
  if (!node.file_id.is_valid()) {
    return {};
  }
  uint32_t end = inc.end;
  const SourceFile * file = sources_.get_file(node.file_id);
  if (file != nullptr) {
    const std::string_view text = file->content();
    while (end > inc.offset && end <= text.size() &&
           (text[end - 1] == '\n' || text[end - 1] == '\r')) {
      --end;
    }
  }
  return {node.file_id, inc.offset, end};
}

}  // namespace cnext
