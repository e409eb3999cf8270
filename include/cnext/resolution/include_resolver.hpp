// cnext/resolution/include_resolver.hpp - Include resolution and graph building
//
// Resolves `#include` directives of C-Next sources and the foreign headers
// they reach into a DependencyGraph.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "cnext/basic/diagnostic.hpp"
#include "cnext/basic/source_manager.hpp"
#include "cnext/resolution/dependency_graph.hpp"

namespace cnext
{

class CacheManager;

/**
 * Builds the dependency graph.
 *
 * - Quoted includes search the including file's directory, then the
 *   search paths; angle includes use the built-in system header list,
 *   then the search paths.
 * - Each canonical path becomes one node; the visited set is the graph
 *   itself, so include cycles terminate and shared headers are loaded once.
 * - An unresolvable include is E0503 and names every location tried.
 * - In C-Next files, a `.h` include with a `.cnx` sibling of the same stem
 *   is E0504.
 *
 * A fresh CacheManager entry supplies a header's language and include list
 * so the header is not rescanned.
 */
class IncludeResolver
{
public:
  IncludeResolver(
    SourceRegistry & sources, DependencyGraph & graph, DiagnosticBag & diags,
    std::vector<std::filesystem::path> search_paths, const CacheManager * cache = nullptr)
  : sources_(sources),
    graph_(graph),
    diags_(diags),
    search_paths_(std::move(search_paths)),
    cache_(cache)
  {
  }

  /**
   * Resolve `entry` (a C-Next source) and everything it includes.
   *
   * @return The entry node, or nullptr when the entry cannot be read (E0001)
   */
  DependencyNode * resolve(const std::filesystem::path & entry);

  [[nodiscard]] size_t cache_hits() const noexcept { return cache_hits_; }
  [[nodiscard]] size_t files_loaded() const noexcept { return files_loaded_; }

private:
  DependencyNode * visit_file(const std::filesystem::path & path);
  DependencyNode * visit_system(std::string_view name);

  [[nodiscard]] std::optional<std::filesystem::path> find_include(
    const IncludeDirective & inc, const std::filesystem::path & including_dir,
    std::vector<std::filesystem::path> & tried) const;

  void check_cnx_shadowing(
    const DependencyNode & node, const IncludeDirective & inc,
    const std::filesystem::path & including_dir);

  [[nodiscard]] SourceRange directive_range(
    const DependencyNode & node, const IncludeDirective & inc) const;

  SourceRegistry & sources_;
  DependencyGraph & graph_;
  DiagnosticBag & diags_;
  std::vector<std::filesystem::path> search_paths_;
  const CacheManager * cache_;

  size_t cache_hits_ = 0;
  size_t files_loaded_ = 0;
};

/// File modification time as nanoseconds since the file clock epoch, or 0.
[[nodiscard]] int64_t file_mtime(const std::filesystem::path & path);

}  // namespace cnext
