// cnext/resolution/dependency_graph.hpp - Include dependency graph
//
// Nodes are keyed by canonical absolute path (or `<name>` for built-in
// system headers), so every file appears once no matter how many
// includes reach it. Cycles are allowed.
//
#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "cnext/basic/source_manager.hpp"
#include "cnext/resolution/directive_scanner.hpp"
#include "cnext/resolution/language.hpp"

namespace cnext
{

struct DependencyNode
{
  /// Graph key: canonical absolute path, or `<stdio.h>` for system headers
  std::string key;
  std::filesystem::path path;
  FileLanguage language = FileLanguage::C;

  /// Content handle in the SourceRegistry (invalid for system headers)
  FileId file_id = FileId::invalid();
  /// Header name as written, for system headers (e.g. "stdint.h")
  std::string systemName;

  /// Modification time in nanoseconds since the file clock epoch
  int64_t mtime = 0;
  /// Include list and language came from a fresh cache entry
  bool fromCache = false;

  std::vector<IncludeDirective> includes;
  std::vector<DependencyNode *> children;

  [[nodiscard]] bool is_system() const noexcept { return language == FileLanguage::SystemHeader; }
};

class DependencyGraph
{
public:
  DependencyGraph() = default;

  DependencyGraph(const DependencyGraph &) = delete;
  DependencyGraph & operator=(const DependencyGraph &) = delete;
  DependencyGraph(DependencyGraph &&) = default;
  DependencyGraph & operator=(DependencyGraph &&) = default;

  /// Returns the existing node for `key`, or creates one.
  DependencyNode * get_or_add(const std::string & key, bool * created = nullptr);

  [[nodiscard]] DependencyNode * find(std::string_view key) const;

  void add_root(DependencyNode * node);
  [[nodiscard]] const std::vector<DependencyNode *> & roots() const noexcept { return roots_; }

  /**
   * Depth-first post-order over all roots: every node comes after the
   * nodes it includes (cycle edges excepted) and appears exactly once.
   */
  [[nodiscard]] std::vector<DependencyNode *> leaves_first_order() const;

  [[nodiscard]] std::vector<DependencyNode *> nodes() const;
  [[nodiscard]] size_t size() const noexcept { return nodes_.size(); }

  /// Canonical key for a filesystem path.
  [[nodiscard]] static std::string key_for(const std::filesystem::path & path);
  [[nodiscard]] static std::string system_key(std::string_view name);

private:
  std::vector<std::unique_ptr<DependencyNode>> nodes_;
  std::map<std::string, DependencyNode *, std::less<>> by_key_;
  std::vector<DependencyNode *> roots_;
};

}  // namespace cnext
