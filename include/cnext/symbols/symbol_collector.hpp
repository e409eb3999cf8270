// cnext/symbols/symbol_collector.hpp - Foreign symbol collection over the graph
#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "cnext/basic/diagnostic.hpp"
#include "cnext/basic/source_manager.hpp"
#include "cnext/resolution/dependency_graph.hpp"
#include "cnext/symbols/symbol_table.hpp"

namespace cnext
{

class CacheManager;

struct CollectStats
{
  size_t headersParsed = 0;
  size_t headersFromCache = 0;
  size_t systemHeaders = 0;
  size_t symbolsInserted = 0;
};

/**
 * Fills the SymbolTable from every non-C-Next node of a dependency graph.
 *
 * Nodes are processed leaves first so a header's typedefs and macros are
 * known before the headers that include it are read. System headers
 * contribute their built-in tables; C and C++ headers run the matching
 * collector, or reuse the cached symbols when neither the header nor any
 * header it includes changed since the entry was written.
 *
 * A header that fails to parse does not stop its siblings; the caller
 * aborts after collection when has_errors() is set.
 */
class SymbolCollector
{
public:
  SymbolCollector(
    const SourceRegistry & sources, SymbolTable & table, DiagnosticBag & diags,
    CacheManager * cache = nullptr)
  : sources_(sources), table_(table), diags_(diags), cache_(cache)
  {
  }

  /// Processes every node of `graph` not processed by an earlier call.
  void collect(const DependencyGraph & graph);

  [[nodiscard]] bool has_errors() const noexcept { return errors_ > 0; }
  [[nodiscard]] const CollectStats & stats() const noexcept { return stats_; }

  /// insert_symbol() plus error and statistics bookkeeping.
  bool insert(Symbol sym, SourceRange range);

private:
  void collect_node(const DependencyNode & node);
  [[nodiscard]] std::vector<Symbol> parse_header(const DependencyNode & node);
  [[nodiscard]] SourceRange line_range(const DependencyNode & node, uint32_t line) const;
  /// Key and mtime of each non-system header reachable from `node`.
  [[nodiscard]] static std::map<std::string, int64_t> dependency_stamps(
    const DependencyNode & node);

  const SourceRegistry & sources_;
  SymbolTable & table_;
  DiagnosticBag & diags_;
  CacheManager * cache_;

  std::set<std::string, std::less<>> done_;
  CollectStats stats_;
  size_t errors_ = 0;
};

/**
 * Inserts `sym` into `table` and reports a rejected insertion as E0301
 * (different languages) or E0302 (same language). Returns false on conflict.
 */
bool insert_symbol(SymbolTable & table, DiagnosticBag & diags, Symbol sym, SourceRange range);

/// Range covering line `line` (1-based) of `file`, or an empty range.
[[nodiscard]] SourceRange range_of_line(const SourceRegistry & sources, FileId file, uint32_t line);

}  // namespace cnext
