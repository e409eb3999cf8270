// cnext/symbols/symbol_collector.cpp - Per-language header collection with caching

#include "cnext/symbols/symbol_collector.hpp"

#include <utility>

#include "cnext/ast/ast.hpp"
#include "cnext/cache/cache_manager.hpp"
#include "cnext/symbols/c_collector.hpp"
#include "cnext/symbols/cpp_collector.hpp"
#include "cnext/symbols/system_headers.hpp"

namespace cnext
{

SourceRange range_of_line(const SourceRegistry & sources, FileId file, uint32_t line)
{
  const SourceFile * sf = sources.get_file(file);
  if (sf == nullptr || line == 0) {
    return {};
  }
  const std::string_view text = sf->get_line(line - 1);
  if (text.data() == nullptr) {
    return {};
  }
  const auto start = static_cast<uint32_t>(text.data() - sf->content().data());
  return {file, start, start + static_cast<uint32_t>(text.size())};
}

void SymbolCollector::collect(const DependencyGraph & graph)
{
  for (const DependencyNode * node : graph.leaves_first_order()) {
    if (node->language == FileLanguage::CNext) {
      continue;
    }
    if (!done_.insert(node->key).second) {
      continue;
    }
    collect_node(*node);
  }
}

void SymbolCollector::collect_node(const DependencyNode & node)
{
  std::vector<Symbol> symbols;

  if (node.is_system()) {
    symbols = builtin_header_symbols(node.systemName);
    ++stats_.systemHeaders;
  } else {
    std::map<std::string, int64_t> stamps = dependency_stamps(node);
    const CacheEntry * cached = nullptr;
    if (node.fromCache && cache_ != nullptr) {
      cached = cache_->lookup(node.key, node.mtime);
      if (cached != nullptr && cached->dependencies != stamps) {
        cached = nullptr;
      }
    }
    if (cached != nullptr) {
      symbols = cached->symbols;
      ++stats_.headersFromCache;
    } else {
      const size_t errors_before = errors_;
      symbols = parse_header(node);
      ++stats_.headersParsed;
      if (cache_ != nullptr && errors_ == errors_before) {
        CacheEntry entry;
        entry.key = node.key;
        entry.language = node.language;
        entry.mtime = node.mtime;
        entry.includes = node.includes;
        entry.symbols = symbols;
        entry.dependencies = std::move(stamps);
        cache_->store(std::move(entry));
      }
    }
  }

  for (auto & sym : symbols) {
    const SourceRange range =
      node.is_system() ? SourceRange{} : line_range(node, sym.line);
    insert(std::move(sym), range);
  }
}

std::vector<Symbol> SymbolCollector::parse_header(const DependencyNode & node)
{
  const SourceFile * file = sources_.get_file(node.file_id);
  if (file == nullptr) {
    return {};
  }

  if (node.language == FileLanguage::Cpp) {
    CppHeaderCollector collector(*file, node.file_id, table_, diags_);
    auto out = collector.collect();
    errors_ += collector.error_count();
    return out;
  }
  CHeaderCollector collector(*file, node.file_id, table_, diags_);
  auto out = collector.collect();
  errors_ += collector.error_count();
  return out;
}

std::map<std::string, int64_t> SymbolCollector::dependency_stamps(const DependencyNode & node)
{
  std::map<std::string, int64_t> stamps;
  std::vector<const DependencyNode *> pending(node.children.begin(), node.children.end());
  while (!pending.empty()) {
    const DependencyNode * dep = pending.back();
    pending.pop_back();
    if (dep->is_system() || dep->key == node.key) {
      continue;
    }
    if (!stamps.emplace(dep->key, dep->mtime).second) {
      continue;
    }
    pending.insert(pending.end(), dep->children.begin(), dep->children.end());
  }
  return stamps;
}

SourceRange SymbolCollector::line_range(const DependencyNode & node, uint32_t line) const
{
  return range_of_line(sources_, node.file_id, line);
}

bool SymbolCollector::insert(Symbol sym, SourceRange range)
{
  const size_t before = table_.size();
  if (!insert_symbol(table_, diags_, std::move(sym), range)) {
    ++errors_;
    return false;
  }
  if (table_.size() > before) {
    ++stats_.symbolsInserted;
  }
  return true;
}

bool insert_symbol(SymbolTable & table, DiagnosticBag & diags, Symbol sym, SourceRange range)
{
  const std::string name = sym.name;
  const SourceLanguage lang = sym.language;
  const std::string origin = sym.originFile;

  const InsertResult result = table.insert(std::move(sym));
  if (result.ok()) {
    return true;
  }

  const Symbol & rival = *result.symbol;
  const bool cross_language = rival.language != lang;
  std::string message =
    cross_language
      ? "'" + name + "' (" + std::string(to_string(lang)) + ") conflicts with " +
          std::string(to_string(rival.kind())) + " '" + rival.name + "' declared in " +
          std::string(to_string(rival.language))
      : "'" + name + "' is defined more than once";

  auto diag = diags.report_error(range, std::move(message));
  diag.with_code(cross_language ? "E0301" : "E0302");
  if (rival.decl != nullptr) {
    diag.with_secondary_label(rival.decl->get_range(), "previous definition here");
  }
  std::string where = rival.originFile;
  if (rival.line > 0) {
    where += ":" + std::to_string(rival.line);
  }
  diag.with_help("the other declaration is in " + where);
  if (range.is_invalid()) {
    diag.with_file(origin);
  }
  return false;
}

}  // namespace cnext
