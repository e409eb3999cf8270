// cnext/driver/compiler.cpp - Compiler driver implementation
//
#include "cnext/driver/compiler.hpp"

#include <fmt/format.h>

#include <fstream>
#include <set>
#include <vector>

#include "cnext/cache/cache_manager.hpp"
#include "cnext/codegen/c_generator.hpp"
#include "cnext/codegen/header_generator.hpp"
#include "cnext/driver/source_discovery.hpp"
#include "cnext/resolution/dependency_graph.hpp"
#include "cnext/resolution/include_resolver.hpp"
#include "cnext/sema/analysis/bit_access_checker.hpp"
#include "cnext/sema/analysis/const_checker.hpp"
#include "cnext/sema/analysis/division_checker.hpp"
#include "cnext/sema/analysis/init_checker.hpp"
#include "cnext/sema/analysis/literal_checker.hpp"
#include "cnext/sema/analysis/null_checker.hpp"
#include "cnext/sema/analysis/register_checker.hpp"
#include "cnext/sema/analysis/switch_checker.hpp"
#include "cnext/sema/resolution/name_resolver.hpp"
#include "cnext/sema/types/type_checker.hpp"
#include "cnext/symbols/symbol_collector.hpp"
#include "cnext/syntax/frontend.hpp"

namespace cnext
{

namespace
{

namespace fs = std::filesystem;

/// Every C-Next file reachable from `root` through includes, itself included.
void collect_visible(
  const DependencyNode * node, std::set<std::string, std::less<>> & out,
  std::set<const DependencyNode *> & seen)
{
  if (!seen.insert(node).second) {
    return;
  }
  if (node->language == FileLanguage::CNext) {
    out.insert(node->path.generic_string());
  }
  for (const DependencyNode * child : node->children) {
    collect_visible(child, out, seen);
  }
}

/// Errors reported in `root` or any file it includes, directly or not.
size_t closure_error_count(const DependencyNode * root, const DiagnosticBag & diags)
{
  size_t count = 0;
  std::set<const DependencyNode *> seen;
  std::vector<const DependencyNode *> pending{root};
  while (!pending.empty()) {
    const DependencyNode * node = pending.back();
    pending.pop_back();
    if (!seen.insert(node).second) {
      continue;
    }
    if (node->file_id.is_valid()) {
      count += diags.error_count_in(node->file_id);
    }
    pending.insert(pending.end(), node->children.begin(), node->children.end());
  }
  return count;
}

bool write_text_file(const fs::path & path, const std::string & text, DiagnosticBag & diags)
{
  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
      diags.report_error(
             SourceRange{},
             fmt::format("cannot create directory {}: {}", path.parent_path().string(), ec.message()))
        .with_code("E0002")
        .with_file(path.string());
      return false;
    }
  }

  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    diags.report_error(SourceRange{}, "failed to open output file: " + path.string())
      .with_code("E0002")
      .with_file(path.string());
    return false;
  }
  out << text;
  out.close();
  if (!out) {
    diags.report_error(SourceRange{}, "failed to write output file: " + path.string())
      .with_code("E0002")
      .with_file(path.string());
    return false;
  }
  return true;
}

fs::path input_directory(const fs::path & input)
{
  std::error_code ec;
  const fs::path abs = fs::absolute(input, ec);
  return fs::is_directory(abs, ec) ? abs : abs.parent_path();
}

}  // namespace

bool Compiler::configure(
  const fs::path & input, const CompileOptions & options, Settings & settings,
  std::optional<fs::path> & config_file, DiagnosticBag & diags)
{
  ProjectConfig config;
  config.project_root = input_directory(input);

  config_file = options.config_file ? options.config_file : find_project_config(input);
  if (config_file) {
    const ConfigLoadResult loaded = load_project_config(*config_file);
    if (!loaded.success) {
      diags.report_error(SourceRange{}, loaded.error)
        .with_code("E0003")
        .with_file(config_file->string());
      return false;
    }
    config = loaded.config;
  }

  settings.include_paths = config.resolved_include_paths();
  for (const auto & p : options.include_paths) {
    settings.include_paths.push_back(fs::absolute(p));
  }

  if (!config.compiler.output_dir.empty()) {
    settings.output_dir = config.project_root / config.compiler.output_dir;
  }
  if (options.output) {
    const fs::path out = fs::absolute(*options.output);
    if (out.extension() == ".c") {
      settings.output_file = out;
    } else {
      settings.output_dir = out;
    }
  }

  settings.cache_dir = options.cache_dir ? fs::absolute(*options.cache_dir)
                                         : config.project_root / config.compiler.cache_dir;
  settings.use_cache = options.use_cache && config.compiler.cache;
  return true;
}

fs::path Compiler::output_path_for(const fs::path & source, const Settings & settings)
{
  fs::path c_name = source.filename();
  c_name.replace_extension(".c");
  if (settings.output_file) {
    if (settings.output_file->stem() == source.stem()) {
      return *settings.output_file;
    }
    return settings.output_file->parent_path() / c_name;
  }
  if (!settings.output_dir.empty()) {
    return settings.output_dir / c_name;
  }
  return source.parent_path() / c_name;
}

CompileResult Compiler::compile(const fs::path & input, const CompileOptions & options)
{
  CompileResult result;
  DiagnosticBag & diags = result.diagnostics;

  Settings settings;
  if (!configure(input, options, settings, result.config_file, diags)) {
    return result;
  }

  result.inputs = discover_sources(input, diags);
  result.stats.sourcesDiscovered = result.inputs.size();
  if (result.inputs.empty()) {
    return result;
  }
  if (settings.output_file && result.inputs.size() > 1) {
    diags.report_error(SourceRange{}, "-o names a .c file but the input has several sources")
      .with_code("E0002")
      .with_file(settings.output_file->string())
      .with_help("pass a directory to -o instead");
    return result;
  }

  std::unique_ptr<CacheManager> cache;
  if (settings.use_cache) {
    cache = std::make_unique<CacheManager>(
      settings.cache_dir, CacheManager::fingerprint_for(settings.include_paths));
    // A missing or corrupt cache file just means a cold run.
    (void)cache->load();
  }

  // 1. Dependency resolution
  DependencyGraph graph;
  IncludeResolver resolver(result.sources, graph, diags, settings.include_paths, cache.get());
  for (const auto & source : result.inputs) {
    (void)resolver.resolve(source);
  }
  result.stats.filesLoaded = resolver.files_loaded();

  // 2. Foreign symbol collection
  SymbolTable table;
  SymbolCollector collector(result.sources, table, diags, cache.get());
  collector.collect(graph);
  result.stats.headersParsed = collector.stats().headersParsed;
  result.stats.headersFromCache = collector.stats().headersFromCache;
  result.stats.systemHeaders = collector.stats().systemHeaders;
  result.stats.symbolsInserted = collector.stats().symbolsInserted;

  // Errors without a file (unreadable inputs, symbol conflicts in system
  // headers) stop every module; the others only stop modules that include
  // the failing file.
  if (diags.error_count_in(FileId::invalid()) == 0) {
    // 3. C-Next modules, leaves first. Symbol declarations of earlier
    // modules stay in `table`, so every module outlives the loop.
    std::vector<std::unique_ptr<ModuleInfo>> modules;
    for (const DependencyNode * node : graph.leaves_first_order()) {
      if (node->language != FileLanguage::CNext) {
        continue;
      }
      if (closure_error_count(node, diags) > 0) {
        continue;
      }

      auto module = std::make_unique<ModuleInfo>();
      module->file_id = node->file_id;
      module->path = node->path;
      module->source = result.sources.get_file(node->file_id);
      module->ast = std::make_unique<AstContext>();
      std::set<const DependencyNode *> seen;
      collect_visible(node, module->visibleFiles, seen);

      module->program = parse_file(result.sources, node->file_id, *module->ast, diags);
      if (module->program == nullptr || diags.error_count_in(node->file_id) > 0) {
        module->failed = true;
        modules.push_back(std::move(module));
        continue;
      }

      if (!run_semantic_analysis(*module, table, diags)) {
        module->failed = true;
      }
      ++result.stats.modulesAnalyzed;

      // 4. Generation for files without errors
      if (!module->failed && options.mode == CompileMode::Build) {
        (void)generate(
          *module, output_path_for(module->path, settings), diags, result.generated_files);
      }
      modules.push_back(std::move(module));
    }
  }

  if (cache) {
    const CacheSaveResult saved = cache->save();
    if (saved.success) {
      result.cache_file = cache->file_path();
    } else {
      diags.report_warning(SourceRange{}, "symbol cache not written: " + saved.error)
        .with_code("E0002")
        .with_file(cache->file_path().string());
    }
  }

  result.success = !diags.has_errors();
  return result;
}

CleanResult Compiler::clean(const fs::path & input, const CompileOptions & options)
{
  CleanResult result;
  DiagnosticBag & diags = result.diagnostics;

  Settings settings;
  std::optional<fs::path> config_file;
  if (!configure(input, options, settings, config_file, diags)) {
    return result;
  }

  const std::vector<fs::path> sources = discover_sources(input, diags);
  if (diags.has_errors()) {
    return result;
  }

  std::error_code ec;
  for (const auto & source : sources) {
    const fs::path c_path = output_path_for(source, settings);
    const fs::path h_path = c_path.parent_path() / (source.stem().string() + ".h");
    for (const fs::path & generated : {c_path, h_path}) {
      if (fs::remove(generated, ec)) {
        result.removed_files.push_back(generated);
      } else if (ec) {
        diags
          .report_error(
            SourceRange{}, fmt::format("cannot remove {}: {}", generated.string(), ec.message()))
          .with_code("E0002")
          .with_file(generated.string());
      }
    }
  }

  if (fs::exists(settings.cache_dir, ec)) {
    fs::remove_all(settings.cache_dir, ec);
    if (ec) {
      diags.report_error(
             SourceRange{},
             fmt::format("cannot remove {}: {}", settings.cache_dir.string(), ec.message()))
        .with_code("E0002")
        .with_file(settings.cache_dir.string());
    } else {
      result.removed_files.push_back(settings.cache_dir);
    }
  }

  result.success = !diags.has_errors();
  return result;
}

bool Compiler::run_semantic_analysis(ModuleInfo & module, SymbolTable & table, DiagnosticBag & diags)
{
  if (!module.program) {
    return false;
  }

  bool success = true;

  // 1. Name resolution (also declares this module's symbols in `table`)
  NameResolver name_resolver(module, table, diags);
  if (!name_resolver.resolve()) {
    success = false;
  }

  // 2. Type checking
  TypeChecker type_checker(module, table, diags);
  if (!type_checker.check()) {
    success = false;
  }

  // The flow analyses read resolved names and types.
  if (!success) {
    return false;
  }

  // 3. Const checking and parameter mutability inference
  ConstChecker const_checker(diags);
  if (!const_checker.check(*module.program)) {
    success = false;
  }

  // 4. Init checking (variable initialization before use)
  InitializationChecker init_checker(table, diags);
  if (!init_checker.check(*module.program)) {
    success = false;
  }

  // 5. Null checking
  NullChecker null_checker(diags);
  if (!null_checker.check(*module.program)) {
    success = false;
  }

  // 6. Literal boundaries
  LiteralChecker literal_checker(diags);
  if (!literal_checker.check(*module.program)) {
    success = false;
  }

  // 7. Constant division by zero
  DivisionChecker division_checker(diags);
  if (!division_checker.check(*module.program)) {
    success = false;
  }

  // 8. Bit access and slices
  BitAccessChecker bit_checker(diags);
  if (!bit_checker.check(*module.program)) {
    success = false;
  }

  // 9. Switch exhaustiveness
  SwitchChecker switch_checker(table, diags);
  if (!switch_checker.check(*module.program)) {
    success = false;
  }

  // 10. Register access rules
  RegisterChecker register_checker(diags);
  if (!register_checker.check(*module.program)) {
    success = false;
  }

  return success;
}

bool Compiler::generate(
  const ModuleInfo & module, const fs::path & c_path, DiagnosticBag & diags,
  std::vector<fs::path> & written)
{
  const fs::path h_path = c_path.parent_path() / (module.stem() + ".h");

  CGenerator c_gen(module);
  HeaderGenerator h_gen(module);
  const std::string c_text = c_gen.generate();
  const std::string h_text = h_gen.generate();

  if (!write_text_file(h_path, h_text, diags)) {
    return false;
  }
  written.push_back(h_path);
  if (!write_text_file(c_path, c_text, diags)) {
    return false;
  }
  written.push_back(c_path);
  return true;
}

}  // namespace cnext
