// cnext/driver/compiler.hpp - Compiler driver
//
// Single entry point for the compile pipeline.
// Used by the CLI and by the end-to-end tests.
//
#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "cnext/basic/diagnostic.hpp"
#include "cnext/basic/source_manager.hpp"
#include "cnext/project/project_config.hpp"
#include "cnext/sema/resolution/module_info.hpp"
#include "cnext/symbols/symbol_table.hpp"

namespace cnext
{

// ============================================================================
// Compile Mode
// ============================================================================

enum class CompileMode {
  Check,  ///< Resolution and analysis only (no output written)
  Build,  ///< Full build including .c/.h generation
};

// ============================================================================
// Compile Options
// ============================================================================

struct CompileOptions
{
  /// Compile mode
  CompileMode mode = CompileMode::Build;

  /// Output override: a `.c` file for a single input, otherwise a directory
  std::optional<std::filesystem::path> output;

  /// Include search paths added after the ones in cnext.yaml
  std::vector<std::filesystem::path> include_paths;

  /// Read and write the symbol cache
  bool use_cache = true;

  /// Cache directory (overrides project config)
  std::optional<std::filesystem::path> cache_dir;

  /// Explicit cnext.yaml; otherwise searched upward from the input
  std::optional<std::filesystem::path> config_file;

  /// Enable verbose output
  bool verbose = false;
};

// ============================================================================
// Compile Result
// ============================================================================

struct CompileStats
{
  size_t sourcesDiscovered = 0;
  size_t modulesAnalyzed = 0;
  size_t filesLoaded = 0;
  size_t headersParsed = 0;
  size_t headersFromCache = 0;
  size_t systemHeaders = 0;
  size_t symbolsInserted = 0;
};

struct CompileResult
{
  /// Whether compilation succeeded (no errors)
  bool success = false;

  /// Collected diagnostics (errors, warnings, etc.)
  DiagnosticBag diagnostics;

  /// Every file read during the run; needed to print diagnostics
  SourceRegistry sources;

  /// cnext.yaml that configured the run, if any
  std::optional<std::filesystem::path> config_file;

  /// C-Next sources named by the input
  std::vector<std::filesystem::path> inputs;

  /// Generated files (only populated for Build mode)
  std::vector<std::filesystem::path> generated_files;

  /// Cache file written at the end of the run (empty when disabled)
  std::filesystem::path cache_file;

  CompileStats stats;
};

struct CleanResult
{
  bool success = false;
  DiagnosticBag diagnostics;
  std::vector<std::filesystem::path> removed_files;
};

// ============================================================================
// Compiler
// ============================================================================

/**
 * Compiler driver that orchestrates the full compilation pipeline.
 *
 * The pipeline consists of:
 * 1. Source discovery (file or recursive directory)
 * 2. Include resolution into one dependency graph
 * 3. Foreign symbol collection, leaves first (aborts the run on errors)
 * 4. Per C-Next file, leaves first: parsing, name resolution, type checking
 * 5. Static safety analysis (const, init, null, literals, bits, switch,
 *    registers)
 * 6. Code generation (Build mode only, files without errors)
 * 7. Cache write-back
 */
class Compiler
{
public:
  /**
   * Compile a `.cnx` file or every `.cnx` file under a directory.
   *
   * @param input File or directory given on the command line
   * @param options Compile options (override cnext.yaml)
   * @return CompileResult with success status and diagnostics
   */
  [[nodiscard]] static CompileResult compile(
    const std::filesystem::path & input, const CompileOptions & options);

  /**
   * Delete the `.c`/`.h` files a build of `input` would produce, and the
   * cache directory.
   */
  [[nodiscard]] static CleanResult clean(
    const std::filesystem::path & input, const CompileOptions & options);

  /**
   * Run semantic analysis on one parsed module: name resolution, type
   * checking, then the static safety analyses. Declares the module's
   * symbols in `table`.
   *
   * @return true if no errors occurred
   */
  static bool run_semantic_analysis(ModuleInfo & module, SymbolTable & table, DiagnosticBag & diags);

private:
  struct Settings
  {
    std::vector<std::filesystem::path> include_paths;
    std::filesystem::path output_dir;
    std::optional<std::filesystem::path> output_file;
    std::filesystem::path cache_dir;
    bool use_cache = true;
  };

  /// Merge cnext.yaml and the options; false on an invalid config (E0003).
  static bool configure(
    const std::filesystem::path & input, const CompileOptions & options, Settings & settings,
    std::optional<std::filesystem::path> & config_file, DiagnosticBag & diags);

  /// .c path for `source`; the .h lives beside it.
  static std::filesystem::path output_path_for(
    const std::filesystem::path & source, const Settings & settings);

  /**
   * Write `<stem>.c` and `<stem>.h` for an analyzed module.
   *
   * @return true if generation succeeded
   */
  static bool generate(
    const ModuleInfo & module, const std::filesystem::path & c_path, DiagnosticBag & diags,
    std::vector<std::filesystem::path> & written);
};

}  // namespace cnext
