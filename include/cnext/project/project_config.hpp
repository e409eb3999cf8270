// cnext/project/project_config.hpp - Project configuration (cnext.yaml)
//
// Parses and validates cnext.yaml project configuration files.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cnext
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Compiler configuration section.
 */
struct CompilerConfig
{
  /// Extra include search paths (relative to cnext.yaml)
  std::vector<std::filesystem::path> include_paths;

  /// Output directory for generated files; empty means alongside each input
  std::filesystem::path output_dir;

  /// Cache directory (relative to cnext.yaml)
  std::filesystem::path cache_dir = ".cnx-cache";

  /// Whether the symbol cache is read and written
  bool cache = true;
};

/**
 * Project metadata section.
 */
struct ProjectInfo
{
  std::string name;
};

/**
 * Complete project configuration (cnext.yaml).
 */
struct ProjectConfig
{
  ProjectInfo project;
  CompilerConfig compiler;

  /// Directory containing cnext.yaml (for resolving relative paths)
  std::filesystem::path project_root;

  /// include_paths made absolute against project_root.
  [[nodiscard]] std::vector<std::filesystem::path> resolved_include_paths() const;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a project configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  /// Whether loading succeeded
  bool success = false;

  /// Error message if loading failed
  std::string error;

  /// Create a successful result
  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  /// Create a failed result
  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from a cnext.yaml file.
 *
 * @param config_path Path to cnext.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Find a project configuration file by searching upward from a path.
 *
 * Searches for cnext.yaml starting from start (or its directory when it
 * is a file) and moving up to the filesystem root.
 *
 * @param start File or directory to start searching from
 * @return Path to cnext.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start);

/**
 * Default name of the project configuration file.
 */
inline constexpr const char * k_project_config_file_name = "cnext.yaml";

}  // namespace cnext
