// cnext/project/project_config.cpp - Project configuration implementation
//
#include "cnext/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

namespace cnext
{

namespace
{

/// Read a scalar string, rejecting maps and sequences.
bool read_string(const YAML::Node & node, const char * key, std::string & out, std::string & error)
{
  const YAML::Node value = node[key];
  if (!value) {
    return true;
  }
  if (!value.IsScalar()) {
    error = std::string(key) + " must be a string";
    return false;
  }
  out = value.as<std::string>();
  return true;
}

}  // namespace

std::vector<std::filesystem::path> ProjectConfig::resolved_include_paths() const
{
  std::vector<std::filesystem::path> out;
  out.reserve(compiler.include_paths.size());
  for (const auto & p : compiler.include_paths) {
    out.push_back(p.is_absolute() ? p : project_root / p);
  }
  return out;
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  std::error_code ec;
  if (!fs::exists(config_path, ec)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  ProjectConfig config;
  config.project_root = fs::absolute(config_path).parent_path();

  if (root.IsNull()) {
    // An empty file selects every default.
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("cnext.yaml must contain a map at the top level");
  }

  try {
    std::string error;

    // Parse 'project' section
    if (const YAML::Node project = root["project"]) {
      if (!project.IsMap()) {
        return ConfigLoadResult::fail("project must be a map");
      }
      if (!read_string(project, "name", config.project.name, error)) {
        return ConfigLoadResult::fail("project." + error);
      }
    }

    // Parse 'compiler' section
    if (const YAML::Node comp = root["compiler"]) {
      if (!comp.IsMap()) {
        return ConfigLoadResult::fail("compiler must be a map");
      }

      if (const YAML::Node includes = comp["include_paths"]) {
        if (!includes.IsSequence()) {
          return ConfigLoadResult::fail("compiler.include_paths must be a list");
        }
        for (const auto & p : includes) {
          config.compiler.include_paths.emplace_back(p.as<std::string>());
        }
      }

      std::string text;
      if (!read_string(comp, "output_dir", text, error)) {
        return ConfigLoadResult::fail("compiler." + error);
      }
      if (!text.empty()) {
        config.compiler.output_dir = text;
      }

      text.clear();
      if (!read_string(comp, "cache_dir", text, error)) {
        return ConfigLoadResult::fail("compiler." + error);
      }
      if (!text.empty()) {
        config.compiler.cache_dir = text;
      }

      if (comp["cache"]) {
        config.compiler.cache = comp["cache"].as<bool>();
      }
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration value: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(std::move(config));
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start)
{
  namespace fs = std::filesystem;

  std::error_code ec;
  fs::path current = fs::absolute(start, ec);
  if (ec) {
    return std::nullopt;
  }

  // If start is a file, begin with its parent
  if (fs::is_regular_file(current, ec)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate, ec)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace cnext
