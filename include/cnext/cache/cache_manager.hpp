// cnext/cache/cache_manager.hpp - On-disk symbol cache (.cnx-cache/cache.json)
//
// Remembers, per foreign header, the detected language, the include list
// and the collected symbols, keyed by canonical path and modification time.
// Symbols also depend on the macros and typedefs of the headers a file
// includes, so each entry records their modification times as well.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "cnext/resolution/directive_scanner.hpp"
#include "cnext/resolution/language.hpp"
#include "cnext/symbols/symbol.hpp"

namespace cnext
{

struct CacheEntry
{
  std::string key;  ///< DependencyGraph key (canonical path)
  FileLanguage language = FileLanguage::C;
  int64_t mtime = 0;
  std::vector<IncludeDirective> includes;
  std::vector<Symbol> symbols;
  /// Key and mtime of every non-system header reachable through `includes`
  std::map<std::string, int64_t> dependencies;
};

/**
 * Result of writing the cache.
 */
struct CacheSaveResult
{
  bool success = false;
  std::string error;

  static CacheSaveResult ok()
  {
    CacheSaveResult r;
    r.success = true;
    return r;
  }

  static CacheSaveResult fail(std::string msg)
  {
    CacheSaveResult r;
    r.error = std::move(msg);
    return r;
  }
};

/**
 * Reads the cache once at the start of a run and rewrites it at the end.
 *
 * Entries are only trusted when the file's mtime is unchanged and the
 * search-path fingerprint matches the one the cache was written with.
 * A missing, unreadable or corrupt cache file is treated as empty.
 */
class CacheManager
{
public:
  static constexpr int k_format_version = 2;
  static constexpr const char * k_cache_file_name = "cache.json";

  CacheManager(std::filesystem::path cache_dir, std::string fingerprint)
  : dir_(std::move(cache_dir)), fingerprint_(std::move(fingerprint))
  {
  }

  /// Loads `<dir>/cache.json`. Returns false when a present file had to be discarded.
  bool load();

  /// Entry for `key` whose own mtime is unchanged, or nullptr. Callers
  /// that use the symbols also compare CacheEntry::dependencies.
  [[nodiscard]] const CacheEntry * lookup(std::string_view key, int64_t mtime) const;

  void store(CacheEntry entry);

  /// Writes a temporary file next to cache.json and renames it into place.
  [[nodiscard]] CacheSaveResult save() const;

  [[nodiscard]] const std::filesystem::path & directory() const noexcept { return dir_; }
  [[nodiscard]] std::filesystem::path file_path() const { return dir_ / k_cache_file_name; }
  [[nodiscard]] size_t size() const noexcept { return entries_.size(); }

  /// Stable string describing the include search paths.
  [[nodiscard]] static std::string fingerprint_for(
    const std::vector<std::filesystem::path> & search_paths);

private:
  std::filesystem::path dir_;
  std::string fingerprint_;
  std::map<std::string, CacheEntry, std::less<>> entries_;
};

}  // namespace cnext
