// cnext/driver/source_discovery.hpp - Input path to source file list
#pragma once

#include <filesystem>
#include <vector>

#include "cnext/basic/diagnostic.hpp"

namespace cnext
{

/// Extension of C-Next source files.
inline constexpr const char * k_source_extension = ".cnx";

/**
 * Expand a command-line input into the `.cnx` files to compile.
 *
 * A file is returned as is (absolute). A directory is searched
 * recursively; the result is sorted so runs are reproducible. A missing
 * input, a file without the `.cnx` extension, or a directory with no
 * sources is E0001.
 */
[[nodiscard]] std::vector<std::filesystem::path> discover_sources(
  const std::filesystem::path & input, DiagnosticBag & diags);

}  // namespace cnext
