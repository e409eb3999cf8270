// cnext/driver/source_discovery.cpp - Input path to source file list
//
#include "cnext/driver/source_discovery.hpp"

#include <algorithm>

namespace cnext
{

std::vector<std::filesystem::path> discover_sources(
  const std::filesystem::path & input, DiagnosticBag & diags)
{
  namespace fs = std::filesystem;

  std::vector<fs::path> out;
  std::error_code ec;
  const fs::path root = fs::absolute(input, ec);

  if (ec || !fs::exists(root, ec)) {
    diags.report_error(SourceRange{}, "input not found: " + input.string())
      .with_code("E0001")
      .with_file(input.string());
    return out;
  }

  if (fs::is_regular_file(root, ec)) {
    if (root.extension() != k_source_extension) {
      diags.report_error(SourceRange{}, "not a C-Next source file: " + input.string())
        .with_code("E0001")
        .with_file(input.string())
        .with_help("C-Next sources use the '.cnx' extension");
      return out;
    }
    out.push_back(root.lexically_normal());
    return out;
  }

  fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
  for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    const fs::directory_entry & entry = *it;
    if (entry.is_directory(ec)) {
      // Hidden directories hold caches and VCS data, never sources.
      const std::string name = entry.path().filename().string();
      if (!name.empty() && name.front() == '.') {
        it.disable_recursion_pending();
      }
      continue;
    }
    if (entry.is_regular_file(ec) && entry.path().extension() == k_source_extension) {
      out.push_back(entry.path().lexically_normal());
    }
  }
  if (ec) {
    diags.report_error(SourceRange{}, "cannot read directory: " + ec.message())
      .with_code("E0001")
      .with_file(input.string());
    return {};
  }

  if (out.empty()) {
    diags.report_error(SourceRange{}, "no .cnx files found in " + input.string())
      .with_code("E0001")
      .with_file(input.string());
    return out;
  }

  std::sort(out.begin(), out.end());
  return out;
}

}  // namespace cnext
