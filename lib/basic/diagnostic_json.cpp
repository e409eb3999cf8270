// cnext/basic/diagnostic_json.cpp - JSON diagnostic serialization
#include "cnext/basic/diagnostic_json.hpp"

#include <algorithm>
#include <vector>

#include "cnext/basic/diagnostic_printer.hpp"

namespace cnext
{

using json = nlohmann::json;

namespace
{

json range_to_json(SourceRange range, const SourceRegistry & sources)
{
  json j = json::object();
  const FullSourceRange fr = sources.get_full_range(range);
  if (!fr.is_valid()) {
    return j;
  }
  j["line"] = fr.start_line;
  j["column"] = fr.start_column;
  j["end_line"] = fr.end_line;
  j["end_column"] = fr.end_column;
  return j;
}

}  // namespace

json diagnostic_to_json(const Diagnostic & diag, const SourceRegistry & sources)
{
  json j;
  j["severity"] = std::string(to_string(diag.severity));
  j["code"] = diag.code;
  j["message"] = diag.message;

  const SourceRange primary = diag.primary_range();
  if (primary.file_id().is_valid()) {
    j["file"] = display_path(sources.get_path(primary.file_id()));
    const FullSourceRange fr = sources.get_full_range(primary);
    if (fr.is_valid()) {
      j["line"] = fr.start_line;
      j["column"] = fr.start_column;
    }
  } else if (!diag.file_hint.empty()) {
    j["file"] = diag.file_hint;
  }

  json labels = json::array();
  for (const auto & label : diag.labels) {
    json lj = range_to_json(label.range, sources);
    lj["message"] = label.message;
    lj["primary"] = label.style == LabelStyle::Primary;
    labels.push_back(std::move(lj));
  }
  j["labels"] = std::move(labels);

  json fixits = json::array();
  for (const auto & fixit : diag.fixits) {
    json fj = range_to_json(fixit.range, sources);
    fj["replacement"] = fixit.replacement_text;
    fixits.push_back(std::move(fj));
  }
  j["fixits"] = std::move(fixits);

  if (diag.help_message) {
    j["help"] = *diag.help_message;
  }
  return j;
}

json diagnostics_to_json(const DiagnosticBag & diags, const SourceRegistry & sources)
{
  std::vector<const Diagnostic *> ordered;
  ordered.reserve(diags.size());
  for (const auto & d : diags) {
    ordered.push_back(&d);
  }
  std::stable_sort(ordered.begin(), ordered.end(), [](const Diagnostic * a, const Diagnostic * b) {
    return a->primary_range().get_begin() < b->primary_range().get_begin();
  });

  json out = json::array();
  for (const Diagnostic * d : ordered) {
    out.push_back(diagnostic_to_json(*d, sources));
  }
  return out;
}

}  // namespace cnext
