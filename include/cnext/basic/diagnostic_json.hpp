// cnext/basic/diagnostic_json.hpp - Machine-readable diagnostic output
#pragma once

#include <nlohmann/json.hpp>

#include "cnext/basic/diagnostic.hpp"
#include "cnext/basic/source_manager.hpp"

namespace cnext
{

/**
 * Serialize one diagnostic.
 *
 * Shape:
 *   {"severity": "error", "code": "E0381", "message": "...",
 *    "file": "src/a.cnx", "line": 3, "column": 5,
 *    "labels": [{"line":..,"column":..,"end_line":..,"end_column":..,"message":..,"primary":true}],
 *    "fixits": [{"line":..,"column":..,"replacement":".."}],
 *    "help": "..."}
 */
[[nodiscard]] nlohmann::json diagnostic_to_json(
  const Diagnostic & diag, const SourceRegistry & sources);

/// Array of all diagnostics, ordered by file then offset.
[[nodiscard]] nlohmann::json diagnostics_to_json(
  const DiagnosticBag & diags, const SourceRegistry & sources);

}  // namespace cnext
