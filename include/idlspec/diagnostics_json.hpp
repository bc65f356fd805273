// diagnostics_json.hpp - JSON serialization for unit diagnostics
#pragma once
#include "idlspec/session.hpp"
#include <string>

namespace idlspec {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// Serialize a unit's diagnostics to a compact JSON string.
std::string diagnostics_to_json(const Unit& u);

// If IDLSPEC_DIAG_JSON=1 in the environment, print diagnostics JSON to stderr.
void maybe_print_json(const Unit& u);

} // namespace idlspec
