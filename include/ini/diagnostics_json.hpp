// diagnostics_json.hpp - JSON serialization for ParseResult diagnostics
#pragma once
#include "ini/ini.hpp"
#include <string>

namespace ini {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// Serialize diagnostics to a compact JSON string.
std::string diagnostics_to_json(const ParseResult& r);

// If INI_DIAG_JSON=1 in the environment, print diagnostics JSON to stderr.
void maybe_print_json(const ParseResult& r);

} // namespace ini
