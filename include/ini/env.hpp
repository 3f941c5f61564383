#pragma once

namespace ini {

struct ParseEnv {
    bool debugScan = false; // INI_DEBUG_SCAN: trace classified lines and entries to stderr
    bool diagJson = false;  // INI_DIAG_JSON: print diagnostics JSON to stderr on failure
};

// Detect parser environment from process env vars.
ParseEnv detect_env();

} // namespace ini
