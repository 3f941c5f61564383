// Load an ini document from disk.
#pragma once
#include "ini/ini.hpp"
#include <optional>
#include <string>

namespace ini {

// Read and parse `path`. An empty path means no ini file is configured and yields
// std::nullopt. Throws io_error if the file cannot be read and parse_error (with the
// path as origin) on malformed content. Bytes are parsed as-is, no encoding conversion.
std::optional<mapping> load_file(const std::string& path);

// Whole-file read helper shared with the tools.
std::string read_file(const std::string& path);

} // namespace ini
