#pragma once
#include <string>
#include <vector>
#include <cstddef>

namespace hookcache {

// Unix epoch seconds with sub-second precision
double epoch_time();

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lower-case
std::string to_lower(const std::string& s);

// Split on runs of whitespace, dropping empty tokens
std::vector<std::string> split_whitespace(const std::string& s);

// Cut to at most max_bytes without splitting a UTF-8 sequence
std::string truncate_utf8(const std::string& s, size_t max_bytes);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write to a unique temp file beside path, then rename over path.
// Creates the parent directory. The temp file is removed on failure.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace hookcache
