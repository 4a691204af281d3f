#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace agentsh {

// ISO 8601 timestamp
std::string timestamp_now();

// Trim whitespace
std::string trim(const std::string& s);

// Join with a separator
std::string join(const std::vector<std::string>& parts, const std::string& sep);

// ASCII lower-case copy
std::string to_lower(const std::string& s);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename so readers never see a partial file.
// Creates missing parent directories.
bool atomic_write_file(const std::string& path, const std::string& content);

// Horizontal rule used between REPL outputs
std::string h_bar();

} // namespace agentsh
