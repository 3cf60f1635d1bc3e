#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace junkrat {

// Unix epoch milliseconds
uint64_t epoch_millis();

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lowercase copy
std::string to_lower(const std::string& s);

// Case-insensitive substring search
bool contains_ci(const std::string& haystack, const std::string& needle);

// Generate a simple unique ID (hex)
std::string generate_id();

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename so readers never see a partial file.
// Creates the parent directory if missing.
bool atomic_write_file(const std::string& path, const std::string& content);

// Quote an argument for /bin/sh (single quotes, embedded quotes escaped)
std::string shell_quote(const std::string& arg);

} // namespace junkrat
