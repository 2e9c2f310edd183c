#pragma once
#include <string>
#include <cstdint>

namespace chunkflow {

// Trim whitespace
std::string trim(const std::string& s);

// Generate a simple unique ID (hex)
std::string generate_id();

// Collapse runs of more than max_run consecutive newlines down to max_run
std::string collapse_newlines(const std::string& s, size_t max_run);

// True if c may appear in a tool name (alnum, '_', '-', '.')
bool is_tool_name_char(char c);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Parse a base-10 unsigned integer; returns false on any non-digit or overflow
bool parse_uint32(const std::string& s, uint32_t& out);

} // namespace chunkflow
