#pragma once

#include <optional>
#include <string>

namespace pathguard {

// ============================================================================
// Path Utilities
// ============================================================================

// Convert a path to use forward slashes (portable format)
std::string to_portable_path(const std::string& path);

// Check if a path is a directory
bool is_directory(const std::string& path);

// Check if a path is a regular file
bool is_regular_file(const std::string& path);

// Read an entire file as bytes
std::optional<std::string> read_file(const std::string& path);

// ============================================================================
// Environment
// ============================================================================

// Get an environment variable
std::optional<std::string> get_env(const std::string& name);

// Get current timestamp as RFC3339 string
std::string get_current_timestamp();

// Generate a UUID string
std::string generate_uuid();

} // namespace pathguard
