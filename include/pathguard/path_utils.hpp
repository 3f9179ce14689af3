#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace pathguard {

// Split a candidate into logical components. Both '/' and '\' are treated as
// separators so Windows-style traversal is visible on every host. Empty
// components (from repeated or leading separators) are dropped.
std::vector<std::string> split_components(const std::string& candidate);

// True if any logical component is exactly "..".
bool has_parent_reference(const std::string& candidate);

bool contains_nul(const std::string& s);

// Component-wise prefix test: every component of root must match the leading
// components of path. "/uploads-evil" is not within "/uploads".
bool is_within_root(const std::filesystem::path& root, const std::filesystem::path& path);

// Join validated components under a relative base without touching the
// filesystem ("components", "text", "default.html" -> "components/text/default.html").
std::string join_relative(const std::vector<std::string>& parts);

} // namespace pathguard
