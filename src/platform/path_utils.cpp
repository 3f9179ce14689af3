#include "pathguard/path_utils.hpp"
#include "pathguard/platform.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace pathguard {

std::vector<std::string> split_components(const std::string& candidate) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : candidate) {
        if (c == '/' || c == '\\') {
            if (!current.empty()) {
                parts.push_back(current);
                current.clear();
            }
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) {
        parts.push_back(current);
    }
    return parts;
}

bool has_parent_reference(const std::string& candidate) {
    for (const auto& part : split_components(candidate)) {
        if (part == "..") {
            return true;
        }
    }
    return false;
}

bool contains_nul(const std::string& s) {
    return s.find('\0') != std::string::npos;
}

bool is_within_root(const std::filesystem::path& root, const std::filesystem::path& path) {
    auto lex_root = root.lexically_normal();
    auto lex_path = path.lexically_normal();

    auto root_it = lex_root.begin();
    auto path_it = lex_path.begin();
    for (; root_it != lex_root.end() && path_it != lex_path.end(); ++root_it, ++path_it) {
        // A trailing separator on the root shows up as an empty final element
        if (root_it->empty()) {
            break;
        }
        if (*root_it != *path_it) {
            return false;
        }
    }
    if (root_it != lex_root.end() && !root_it->empty()) {
        return false;
    }
    return true;
}

std::string join_relative(const std::vector<std::string>& parts) {
    std::filesystem::path p;
    for (const auto& part : parts) {
        p /= part;
    }
    // Always use forward slashes for portable keys
    return to_portable_path(p.lexically_normal().string());
}

} // namespace pathguard
