#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace pathguard {

struct TrustedRootResult;

// ============================================================================
// Trusted Root
// ============================================================================

// Operator-configured directory bounding all file access. The canonical form
// is computed once in open() and never changes afterwards, so a TrustedRoot
// can be shared read-only between threads.
class TrustedRoot {
public:
    // Fails (a startup-fatal configuration error) when the path is empty,
    // relative, missing, not a directory, or cannot be canonicalized.
    static TrustedRootResult open(const std::string& directory);

    // Path as configured; used only to join candidates for existence tests
    const std::filesystem::path& raw() const { return raw_; }

    // Symlink-free absolute form; the containment reference
    const std::filesystem::path& canonical() const { return canonical_; }

private:
    TrustedRoot(std::filesystem::path raw, std::filesystem::path canonical)
        : raw_(std::move(raw)), canonical_(std::move(canonical)) {}

    std::filesystem::path raw_;
    std::filesystem::path canonical_;
};

struct TrustedRootResult {
    bool ok = false;
    std::string error;
    std::optional<TrustedRoot> root;
};

} // namespace pathguard
