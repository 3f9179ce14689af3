#pragma once

#include "pathguard/audit.hpp"
#include "pathguard/trusted_root.hpp"
#include "pathguard/types.hpp"

#include <filesystem>
#include <future>
#include <optional>
#include <string>

namespace pathguard {

class BoundedPathResolver;

// ============================================================================
// Resolved Path
// ============================================================================

// Canonical absolute path known to be a regular file under a TrustedRoot.
// Only BoundedPathResolver can create one. Do not log or cache it.
class ResolvedPath {
public:
    const std::filesystem::path& path() const { return path_; }
    std::string string() const { return path_.string(); }

private:
    friend class BoundedPathResolver;

    explicit ResolvedPath(std::filesystem::path path) : path_(std::move(path)) {}

    std::filesystem::path path_;
};

struct ResolveResult {
    bool ok = false;
    Rejection rejection = Rejection::None;
    std::optional<ResolvedPath> path;
};

// ============================================================================
// Bounded Path Resolver
// ============================================================================

class BoundedPathResolver {
public:
    // audit may be null; it must outlive the resolver and any pending
    // resolve_async() call.
    explicit BoundedPathResolver(TrustedRoot root, AuditLog* audit = nullptr)
        : root_(std::move(root)), audit_(audit) {}

    // Ordered gates, first failure wins:
    //   empty -> Empty, NUL byte -> InvalidCharacter, ".." component -> TraversalAttempt,
    //   canonicalize failure -> NotFound, outside root -> OutOfBounds,
    //   not a regular file -> NotAFile
    ResolveResult resolve(const std::string& candidate) const;

    // Runs resolve() on a separate thread so blocking filesystem calls stay
    // off the caller's event loop.
    std::future<ResolveResult> resolve_async(std::string candidate) const;

    const TrustedRoot& root() const { return root_; }

private:
    ResolveResult reject(const std::string& candidate, Rejection kind) const;

    TrustedRoot root_;
    AuditLog* audit_;
};

// One-shot form of BoundedPathResolver::resolve
ResolveResult resolve(const TrustedRoot& root, const std::string& candidate,
                      AuditLog* audit = nullptr);

// Read the whole file. The only file read entry point; it takes no raw string.
std::optional<std::string> read_resolved_file(const ResolvedPath& path);

} // namespace pathguard
