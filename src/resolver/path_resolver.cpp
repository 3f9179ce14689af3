#include "pathguard/path_resolver.hpp"
#include "pathguard/path_utils.hpp"
#include "pathguard/platform.hpp"

#include <system_error>

namespace pathguard {

namespace fs = std::filesystem;

ResolveResult BoundedPathResolver::reject(const std::string& candidate, Rejection kind) const {
    if (audit_) {
        audit_->record("path", candidate, kind);
    }
    ResolveResult result;
    result.rejection = kind;
    return result;
}

ResolveResult BoundedPathResolver::resolve(const std::string& candidate) const {
    if (candidate.empty()) {
        return reject(candidate, Rejection::Empty);
    }
    if (contains_nul(candidate)) {
        return reject(candidate, Rejection::InvalidCharacter);
    }
    if (has_parent_reference(candidate)) {
        return reject(candidate, Rejection::TraversalAttempt);
    }

    // An absolute candidate replaces the root here; containment decides below
    fs::path joined = root_.raw() / fs::path(candidate);

    std::error_code ec;
    fs::path canonical = fs::canonical(joined, ec);
    if (ec) {
        // Missing, dangling symlink and untraversable are reported alike
        return reject(candidate, Rejection::NotFound);
    }

    if (!is_within_root(root_.canonical(), canonical)) {
        return reject(candidate, Rejection::OutOfBounds);
    }

    if (!is_regular_file(canonical.string())) {
        return reject(candidate, Rejection::NotAFile);
    }

    ResolveResult result;
    result.ok = true;
    result.path = ResolvedPath(std::move(canonical));
    return result;
}

std::future<ResolveResult> BoundedPathResolver::resolve_async(std::string candidate) const {
    return std::async(std::launch::async,
                      [self = *this, candidate = std::move(candidate)]() {
                          return self.resolve(candidate);
                      });
}

ResolveResult resolve(const TrustedRoot& root, const std::string& candidate, AuditLog* audit) {
    return BoundedPathResolver(root, audit).resolve(candidate);
}

std::optional<std::string> read_resolved_file(const ResolvedPath& path) {
    return read_file(path.string());
}

} // namespace pathguard
