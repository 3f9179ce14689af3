#pragma once

#include "pathguard/audit.hpp"
#include "pathguard/path_resolver.hpp"
#include "pathguard/trusted_root.hpp"
#include "pathguard/types.hpp"

#include <cstdint>
#include <future>
#include <string>

namespace pathguard {

constexpr std::uint64_t kDefaultMaxAge = 31536000;

struct ServeResult {
    PublicOutcome outcome = PublicOutcome::NotFound;
    Rejection rejection = Rejection::None;  // internal only, never sent to the requester
    std::string content_type;
    std::string cache_control;
    std::string body;
};

// Content type from the file extension (case-insensitive)
std::string content_type_for(const std::string& path);

// ============================================================================
// Upload File Server
// ============================================================================

// Serves stored upload paths (e.g. an image component's "file_path") from the
// configured uploads root.
class UploadFileServer {
public:
    explicit UploadFileServer(TrustedRoot uploads_root, AuditLog* audit = nullptr,
                              std::uint64_t max_age = kDefaultMaxAge)
        : resolver_(std::move(uploads_root), audit), max_age_(max_age) {}

    ServeResult serve(const std::string& stored_path) const;

    // Runs on a copy of the server; only the audit log must outlive the future
    std::future<ServeResult> serve_async(std::string stored_path) const;

    const BoundedPathResolver& resolver() const { return resolver_; }

private:
    BoundedPathResolver resolver_;
    std::uint64_t max_age_;
};

} // namespace pathguard
