#include "pathguard/file_server.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace pathguard {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

std::string content_type_for(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    if (!ext.empty() && ext[0] == '.') {
        ext.erase(0, 1);
    }
    ext = to_lower(ext);

    if (ext == "jpg" || ext == "jpeg") return "image/jpeg";
    if (ext == "png") return "image/png";
    if (ext == "gif") return "image/gif";
    if (ext == "webp") return "image/webp";
    if (ext == "svg") return "image/svg+xml";
    return "application/octet-stream";
}

ServeResult UploadFileServer::serve(const std::string& stored_path) const {
    ServeResult result;

    auto resolved = resolver_.resolve(stored_path);
    if (!resolved.ok) {
        result.rejection = resolved.rejection;
        result.outcome = public_outcome_for(resolved.rejection);
        return result;
    }

    auto data = read_resolved_file(*resolved.path);
    if (!data) {
        result.outcome = PublicOutcome::InternalError;
        return result;
    }

    result.outcome = PublicOutcome::Ok;
    result.content_type = content_type_for(resolved.path->string());
    result.cache_control = "public, max-age=" + std::to_string(max_age_);
    result.body = std::move(*data);
    return result;
}

std::future<ServeResult> UploadFileServer::serve_async(std::string stored_path) const {
    return std::async(std::launch::async,
                      [self = *this, stored_path = std::move(stored_path)]() {
                          return self.serve(stored_path);
                      });
}

} // namespace pathguard
