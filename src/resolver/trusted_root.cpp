#include "pathguard/trusted_root.hpp"
#include "pathguard/path_utils.hpp"
#include "pathguard/platform.hpp"

#include <system_error>

namespace pathguard {

namespace fs = std::filesystem;

TrustedRootResult TrustedRoot::open(const std::string& directory) {
    TrustedRootResult result;

    if (directory.empty()) {
        result.error = "trusted root is empty";
        return result;
    }
    if (contains_nul(directory)) {
        result.error = "trusted root contains NUL byte";
        return result;
    }

    fs::path raw(directory);
    if (!raw.is_absolute()) {
        result.error = "trusted root must be absolute: " + directory;
        return result;
    }

    std::error_code ec;
    fs::path canonical = fs::canonical(raw, ec);
    if (ec) {
        result.error = "cannot canonicalize trusted root " + directory + ": " + ec.message();
        return result;
    }

    if (!is_directory(canonical.string())) {
        result.error = "trusted root is not a directory: " + directory;
        return result;
    }

    result.root = TrustedRoot(raw, canonical);
    result.ok = true;
    return result;
}

} // namespace pathguard
