#include "pathguard/types.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

namespace pathguard {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

std::optional<Rejection> parse_rejection(const std::string& s) {
    std::string lower = to_lower(s);

    if (lower == "none") return Rejection::None;
    if (lower == "empty") return Rejection::Empty;
    if (lower == "too_long") return Rejection::TooLong;
    if (lower == "invalid_character") return Rejection::InvalidCharacter;
    if (lower == "traversal_attempt") return Rejection::TraversalAttempt;
    if (lower == "not_found") return Rejection::NotFound;
    if (lower == "out_of_bounds") return Rejection::OutOfBounds;
    if (lower == "not_a_file") return Rejection::NotAFile;
    if (lower == "configuration_error") return Rejection::ConfigurationError;

    return std::nullopt;
}

std::optional<AuditFormat> parse_audit_format(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "text") return AuditFormat::Text;
    if (lower == "json") return AuditFormat::Json;
    return std::nullopt;
}

} // namespace pathguard
