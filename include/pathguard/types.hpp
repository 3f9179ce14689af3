#pragma once

#include <optional>
#include <string>

namespace pathguard {

// ============================================================================
// Rejection Kinds
// ============================================================================

// Shared taxonomy for every validator. All kinds except ConfigurationError
// are per-request and recoverable.
enum class Rejection {
    None,
    Empty,
    TooLong,
    InvalidCharacter,
    TraversalAttempt,
    NotFound,
    OutOfBounds,
    NotAFile,
    ConfigurationError,
};

// Convert rejection enum to canonical lowercase snake_case string
inline const char* rejection_to_string(Rejection r) {
    switch (r) {
        case Rejection::None: return "none";
        case Rejection::Empty: return "empty";
        case Rejection::TooLong: return "too_long";
        case Rejection::InvalidCharacter: return "invalid_character";
        case Rejection::TraversalAttempt: return "traversal_attempt";
        case Rejection::NotFound: return "not_found";
        case Rejection::OutOfBounds: return "out_of_bounds";
        case Rejection::NotAFile: return "not_a_file";
        case Rejection::ConfigurationError: return "configuration_error";
        default: return "unknown";
    }
}

// Parse rejection key string to enum (case-insensitive)
std::optional<Rejection> parse_rejection(const std::string& s);

// ============================================================================
// Public Outcome
// ============================================================================

// What an external requester is allowed to see. OutOfBounds and NotFound
// both map to NotFound so the response is not an existence oracle.
enum class PublicOutcome {
    Ok,
    NotFound,
    InternalError,
};

inline const char* public_outcome_to_string(PublicOutcome o) {
    switch (o) {
        case PublicOutcome::Ok: return "ok";
        case PublicOutcome::NotFound: return "not_found";
        case PublicOutcome::InternalError: return "internal_error";
        default: return "internal_error";
    }
}

inline PublicOutcome public_outcome_for(Rejection r) {
    switch (r) {
        case Rejection::None:
            return PublicOutcome::Ok;
        case Rejection::ConfigurationError:
            return PublicOutcome::InternalError;
        default:
            return PublicOutcome::NotFound;
    }
}

// ============================================================================
// Audit Output Format
// ============================================================================

enum class AuditFormat {
    Text,
    Json,
};

inline const char* audit_format_to_string(AuditFormat f) {
    switch (f) {
        case AuditFormat::Text: return "text";
        case AuditFormat::Json: return "json";
        default: return "text";
    }
}

std::optional<AuditFormat> parse_audit_format(const std::string& s);

} // namespace pathguard
