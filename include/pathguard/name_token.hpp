#pragma once

#include "pathguard/audit.hpp"
#include "pathguard/types.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace pathguard {

class NameTokenValidator;

struct TokenPolicy {
    std::size_t max_length = 50;
};

// ============================================================================
// Name Token
// ============================================================================

// Identifier safe to interpolate into a path: 1..max_length characters from
// [A-Za-z0-9_-]. Only NameTokenValidator can create one.
class NameToken {
public:
    const std::string& str() const { return value_; }

    bool operator==(const NameToken& other) const { return value_ == other.value_; }
    bool operator!=(const NameToken& other) const { return value_ != other.value_; }

private:
    friend class NameTokenValidator;

    explicit NameToken(std::string value) : value_(std::move(value)) {}

    std::string value_;
};

struct TokenResult {
    bool ok = false;
    Rejection rejection = Rejection::None;
    std::optional<NameToken> token;
};

// ============================================================================
// Name Token Validator
// ============================================================================

class NameTokenValidator {
public:
    NameTokenValidator() = default;

    // source labels audit events (e.g. "template", "component_type")
    explicit NameTokenValidator(TokenPolicy policy, AuditLog* audit = nullptr,
                                std::string source = "token")
        : policy_(policy), audit_(audit), source_(std::move(source)) {}

    // Empty -> Empty, longer than max_length -> TooLong,
    // outside [A-Za-z0-9_-] -> InvalidCharacter, "..", "/" or "\" -> TraversalAttempt
    TokenResult validate(const std::string& raw) const;

    const TokenPolicy& policy() const { return policy_; }

private:
    TokenPolicy policy_;
    AuditLog* audit_ = nullptr;
    std::string source_ = "token";
};

// Policy check without auditing
Rejection check_name_token(const std::string& raw, const TokenPolicy& policy = {});

inline bool is_token_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '-' || c == '_';
}

} // namespace pathguard
