#include "pathguard/name_token.hpp"

namespace pathguard {

Rejection check_name_token(const std::string& raw, const TokenPolicy& policy) {
    if (raw.empty()) {
        return Rejection::Empty;
    }
    if (raw.size() > policy.max_length) {
        return Rejection::TooLong;
    }
    for (char c : raw) {
        if (!is_token_char(c)) {
            return Rejection::InvalidCharacter;
        }
    }
    // Unreachable with the current allow-list; kept so the traversal property
    // does not depend on it.
    if (raw.find("..") != std::string::npos ||
        raw.find('/') != std::string::npos ||
        raw.find('\\') != std::string::npos) {
        return Rejection::TraversalAttempt;
    }
    return Rejection::None;
}

TokenResult NameTokenValidator::validate(const std::string& raw) const {
    TokenResult result;
    Rejection kind = check_name_token(raw, policy_);
    if (kind != Rejection::None) {
        if (audit_) {
            audit_->record(source_, raw, kind);
        }
        result.rejection = kind;
        return result;
    }
    result.ok = true;
    result.token = NameToken(raw);
    return result;
}

} // namespace pathguard
