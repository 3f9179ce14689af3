#pragma once

#include "pathguard/types.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace pathguard {

// ============================================================================
// Audit Event
// ============================================================================

struct AuditEvent {
    std::string validator;   // path | token | component_type | template
    std::string raw_input;   // untrusted value exactly as received
    Rejection kind = Rejection::None;
    std::string timestamp;   // RFC3339 UTC
};

// ============================================================================
// Audit Log
// ============================================================================

// Thread-safe sink for rejection events. Recording never throws into the
// caller: a handler that throws is counted as a dropped delivery.
class AuditLog {
public:
    using Handler = std::function<void(const AuditEvent&)>;

    static constexpr std::size_t kDefaultCapacity = 1024;

    AuditLog() = default;

    explicit AuditLog(Handler handler, std::size_t capacity = kDefaultCapacity)
        : handler_(std::move(handler)), capacity_(capacity) {}

    AuditLog(const AuditLog&) = delete;
    AuditLog& operator=(const AuditLog&) = delete;

    void set_handler(Handler handler);

    // Record a rejection. Retained events are bounded by capacity; the oldest
    // events are discarded first. Counters are never discarded.
    void record(const std::string& validator, const std::string& raw_input, Rejection kind);

    std::vector<AuditEvent> events() const;

    std::size_t count(Rejection kind) const;
    std::size_t total() const;
    std::size_t dropped() const;

    void clear();

private:
    mutable std::mutex mutex_;
    Handler handler_;
    std::size_t capacity_ = kDefaultCapacity;
    std::vector<AuditEvent> events_;
    std::unordered_map<Rejection, std::size_t> counts_;
    std::size_t total_ = 0;
    std::size_t dropped_ = 0;
};

// ============================================================================
// Formatting and built-in handlers
// ============================================================================

// Render untrusted input for a log line: quotes and backslashes escaped,
// control bytes as \xNN.
std::string escape_for_log(const std::string& raw);

// "Audit: path rejected kind=out_of_bounds input=\"...\" at=..."
std::string format_audit_text(const AuditEvent& event);

// Single-line JSON object
std::string format_audit_json(const AuditEvent& event);

// Handler writing one line per event to stderr
AuditLog::Handler make_stderr_audit_handler(AuditFormat format);

} // namespace pathguard
