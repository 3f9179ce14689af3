#include "pathguard/audit.hpp"
#include "pathguard/platform.hpp"

#include <cstdio>
#include <exception>
#include <iostream>

#include <nlohmann/json.hpp>

namespace pathguard {

void AuditLog::set_handler(Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handler_ = std::move(handler);
}

void AuditLog::record(const std::string& validator, const std::string& raw_input, Rejection kind) {
    AuditEvent event;
    event.validator = validator;
    event.raw_input = raw_input;
    event.kind = kind;
    event.timestamp = get_current_timestamp();

    Handler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++total_;
        ++counts_[kind];
        if (capacity_ > 0) {
            if (events_.size() >= capacity_) {
                events_.erase(events_.begin());
            }
            events_.push_back(event);
        }
        handler = handler_;
    }

    // Deliver outside the lock so a slow handler does not serialize callers
    if (!handler) {
        return;
    }
    try {
        handler(event);
    } catch (const std::exception&) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++dropped_;
    } catch (...) {
        // Sinks may throw non-standard types; the delivery is still counted
        std::lock_guard<std::mutex> lock(mutex_);
        ++dropped_;
    }
}

std::vector<AuditEvent> AuditLog::events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
}

std::size_t AuditLog::count(Rejection kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counts_.find(kind);
    return it == counts_.end() ? 0 : it->second;
}

std::size_t AuditLog::total() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_;
}

std::size_t AuditLog::dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

void AuditLog::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.clear();
    counts_.clear();
    total_ = 0;
    dropped_ = 0;
}

std::string escape_for_log(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());
    for (unsigned char c : raw) {
        if (c == '"' || c == '\\') {
            out.push_back('\\');
            out.push_back(static_cast<char>(c));
        } else if (c < 0x20 || c == 0x7f) {
            char buf[5];
            std::snprintf(buf, sizeof(buf), "\\x%02x", static_cast<unsigned>(c));
            out += buf;
        } else {
            out.push_back(static_cast<char>(c));
        }
    }
    return out;
}

std::string format_audit_text(const AuditEvent& event) {
    return "Audit: " + event.validator + " rejected kind=" + rejection_to_string(event.kind) +
           " input=\"" + escape_for_log(event.raw_input) + "\" at=" + event.timestamp;
}

std::string format_audit_json(const AuditEvent& event) {
    nlohmann::json j;
    j["validator"] = event.validator;
    j["raw_input"] = event.raw_input;
    j["kind"] = rejection_to_string(event.kind);
    j["timestamp"] = event.timestamp;
    // Untrusted input may not be valid UTF-8
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

AuditLog::Handler make_stderr_audit_handler(AuditFormat format) {
    return [format](const AuditEvent& event) {
        if (format == AuditFormat::Json) {
            std::cerr << format_audit_json(event) << std::endl;
        } else {
            std::cerr << format_audit_text(event) << std::endl;
        }
    };
}

} // namespace pathguard
