#include <doctest/doctest.h>
#include <pathguard/audit.hpp>
#include <pathguard/path_resolver.hpp>
#include <pathguard/types.hpp>

#include "temp_dir.hpp"

#include <nlohmann/json.hpp>

#include <future>
#include <stdexcept>
#include <string>
#include <vector>

using namespace pathguard;

// ============================================================================
// Rejection kinds
// ============================================================================

TEST_CASE("rejection_to_string returns snake_case keys") {
    CHECK(std::string(rejection_to_string(Rejection::Empty)) == "empty");
    CHECK(std::string(rejection_to_string(Rejection::TooLong)) == "too_long");
    CHECK(std::string(rejection_to_string(Rejection::TraversalAttempt)) == "traversal_attempt");
    CHECK(std::string(rejection_to_string(Rejection::OutOfBounds)) == "out_of_bounds");
    CHECK(std::string(rejection_to_string(Rejection::NotAFile)) == "not_a_file");
    CHECK(std::string(rejection_to_string(Rejection::ConfigurationError)) == "configuration_error");
}

TEST_CASE("parse_rejection is case-insensitive") {
    CHECK(parse_rejection("OUT_OF_BOUNDS") == Rejection::OutOfBounds);
    CHECK(parse_rejection("not_found") == Rejection::NotFound);
    CHECK_FALSE(parse_rejection("forbidden").has_value());
}

TEST_CASE("out of bounds and not found look identical to the requester") {
    CHECK(public_outcome_for(Rejection::OutOfBounds) == public_outcome_for(Rejection::NotFound));
    CHECK(public_outcome_for(Rejection::OutOfBounds) == PublicOutcome::NotFound);
    CHECK(public_outcome_for(Rejection::TraversalAttempt) == PublicOutcome::NotFound);
    CHECK(public_outcome_for(Rejection::None) == PublicOutcome::Ok);
}

// ============================================================================
// Audit log
// ============================================================================

TEST_CASE("audit log records events and counts") {
    AuditLog audit;
    audit.record("path", "../x", Rejection::TraversalAttempt);
    audit.record("path", "/etc/passwd", Rejection::OutOfBounds);
    audit.record("token", "", Rejection::Empty);

    CHECK(audit.total() == 3);
    CHECK(audit.count(Rejection::OutOfBounds) == 1);
    CHECK(audit.count(Rejection::NotFound) == 0);

    auto events = audit.events();
    REQUIRE(events.size() == 3);
    CHECK(events[1].raw_input == "/etc/passwd");
    CHECK(events[2].validator == "token");
}

TEST_CASE("audit log forwards events to its handler") {
    std::vector<AuditEvent> seen;
    AuditLog audit([&seen](const AuditEvent& e) { seen.push_back(e); });

    audit.record("template", "..", Rejection::InvalidCharacter);
    REQUIRE(seen.size() == 1);
    CHECK(seen[0].kind == Rejection::InvalidCharacter);
    CHECK(seen[0].timestamp.size() == 20);  // YYYY-MM-DDTHH:MM:SSZ
}

TEST_CASE("a throwing handler never reaches the caller") {
    AuditLog audit([](const AuditEvent&) { throw std::runtime_error("sink down"); });

    CHECK_NOTHROW(audit.record("path", "../x", Rejection::TraversalAttempt));
    CHECK(audit.dropped() == 1);
    CHECK(audit.total() == 1);
}

TEST_CASE("a handler throwing a non-standard type is counted as dropped") {
    pathguard::test::TempDir tmp;
    auto opened = TrustedRoot::open(tmp.str());
    REQUIRE(opened.ok);

    AuditLog audit([](const AuditEvent&) { throw 42; });
    BoundedPathResolver resolver(*opened.root, &audit);

    ResolveResult r;
    CHECK_NOTHROW(r = resolver.resolve("../x"));
    CHECK_FALSE(r.ok);
    CHECK(r.rejection == Rejection::TraversalAttempt);
    CHECK(audit.dropped() == 1);
    CHECK(audit.count(Rejection::TraversalAttempt) == 1);
}

TEST_CASE("retained events are bounded, counters are not") {
    AuditLog audit(nullptr, 2);
    audit.record("path", "a", Rejection::NotFound);
    audit.record("path", "b", Rejection::NotFound);
    audit.record("path", "c", Rejection::NotFound);

    auto events = audit.events();
    REQUIRE(events.size() == 2);
    CHECK(events[0].raw_input == "b");
    CHECK(events[1].raw_input == "c");
    CHECK(audit.count(Rejection::NotFound) == 3);
}

TEST_CASE("clear resets events and counters") {
    AuditLog audit;
    audit.record("path", "a", Rejection::NotFound);
    audit.clear();
    CHECK(audit.total() == 0);
    CHECK(audit.events().empty());
}

TEST_CASE("concurrent recording is not lost") {
    AuditLog audit(nullptr, 0);
    std::vector<std::future<void>> workers;
    for (int t = 0; t < 4; ++t) {
        workers.push_back(std::async(std::launch::async, [&audit]() {
            for (int i = 0; i < 250; ++i) {
                audit.record("path", "../x", Rejection::TraversalAttempt);
            }
        }));
    }
    for (auto& w : workers) w.get();
    CHECK(audit.total() == 1000);
    CHECK(audit.events().empty());
}

// ============================================================================
// Formatting
// ============================================================================

TEST_CASE("escape_for_log neutralizes control bytes and quotes") {
    CHECK(escape_for_log("plain/path.jpg") == "plain/path.jpg");
    CHECK(escape_for_log("a\nb") == "a\\x0ab");
    CHECK(escape_for_log(std::string("a\0b", 3)) == "a\\x00b");
    CHECK(escape_for_log("say \"hi\"") == "say \\\"hi\\\"");
    CHECK(escape_for_log("..\\win") == "..\\\\win");
}

TEST_CASE("text format carries validator, kind and escaped input") {
    AuditEvent event{"path", "../../etc/passwd\n", Rejection::TraversalAttempt, "2024-01-01T00:00:00Z"};
    auto line = format_audit_text(event);
    CHECK(line == "Audit: path rejected kind=traversal_attempt "
                  "input=\"../../etc/passwd\\x0a\" at=2024-01-01T00:00:00Z");
}

TEST_CASE("json format is a single parsable line") {
    AuditEvent event{"token", "bad\nname", Rejection::InvalidCharacter, "2024-01-01T00:00:00Z"};
    auto line = format_audit_json(event);
    CHECK(line.find('\n') == std::string::npos);

    auto j = nlohmann::json::parse(line);
    CHECK(j["validator"] == "token");
    CHECK(j["raw_input"] == "bad\nname");
    CHECK(j["kind"] == "invalid_character");
    CHECK(j["timestamp"] == "2024-01-01T00:00:00Z");
}

TEST_CASE("json format tolerates invalid UTF-8 input") {
    AuditEvent event{"path", "\xff\xfe", Rejection::NotFound, "2024-01-01T00:00:00Z"};
    std::string line;
    CHECK_NOTHROW(line = format_audit_json(event));
    CHECK(nlohmann::json::parse(line)["kind"] == "not_found");
}
