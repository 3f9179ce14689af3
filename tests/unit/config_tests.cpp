#include <doctest/doctest.h>
#include <pathguard/config.hpp>

#include "temp_dir.hpp"

#include <algorithm>
#include <cstdlib>
#include <optional>
#include <string>

using namespace pathguard;
using pathguard::test::TempDir;

namespace {

bool has_warning(const ConfigParseResult& r, const std::string& w) {
    return std::find(r.warnings.begin(), r.warnings.end(), w) != r.warnings.end();
}

// Restores an environment variable on scope exit
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        if (const char* old = std::getenv(name)) {
            old_ = old;
        }
        if (value) {
            setenv(name, value, 1);
        } else {
            unsetenv(name);
        }
    }
    ~ScopedEnv() {
        if (old_) {
            setenv(name_.c_str(), old_->c_str(), 1);
        } else {
            unsetenv(name_.c_str());
        }
    }

private:
    std::string name_;
    std::optional<std::string> old_;
};

} // namespace

TEST_CASE("builtin config has reference defaults") {
    auto config = get_builtin_config();
    CHECK(config.schema == "pathguard.config.v1");
    CHECK(config.token.max_length == 50);
    CHECK(config.templates.suffix == ".html");
    CHECK(config.templates.default_template == "default");
    CHECK(config.templates.directory == "components");
    CHECK(config.serving.max_age == 31536000);
    CHECK(config.audit.enabled);
    CHECK(config.audit.format == AuditFormat::Text);
    CHECK_FALSE(config.uploads_root.empty());
    CHECK(config.templates_root.empty());
}

TEST_CASE("parse full config") {
    const char* json = R"({
        "$schema": "pathguard.config.v1",
        "uploads_root": "/data/uploads",
        "templates_root": "/srv/templates",
        "token": { "max_length": 32 },
        "templates": {
            "component_types": ["text", "image", "text"],
            "suffix": ".tera",
            "default_template": "basic",
            "directory": "blocks"
        },
        "serving": { "max_age": 600 },
        "audit": { "enabled": false, "format": "JSON" }
    })";
    auto r = parse_config(json, "/etc/pathguard.json");
    REQUIRE(r.ok);
    CHECK(r.warnings.empty());
    CHECK(r.config.source_path == "/etc/pathguard.json");
    CHECK(r.config.uploads_root == "/data/uploads");
    CHECK(r.config.templates_root == "/srv/templates");
    CHECK(r.config.token.max_length == 32);
    REQUIRE(r.config.templates.component_types.size() == 2);
    CHECK(r.config.templates.component_types[0] == "text");
    CHECK(r.config.templates.component_types[1] == "image");
    CHECK(r.config.templates.suffix == ".tera");
    CHECK(r.config.templates.default_template == "basic");
    CHECK(r.config.templates.directory == "blocks");
    CHECK(r.config.serving.max_age == 600);
    CHECK_FALSE(r.config.audit.enabled);
    CHECK(r.config.audit.format == AuditFormat::Json);
}

TEST_CASE("schema is required and must match") {
    CHECK(parse_config(R"({"uploads_root": "/x"})").error == "$schema missing");

    auto r = parse_config(R"({"$schema": "pathguard.config.v2"})");
    CHECK_FALSE(r.ok);
    CHECK(r.error.find("mismatch") != std::string::npos);
}

TEST_CASE("malformed JSON is an error") {
    auto r = parse_config("{not json");
    CHECK_FALSE(r.ok);
    CHECK(r.error.find("parse error") != std::string::npos);
    CHECK_FALSE(parse_config("[]").ok);
}

TEST_CASE("invalid optional values warn and keep defaults") {
    const char* json = R"({
        "$schema": "pathguard.config.v1",
        "uploads_root": 7,
        "token": { "max_length": 0 },
        "templates": {
            "component_types": ["text", "../etc", 5],
            "suffix": "/../x",
            "default_template": "bad name"
        },
        "serving": { "max_age": -1 },
        "audit": { "enabled": "yes", "format": "xml" }
    })";
    auto r = parse_config(json);
    REQUIRE(r.ok);
    CHECK(has_warning(r, "invalid_configuration:uploads_root"));
    CHECK(has_warning(r, "invalid_configuration:token.max_length"));
    CHECK(has_warning(r, "invalid_configuration:templates.component_types:../etc"));
    CHECK(has_warning(r, "invalid_configuration:templates.component_types"));
    CHECK(has_warning(r, "invalid_configuration:templates.suffix"));
    CHECK(has_warning(r, "invalid_configuration:templates.default_template"));
    CHECK(has_warning(r, "invalid_configuration:serving.max_age"));
    CHECK(has_warning(r, "invalid_configuration:audit.enabled"));
    CHECK(has_warning(r, "invalid_configuration:audit.format"));

    CHECK(r.config.token.max_length == 50);
    REQUIRE(r.config.templates.component_types.size() == 1);
    CHECK(r.config.templates.component_types[0] == "text");
    CHECK(r.config.templates.suffix == ".html");
    CHECK(r.config.templates.default_template == "default");
    CHECK(r.config.serving.max_age == 31536000);
    CHECK(r.config.audit.enabled);
}

TEST_CASE("environment overrides replace configured roots") {
    ScopedEnv uploads("PATHGUARD_UPLOADS_ROOT", "/env/uploads");
    ScopedEnv templates("PATHGUARD_TEMPLATES_ROOT", "/env/templates");

    auto config = get_builtin_config();
    apply_env_overrides(config);
    CHECK(config.uploads_root == "/env/uploads");
    CHECK(config.templates_root == "/env/templates");
}

TEST_CASE("load_config priority: explicit path, then env, then builtin") {
    TempDir tmp;
    auto explicit_file = tmp.write("explicit.json",
        R"({"$schema": "pathguard.config.v1", "uploads_root": "/explicit"})");
    auto env_file = tmp.write("env.json",
        R"({"$schema": "pathguard.config.v1", "uploads_root": "/from-env"})");

    ScopedEnv no_uploads("PATHGUARD_UPLOADS_ROOT", nullptr);
    ScopedEnv no_templates("PATHGUARD_TEMPLATES_ROOT", nullptr);

    SUBCASE("explicit path wins") {
        ScopedEnv env("PATHGUARD_CONFIG", env_file.string().c_str());
        auto r = load_config(explicit_file.string());
        REQUIRE(r.ok);
        CHECK(r.config.uploads_root == "/explicit");
        CHECK(r.config.source_path == explicit_file.string());
    }
    SUBCASE("environment variable used without explicit path") {
        ScopedEnv env("PATHGUARD_CONFIG", env_file.string().c_str());
        auto r = load_config(std::nullopt);
        REQUIRE(r.ok);
        CHECK(r.config.uploads_root == "/from-env");
    }
    SUBCASE("builtin defaults otherwise") {
        ScopedEnv env("PATHGUARD_CONFIG", nullptr);
        auto r = load_config(std::nullopt);
        REQUIRE(r.ok);
        CHECK(r.config.source_path.empty());
        CHECK(r.config.schema == "pathguard.config.v1");
    }
    SUBCASE("unreadable file is an error") {
        auto r = load_config((tmp.path() / "missing.json").string());
        CHECK_FALSE(r.ok);
        CHECK(r.error.find("cannot read") != std::string::npos);
    }
}
