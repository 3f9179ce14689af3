#include "pathguard/config.hpp"
#include "pathguard/platform.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

#include <nlohmann/json.hpp>

namespace pathguard {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

// Helper to safely get a string from JSON
std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

// Positive integer or nullopt
std::optional<std::uint64_t> get_positive(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_number_unsigned()) {
        auto value = j[key].get<std::uint64_t>();
        if (value > 0) {
            return value;
        }
    }
    return std::nullopt;
}

} // namespace

GuardConfig get_builtin_config() {
    GuardConfig config;
    config.schema = kConfigSchema;
    if (auto home = get_env("HOME"); home && !home->empty()) {
        config.uploads_root = *home + "/.pathguard/uploads";
    } else {
        config.uploads_root = "/var/lib/pathguard/uploads";
    }
    return config;
}

ConfigParseResult parse_config(const std::string& json_str, const std::string& source_path) {
    ConfigParseResult result;
    result.config = get_builtin_config();
    result.config.source_path = source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        // $schema (REQUIRED)
        if (auto schema = get_string(j, "$schema")) {
            result.config.schema = trim(*schema);
        } else {
            result.error = "$schema missing";
            return result;
        }

        if (result.config.schema != kConfigSchema) {
            result.error = std::string("$schema mismatch: expected ") + kConfigSchema;
            return result;
        }

        if (j.contains("uploads_root")) {
            if (auto root = get_string(j, "uploads_root")) {
                result.config.uploads_root = *root;
            } else {
                result.warnings.push_back("invalid_configuration:uploads_root");
            }
        }

        if (j.contains("templates_root")) {
            if (auto root = get_string(j, "templates_root")) {
                result.config.templates_root = *root;
            } else {
                result.warnings.push_back("invalid_configuration:templates_root");
            }
        }

        // "token" section
        if (j.contains("token") && j["token"].is_object()) {
            const auto& token = j["token"];
            if (token.contains("max_length")) {
                if (auto max_length = get_positive(token, "max_length")) {
                    result.config.token.max_length = static_cast<std::size_t>(*max_length);
                } else {
                    result.warnings.push_back("invalid_configuration:token.max_length");
                }
            }
        }

        // "templates" section
        if (j.contains("templates") && j["templates"].is_object()) {
            const auto& templates = j["templates"];
            auto& settings = result.config.templates;

            if (templates.contains("component_types") && templates["component_types"].is_array()) {
                settings.component_types.clear();
                for (const auto& elem : templates["component_types"]) {
                    if (!elem.is_string()) {
                        result.warnings.push_back("invalid_configuration:templates.component_types");
                        continue;
                    }
                    auto type = elem.get<std::string>();
                    // Entries become directory names, so they obey the token policy too
                    if (check_name_token(type, result.config.token) != Rejection::None) {
                        result.warnings.push_back("invalid_configuration:templates.component_types:" + type);
                        continue;
                    }
                    if (std::find(settings.component_types.begin(), settings.component_types.end(),
                                  type) == settings.component_types.end()) {
                        settings.component_types.push_back(type);
                    }
                }
            }

            if (auto suffix = get_string(templates, "suffix")) {
                if (suffix->find('/') == std::string::npos &&
                    suffix->find('\\') == std::string::npos &&
                    suffix->find("..") == std::string::npos) {
                    settings.suffix = *suffix;
                } else {
                    result.warnings.push_back("invalid_configuration:templates.suffix");
                }
            }

            if (auto name = get_string(templates, "default_template")) {
                if (check_name_token(*name, result.config.token) == Rejection::None) {
                    settings.default_template = *name;
                } else {
                    result.warnings.push_back("invalid_configuration:templates.default_template");
                }
            }

            if (auto directory = get_string(templates, "directory")) {
                if (check_name_token(*directory, result.config.token) == Rejection::None) {
                    settings.directory = *directory;
                } else {
                    result.warnings.push_back("invalid_configuration:templates.directory");
                }
            }
        }

        // "serving" section
        if (j.contains("serving") && j["serving"].is_object()) {
            const auto& serving = j["serving"];
            if (serving.contains("max_age")) {
                if (serving["max_age"].is_number_unsigned()) {
                    result.config.serving.max_age = serving["max_age"].get<std::uint64_t>();
                } else {
                    result.warnings.push_back("invalid_configuration:serving.max_age");
                }
            }
        }

        // "audit" section
        if (j.contains("audit") && j["audit"].is_object()) {
            const auto& audit = j["audit"];
            if (audit.contains("enabled")) {
                if (audit["enabled"].is_boolean()) {
                    result.config.audit.enabled = audit["enabled"].get<bool>();
                } else {
                    result.warnings.push_back("invalid_configuration:audit.enabled");
                }
            }
            if (auto format = get_string(audit, "format")) {
                if (auto parsed = parse_audit_format(*format)) {
                    result.config.audit.format = *parsed;
                } else {
                    result.warnings.push_back("invalid_configuration:audit.format");
                }
            }
        }

        result.ok = true;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

void apply_env_overrides(GuardConfig& config) {
    if (auto uploads = get_env("PATHGUARD_UPLOADS_ROOT"); uploads && !uploads->empty()) {
        config.uploads_root = *uploads;
    }
    if (auto templates = get_env("PATHGUARD_TEMPLATES_ROOT"); templates && !templates->empty()) {
        config.templates_root = *templates;
    }
}

ConfigParseResult load_config(const std::optional<std::string>& config_path) {
    std::optional<std::string> path = config_path;
    if (!path || path->empty()) {
        path = get_env("PATHGUARD_CONFIG");
    }

    ConfigParseResult result;
    if (!path || path->empty()) {
        result.ok = true;
        result.config = get_builtin_config();
    } else {
        auto content = read_file(*path);
        if (!content) {
            result.error = "cannot read configuration: " + *path;
            return result;
        }
        result = parse_config(*content, *path);
        if (!result.ok) {
            return result;
        }
    }

    apply_env_overrides(result.config);
    return result;
}

} // namespace pathguard
