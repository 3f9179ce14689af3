#pragma once

#include "pathguard/name_token.hpp"
#include "pathguard/template_locator.hpp"
#include "pathguard/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pathguard {

// ============================================================================
// Guard Configuration
// ============================================================================

constexpr const char* kConfigSchema = "pathguard.config.v1";

struct GuardConfig {
    std::string schema;  // MUST be "pathguard.config.v1"

    std::string uploads_root;
    std::string templates_root;

    // "token" section
    TokenPolicy token;

    // "templates" section
    TemplateSettings templates;

    // "serving" section
    struct {
        std::uint64_t max_age = 31536000;
    } serving;

    // "audit" section
    struct {
        bool enabled = true;
        AuditFormat format = AuditFormat::Text;
    } audit;

    // Source path for diagnostics; empty for built-in defaults
    std::string source_path;
};

// Defaults used when no configuration file is given. uploads_root falls back
// to $HOME/.pathguard/uploads, then /var/lib/pathguard/uploads.
GuardConfig get_builtin_config();

struct ConfigParseResult {
    bool ok = false;
    std::string error;
    GuardConfig config;
    std::vector<std::string> warnings;  // "invalid_configuration:<field>"
};

// Parse a configuration from a JSON string
ConfigParseResult parse_config(const std::string& json_str, const std::string& source_path = "");

// Apply PATHGUARD_UPLOADS_ROOT and PATHGUARD_TEMPLATES_ROOT
void apply_env_overrides(GuardConfig& config);

// Locate and parse the configuration.
// Priority: explicit path > PATHGUARD_CONFIG env > built-in defaults.
// Environment root overrides are applied last.
ConfigParseResult load_config(const std::optional<std::string>& config_path);

} // namespace pathguard
