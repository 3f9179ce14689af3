#pragma once

#include "pathguard/audit.hpp"
#include "pathguard/name_token.hpp"
#include "pathguard/path_resolver.hpp"
#include "pathguard/trusted_root.hpp"
#include "pathguard/types.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace pathguard {

// ============================================================================
// Template Settings
// ============================================================================

struct TemplateSettings {
    // Closed set of component directories
    std::vector<std::string> component_types = {
        "text", "markdown", "html", "image", "code", "blog_summary", "custom"};
    std::string directory = "components";
    std::string suffix = ".html";
    std::string default_template = "default";
};

// ============================================================================
// Template Lookup
// ============================================================================

enum class TemplateSource {
    Override,     // site-specific content registered in memory
    File,         // <root>/<directory>/<type>/<template><suffix>
    DefaultFile,  // <root>/<directory>/<type>/<default_template><suffix>
};

inline const char* template_source_to_string(TemplateSource s) {
    switch (s) {
        case TemplateSource::Override: return "override";
        case TemplateSource::File: return "file";
        case TemplateSource::DefaultFile: return "default";
        default: return "file";
    }
}

struct TemplateLookup {
    bool ok = false;
    Rejection rejection = Rejection::None;
    TemplateSource source = TemplateSource::File;
    std::string key;                   // relative key of the selected template
    std::optional<ResolvedPath> path;  // set for File and DefaultFile
    std::string content;               // set for Override
};

struct TemplateContent {
    bool ok = false;
    Rejection rejection = Rejection::None;
    TemplateSource source = TemplateSource::File;
    std::string content;
};

struct TemplateListing {
    bool ok = false;
    Rejection rejection = Rejection::None;
    std::vector<std::string> names;  // default template first
};

// ============================================================================
// Component Template Locator
// ============================================================================

// Maps (component_type, template) pairs to template content without letting
// either value steer the lookup outside the templates root.
class ComponentTemplateLocator {
public:
    ComponentTemplateLocator(TrustedRoot root, TemplateSettings settings,
                             TokenPolicy policy = {}, AuditLog* audit = nullptr);

    // Register site-specific content for a key such as
    // "components/text/hero.html". Keys are matched exactly.
    void set_override(const std::string& key, std::string content);

    // No filesystem reads beyond existence checks
    TemplateLookup locate(const std::string& component_type,
                          const std::string& template_name) const;

    // locate() followed by reading the selected file
    TemplateContent load(const std::string& component_type,
                         const std::string& template_name) const;

    // Template names available on disk for a component type. A missing
    // component directory lists only the default template.
    TemplateListing list_templates(const std::string& component_type) const;

    std::string template_key(const NameToken& component_type, const NameToken& template_name) const;

    bool is_known_component_type(const std::string& component_type) const;

    const TemplateSettings& settings() const { return settings_; }

private:
    TemplateLookup reject(const std::string& validator, const std::string& raw, Rejection kind) const;
    void audit_rejection(const std::string& validator, const std::string& raw, Rejection kind) const;

    TemplateSettings settings_;
    BoundedPathResolver resolver_;  // unaudited; misses here are normal fallbacks
    NameTokenValidator type_validator_;
    NameTokenValidator name_validator_;
    AuditLog* audit_;
    std::unordered_map<std::string, std::string> overrides_;
};

} // namespace pathguard
