#include "pathguard/template_locator.hpp"
#include "pathguard/path_utils.hpp"
#include "pathguard/platform.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>

namespace pathguard {

ComponentTemplateLocator::ComponentTemplateLocator(TrustedRoot root, TemplateSettings settings,
                                                   TokenPolicy policy, AuditLog* audit)
    : settings_(std::move(settings)),
      resolver_(std::move(root)),
      type_validator_(policy, audit, "component_type"),
      name_validator_(policy, audit, "template"),
      audit_(audit) {}

void ComponentTemplateLocator::set_override(const std::string& key, std::string content) {
    overrides_[key] = std::move(content);
}

bool ComponentTemplateLocator::is_known_component_type(const std::string& component_type) const {
    const auto& types = settings_.component_types;
    return std::find(types.begin(), types.end(), component_type) != types.end();
}

std::string ComponentTemplateLocator::template_key(const NameToken& component_type,
                                                   const NameToken& template_name) const {
    return join_relative({settings_.directory, component_type.str(),
                          template_name.str() + settings_.suffix});
}

void ComponentTemplateLocator::audit_rejection(const std::string& validator,
                                               const std::string& raw,
                                               Rejection kind) const {
    if (audit_) {
        audit_->record(validator, raw, kind);
    }
}

TemplateLookup ComponentTemplateLocator::reject(const std::string& validator,
                                                const std::string& raw,
                                                Rejection kind) const {
    audit_rejection(validator, raw, kind);
    TemplateLookup lookup;
    lookup.rejection = kind;
    return lookup;
}

TemplateLookup ComponentTemplateLocator::locate(const std::string& component_type,
                                                const std::string& template_name) const {
    auto type = type_validator_.validate(component_type);
    if (!type.ok) {
        TemplateLookup lookup;
        lookup.rejection = type.rejection;
        return lookup;
    }
    if (!is_known_component_type(type.token->str())) {
        return reject("component_type", component_type, Rejection::OutOfBounds);
    }

    auto name = name_validator_.validate(template_name);
    if (!name.ok) {
        TemplateLookup lookup;
        lookup.rejection = name.rejection;
        return lookup;
    }

    std::string key = template_key(*type.token, *name.token);

    auto override_it = overrides_.find(key);
    if (override_it != overrides_.end()) {
        TemplateLookup lookup;
        lookup.ok = true;
        lookup.source = TemplateSource::Override;
        lookup.key = key;
        lookup.content = override_it->second;
        return lookup;
    }

    auto primary = resolver_.resolve(key);
    if (primary.ok) {
        TemplateLookup lookup;
        lookup.ok = true;
        lookup.source = TemplateSource::File;
        lookup.key = key;
        lookup.path = std::move(primary.path);
        return lookup;
    }
    if (primary.rejection != Rejection::NotFound) {
        // A symlink out of the root or a directory in place of a template
        return reject("template", template_name, primary.rejection);
    }

    auto fallback_name = name_validator_.validate(settings_.default_template);
    if (!fallback_name.ok) {
        return reject("template", template_name, Rejection::NotFound);
    }
    std::string default_key = template_key(*type.token, *fallback_name.token);

    auto fallback = resolver_.resolve(default_key);
    if (!fallback.ok) {
        return reject("template", template_name, fallback.rejection);
    }

    TemplateLookup lookup;
    lookup.ok = true;
    lookup.source = TemplateSource::DefaultFile;
    lookup.key = default_key;
    lookup.path = std::move(fallback.path);
    return lookup;
}

TemplateListing ComponentTemplateLocator::list_templates(const std::string& component_type) const {
    namespace fs = std::filesystem;

    TemplateListing listing;
    auto type = type_validator_.validate(component_type);
    if (!type.ok) {
        listing.rejection = type.rejection;
        return listing;
    }
    if (!is_known_component_type(type.token->str())) {
        audit_rejection("component_type", component_type, Rejection::OutOfBounds);
        listing.rejection = Rejection::OutOfBounds;
        return listing;
    }

    const std::string type_dir = join_relative({settings_.directory, type.token->str()});
    const TrustedRoot& root = resolver_.root();

    std::error_code ec;
    fs::path canonical_dir = fs::canonical(root.raw() / type_dir, ec);
    if (!ec && !is_within_root(root.canonical(), canonical_dir)) {
        audit_rejection("component_type", component_type, Rejection::OutOfBounds);
        listing.rejection = Rejection::OutOfBounds;
        return listing;
    }
    if (ec || !is_directory(canonical_dir.string())) {
        listing.ok = true;
        listing.names.push_back(settings_.default_template);
        return listing;
    }

    const auto& suffix = settings_.suffix;
    for (fs::directory_iterator it(canonical_dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::string file_name = it->path().filename().string();
        if (file_name.size() <= suffix.size() ||
            file_name.compare(file_name.size() - suffix.size(), suffix.size(), suffix) != 0) {
            continue;
        }
        std::string stem = file_name.substr(0, file_name.size() - suffix.size());
        if (check_name_token(stem, name_validator_.policy()) != Rejection::None) {
            continue;
        }
        // Symlinks leaving the root and directories named like templates drop out here
        if (!resolver_.resolve(join_relative({type_dir, file_name})).ok) {
            continue;
        }
        listing.names.push_back(std::move(stem));
    }

    const std::string& default_name = settings_.default_template;
    std::sort(listing.names.begin(), listing.names.end(),
              [&default_name](const std::string& a, const std::string& b) {
                  if (a == b) return false;
                  if (a == default_name) return true;
                  if (b == default_name) return false;
                  return a < b;
              });
    listing.ok = true;
    return listing;
}

TemplateContent ComponentTemplateLocator::load(const std::string& component_type,
                                               const std::string& template_name) const {
    TemplateContent result;
    auto lookup = locate(component_type, template_name);
    if (!lookup.ok) {
        result.rejection = lookup.rejection;
        return result;
    }

    result.source = lookup.source;
    if (lookup.source == TemplateSource::Override) {
        result.ok = true;
        result.content = std::move(lookup.content);
        return result;
    }

    auto content = read_resolved_file(*lookup.path);
    if (!content) {
        // Removed between resolution and read
        result.rejection = Rejection::NotFound;
        return result;
    }
    result.ok = true;
    result.content = std::move(*content);
    return result;
}

} // namespace pathguard
