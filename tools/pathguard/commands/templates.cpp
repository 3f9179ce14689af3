/**
 * pathguard CLI - templates command
 *
 * List the templates available for a component type.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace pathguard::cli::commands {

namespace {

struct TemplatesOptions {
    std::string component_type;
    std::string root;
};

int cmd_templates(const GlobalOptions& opts, const TemplatesOptions& templates_opts) {
    auto runtime = load_runtime(opts);
    if (!runtime) {
        return kExitConfigError;
    }

    std::string directory = templates_opts.root.empty() ? runtime->config.templates_root
                                                        : templates_opts.root;
    auto root = open_root("templates_root", directory, opts.json);
    if (!root) {
        return kExitConfigError;
    }

    ComponentTemplateLocator locator(*root, runtime->config.templates, runtime->config.token,
                                     &runtime->audit);
    auto listing = locator.list_templates(templates_opts.component_type);

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = listing.ok;
        if (listing.ok) {
            j["templates"] = listing.names;
        } else {
            j["rejection"] = rejection_to_string(listing.rejection);
        }
        output_json(j);
    } else if (listing.ok) {
        for (const auto& name : listing.names) {
            std::cout << name << std::endl;
        }
    } else {
        std::cout << "rejected: " << rejection_to_string(listing.rejection) << std::endl;
    }

    return listing.ok ? kExitAccepted : kExitRejected;
}

} // anonymous namespace

void setup_templates(CLI::App* app, GlobalOptions& opts) {
    static TemplatesOptions templates_opts;

    app->add_option("component_type", templates_opts.component_type, "Component type")->required();
    app->add_option("--root", templates_opts.root, "Templates root (overrides templates_root)");

    app->callback([&opts]() {
        std::exit(cmd_templates(opts, templates_opts));
    });
}

} // namespace pathguard::cli::commands
