/**
 * pathguard CLI - template command
 *
 * Locate the template a component would render with.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace pathguard::cli::commands {

namespace {

struct TemplateOptions {
    std::string component_type;
    std::string template_name;
    std::string root;
    bool print_content = false;
};

int cmd_template(const GlobalOptions& opts, const TemplateOptions& template_opts) {
    auto runtime = load_runtime(opts);
    if (!runtime) {
        return kExitConfigError;
    }

    std::string directory = template_opts.root.empty() ? runtime->config.templates_root
                                                       : template_opts.root;
    auto root = open_root("templates_root", directory, opts.json);
    if (!root) {
        return kExitConfigError;
    }

    ComponentTemplateLocator locator(*root, runtime->config.templates, runtime->config.token,
                                     &runtime->audit);

    auto lookup = locator.locate(template_opts.component_type, template_opts.template_name);
    std::string content;
    if (lookup.ok && template_opts.print_content) {
        auto loaded = locator.load(template_opts.component_type, template_opts.template_name);
        if (!loaded.ok) {
            lookup.ok = false;
            lookup.rejection = loaded.rejection;
        } else {
            content = std::move(loaded.content);
        }
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = lookup.ok;
        if (lookup.ok) {
            j["source"] = template_source_to_string(lookup.source);
            j["key"] = lookup.key;
            if (template_opts.print_content) {
                j["content"] = content;
            }
        } else {
            j["rejection"] = rejection_to_string(lookup.rejection);
        }
        output_json(j);
    } else if (lookup.ok) {
        std::cout << template_source_to_string(lookup.source) << ": " << lookup.key << std::endl;
        if (template_opts.print_content) {
            std::cout << content;
        }
    } else {
        std::cout << "rejected: " << rejection_to_string(lookup.rejection) << std::endl;
    }

    return lookup.ok ? kExitAccepted : kExitRejected;
}

} // anonymous namespace

void setup_template(CLI::App* app, GlobalOptions& opts) {
    static TemplateOptions template_opts;

    app->add_option("component_type", template_opts.component_type, "Component type")->required();
    app->add_option("template", template_opts.template_name, "Template name")->required();
    app->add_option("--root", template_opts.root, "Templates root (overrides templates_root)");
    app->add_flag("--content", template_opts.print_content, "Print the template content");

    app->callback([&opts]() {
        std::exit(cmd_template(opts, template_opts));
    });
}

} // namespace pathguard::cli::commands
