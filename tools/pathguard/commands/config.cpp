/**
 * pathguard CLI - config command
 *
 * Print the effective configuration after file and environment overrides.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace pathguard::cli::commands {

namespace {

struct ConfigOptions {
    bool check = false;
};

int cmd_config(const GlobalOptions& opts, const ConfigOptions& config_opts) {
    auto runtime = load_runtime(opts);
    if (!runtime) {
        return kExitConfigError;
    }
    const auto& config = runtime->config;

    // --check opens every configured root the way a server would at startup
    bool roots_ok = true;
    if (config_opts.check) {
        if (!open_root("uploads_root", config.uploads_root, opts.json)) {
            roots_ok = false;
        }
        if (!config.templates_root.empty() &&
            !open_root("templates_root", config.templates_root, opts.json)) {
            roots_ok = false;
        }
    }

    if (opts.json) {
        nlohmann::json j;
        j["$schema"] = config.schema;
        j["source"] = config.source_path.empty() ? "builtin" : config.source_path;
        j["uploads_root"] = config.uploads_root;
        j["templates_root"] = config.templates_root;
        j["token"]["max_length"] = config.token.max_length;
        j["templates"]["component_types"] = config.templates.component_types;
        j["templates"]["directory"] = config.templates.directory;
        j["templates"]["suffix"] = config.templates.suffix;
        j["templates"]["default_template"] = config.templates.default_template;
        j["serving"]["max_age"] = config.serving.max_age;
        j["audit"]["enabled"] = config.audit.enabled;
        j["audit"]["format"] = audit_format_to_string(config.audit.format);
        if (config_opts.check) {
            j["roots_ok"] = roots_ok;
        }
        output_json(j);
    } else {
        std::cout << "Source: " << (config.source_path.empty() ? "builtin" : config.source_path) << std::endl;
        std::cout << "Uploads root: " << config.uploads_root << std::endl;
        std::cout << "Templates root: "
                  << (config.templates_root.empty() ? "(not configured)" : config.templates_root)
                  << std::endl;
        std::cout << "Token max length: " << config.token.max_length << std::endl;
        std::cout << "Component types:";
        for (const auto& type : config.templates.component_types) {
            std::cout << " " << type;
        }
        std::cout << std::endl;
        std::cout << "Template layout: " << config.templates.directory << "/<type>/<name>"
                  << config.templates.suffix << " (default: " << config.templates.default_template
                  << ")" << std::endl;
        std::cout << "Cache max-age: " << config.serving.max_age << std::endl;
        std::cout << "Audit: " << (config.audit.enabled ? audit_format_to_string(config.audit.format) : "off")
                  << std::endl;
    }

    return roots_ok ? kExitAccepted : kExitConfigError;
}

} // anonymous namespace

void setup_config(CLI::App* app, GlobalOptions& opts) {
    static ConfigOptions config_opts;

    app->add_flag("--check", config_opts.check, "Open the configured roots");

    app->callback([&opts]() {
        std::exit(cmd_config(opts, config_opts));
    });
}

} // namespace pathguard::cli::commands
