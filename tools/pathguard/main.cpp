/**
 * pathguard CLI - Entry Point
 *
 * Operator diagnostics for path and template-name validation.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace pathguard::cli::commands {
    void setup_resolve(CLI::App* app, GlobalOptions& opts);
    void setup_token(CLI::App* app, GlobalOptions& opts);
    void setup_template(CLI::App* app, GlobalOptions& opts);
    void setup_templates(CLI::App* app, GlobalOptions& opts);
    void setup_config(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace pathguard::cli;

    CLI::App app{"pathguard - bounded path resolution"};
    app.set_version_flag("-V,--version", PATHGUARD_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--config", opts.config, "Configuration file (JSON)");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output, no audit lines");

    auto* resolve_cmd = app.add_subcommand("resolve", "Resolve a stored file path under the uploads root");
    commands::setup_resolve(resolve_cmd, opts);

    auto* token_cmd = app.add_subcommand("token", "Check a template name against the token policy");
    commands::setup_token(token_cmd, opts);

    auto* template_cmd = app.add_subcommand("template", "Locate a component template");
    commands::setup_template(template_cmd, opts);

    auto* templates_cmd = app.add_subcommand("templates", "List templates for a component type");
    commands::setup_templates(templates_cmd, opts);

    auto* config_cmd = app.add_subcommand("config", "Print the effective configuration");
    commands::setup_config(config_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
