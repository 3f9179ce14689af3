/**
 * pathguard CLI - resolve command
 *
 * Resolve a stored file path under the uploads root.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace pathguard::cli::commands {

namespace {

struct ResolveOptions {
    std::string candidate;
    std::string root;
};

int cmd_resolve(const GlobalOptions& opts, const ResolveOptions& resolve_opts) {
    auto runtime = load_runtime(opts);
    if (!runtime) {
        return kExitConfigError;
    }

    std::string directory = resolve_opts.root.empty() ? runtime->config.uploads_root
                                                      : resolve_opts.root;
    auto root = open_root("uploads_root", directory, opts.json);
    if (!root) {
        return kExitConfigError;
    }

    BoundedPathResolver resolver(*root, &runtime->audit);
    auto result = resolver.resolve(resolve_opts.candidate);

    // Only the location relative to the root is shown
    std::string relative;
    if (result.ok) {
        relative = to_portable_path(
            result.path->path().lexically_relative(root->canonical()).string());
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = result.ok;
        if (result.ok) {
            j["relative_path"] = relative;
        } else {
            j["rejection"] = rejection_to_string(result.rejection);
            j["public_outcome"] = public_outcome_to_string(public_outcome_for(result.rejection));
        }
        output_json(j);
    } else if (result.ok) {
        std::cout << "accepted: " << relative << std::endl;
    } else {
        std::cout << "rejected: " << rejection_to_string(result.rejection) << std::endl;
    }

    return result.ok ? kExitAccepted : kExitRejected;
}

} // anonymous namespace

void setup_resolve(CLI::App* app, GlobalOptions& opts) {
    static ResolveOptions resolve_opts;

    app->add_option("candidate", resolve_opts.candidate, "Stored file path to check")->required();
    app->add_option("--root", resolve_opts.root, "Trusted root (overrides uploads_root)");

    app->callback([&opts]() {
        std::exit(cmd_resolve(opts, resolve_opts));
    });
}

} // namespace pathguard::cli::commands
