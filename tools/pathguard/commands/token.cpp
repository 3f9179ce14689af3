/**
 * pathguard CLI - token command
 *
 * Check a template name against the token policy.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace pathguard::cli::commands {

namespace {

struct TokenOptions {
    std::string raw;
    std::size_t max_length = 0;
};

int cmd_token(const GlobalOptions& opts, const TokenOptions& token_opts) {
    auto runtime = load_runtime(opts);
    if (!runtime) {
        return kExitConfigError;
    }

    TokenPolicy policy = runtime->config.token;
    if (token_opts.max_length > 0) {
        policy.max_length = token_opts.max_length;
    }

    NameTokenValidator validator(policy, &runtime->audit, "token");
    auto result = validator.validate(token_opts.raw);

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = result.ok;
        j["max_length"] = policy.max_length;
        if (result.ok) {
            j["token"] = result.token->str();
        } else {
            j["rejection"] = rejection_to_string(result.rejection);
        }
        output_json(j);
    } else if (result.ok) {
        std::cout << "accepted: " << result.token->str() << std::endl;
    } else {
        std::cout << "rejected: " << rejection_to_string(result.rejection) << std::endl;
    }

    return result.ok ? kExitAccepted : kExitRejected;
}

} // anonymous namespace

void setup_token(CLI::App* app, GlobalOptions& opts) {
    static TokenOptions token_opts;

    app->add_option("raw", token_opts.raw, "Template name to check")->required();
    app->add_option("--max-length", token_opts.max_length, "Override token.max_length")
        ->check(CLI::PositiveNumber);

    app->callback([&opts]() {
        std::exit(cmd_token(opts, token_opts));
    });
}

} // namespace pathguard::cli::commands
