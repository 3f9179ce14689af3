/**
 * pathguard CLI - Common utilities and types
 */

#pragma once

#include <pathguard/pathguard.hpp>
#include <nlohmann/json.hpp>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pathguard::cli {

// Exit status shared by all commands
constexpr int kExitAccepted = 0;
constexpr int kExitRejected = 1;
constexpr int kExitConfigError = 2;

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string config;            // --config
    bool json = false;             // --json
    bool quiet = false;            // -q, --quiet
};

/**
 * Warning collector for accumulating warnings during command execution.
 * In JSON mode, warnings are collected and output at the end.
 * In text mode, warnings are printed immediately to stderr.
 */
struct WarningCollector {
    std::vector<std::string> warnings;
    bool json_mode = false;
    bool quiet = false;

    void add(const std::string& msg) {
        if (json_mode) {
            warnings.push_back(msg);
        } else if (!quiet) {
            std::cerr << "Warning: " << msg << std::endl;
        }
    }

    void clear() { warnings.clear(); }
    bool empty() const { return warnings.empty(); }

    nlohmann::json to_json() const {
        return nlohmann::json(warnings);
    }
};

inline WarningCollector& get_warning_collector() {
    static thread_local WarningCollector collector;
    return collector;
}

inline void init_warning_collector(bool json_mode, bool quiet) {
    auto& collector = get_warning_collector();
    collector.clear();
    collector.json_mode = json_mode;
    collector.quiet = quiet;
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        auto& collector = get_warning_collector();
        if (!collector.empty()) {
            j["warnings"] = collector.to_json();
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_warning(const std::string& msg) {
    get_warning_collector().add(msg);
}

inline void output_json(const nlohmann::json& j) {
    auto& collector = get_warning_collector();
    if (!collector.empty() && !j.contains("warnings")) {
        nlohmann::json output = j;
        output["warnings"] = collector.to_json();
        std::cout << output.dump(2) << std::endl;
    } else {
        std::cout << j.dump(2) << std::endl;
    }
}

/**
 * Configuration plus the audit log every command reports rejections to.
 */
struct Runtime {
    GuardConfig config;
    AuditLog audit;
};

/**
 * Load configuration and wire the audit handler.
 * Returns nullptr after printing the error when the configuration is unusable.
 */
inline std::unique_ptr<Runtime> load_runtime(const GlobalOptions& opts) {
    init_warning_collector(opts.json, opts.quiet);

    auto loaded = load_config(opts.config.empty() ? std::nullopt
                                                  : std::make_optional(opts.config));
    if (!loaded.ok) {
        print_error(loaded.error, opts.json);
        return nullptr;
    }
    for (const auto& w : loaded.warnings) {
        print_warning(w);
    }

    auto runtime = std::make_unique<Runtime>();
    runtime->config = loaded.config;
    if (runtime->config.audit.enabled && !opts.quiet) {
        runtime->audit.set_handler(make_stderr_audit_handler(runtime->config.audit.format));
    }
    return runtime;
}

/**
 * Open a configured root, reporting failure as a configuration error.
 */
inline std::optional<TrustedRoot> open_root(const std::string& field,
                                            const std::string& directory,
                                            bool json_mode) {
    if (directory.empty()) {
        print_error(field + " is not configured", json_mode);
        return std::nullopt;
    }
    auto opened = TrustedRoot::open(directory);
    if (!opened.ok) {
        print_error(field + ": " + opened.error, json_mode);
        return std::nullopt;
    }
    return opened.root;
}

} // namespace pathguard::cli
