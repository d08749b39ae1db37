/**
 * assetkit CLI - Common utilities and types
 */

#pragma once

#include <assetkit/bundle_config.hpp>
#include <assetkit/installer.hpp>
#include <assetkit/integrity_checker.hpp>
#include <assetkit/path_scope.hpp>
#include <assetkit/platform.hpp>
#include <assetkit/types.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace assetkit::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    bool global = false;           // --global
    bool local = false;            // --local
    std::string config_dir;        // --config-dir
    std::string source;            // --source
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Route library logging to stderr at the level the flags ask for.
 * JSON mode keeps stdout and stderr free of log lines.
 */
inline void configure_logging(const GlobalOptions& opts) {
    auto logger = spdlog::get("assetkit");
    if (!logger) {
        logger = spdlog::stderr_color_mt("assetkit");
    }
    logger->set_pattern("%^%l%$: %v");
    spdlog::set_default_logger(logger);

    if (opts.json) {
        spdlog::set_level(spdlog::level::off);
    } else if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (opts.quiet) {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }
}

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
    static WarningCollector collector;
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
inline void print_error(const std::string& msg, bool json_mode,
                        ErrorKind kind = ErrorKind::Io) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        j["error_kind"] = error_kind_to_string(kind);
        auto& collector = get_warning_collector();
        if (!collector.empty()) {
            j["warnings"] = collector.to_json();
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_warning(const std::string& msg, bool /* json_mode */) {
    get_warning_collector().add(msg);
}

inline void print_warnings(const std::vector<std::string>& msgs, bool json_mode) {
    for (const auto& m : msgs) print_warning(m, json_mode);
}

inline void print_success(const std::string& msg, bool json_mode) {
    if (!json_mode) {
        std::cout << msg << std::endl;
    }
}

inline void print_list(const std::string& heading, const std::vector<std::string>& items,
                       const GlobalOptions& opts) {
    if (opts.json || items.empty()) return;
    std::cout << heading << " (" << items.size() << "):" << std::endl;
    if (opts.quiet) return;
    for (const auto& item : items) {
        std::cout << "  " << item << std::endl;
    }
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
 * Resolve the bundle source directory.
 * Priority: --source flag > ASSETKIT_BUNDLE_DIR env
 */
inline std::optional<std::string> resolve_bundle_source(const GlobalOptions& opts) {
    if (!opts.source.empty()) {
        return expand_home(opts.source);
    }
    if (auto env = get_env("ASSETKIT_BUNDLE_DIR")) {
        return expand_home(*env);
    }
    return std::nullopt;
}

/**
 * Bundle configuration from the source's bundle.json, or defaults when no
 * source is known. Prints the error and returns nullopt on a bad config.
 */
inline std::optional<BundleConfig> load_config(const GlobalOptions& opts) {
    auto source = resolve_bundle_source(opts);
    if (!source) {
        return BundleConfig{};
    }
    auto parsed = load_bundle_config(*source);
    if (!parsed.ok) {
        print_error("invalid bundle configuration: " + parsed.error, opts.json,
                    ErrorKind::Precondition);
        return std::nullopt;
    }
    print_warnings(parsed.warnings, opts.json);
    return parsed.config;
}

inline PathScopeOptions scope_options(const GlobalOptions& opts) {
    PathScopeOptions scope;
    if (opts.global) scope.scope = Scope::Global;
    if (opts.local) scope.scope = Scope::Local;
    scope.explicit_dir = opts.config_dir;
    return scope;
}

/**
 * Root for a command acting on an existing installation.
 */
inline std::optional<std::string> resolve_existing_root(const GlobalOptions& opts,
                                                        const BundleConfig& config) {
    if (opts.global && opts.local) {
        print_error("--global and --local are mutually exclusive", opts.json,
                    ErrorKind::Precondition);
        return std::nullopt;
    }
    auto resolved = detect_installed_root(config, scope_options(opts));
    if (!resolved.ok) {
        print_error(resolved.error, opts.json, ErrorKind::Precondition);
        return std::nullopt;
    }
    return resolved.root;
}

enum class ConfirmAnswer { Yes, No, Eof };

/**
 * Ask for a typed confirmation on stdin.
 */
inline ConfirmAnswer confirm(const std::string& prompt, const std::string& expected) {
    std::cout << prompt << " Type '" << expected << "' to continue: " << std::flush;
    std::string line;
    if (!std::getline(std::cin, line)) {
        std::cout << std::endl;
        return ConfirmAnswer::Eof;
    }
    return line == expected ? ConfirmAnswer::Yes : ConfirmAnswer::No;
}

/**
 * JSON views of library results shared by several commands.
 */
inline nlohmann::json category_to_json(const HealthCategory& category) {
    nlohmann::json j;
    j["passed"] = category.passed;
    j["checks"] = nlohmann::json::array();
    for (const auto& check : category.checks) {
        nlohmann::json c;
        c["name"] = check.name;
        c["passed"] = check.passed;
        c["path"] = check.path;
        if (!check.error.empty()) c["error"] = check.error;
        if (!check.hash.empty()) c["hash"] = check.hash;
        if (check.issue != IssueKind::None) c["issue"] = issue_kind_to_string(check.issue);
        j["checks"].push_back(c);
    }
    return j;
}

inline nlohmann::json health_report_to_json(const HealthReport& report) {
    nlohmann::json j;
    j["passed"] = report.passed;
    j["exit_code"] = report.exit_code;
    j["categories"]["files"] = category_to_json(report.files);
    if (report.version) {
        j["categories"]["version"] = category_to_json(*report.version);
    }
    j["categories"]["integrity"] = category_to_json(report.integrity);
    j["used_manifest"] = report.used_manifest;
    j["tracked_files"] = report.tracked_files;
    return j;
}

inline nlohmann::json install_result_to_json(const InstallResult& result) {
    nlohmann::json j;
    j["ok"] = result.ok;
    j["dry_run"] = result.dry_run;
    j["target"] = result.target_root;
    if (result.dry_run) {
        j["planned"] = nlohmann::json::array();
        for (const auto& p : result.planned) {
            j["planned"].push_back({{"relativePath", p.relative_path},
                                    {"action", planned_action_to_string(p.action)},
                                    {"size", p.size},
                                    {"hash", p.hash}});
        }
    } else {
        j["files_copied"] = result.files_copied;
        j["staged_bytes"] = result.staged_bytes;
        j["manifest_path"] = result.manifest_path;
        j["backed_up"] = result.backed_up;
        j["carried_over"] = result.carried_over;
        if (!result.backup_session.empty()) j["backup_session"] = result.backup_session;
    }
    j["stale_removed"] = result.stale_removed;
    j["migrated"] = result.migrated;
    j["legacy_removed"] = result.legacy_removed;
    if (!result.errors.empty()) j["errors"] = result.errors;
    return j;
}

/**
 * Print the outcome of the health check in text mode.
 */
inline void print_health_report(const HealthReport& report, const GlobalOptions& opts) {
    if (opts.json) return;

    auto print_category = [&opts](const std::string& title, const HealthCategory& category) {
        std::cout << title << ": " << (category.passed ? "OK" : "FAILED") << std::endl;
        for (const auto& check : category.checks) {
            if (check.passed && !opts.verbose) continue;
            std::cout << "  " << (check.passed ? "ok    " : "FAIL  ") << check.name;
            if (!check.error.empty()) std::cout << " (" << check.error << ")";
            std::cout << std::endl;
        }
    };

    print_category("Files", report.files);
    if (report.version) print_category("Version", *report.version);
    print_category("Integrity", report.integrity);
    std::cout << (report.passed ? "All checks passed" : "Some checks failed") << std::endl;
}

} // namespace assetkit::cli
