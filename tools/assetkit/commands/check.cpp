/**
 * assetkit CLI - check command
 *
 * Verify an installation: required directories, version marker, file integrity.
 */

#include "../common.hpp"

#include <assetkit/integrity_checker.hpp>

#include <CLI/CLI.hpp>

namespace assetkit::cli::commands {

namespace {

struct CheckCommandOptions {
    std::string expected_version;
};

int cmd_check(const GlobalOptions& opts, const CheckCommandOptions& check_opts) {
    init_warning_collector(opts.json, opts.quiet);

    auto config = load_config(opts);
    if (!config) return exit_code_for(ErrorKind::Precondition);

    auto root = resolve_existing_root(opts, *config);
    if (!root) return exit_code_for(ErrorKind::Precondition);

    IntegrityChecker checker(*root, *config);
    CheckOptions options;
    options.expected_version = check_opts.expected_version;
    auto report = checker.check_all(options);

    if (opts.json) {
        auto j = health_report_to_json(report);
        j["ok"] = report.passed;
        j["root"] = *root;
        if (auto version = checker.installed_version()) j["installed_version"] = *version;
        output_json(j);
    } else {
        std::cout << "Installation: " << *root << std::endl;
        if (auto version = checker.installed_version()) {
            std::cout << "Version: " << *version << std::endl;
        }
        print_health_report(report, opts);
    }
    return report.exit_code;
}

} // anonymous namespace

void setup_check(CLI::App* app, GlobalOptions& opts) {
    static CheckCommandOptions check_opts;

    app->add_option("--expected-version", check_opts.expected_version,
                    "Fail unless this version is installed");

    app->callback([&opts]() {
        configure_logging(opts);
        std::exit(cmd_check(opts, check_opts));
    });
}

} // namespace assetkit::cli::commands
