/**
 * assetkit CLI - Entry Point
 *
 * Safe installer for a bundle of markdown agents and commands.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace assetkit::cli::commands {
    void setup_install(CLI::App* app, GlobalOptions& opts);
    void setup_uninstall(CLI::App* app, GlobalOptions& opts);
    void setup_check(CLI::App* app, GlobalOptions& opts);
    void setup_repair(CLI::App* app, GlobalOptions& opts);
    void setup_update(CLI::App* app, GlobalOptions& opts);
    void setup_backups(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace assetkit::cli;

    CLI::App app{"assetkit - install and safely remove agent bundles"};
    app.set_version_flag("-V,--version", ASSETKIT_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    auto* global_flag = app.add_flag("-g,--global", opts.global, "Use the global configuration directory");
    auto* local_flag = app.add_flag("-l,--local", opts.local, "Use ./.opencode in the current directory");
    global_flag->excludes(local_flag);
    app.add_option("-c,--config-dir", opts.config_dir, "Installation directory to use instead of a scope");
    app.add_option("-s,--source", opts.source, "Bundle source directory");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");
    app.fallthrough();

    // Commands
    auto* install_cmd = app.add_subcommand("install", "Install the bundle");
    commands::setup_install(install_cmd, opts);

    auto* uninstall_cmd = app.add_subcommand("uninstall", "Remove the bundle's files");
    commands::setup_uninstall(uninstall_cmd, opts);

    auto* check_cmd = app.add_subcommand("check", "Verify an installation");
    commands::setup_check(check_cmd, opts);

    auto* repair_cmd = app.add_subcommand("repair", "Fix missing or modified bundle files");
    commands::setup_repair(repair_cmd, opts);

    auto* update_cmd = app.add_subcommand("update", "Update to the bundle's version");
    commands::setup_update(update_cmd, opts);

    auto* backups_cmd = app.add_subcommand("backups", "List or restore backups");
    commands::setup_backups(backups_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
