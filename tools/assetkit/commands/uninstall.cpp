/**
 * assetkit CLI - uninstall command
 *
 * Remove the files the bundle owns, leaving everything else in place.
 */

#include "../common.hpp"

#include <assetkit/backup_manager.hpp>
#include <assetkit/manifest.hpp>
#include <assetkit/uninstaller.hpp>

#include <CLI/CLI.hpp>

namespace assetkit::cli::commands {

namespace {

struct UninstallCommandOptions {
    bool dry_run = false;
    bool force = false;
    bool no_backup = false;
};

nlohmann::json result_to_json(const UninstallResult& result, const std::string& root) {
    nlohmann::json j;
    j["ok"] = result.ok;
    j["root"] = root;
    j["dry_run"] = result.dry_run;
    j["fallback_mode"] = result.fallback_mode;
    if (result.fallback_mode) j["fallback_reason"] = result.fallback_reason;
    j["removed"] = result.removed;
    j["skippedMissing"] = result.skipped_missing;
    j["preservedDirs"] = result.preserved_dirs;
    j["removedDirs"] = result.removed_dirs;
    j["diverged"] = result.diverged;
    j["protected"] = result.protected_entries;
    if (!result.failed.empty()) j["failed"] = result.failed;
    if (!result.backup_session.empty()) j["backup_session"] = result.backup_session;
    if (!result.backup_failures.empty()) j["backup_failures"] = result.backup_failures;
    return j;
}

void print_plan(const UninstallPlan& plan, const NamespaceFilter& filter,
                const GlobalOptions& opts) {
    if (opts.json) return;

    std::cout << "Installation: " << plan.root << std::endl;
    std::cout << "Only paths matching these namespaces can be removed:" << std::endl;
    for (const auto& ns : filter.describe()) {
        std::cout << "  " << ns << std::endl;
    }

    std::vector<std::string> files;
    for (const auto& c : plan.to_remove) files.push_back(c.relative_path);
    print_list("Files to remove", files, opts);
    print_list("Already missing", plan.skipped_missing, opts);
    print_list("Directories to remove", plan.removed_dirs, opts);
    print_list("Directories kept (contain other files)", plan.preserved_dirs, opts);
    print_list("Tracked but outside the namespaces (kept)", plan.protected_entries, opts);
    print_list("Modified since install (removed anyway)", plan.diverged, opts);
}

int cmd_uninstall(const GlobalOptions& opts, const UninstallCommandOptions& uninstall_opts) {
    init_warning_collector(opts.json, opts.quiet);

    auto config = load_config(opts);
    if (!config) return exit_code_for(ErrorKind::Precondition);

    auto root = resolve_existing_root(opts, *config);
    if (!root) return exit_code_for(ErrorKind::Precondition);

    Manifest manifest(*root, config->manifest_relative_path());
    auto loaded = manifest.load();
    if (!loaded.ok) {
        print_warning("manifest unusable (" + loaded.error + "); using namespace scan", opts.json);
    }

    auto filter = config->make_filter();
    BackupManager backups(*root, {config->backup_dir, config->backup_retention});
    Uninstaller uninstaller(*root, filter, config->manifest_relative_path(), &backups);

    auto plan = uninstaller.plan(loaded);
    print_warnings(plan.warnings, opts.json);
    if (plan.fallback_mode) {
        print_warning("fallback mode: " + plan.fallback_reason, opts.json);
    }
    print_plan(plan, filter, opts);

    if (plan.to_remove.empty()) {
        if (opts.json) {
            UninstallOptions preview;
            preview.dry_run = true;
            auto nothing = uninstaller.execute(plan, preview);
            nothing.dry_run = uninstall_opts.dry_run;
            output_json(result_to_json(nothing, *root));
        } else {
            print_success("Nothing to remove", false);
        }
        return 0;
    }

    if (!uninstall_opts.dry_run && !uninstall_opts.force) {
        if (opts.json) {
            print_error("confirmation required: pass --force with --json", true,
                        ErrorKind::Precondition);
            return exit_code_for(ErrorKind::Precondition);
        }
        auto answer = confirm("Remove " + std::to_string(plan.to_remove.size()) + " files from " +
                                  *root + "?",
                              "yes");
        if (answer == ConfirmAnswer::Eof) {
            print_error("interrupted; nothing was removed", false, ErrorKind::Interrupted);
            return exit_code_for(ErrorKind::Interrupted);
        }
        if (answer == ConfirmAnswer::No) {
            print_success("Uninstall cancelled; nothing was removed", false);
            return 0;
        }
    }

    UninstallOptions options;
    options.dry_run = uninstall_opts.dry_run;
    options.backup = !uninstall_opts.no_backup;
    options.manifest_relative_path = config->manifest_relative_path();

    auto result = uninstaller.execute(plan, options);
    print_warnings(result.backup_failures, opts.json);

    if (opts.json) {
        auto j = result_to_json(result, *root);
        if (!result.ok) {
            j["error"] = result.error;
            j["error_kind"] = error_kind_to_string(result.error_kind);
        }
        output_json(j);
        return result.ok ? 0 : exit_code_for(result.error_kind);
    }

    if (result.dry_run) {
        print_success("Dry run: nothing was removed", false);
        return 0;
    }

    print_list("Failed", result.failed, opts);
    if (!result.backup_session.empty()) {
        print_success("Backup: " + backups.session_path(), false);
    }
    if (!result.ok) {
        print_error(result.error, false);
        return exit_code_for(result.error_kind);
    }
    print_success("Removed " + std::to_string(result.removed.size()) + " files and " +
                      std::to_string(result.removed_dirs.size()) + " directories",
                  false);
    return 0;
}

} // anonymous namespace

void setup_uninstall(CLI::App* app, GlobalOptions& opts) {
    static UninstallCommandOptions uninstall_opts;

    app->add_flag("--dry-run", uninstall_opts.dry_run, "Show what would be removed");
    app->add_flag("-f,--force", uninstall_opts.force, "Skip the confirmation prompt");
    app->add_flag("--no-backup", uninstall_opts.no_backup, "Do not back up removed files");

    app->callback([&opts]() {
        configure_logging(opts);
        std::exit(cmd_uninstall(opts, uninstall_opts));
    });
}

} // namespace assetkit::cli::commands
