/**
 * assetkit CLI - install command
 *
 * Install the bundle into the global or local configuration directory.
 */

#include "../common.hpp"

#include <assetkit/backup_manager.hpp>
#include <assetkit/cancellation.hpp>
#include <assetkit/installer.hpp>

#include <CLI/CLI.hpp>

namespace assetkit::cli::commands {

namespace {

struct InstallCommandOptions {
    bool force = false;
    bool dry_run = false;
};

int cmd_install(const GlobalOptions& opts, const InstallCommandOptions& install_opts) {
    init_warning_collector(opts.json, opts.quiet);

    auto source = resolve_bundle_source(opts);
    if (!source) {
        print_error("no bundle source: pass --source or set ASSETKIT_BUNDLE_DIR", opts.json,
                    ErrorKind::Precondition);
        return exit_code_for(ErrorKind::Precondition);
    }

    auto config = load_config(opts);
    if (!config) return exit_code_for(ErrorKind::Precondition);

    if (opts.global && opts.local) {
        print_error("--global and --local are mutually exclusive", opts.json, ErrorKind::Precondition);
        return exit_code_for(ErrorKind::Precondition);
    }

    auto root = resolve_install_root(*config, scope_options(opts));
    if (!root.ok) {
        print_error(root.error, opts.json, ErrorKind::Precondition);
        return exit_code_for(ErrorKind::Precondition);
    }

    if (has_installation(*config, root.root) && !install_opts.force && !install_opts.dry_run) {
        print_error(config->name + " is already installed in " + root.root +
                        "; use --force to reinstall or run update",
                    opts.json, ErrorKind::Precondition);
        return exit_code_for(ErrorKind::Precondition);
    }

    CancellationToken cancel;
    install_signal_handlers(cancel);

    BackupManager backups(root.root, {config->backup_dir, config->backup_retention});
    Installer installer(*config, &backups);

    InstallOptions options;
    options.dry_run = install_opts.dry_run;
    options.cancel = &cancel;

    auto result = installer.install(*source, root.root, options);
    restore_signal_handlers();

    print_warnings(result.warnings, opts.json);

    if (!result.ok) {
        if (opts.json) {
            auto j = install_result_to_json(result);
            j["error"] = result.error;
            j["error_kind"] = error_kind_to_string(result.error_kind);
            output_json(j);
        } else {
            print_error(result.error, false);
            print_list("Failed files", result.errors, opts);
        }
        return exit_code_for(result.error_kind);
    }

    if (opts.json) {
        auto j = install_result_to_json(result);
        j["scope"] = scope_to_string(root.scope);
        output_json(j);
        return 0;
    }

    if (result.dry_run) {
        std::vector<std::string> create, overwrite, unchanged;
        for (const auto& p : result.planned) {
            switch (p.action) {
                case PlannedAction::Create: create.push_back(p.relative_path); break;
                case PlannedAction::Overwrite: overwrite.push_back(p.relative_path); break;
                case PlannedAction::Unchanged: unchanged.push_back(p.relative_path); break;
            }
        }
        print_success("Dry run: nothing was written to " + result.target_root, false);
        print_list("Would create", create, opts);
        print_list("Would overwrite", overwrite, opts);
        print_list("Unchanged", unchanged, opts);
        print_list("Would remove (no longer in the bundle)", result.stale_removed, opts);
        print_list("Would move to the current layout", result.migrated, opts);
        print_list("Would remove (replaced by the current layout)", result.legacy_removed, opts);
        return 0;
    }

    print_list("Backed up", result.backed_up, opts);
    print_list("Removed files no longer in the bundle", result.stale_removed, opts);
    print_list("Moved to the current layout", result.migrated, opts);
    print_list("Removed legacy copies", result.legacy_removed, opts);
    print_success("Installed " + std::to_string(result.files_copied) + " files into " +
                      result.target_root + " (" + scope_to_string(root.scope) + ")",
                  false);
    return 0;
}

} // anonymous namespace

void setup_install(CLI::App* app, GlobalOptions& opts) {
    static InstallCommandOptions install_opts;

    app->add_flag("-f,--force", install_opts.force, "Reinstall over an existing installation");
    app->add_flag("--dry-run", install_opts.dry_run, "Show what would be written");

    app->callback([&opts]() {
        configure_logging(opts);
        std::exit(cmd_install(opts, install_opts));
    });
}

} // namespace assetkit::cli::commands
