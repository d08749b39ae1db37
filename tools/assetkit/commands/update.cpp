/**
 * assetkit CLI - update command
 *
 * Move an existing installation to the bundle's version.
 */

#include "../common.hpp"

#include <assetkit/cancellation.hpp>
#include <assetkit/maintenance.hpp>

#include <CLI/CLI.hpp>

namespace assetkit::cli::commands {

namespace {

struct UpdateCommandOptions {
    bool force = false;
    bool dry_run = false;
};

int cmd_update(const GlobalOptions& opts, const UpdateCommandOptions& update_opts) {
    init_warning_collector(opts.json, opts.quiet);

    auto source = resolve_bundle_source(opts);
    if (!source) {
        print_error("no bundle source: pass --source or set ASSETKIT_BUNDLE_DIR", opts.json,
                    ErrorKind::Precondition);
        return exit_code_for(ErrorKind::Precondition);
    }

    auto config = load_config(opts);
    if (!config) return exit_code_for(ErrorKind::Precondition);

    auto root = resolve_existing_root(opts, *config);
    if (!root) return exit_code_for(ErrorKind::Precondition);

    CancellationToken cancel;
    install_signal_handlers(cancel);

    UpdateService service(*source, *root, *config);
    UpdateOptions options;
    options.force = update_opts.force;
    options.dry_run = update_opts.dry_run;
    options.cancel = &cancel;
    auto result = service.update(options);
    restore_signal_handlers();

    print_warnings(result.warnings, opts.json);
    print_warnings(result.install.warnings, opts.json);

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = result.ok;
        j["root"] = *root;
        j["dry_run"] = result.dry_run;
        j["from_version"] = result.from_version;
        j["to_version"] = result.to_version;
        j["relation"] = version_relation_to_string(result.relation);
        j["up_to_date"] = result.up_to_date;
        if (result.pre_check) j["pre_check"] = health_report_to_json(*result.pre_check);
        if (result.install.ok) j["install"] = install_result_to_json(result.install);
        if (result.post_check) j["post_check"] = health_report_to_json(*result.post_check);
        if (!result.ok) {
            j["error"] = result.error;
            j["error_kind"] = error_kind_to_string(result.error_kind);
        }
        output_json(j);
        return result.ok ? 0 : exit_code_for(result.error_kind);
    }

    if (!result.ok) {
        print_error(result.error, false);
        if (result.post_check) print_health_report(*result.post_check, opts);
        return exit_code_for(result.error_kind);
    }

    if (result.up_to_date) {
        print_success("Already up to date (" + result.to_version + ")", false);
        return 0;
    }

    std::string from = result.from_version.empty() ? "unknown" : result.from_version;
    if (result.dry_run) {
        print_success("Dry run: would update " + *root + " from " + from + " to " + result.to_version, false);
        return 0;
    }

    print_list("Backed up", result.install.backed_up, opts);
    print_list("Removed files no longer in the bundle", result.install.stale_removed, opts);
    print_list("Moved to the current layout", result.install.migrated, opts);
    print_success("Updated " + *root + " from " + from + " to " + result.to_version, false);
    return 0;
}

} // anonymous namespace

void setup_update(CLI::App* app, GlobalOptions& opts) {
    static UpdateCommandOptions update_opts;

    app->add_flag("-f,--force", update_opts.force, "Reinstall the same version or allow a downgrade");
    app->add_flag("--dry-run", update_opts.dry_run, "Show what the update would do");

    app->callback([&opts]() {
        configure_logging(opts);
        std::exit(cmd_update(opts, update_opts));
    });
}

} // namespace assetkit::cli::commands
