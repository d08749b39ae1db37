/**
 * assetkit CLI - repair command
 *
 * Reinstall missing, modified or unrewritten bundle files.
 */

#include "../common.hpp"

#include <assetkit/cancellation.hpp>
#include <assetkit/maintenance.hpp>

#include <CLI/CLI.hpp>

namespace assetkit::cli::commands {

namespace {

struct RepairCommandOptions {
    bool dry_run = false;
};

nlohmann::json issues_to_json(const IssueSet& issues) {
    nlohmann::json j;
    j["missing"] = issues.missing;
    j["drifted"] = issues.drifted;
    j["unrewritten"] = issues.unrewritten;
    j["unreadable"] = issues.unreadable;
    j["structural"] = issues.structural;
    return j;
}

int cmd_repair(const GlobalOptions& opts, const RepairCommandOptions& repair_opts) {
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

    RepairService service(*source, *root, *config);
    RepairOptions options;
    options.dry_run = repair_opts.dry_run;
    options.cancel = &cancel;
    auto result = service.repair(options);
    restore_signal_handlers();

    print_warnings(result.install.warnings, opts.json);

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = result.ok;
        j["root"] = *root;
        j["dry_run"] = result.dry_run;
        j["issues"] = issues_to_json(result.issues);
        j["full_reinstall"] = result.full_reinstall;
        j["repaired"] = result.repaired;
        j["unrepairable"] = result.unrepairable;
        if (result.post_check) j["post_check"] = health_report_to_json(*result.post_check);
        if (!result.ok) {
            j["error"] = result.error;
            j["error_kind"] = error_kind_to_string(result.error_kind);
        }
        output_json(j);
        return result.ok ? 0 : exit_code_for(result.error_kind);
    }

    if (result.issues.empty()) {
        print_success("No issues found in " + *root, false);
        return 0;
    }

    print_list("Missing", result.issues.missing, opts);
    print_list("Modified", result.issues.drifted, opts);
    print_list("Path token not rewritten", result.issues.unrewritten, opts);
    print_list("Unreadable", result.issues.unreadable, opts);
    print_list("Structural problems", result.issues.structural, opts);
    print_list("Cannot be repaired (no longer in the bundle)", result.unrepairable, opts);

    if (!result.ok) {
        print_error(result.error, false);
        if (result.post_check) print_health_report(*result.post_check, opts);
        return exit_code_for(result.error_kind);
    }

    if (result.dry_run) {
        print_list(result.full_reinstall ? "Would reinstall the whole bundle" : "Would repair",
                   result.repaired, opts);
        return 0;
    }

    print_list("Backed up", result.install.backed_up, opts);
    print_list("Moved to the current layout", result.install.migrated, opts);
    print_success("Repaired " + std::to_string(result.repaired.size()) + " files" +
                      (result.full_reinstall ? " (full reinstall)" : ""),
                  false);
    return 0;
}

} // anonymous namespace

void setup_repair(CLI::App* app, GlobalOptions& opts) {
    static RepairCommandOptions repair_opts;

    app->add_flag("--dry-run", repair_opts.dry_run, "Show what would be repaired");

    app->callback([&opts]() {
        configure_logging(opts);
        std::exit(cmd_repair(opts, repair_opts));
    });
}

} // namespace assetkit::cli::commands
