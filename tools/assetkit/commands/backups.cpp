/**
 * assetkit CLI - backups command
 *
 * List backup sessions and restore one on request.
 */

#include "../common.hpp"

#include <assetkit/backup_manager.hpp>

#include <CLI/CLI.hpp>

#include <set>

namespace assetkit::cli::commands {

namespace {

struct RestoreCommandOptions {
    std::string session;
    std::vector<std::string> only;
};

int cmd_backups_list(const GlobalOptions& opts) {
    init_warning_collector(opts.json, opts.quiet);

    auto config = load_config(opts);
    if (!config) return exit_code_for(ErrorKind::Precondition);

    auto root = resolve_existing_root(opts, *config);
    if (!root) return exit_code_for(ErrorKind::Precondition);

    BackupManager backups(*root, {config->backup_dir, config->backup_retention});
    auto sessions = backups.list_sessions();

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["backup_dir"] = backups.backup_dir();
        j["sessions"] = nlohmann::json::array();
        for (const auto& s : sessions) {
            nlohmann::json js;
            js["name"] = s.name;
            js["path"] = s.path;
            js["files"] = nlohmann::json::array();
            for (const auto& e : s.entries) {
                js["files"].push_back({{"relativePath", e.relative_path},
                                       {"reason", e.reason},
                                       {"size", e.size}});
            }
            j["sessions"].push_back(js);
        }
        output_json(j);
        return 0;
    }

    if (sessions.empty()) {
        std::cout << "No backups in " << backups.backup_dir() << std::endl;
        return 0;
    }
    for (const auto& s : sessions) {
        std::cout << s.name << " (" << s.entries.size() << " files)" << std::endl;
        if (!opts.verbose) continue;
        for (const auto& e : s.entries) {
            std::cout << "  " << e.relative_path;
            if (!e.reason.empty()) std::cout << " [" << e.reason << "]";
            std::cout << std::endl;
        }
    }
    return 0;
}

int cmd_backups_restore(const GlobalOptions& opts, const RestoreCommandOptions& restore_opts) {
    init_warning_collector(opts.json, opts.quiet);

    auto config = load_config(opts);
    if (!config) return exit_code_for(ErrorKind::Precondition);

    auto root = resolve_existing_root(opts, *config);
    if (!root) return exit_code_for(ErrorKind::Precondition);

    BackupManager backups(*root, {config->backup_dir, config->backup_retention});
    std::set<std::string> only(restore_opts.only.begin(), restore_opts.only.end());
    auto result = backups.restore_session(restore_opts.session, only);

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = result.ok;
        j["session"] = restore_opts.session;
        j["restored"] = result.restored;
        j["failed"] = result.failed;
        if (!result.backup_session.empty()) j["backup_session"] = result.backup_session;
        if (!result.ok) {
            j["error"] = result.error;
            j["error_kind"] = error_kind_to_string(result.error_kind);
        }
        output_json(j);
        return result.ok ? 0 : exit_code_for(result.error_kind);
    }

    print_list("Restored", result.restored, opts);
    print_list("Failed", result.failed, opts);
    if (!result.ok) {
        print_error(result.error, false);
        return exit_code_for(result.error_kind);
    }
    if (!result.backup_session.empty()) {
        print_success("Replaced files were backed up to " + backups.session_path(), false);
    }
    print_success("Restored " + std::to_string(result.restored.size()) + " files from " +
                      restore_opts.session,
                  false);
    return 0;
}

} // anonymous namespace

void setup_backups(CLI::App* app, GlobalOptions& opts) {
    static RestoreCommandOptions restore_opts;

    app->require_subcommand(1);

    auto* list_cmd = app->add_subcommand("list", "List backup sessions, newest first");
    list_cmd->callback([&opts]() {
        configure_logging(opts);
        std::exit(cmd_backups_list(opts));
    });

    auto* restore_cmd = app->add_subcommand("restore", "Restore the files of one session");
    restore_cmd->add_option("session", restore_opts.session, "Session name from 'backups list'")
        ->required();
    restore_cmd->add_option("--only", restore_opts.only, "Restore only these relative paths");
    restore_cmd->callback([&opts]() {
        configure_logging(opts);
        std::exit(cmd_backups_restore(opts, restore_opts));
    });
}

} // namespace assetkit::cli::commands
