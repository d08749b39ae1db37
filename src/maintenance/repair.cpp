#include "assetkit/maintenance.hpp"
#include "assetkit/backup_manager.hpp"
#include "assetkit/manifest.hpp"

#include <filesystem>
#include <set>

#include <spdlog/spdlog.h>

namespace assetkit {

RepairService::RepairService(std::string source_root, std::string target_root, BundleConfig config)
    : source_root_(std::move(source_root)),
      target_root_(std::move(target_root)),
      config_(std::move(config)) {}

IssueSet RepairService::detect() const {
    IntegrityChecker checker(target_root_, config_);
    auto report = checker.check_all();
    IssueSet issues = checker.detect_issues(report);

    if (!report.used_manifest) {
        Manifest manifest(target_root_, config_.manifest_relative_path());
        auto loaded = manifest.load();
        if (loaded.ok && !loaded.found) {
            issues.structural.push_back("manifest: not found");
        }
    }
    return issues;
}

RepairResult RepairService::repair(const RepairOptions& options) {
    RepairResult result;
    result.dry_run = options.dry_run;

    std::error_code ec;
    if (!std::filesystem::is_directory(target_root_, ec)) {
        result.error = "no installation found at " + target_root_ + "; use install";
        result.error_kind = ErrorKind::Precondition;
        return result;
    }

    result.issues = detect();
    if (result.issues.empty()) {
        spdlog::info("no issues found in {}", target_root_);
        result.ok = true;
        return result;
    }

    BackupManager backups(target_root_, {config_.backup_dir, config_.backup_retention});
    Installer installer(config_, &backups);

    auto listing = installer.list_source_files(source_root_);
    if (!listing.ok) {
        result.error = listing.error;
        result.error_kind = ErrorKind::Precondition;
        return result;
    }
    std::set<std::string> shipped(listing.files.begin(), listing.files.end());
    if (!config_.version.empty()) {
        shipped.insert(config_.version_relative_path());
    }

    InstallOptions install_options;
    install_options.dry_run = options.dry_run;
    install_options.cancel = options.cancel;

    if (!result.issues.structural.empty()) {
        result.full_reinstall = true;
        spdlog::info("structural problems found, reinstalling the whole bundle");
        result.repaired.assign(shipped.begin(), shipped.end());
    } else {
        std::set<std::string> affected;
        for (const auto* group : {&result.issues.missing, &result.issues.drifted,
                                  &result.issues.unrewritten, &result.issues.unreadable}) {
            affected.insert(group->begin(), group->end());
        }
        for (const auto& rel : affected) {
            if (shipped.count(rel)) {
                install_options.only.insert(rel);
                result.repaired.push_back(rel);
            } else {
                result.unrepairable.push_back(rel);
            }
        }
        if (install_options.only.empty()) {
            result.error = std::to_string(result.unrepairable.size()) +
                           " file(s) cannot be repaired: no longer part of the bundle";
            result.error_kind = ErrorKind::Precondition;
            return result;
        }
    }

    result.install = installer.install(source_root_, target_root_, install_options);
    if (!result.install.ok) {
        result.error = "repair failed: " + result.install.error;
        result.error_kind = result.install.error_kind;
        return result;
    }

    if (options.dry_run) {
        result.ok = true;
        return result;
    }

    IntegrityChecker checker(target_root_, config_);
    result.post_check = checker.check_all();

    if (!result.unrepairable.empty()) {
        result.error = std::to_string(result.unrepairable.size()) +
                       " file(s) cannot be repaired: no longer part of the bundle";
        result.error_kind = ErrorKind::Precondition;
    }
    result.ok = result.post_check->passed && result.unrepairable.empty();
    if (!result.post_check->passed && result.error.empty()) {
        result.error = "repair finished but the health check still fails";
        result.error_kind = ErrorKind::Corruption;
    }
    spdlog::info("repaired {} file(s) in {}", result.repaired.size(), target_root_);
    return result;
}

} // namespace assetkit
