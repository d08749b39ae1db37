#include "assetkit/maintenance.hpp"
#include "assetkit/backup_manager.hpp"
#include "assetkit/path_scope.hpp"
#include "assetkit/platform.hpp"

#include <cctype>

#include <spdlog/spdlog.h>

namespace assetkit {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

} // namespace

UpdateService::UpdateService(std::string source_root, std::string target_root, BundleConfig config)
    : source_root_(std::move(source_root)),
      target_root_(std::move(target_root)),
      config_(std::move(config)) {}

std::string UpdateService::available_version() const {
    if (!config_.version.empty()) return config_.version;
    auto marker = read_file_bytes(join_path(source_root_, config_.version_relative_path()));
    return marker ? trim(*marker) : "";
}

UpdateResult UpdateService::update(const UpdateOptions& options) {
    UpdateResult result;
    result.dry_run = options.dry_run;

    result.to_version = available_version();
    if (result.to_version.empty()) {
        result.error = "bundle has no version; use install instead";
        result.error_kind = ErrorKind::Precondition;
        return result;
    }

    if (!has_installation(config_, target_root_)) {
        result.error = "no installation found at " + target_root_ + "; use install";
        result.error_kind = ErrorKind::Precondition;
        return result;
    }

    IntegrityChecker checker(target_root_, config_);
    result.from_version = checker.installed_version().value_or("");
    result.relation = compare_versions(result.from_version, result.to_version);

    if (result.relation == VersionRelation::Same && !options.force) {
        spdlog::info("already at version {}", result.to_version);
        result.up_to_date = true;
        result.ok = true;
        return result;
    }
    if (result.relation == VersionRelation::Older && !options.force) {
        result.error = "refusing to downgrade from " + result.from_version + " to " +
                       result.to_version + " (use --force)";
        result.error_kind = ErrorKind::Precondition;
        return result;
    }

    result.pre_check = checker.check_all();
    if (!result.pre_check->passed) {
        result.warnings.push_back("pre-update health check failed; the update replaces all bundle files");
        spdlog::warn("pre-update health check failed for {}", target_root_);
    }

    BundleConfig target_config = config_;
    target_config.version = result.to_version;

    BackupManager backups(target_root_, {config_.backup_dir, config_.backup_retention});
    Installer installer(target_config, &backups);

    // The old version marker is among the files the installer backs up
    InstallOptions install_options;
    install_options.dry_run = options.dry_run;
    install_options.cancel = options.cancel;

    result.install = installer.install(source_root_, target_root_, install_options);
    if (!result.install.ok) {
        result.error = "update failed: " + result.install.error;
        result.error_kind = result.install.error_kind;
        return result;
    }

    if (options.dry_run) {
        result.ok = true;
        return result;
    }

    IntegrityChecker post(target_root_, target_config);
    CheckOptions check_options;
    check_options.expected_version = result.to_version;
    result.post_check = post.check_all(check_options);

    result.ok = result.post_check->passed;
    if (!result.ok) {
        result.error = "post-update verification failed; installation may be incomplete";
        result.error_kind = ErrorKind::Corruption;
    } else {
        spdlog::info("updated {} from {} to {}", target_root_,
                     result.from_version.empty() ? "unknown" : result.from_version,
                     result.to_version);
    }
    return result;
}

} // namespace assetkit
