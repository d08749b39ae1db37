#pragma once

#include "assetkit/bundle_config.hpp"
#include "assetkit/cancellation.hpp"
#include "assetkit/installer.hpp"
#include "assetkit/integrity_checker.hpp"
#include "assetkit/semver.hpp"
#include "assetkit/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace assetkit {

// ============================================================================
// Repair
// ============================================================================

struct RepairOptions {
    bool dry_run = false;
    CancellationToken* cancel = nullptr;
};

struct RepairResult {
    bool ok = false;
    std::string error;
    ErrorKind error_kind = ErrorKind::None;
    bool dry_run = false;

    IssueSet issues;                          // Found before repairing
    bool full_reinstall = false;
    std::vector<std::string> repaired;        // Relative paths reinstalled
    std::vector<std::string> unrepairable;    // Tracked, but no longer shipped
    InstallResult install;
    std::optional<HealthReport> post_check;
};

class RepairService {
public:
    RepairService(std::string source_root, std::string target_root, BundleConfig config);

    // Health problems plus a missing manifest, which repair treats as structural
    IssueSet detect() const;

    RepairResult repair(const RepairOptions& options = {});

private:
    std::string source_root_;
    std::string target_root_;
    BundleConfig config_;
};

// ============================================================================
// Update
// ============================================================================

struct UpdateOptions {
    bool force = false;                       // Reinstall same version, allow downgrade
    bool dry_run = false;
    CancellationToken* cancel = nullptr;
};

struct UpdateResult {
    bool ok = false;
    std::string error;
    ErrorKind error_kind = ErrorKind::None;
    bool dry_run = false;

    std::string from_version;
    std::string to_version;
    VersionRelation relation = VersionRelation::Unknown;
    bool up_to_date = false;

    std::optional<HealthReport> pre_check;
    InstallResult install;
    std::optional<HealthReport> post_check;
    std::vector<std::string> warnings;
};

class UpdateService {
public:
    UpdateService(std::string source_root, std::string target_root, BundleConfig config);

    // Version the bundle would install: config version, else the bundle's marker file
    std::string available_version() const;

    UpdateResult update(const UpdateOptions& options = {});

private:
    std::string source_root_;
    std::string target_root_;
    BundleConfig config_;
};

} // namespace assetkit
