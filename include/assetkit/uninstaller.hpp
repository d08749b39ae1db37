#pragma once

#include "assetkit/manifest.hpp"
#include "assetkit/namespace_filter.hpp"
#include "assetkit/types.hpp"

#include <string>
#include <vector>

namespace assetkit {

class BackupManager;

// ============================================================================
// Uninstall Plan
// ============================================================================

struct UninstallCandidate {
    std::string relative_path;
    std::string expected_hash;   // From the manifest; empty in fallback mode
};

struct UninstallPlan {
    std::string root;
    bool fallback_mode = false;
    std::string fallback_reason;

    std::vector<UninstallCandidate> to_remove;      // Manifest file, when owned, is last
    std::vector<std::string> skipped_missing;
    std::vector<std::string> diverged;              // Advisory only
    std::vector<std::string> protected_entries;     // In the manifest, outside every namespace
    std::vector<std::string> warnings;

    // Predicted by simulating the deletion
    std::vector<std::string> removed_dirs;
    std::vector<std::string> preserved_dirs;
};

struct UninstallOptions {
    bool dry_run = false;
    bool backup = true;
    std::string manifest_relative_path = "get-shit-done/INSTALLED_FILES.json";
};

struct UninstallResult {
    bool ok = false;
    std::string error;
    ErrorKind error_kind = ErrorKind::None;
    bool dry_run = false;
    bool fallback_mode = false;
    std::string fallback_reason;

    std::vector<std::string> removed;
    std::vector<std::string> skipped_missing;
    std::vector<std::string> preserved_dirs;
    std::vector<std::string> removed_dirs;
    std::vector<std::string> diverged;
    std::vector<std::string> protected_entries;
    std::vector<std::string> failed;                // "path: reason"

    std::string backup_session;
    std::vector<std::string> backup_failures;
    std::vector<std::string> warnings;
};

// ============================================================================
// Uninstaller
// ============================================================================

class Uninstaller {
public:
    Uninstaller(std::string root, NamespaceFilter filter,
                std::string manifest_relative_path, BackupManager* backups = nullptr);

    // Deletion set from a loaded manifest; a missing or corrupt manifest
    // switches to the structural namespace scan.
    UninstallPlan plan(const ManifestLoadResult& manifest) const;

    UninstallResult execute(const UninstallPlan& plan, const UninstallOptions& options) const;

    struct RemoveResult {
        bool ok = false;
        std::string error;
        ErrorKind error_kind = ErrorKind::None;
    };

    // The only deletion path. Re-checks ownership and the real location
    // of the parent directory, refuses directories.
    RemoveResult remove_owned_file(const std::string& relative_path) const;

    const std::string& root() const { return root_; }
    const NamespaceFilter& filter() const { return filter_; }

private:
    std::string root_;
    NamespaceFilter filter_;
    std::string manifest_relative_path_;
    BackupManager* backups_;
};

// Plan from an already loaded manifest, then execute
UninstallResult uninstall(const std::string& root,
                          const ManifestLoadResult& manifest,
                          const NamespaceFilter& filter,
                          const UninstallOptions& options = {},
                          BackupManager* backups = nullptr);

} // namespace assetkit
