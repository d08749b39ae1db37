#pragma once

#include "assetkit/bundle_config.hpp"
#include "assetkit/cancellation.hpp"
#include "assetkit/manifest.hpp"
#include "assetkit/types.hpp"

#include <cstdint>
#include <functional>
#include <set>
#include <string>
#include <vector>

namespace assetkit {

class BackupManager;

// ============================================================================
// Path Token Rewriting
// ============================================================================

// Replace every occurrence of token with replacement. The replacement is
// inserted verbatim: "$", "&" and "\" carry no special meaning.
std::string replace_all_literal(const std::string& content,
                                const std::string& token,
                                const std::string& replacement);

// ============================================================================
// Installer
// ============================================================================

enum class PlannedAction {
    Create,      // File does not exist in the target
    Overwrite,   // File exists with different content
    Unchanged    // File exists with identical content
};

const char* planned_action_to_string(PlannedAction action);

struct PlannedFile {
    std::string relative_path;
    PlannedAction action = PlannedAction::Create;
    uint64_t size = 0;
    std::string hash;
};

struct InstallOptions {
    bool dry_run = false;
    std::set<std::string> only;          // Subset install; empty = full install
    std::string path_prefix;             // Token replacement; defaults to the target root
    CancellationToken* cancel = nullptr;

    // Called with each relative path kept from the existing target,
    // before it is linked into staging
    std::function<void(const std::string&)> on_carry_over;
};

struct InstallResult {
    bool ok = false;
    std::string error;
    ErrorKind error_kind = ErrorKind::None;
    bool dry_run = false;

    int files_copied = 0;
    uint64_t staged_bytes = 0;
    std::vector<ManifestEntry> manifest;
    std::string manifest_path;
    std::string target_root;

    std::vector<PlannedFile> planned;            // Dry run classification
    std::vector<std::string> backed_up;          // Relative paths backed up before replacement
    std::vector<std::string> stale_removed;      // Previously installed, no longer shipped
    std::vector<std::string> migrated;           // Legacy layout entries moved to the current layout
    std::vector<std::string> legacy_removed;     // Legacy entries the current layout already provides
    int carried_over = 0;                        // Unrelated entries kept from the old target
    std::string backup_session;

    std::vector<std::string> errors;             // Per-file failures
    std::vector<std::string> warnings;
};

class Installer {
public:
    explicit Installer(BundleConfig config, BackupManager* backups = nullptr);

    InstallResult install(const std::string& source_root,
                          const std::string& target_root,
                          const InstallOptions& options = {});

    const BundleConfig& config() const { return config_; }

    // Sorted bundle files under source_root, relative and forward-slash.
    // Fails on symlinks and special files.
    struct SourceListing {
        bool ok = false;
        std::string error;
        std::vector<std::string> files;
    };
    SourceListing list_source_files(const std::string& source_root) const;

    // Final bytes of a bundle file as they will be installed
    std::string render(const std::string& relative_path,
                       const std::string& content,
                       const std::string& install_root) const;

private:
    BundleConfig config_;
    NamespaceFilter filter_;
    BackupManager* backups_;
};

} // namespace assetkit
