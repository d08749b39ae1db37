#pragma once

#include "assetkit/types.hpp"

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace assetkit {

// ============================================================================
// Backup Sessions
// ============================================================================
//
// Layout: <root>/<backup_dir>/<session>/<relativePath>, where <session> is a
// sortable UTC timestamp. Each session carries BACKUP_INDEX.json.

constexpr const char* BACKUP_INDEX_FILENAME = "BACKUP_INDEX.json";

struct BackupOptions {
    std::string backup_dir = ".backups";
    int retention = 5;
};

struct BackupResult {
    bool success = false;
    std::optional<std::string> backup_path;   // Unset when there was nothing to copy
    std::string error;
};

struct CleanupResult {
    int cleaned = 0;
    int kept = 0;
    std::vector<std::string> errors;
};

struct BackupIndexEntry {
    std::string relative_path;
    std::string original_path;
    std::string reason;
    uint64_t size = 0;
};

struct BackupSession {
    std::string name;
    std::string path;
    std::vector<BackupIndexEntry> entries;
};

struct RestoreResult {
    bool ok = false;
    std::string error;
    ErrorKind error_kind = ErrorKind::None;
    std::vector<std::string> restored;
    std::vector<std::string> failed;
    std::string backup_session;               // Session holding the replaced files
};

class BackupManager {
public:
    explicit BackupManager(std::string root, BackupOptions options = {});

    // Copy source_path into the current session. Missing source is a success
    // with no backup_path. original_path is what the index records; it
    // defaults to source_path. Never throws.
    BackupResult backup_file(const std::string& source_path,
                             const std::string& relative_path,
                             const std::string& reason = "",
                             const std::string& original_path = "");

    // Keep the newest `retention` timestamp groups, remove the rest.
    // Entries without a recognizable timestamp prefix are left alone.
    CleanupResult cleanup_old_backups();

    std::vector<BackupSession> list_sessions() const;

    // Copy a session's files back into the root. Files about to be replaced
    // are backed up into this manager's own session first.
    RestoreResult restore_session(const std::string& session,
                                  const std::set<std::string>& only = {});

    // Empty until the first backup is made
    const std::string& session_name() const { return session_name_; }
    std::string session_path() const;

    const std::string& root() const { return root_; }
    const std::string& backup_dir() const { return backup_dir_; }
    int retention() const { return options_.retention; }
    size_t files_backed_up() const { return index_.size(); }

    // Timestamp group key of a backup directory entry, if it has one
    static std::optional<std::string> timestamp_prefix(const std::string& name);

private:
    bool ensure_session(std::string& error);
    bool write_index(std::string& error) const;

    std::string root_;
    BackupOptions options_;
    std::string backup_dir_;
    std::string session_name_;
    std::vector<BackupIndexEntry> index_;
};

} // namespace assetkit
