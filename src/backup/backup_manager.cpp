#include "assetkit/backup_manager.hpp"
#include "assetkit/namespace_filter.hpp"
#include "assetkit/platform.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <map>
#include <regex>

#include <spdlog/spdlog.h>

namespace assetkit {

namespace fs = std::filesystem;

namespace {

// YYYY-MM-DD, optionally THH-MM-SS[-mmm]Z, then end of name or "_"
const std::regex& timestamp_pattern() {
    static const std::regex re(R"(^(\d{4}-\d{2}-\d{2}(T\d{2}-\d{2}-\d{2}(-\d{3})?Z)?)(_.*)?$)");
    return re;
}

std::vector<BackupIndexEntry> read_index(const std::string& session_dir) {
    std::vector<BackupIndexEntry> entries;
    auto content = read_file_bytes(join_path(session_dir, BACKUP_INDEX_FILENAME));
    if (!content) return entries;

    try {
        auto j = nlohmann::json::parse(*content);
        if (!j.is_array()) return entries;
        for (const auto& item : j) {
            if (!item.is_object() || !item.contains("relativePath") ||
                !item["relativePath"].is_string()) {
                continue;
            }
            BackupIndexEntry e;
            e.relative_path = item["relativePath"].get<std::string>();
            if (item.contains("originalPath") && item["originalPath"].is_string()) {
                e.original_path = item["originalPath"].get<std::string>();
            }
            if (item.contains("reason") && item["reason"].is_string()) {
                e.reason = item["reason"].get<std::string>();
            }
            if (item.contains("size") && item["size"].is_number_unsigned()) {
                e.size = item["size"].get<uint64_t>();
            }
            entries.push_back(e);
        }
    } catch (const nlohmann::json::exception& ex) {
        spdlog::warn("ignoring unreadable backup index in {}: {}", session_dir, ex.what());
        entries.clear();
    }
    return entries;
}

// Files of a session without an index
std::vector<BackupIndexEntry> walk_session(const std::string& session_dir) {
    std::vector<BackupIndexEntry> entries;
    std::error_code ec;
    fs::recursive_directory_iterator it(session_dir, ec);
    if (ec) return entries;
    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) break;
        if (!it->is_regular_file(ec)) continue;
        std::string rel = it->path().lexically_relative(session_dir).generic_string();
        if (rel == BACKUP_INDEX_FILENAME) continue;
        BackupIndexEntry e;
        e.relative_path = rel;
        e.size = static_cast<uint64_t>(it->file_size(ec));
        entries.push_back(e);
    }
    std::sort(entries.begin(), entries.end(),
              [](const BackupIndexEntry& a, const BackupIndexEntry& b) {
                  return a.relative_path < b.relative_path;
              });
    return entries;
}

} // namespace

BackupManager::BackupManager(std::string root, BackupOptions options)
    : root_(std::move(root)), options_(std::move(options)) {
    backup_dir_ = join_path(root_, options_.backup_dir);
    spdlog::debug("backup manager for {} (retention {})", backup_dir_, options_.retention);
}

std::string BackupManager::session_path() const {
    if (session_name_.empty()) return "";
    return join_path(backup_dir_, session_name_);
}

std::optional<std::string> BackupManager::timestamp_prefix(const std::string& name) {
    std::smatch m;
    if (std::regex_match(name, m, timestamp_pattern())) {
        return m[1].str();
    }
    return std::nullopt;
}

bool BackupManager::ensure_session(std::string& error) {
    if (!session_name_.empty()) return true;

    std::error_code ec;
    fs::create_directories(backup_dir_, ec);
    if (ec) {
        error = "cannot create backup directory " + backup_dir_ + ": " + ec.message();
        return false;
    }

    std::string base = get_sortable_timestamp();
    std::string name = base;
    for (int n = 1; fs::exists(join_path(backup_dir_, name), ec); ++n) {
        name = base + "_" + std::to_string(n);
    }

    fs::create_directory(join_path(backup_dir_, name), ec);
    if (ec) {
        error = "cannot create backup session: " + ec.message();
        return false;
    }

    session_name_ = name;
    spdlog::debug("backup session {}", session_path());
    return true;
}

bool BackupManager::write_index(std::string& error) const {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& e : index_) {
        j.push_back({
            {"relativePath", e.relative_path},
            {"originalPath", e.original_path},
            {"reason", e.reason},
            {"size", e.size},
        });
    }
    auto write = atomic_write_file(join_path(session_path(), BACKUP_INDEX_FILENAME), j.dump(2));
    if (!write.ok) {
        error = "failed to write backup index: " + write.error;
        return false;
    }
    return true;
}

BackupResult BackupManager::backup_file(const std::string& source_path,
                                        const std::string& relative_path,
                                        const std::string& reason,
                                        const std::string& original_path) {
    BackupResult result;

    std::error_code ec;
    auto status = fs::symlink_status(source_path, ec);
    if (ec || !fs::exists(status)) {
        spdlog::debug("no backup needed for {}: file does not exist", relative_path);
        result.success = true;
        return result;
    }

    auto rel = NamespaceFilter::normalize(relative_path);
    if (!rel) {
        result.error = "refusing to back up unsafe path: " + relative_path;
        spdlog::warn("{}", result.error);
        return result;
    }

    std::string error;
    if (!ensure_session(error)) {
        result.error = "failed to back up " + *rel + ": " + error;
        spdlog::warn("{}", result.error);
        return result;
    }

    std::string dest = join_path(session_path(), *rel);
    fs::create_directories(get_parent_directory(dest), ec);
    if (!ec) {
        if (fs::is_symlink(status)) {
            fs::remove(dest, ec);
            ec.clear();
            fs::copy_symlink(source_path, dest, ec);
        } else {
            fs::copy_file(source_path, dest, fs::copy_options::overwrite_existing, ec);
        }
    }
    if (ec) {
        result.error = "failed to back up " + *rel + ": " + ec.message();
        spdlog::warn("{}", result.error);
        return result;
    }

    BackupIndexEntry entry;
    entry.relative_path = *rel;
    entry.original_path = to_portable_path(original_path.empty() ? source_path : original_path);
    entry.reason = reason;
    if (fs::is_regular_file(status)) {
        entry.size = static_cast<uint64_t>(fs::file_size(source_path, ec));
    }

    auto existing = std::find_if(index_.begin(), index_.end(),
                                 [&](const BackupIndexEntry& e) {
                                     return e.relative_path == entry.relative_path;
                                 });
    if (existing != index_.end()) {
        *existing = entry;
    } else {
        index_.push_back(entry);
    }

    if (!write_index(error)) {
        // The copy itself succeeded; only the index is stale
        spdlog::warn("{}", error);
    }

    spdlog::debug("backed up {} -> {}", *rel, dest);
    result.backup_path = dest;
    result.success = true;
    return result;
}

CleanupResult BackupManager::cleanup_old_backups() {
    CleanupResult result;

    std::error_code ec;
    if (!fs::is_directory(backup_dir_, ec)) {
        spdlog::debug("backup directory does not exist, nothing to clean up");
        return result;
    }

    std::map<std::string, std::vector<fs::path>, std::greater<std::string>> groups;
    fs::directory_iterator it(backup_dir_, ec);
    if (ec) {
        result.errors.push_back("cannot list " + backup_dir_ + ": " + ec.message());
        return result;
    }
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            result.errors.push_back("cannot list " + backup_dir_ + ": " + ec.message());
            break;
        }
        std::string name = it->path().filename().string();
        if (auto key = timestamp_prefix(name)) {
            groups[*key].push_back(it->path());
        }
    }

    int index = 0;
    for (const auto& [key, paths] : groups) {
        bool keep = index < options_.retention;
        ++index;
        if (keep) {
            ++result.kept;
            continue;
        }

        bool group_failed = false;
        for (const auto& p : paths) {
            if (p.filename().string() == session_name_) continue;
            // remove_all on a symlink removes the link, never its target
            fs::remove_all(p, ec);
            if (ec) {
                result.errors.push_back("failed to remove " + p.string() + ": " + ec.message());
                spdlog::warn("failed to remove old backup {}: {}", p.string(), ec.message());
                group_failed = true;
            } else {
                spdlog::debug("removed old backup {}", p.string());
            }
        }
        if (!group_failed) ++result.cleaned;
    }

    if (result.cleaned > 0) {
        spdlog::info("cleaned up {} old backups, kept {}", result.cleaned, result.kept);
    }
    return result;
}

std::vector<BackupSession> BackupManager::list_sessions() const {
    std::vector<BackupSession> sessions;

    std::error_code ec;
    fs::directory_iterator it(backup_dir_, ec);
    if (ec) return sessions;

    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) break;
        auto status = it->symlink_status(ec);
        if (ec || !fs::is_directory(status)) continue;

        std::string name = it->path().filename().string();
        if (!timestamp_prefix(name)) continue;

        BackupSession session;
        session.name = name;
        session.path = to_portable_path(it->path().string());
        session.entries = read_index(session.path);
        if (session.entries.empty()) {
            session.entries = walk_session(session.path);
        }
        sessions.push_back(session);
    }

    std::sort(sessions.begin(), sessions.end(),
              [](const BackupSession& a, const BackupSession& b) { return a.name > b.name; });
    return sessions;
}

RestoreResult BackupManager::restore_session(const std::string& session,
                                             const std::set<std::string>& only) {
    RestoreResult result;

    if (session.empty() || session.find('/') != std::string::npos ||
        session.find('\\') != std::string::npos || session == "." || session == "..") {
        result.error = "invalid backup session name: " + session;
        result.error_kind = ErrorKind::PathTraversal;
        return result;
    }
    if (session == session_name_) {
        result.error = "cannot restore the session currently being written";
        result.error_kind = ErrorKind::Precondition;
        return result;
    }

    std::string session_dir = join_path(backup_dir_, session);
    std::error_code ec;
    if (!fs::is_directory(session_dir, ec)) {
        result.error = "backup session not found: " + session;
        result.error_kind = ErrorKind::Precondition;
        return result;
    }

    auto entries = read_index(session_dir);
    if (entries.empty()) {
        entries = walk_session(session_dir);
    }

    auto backup_prefix = NamespaceFilter::normalize(options_.backup_dir);

    for (const auto& entry : entries) {
        auto rel = NamespaceFilter::normalize(entry.relative_path);
        if (!rel) {
            result.failed.push_back(entry.relative_path + ": unsafe path");
            continue;
        }
        if (!only.empty() && only.count(*rel) == 0) continue;
        if (backup_prefix && (*rel == *backup_prefix || rel->rfind(*backup_prefix + "/", 0) == 0)) {
            result.failed.push_back(*rel + ": inside the backup directory");
            continue;
        }

        std::string src = join_path(session_dir, *rel);
        std::string dest = join_path(root_, *rel);

        auto replaced = backup_file(dest, *rel, "restore");
        if (!replaced.success) {
            result.failed.push_back(*rel + ": " + replaced.error);
            continue;
        }

        fs::create_directories(get_parent_directory(dest), ec);
        if (!ec) {
            auto src_status = fs::symlink_status(src, ec);
            if (!ec && fs::is_symlink(src_status)) {
                fs::remove(dest, ec);
                ec.clear();
                fs::copy_symlink(src, dest, ec);
            } else if (!ec) {
                auto content = read_file_bytes(src);
                if (!content) {
                    result.failed.push_back(*rel + ": cannot read backup copy");
                    continue;
                }
                auto write = atomic_write_file(dest, *content);
                if (!write.ok) {
                    result.failed.push_back(*rel + ": " + write.error);
                    continue;
                }
            }
        }
        if (ec) {
            result.failed.push_back(*rel + ": " + ec.message());
            continue;
        }

        spdlog::debug("restored {}", *rel);
        result.restored.push_back(*rel);
    }

    result.backup_session = session_name_;
    result.ok = result.failed.empty();
    if (!result.ok) {
        result.error = std::to_string(result.failed.size()) + " file(s) could not be restored";
        result.error_kind = ErrorKind::Io;
    }
    return result;
}

} // namespace assetkit
