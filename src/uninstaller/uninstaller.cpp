#include "assetkit/uninstaller.hpp"
#include "assetkit/backup_manager.hpp"
#include "assetkit/hash.hpp"
#include "assetkit/platform.hpp"

#include <algorithm>
#include <filesystem>
#include <functional>
#include <set>

#include <spdlog/spdlog.h>

namespace assetkit {

namespace fs = std::filesystem;

namespace {

std::string parent_of(const std::string& rel) {
    size_t slash = rel.rfind('/');
    return slash == std::string::npos ? "" : rel.substr(0, slash);
}

size_t depth_of(const std::string& rel) {
    return static_cast<size_t>(std::count(rel.begin(), rel.end(), '/'));
}

// Deepest first, ties broken by name for stable output
struct DeeperFirst {
    bool operator()(const std::string& a, const std::string& b) const {
        size_t da = depth_of(a);
        size_t db = depth_of(b);
        if (da != db) return da > db;
        return a < b;
    }
};

bool is_within(const fs::path& candidate, const fs::path& root) {
    auto rel = candidate.lexically_relative(root);
    if (rel.empty()) return false;
    auto first = *rel.begin();
    return first != ".." && !rel.is_absolute();
}

struct PruneOutcome {
    std::vector<std::string> removed;
    std::vector<std::string> preserved;
    std::vector<std::string> failed;
};

// Walk up from every directory that held a removed file, deepest first,
// removing directories that are empty. The root is never a candidate.
// is_empty decides emptiness; remove performs (or simulates) the rmdir.
PruneOutcome prune_directories(const std::vector<std::string>& removed_files,
                               const std::function<bool(const std::string&)>& is_empty,
                               const std::function<bool(const std::string&, std::string&)>& remove) {
    PruneOutcome outcome;
    std::set<std::string, DeeperFirst> pending;
    for (const auto& f : removed_files) {
        std::string dir = parent_of(f);
        if (!dir.empty()) pending.insert(dir);
    }

    std::set<std::string> preserved;
    while (!pending.empty()) {
        std::string dir = *pending.begin();
        pending.erase(pending.begin());

        if (!is_empty(dir)) {
            preserved.insert(dir);
            continue;
        }
        std::string error;
        if (!remove(dir, error)) {
            outcome.failed.push_back(dir + "/: " + error);
            continue;
        }
        outcome.removed.push_back(dir);

        std::string up = parent_of(dir);
        if (!up.empty()) pending.insert(up);
    }

    outcome.preserved.assign(preserved.begin(), preserved.end());
    return outcome;
}

} // namespace

Uninstaller::Uninstaller(std::string root, NamespaceFilter filter,
                         std::string manifest_relative_path, BackupManager* backups)
    : root_(std::move(root)),
      filter_(std::move(filter)),
      manifest_relative_path_(std::move(manifest_relative_path)),
      backups_(backups) {}

Uninstaller::RemoveResult Uninstaller::remove_owned_file(const std::string& relative_path) const {
    RemoveResult result;

    auto rel = NamespaceFilter::normalize(relative_path, root_);
    if (!rel || !filter_.is_owned(*rel)) {
        result.error = "refusing to delete path outside the bundle namespace";
        result.error_kind = ErrorKind::PathTraversal;
        spdlog::error("refused deletion of {}", relative_path);
        return result;
    }

    fs::path full = fs::path(root_) / *rel;
    std::error_code ec;

    fs::path real_root = fs::weakly_canonical(root_, ec);
    if (ec) {
        result.error = "cannot resolve root: " + ec.message();
        result.error_kind = classify_error(ec);
        return result;
    }
    fs::path real_parent = fs::weakly_canonical(full.parent_path(), ec);
    if (ec) {
        result.error = "cannot resolve parent directory: " + ec.message();
        result.error_kind = classify_error(ec);
        return result;
    }
    if (real_parent != real_root && !is_within(real_parent, real_root)) {
        result.error = "refusing to delete through a link that leaves the installation root";
        result.error_kind = ErrorKind::PathTraversal;
        spdlog::error("refused deletion of {}: resolves outside {}", *rel, root_);
        return result;
    }

    auto status = fs::symlink_status(full, ec);
    if (ec || !fs::exists(status)) {
        result.error = "file not found";
        result.error_kind = ErrorKind::Io;
        return result;
    }
    if (fs::is_directory(status)) {
        result.error = "refusing to delete a directory";
        result.error_kind = ErrorKind::Precondition;
        return result;
    }

    if (!fs::remove(full, ec)) {
        result.error = ec ? ec.message() : "file not found";
        result.error_kind = ec ? classify_error(ec) : ErrorKind::Io;
        return result;
    }
    spdlog::debug("removed {}", *rel);
    result.ok = true;
    return result;
}

UninstallPlan Uninstaller::plan(const ManifestLoadResult& manifest) const {
    UninstallPlan plan;
    plan.root = root_;
    plan.warnings = manifest.warnings;

    std::vector<UninstallCandidate> candidates;
    if (manifest.ok && manifest.found) {
        for (const auto& e : manifest.entries) {
            if (e.relative_path == manifest_relative_path_) continue;
            if (filter_.is_owned(e.relative_path)) {
                candidates.push_back({e.relative_path, e.hash});
            } else {
                plan.protected_entries.push_back(e.relative_path);
            }
        }
    } else {
        plan.fallback_mode = true;
        plan.fallback_reason = manifest.ok ? "manifest not found" : manifest.error;
        spdlog::warn("fallback mode ({}): removing only files matching the bundle namespaces",
                     plan.fallback_reason);
        for (const auto& rel : filter_.scan(root_)) {
            if (rel == manifest_relative_path_) continue;
            candidates.push_back({rel, ""});
        }
    }

    // The manifest goes last so an interrupted uninstall can be resumed
    std::error_code ec;
    if (filter_.is_owned(manifest_relative_path_) &&
        fs::exists(fs::symlink_status(join_path(root_, manifest_relative_path_), ec))) {
        candidates.push_back({manifest_relative_path_, ""});
    }

    std::set<std::string> gone;
    for (const auto& c : candidates) {
        std::string full = join_path(root_, c.relative_path);
        auto status = fs::symlink_status(full, ec);
        if (ec || !fs::exists(status)) {
            plan.skipped_missing.push_back(c.relative_path);
            continue;
        }
        if (fs::is_directory(status)) {
            plan.warnings.push_back("manifest entry is a directory, skipped: " + c.relative_path);
            continue;
        }
        if (!c.expected_hash.empty() && fs::is_regular_file(status)) {
            auto current = compute_sha256_file(full);
            if (current.ok && !hashes_equal(current.prefixed(), c.expected_hash)) {
                plan.diverged.push_back(c.relative_path);
            }
        }
        plan.to_remove.push_back(c);
        gone.insert(c.relative_path);
    }

    std::vector<std::string> files;
    for (const auto& c : plan.to_remove) files.push_back(c.relative_path);

    auto simulated = prune_directories(
        files,
        [&](const std::string& dir) {
            std::error_code iter_ec;
            fs::path base(root_);
            fs::directory_iterator it(base / dir, iter_ec);
            if (iter_ec) return false;
            for (fs::directory_iterator end; it != end; it.increment(iter_ec)) {
                if (iter_ec) return false;
                std::string child = it->path().lexically_relative(base).generic_string();
                if (gone.count(child) == 0) return false;
            }
            return true;
        },
        [&](const std::string& dir, std::string&) {
            gone.insert(dir);
            return true;
        });
    plan.removed_dirs = simulated.removed;
    plan.preserved_dirs = simulated.preserved;

    if (!plan.diverged.empty()) {
        spdlog::warn("{} bundle file(s) were modified since installation and will still be removed",
                     plan.diverged.size());
    }
    return plan;
}

UninstallResult Uninstaller::execute(const UninstallPlan& plan,
                                     const UninstallOptions& options) const {
    UninstallResult result;
    result.dry_run = options.dry_run;
    result.fallback_mode = plan.fallback_mode;
    result.fallback_reason = plan.fallback_reason;
    result.skipped_missing = plan.skipped_missing;
    result.diverged = plan.diverged;
    result.protected_entries = plan.protected_entries;
    result.warnings = plan.warnings;

    if (options.dry_run) {
        for (const auto& c : plan.to_remove) result.removed.push_back(c.relative_path);
        result.removed_dirs = plan.removed_dirs;
        result.preserved_dirs = plan.preserved_dirs;
        result.ok = true;
        return result;
    }

    if (options.backup && backups_) {
        for (const auto& c : plan.to_remove) {
            auto backup = backups_->backup_file(join_path(root_, c.relative_path),
                                                c.relative_path, "uninstall");
            if (!backup.success) {
                result.backup_failures.push_back(backup.error);
            }
        }
        result.backup_session = backups_->session_name();
    }

    ErrorKind failure_kind = ErrorKind::Io;
    for (const auto& c : plan.to_remove) {
        auto removal = remove_owned_file(c.relative_path);
        if (removal.ok) {
            result.removed.push_back(c.relative_path);
        } else {
            if (removal.error_kind == ErrorKind::Permission ||
                removal.error_kind == ErrorKind::PathTraversal) {
                failure_kind = removal.error_kind;
            }
            result.failed.push_back(c.relative_path + ": " + removal.error);
        }
    }

    fs::path base(root_);
    auto pruned = prune_directories(
        result.removed,
        [&](const std::string& dir) {
            std::error_code ec;
            auto status = fs::symlink_status(base / dir, ec);
            return !ec && fs::is_directory(status) && fs::is_empty(base / dir, ec) && !ec;
        },
        [&](const std::string& dir, std::string& error) {
            std::error_code ec;
            // Removes an empty directory only
            fs::remove(base / dir, ec);
            if (ec) error = ec.message();
            return !ec;
        });
    result.removed_dirs = pruned.removed;
    result.preserved_dirs = pruned.preserved;
    for (const auto& f : pruned.failed) result.failed.push_back(f);

    result.ok = result.failed.empty();
    if (!result.ok) {
        result.error = std::to_string(result.failed.size()) + " item(s) could not be removed";
        result.error_kind = failure_kind;
    }

    spdlog::info("uninstalled {} files from {}", result.removed.size(), root_);
    return result;
}

UninstallResult uninstall(const std::string& root,
                          const ManifestLoadResult& manifest,
                          const NamespaceFilter& filter,
                          const UninstallOptions& options,
                          BackupManager* backups) {
    Uninstaller uninstaller(root, filter, options.manifest_relative_path, backups);
    return uninstaller.execute(uninstaller.plan(manifest), options);
}

} // namespace assetkit
