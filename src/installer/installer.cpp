#include "assetkit/installer.hpp"
#include "assetkit/backup_manager.hpp"
#include "assetkit/hash.hpp"
#include "assetkit/platform.hpp"

#include <algorithm>
#include <filesystem>
#include <map>

#include <spdlog/spdlog.h>

namespace assetkit {

namespace fs = std::filesystem;

// ============================================================================
// Path Token Rewriting
// ============================================================================

std::string replace_all_literal(const std::string& content,
                                const std::string& token,
                                const std::string& replacement) {
    if (token.empty()) return content;

    std::string out;
    out.reserve(content.size());

    size_t pos = 0;
    while (true) {
        size_t found = content.find(token, pos);
        if (found == std::string::npos) {
            out.append(content, pos, std::string::npos);
            break;
        }
        out.append(content, pos, found - pos);
        out.append(replacement);
        pos = found + token.size();
    }
    return out;
}

const char* planned_action_to_string(PlannedAction action) {
    switch (action) {
        case PlannedAction::Create: return "would_create";
        case PlannedAction::Overwrite: return "would_overwrite";
        case PlannedAction::Unchanged: return "unchanged";
    }
    return "unknown";
}

// ============================================================================
// Installer
// ============================================================================

namespace {

std::string normalize_absolute(const std::string& path) {
    std::error_code ec;
    fs::path p = fs::absolute(fs::path(path), ec);
    if (ec) p = fs::path(path);
    std::string out = p.lexically_normal().generic_string();
    while (out.size() > 1 && out.back() == '/') out.pop_back();
    return out;
}

bool is_under(const std::string& rel, const std::string& dir) {
    return rel == dir || rel.rfind(dir + "/", 0) == 0;
}

struct StagedFile {
    std::string relative_path;
    uint64_t size = 0;
    std::string hash;
};

struct PendingBackup {
    std::string relative_path;
    std::string reason;
};

struct LegacyMove {
    std::string from;
    std::string to;
    bool superseded = false;     // The bundle or the target already has `to`
    fs::file_status status;
};

void fail(InstallResult& result, ErrorKind kind, const std::string& message) {
    result.ok = false;
    result.error = message;
    result.error_kind = kind;
    spdlog::error("{}", message);
}

// Reproduce one existing target entry inside staging
bool carry_over_entry(const fs::path& src, const fs::path& dest, const fs::file_status& status,
                      std::string& error) {
    std::error_code ec;

    if (fs::is_directory(status)) {
        if (!fs::exists(fs::symlink_status(dest, ec))) {
            fs::create_directory(dest, ec);
            if (ec) {
                error = ec.message();
                return false;
            }
        }
        fs::permissions(dest, status.permissions(), ec);
        if (ec) {
            error = ec.message();
            return false;
        }
        return true;
    }

    fs::create_directories(dest.parent_path(), ec);
    if (ec) {
        error = ec.message();
        return false;
    }

    if (fs::is_symlink(status)) {
        fs::copy_symlink(src, dest, ec);
    } else {
        // Any non-directory can be linked when staging shares the filesystem
        fs::create_hard_link(src, dest, ec);
        if (ec && fs::is_regular_file(status)) {
            ec.clear();
            fs::copy_file(src, dest, fs::copy_options::none, ec);
            if (!ec) fs::permissions(dest, status.permissions(), ec);
        } else if (ec && fs::is_fifo(status)) {
            ec.clear();
            create_fifo(dest.string(), status.permissions(), ec);
        } else if (ec) {
            error = "special file cannot be linked: " + ec.message();
            return false;
        }
    }

    if (ec) {
        error = ec.message();
        return false;
    }
    return true;
}

// Untracked entries under each legacy directory and where they belong now
bool plan_layout_moves(const std::string& target, const std::vector<LegacyLayout>& layouts,
                       const std::set<std::string>& shipped, const std::set<std::string>& stale,
                       std::vector<LegacyMove>& moves, std::vector<std::string>& migrating,
                       std::string& error) {
    std::error_code ec;
    for (const auto& layout : layouts) {
        fs::path legacy_dir = fs::path(target) / layout.legacy;
        if (!fs::is_directory(fs::symlink_status(legacy_dir, ec))) continue;
        // A bundle that still ships into the legacy directory keeps it
        if (std::any_of(shipped.begin(), shipped.end(),
                        [&](const std::string& rel) { return is_under(rel, layout.legacy); })) {
            continue;
        }
        migrating.push_back(layout.legacy);

        fs::recursive_directory_iterator it(legacy_dir, ec);
        for (fs::recursive_directory_iterator end; !ec && it != end; it.increment(ec)) {
            auto status = it->symlink_status(ec);
            if (ec) break;
            if (fs::is_directory(status)) continue;

            std::string sub = it->path().lexically_relative(legacy_dir).generic_string();
            LegacyMove move;
            move.from = layout.legacy + "/" + sub;
            if (stale.count(move.from)) continue;
            move.to = layout.current + "/" + sub;
            move.superseded = shipped.count(move.to) > 0 ||
                              fs::exists(fs::symlink_status(join_path(target, move.to), ec));
            move.status = status;
            moves.push_back(move);
        }
        if (ec) {
            error = "cannot read legacy directory " + layout.legacy + ": " + ec.message();
            return false;
        }
    }
    return true;
}

} // namespace

Installer::Installer(BundleConfig config, BackupManager* backups)
    : config_(std::move(config)), filter_(config_.make_filter()), backups_(backups) {}

std::string Installer::render(const std::string& relative_path,
                              const std::string& content,
                              const std::string& install_root) const {
    if (!config_.should_rewrite(relative_path)) {
        return content;
    }
    std::string root = install_root;
    while (root.size() > 1 && root.back() == '/') root.pop_back();
    return replace_all_literal(content, config_.path_token, root + "/");
}

Installer::SourceListing Installer::list_source_files(const std::string& source_root) const {
    SourceListing listing;
    fs::path root(source_root);

    std::error_code ec;
    fs::recursive_directory_iterator it(root, ec);
    if (ec) {
        listing.error = "cannot read source directory " + source_root + ": " + ec.message();
        return listing;
    }

    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            listing.error = "cannot read source directory " + source_root + ": " + ec.message();
            return listing;
        }

        std::string rel = it->path().lexically_relative(root).generic_string();
        auto status = it->symlink_status(ec);
        if (ec) {
            listing.error = "cannot stat " + rel + ": " + ec.message();
            return listing;
        }

        if (fs::is_directory(status)) continue;
        if (!fs::is_regular_file(status)) {
            listing.error = "unsupported file type in bundle (symlink or special file): " + rel;
            return listing;
        }

        if (rel == BUNDLE_CONFIG_FILENAME) continue;
        if (rel == config_.manifest_relative_path() || is_under(rel, config_.backup_dir)) {
            spdlog::warn("skipping reserved path in bundle: {}", rel);
            continue;
        }

        if (!config_.include.empty()) {
            bool included = std::any_of(config_.include.begin(), config_.include.end(),
                                        [&](const std::string& inc) {
                                            auto n = NamespaceFilter::normalize(inc);
                                            return n && is_under(rel, *n);
                                        });
            if (!included) continue;
        }

        listing.files.push_back(rel);
    }

    std::sort(listing.files.begin(), listing.files.end());
    listing.ok = true;
    return listing;
}

InstallResult Installer::install(const std::string& source_root,
                                 const std::string& target_root,
                                 const InstallOptions& options) {
    InstallResult result;
    result.dry_run = options.dry_run;

    const std::string target = normalize_absolute(target_root);
    result.target_root = target;
    const bool subset = !options.only.empty();
    auto interrupted = [&]() { return options.cancel && options.cancel->is_cancelled(); };

    // ------------------------------------------------------------------------
    // Pre-flight: nothing is touched until every check passes
    // ------------------------------------------------------------------------

    std::error_code ec;
    if (!fs::is_directory(source_root, ec)) {
        fail(result, ErrorKind::Precondition, "source directory not found: " + source_root);
        return result;
    }

    // A symlinked root is swapped at its real location so the link survives
    std::string swap_target = target;
    bool target_exists = fs::exists(fs::symlink_status(target, ec));
    if (target_exists) {
        if (fs::is_symlink(fs::symlink_status(target, ec))) {
            swap_target = fs::canonical(target, ec).generic_string();
            if (ec) {
                fail(result, ErrorKind::Precondition, "cannot resolve target " + target + ": " + ec.message());
                return result;
            }
        }
        if (!fs::is_directory(swap_target, ec)) {
            fail(result, ErrorKind::Precondition, "target exists and is not a directory: " + target);
            return result;
        }
    }

    std::string parent = get_parent_directory(swap_target);
    if (parent.empty() || !fs::is_directory(parent, ec)) {
        fail(result, ErrorKind::Precondition, "target parent directory does not exist: " + parent);
        return result;
    }
    if (!options.dry_run && !is_writable_directory(parent)) {
        fail(result, ErrorKind::Permission, "permission denied: cannot write to " + parent);
        return result;
    }

    auto listing = list_source_files(source_root);
    if (!listing.ok) {
        fail(result, ErrorKind::Precondition, listing.error);
        return result;
    }

    std::vector<std::string> files;
    for (const auto& rel : listing.files) {
        if (!subset || options.only.count(rel) > 0) {
            files.push_back(rel);
        }
    }

    std::string replacement_root = options.path_prefix.empty() ? target : options.path_prefix;

    // Previous manifest, used for stale detection and subset merging
    Manifest previous(target, config_.manifest_relative_path());
    bool have_previous = false;
    if (target_exists) {
        auto loaded = previous.load();
        have_previous = loaded.ok && loaded.found;
        if (!loaded.ok) {
            result.warnings.push_back("previous manifest ignored: " + loaded.error);
            spdlog::warn("previous manifest ignored: {}", loaded.error);
        }
        for (const auto& w : loaded.warnings) result.warnings.push_back(w);
    }

    const std::string version_rel = config_.version_relative_path();
    const bool write_version = !config_.version.empty() && (!subset || options.only.count(version_rel) > 0);

    std::set<std::string> shipped(files.begin(), files.end());
    if (write_version) shipped.insert(version_rel);

    // Previously installed bundle files the new bundle no longer ships
    std::set<std::string> stale;
    if (target_exists && have_previous && !subset) {
        for (const auto& e : previous.entries()) {
            if (e.relative_path == config_.manifest_relative_path()) continue;
            if (shipped.count(e.relative_path)) continue;
            if (!filter_.is_owned(e.relative_path)) continue;
            if (!fs::exists(fs::symlink_status(join_path(target, e.relative_path), ec))) continue;
            stale.insert(e.relative_path);
        }
    }

    // Full installs move legacy layouts into their current place
    std::vector<LegacyMove> moves;
    std::vector<std::string> migrating;
    if (target_exists && !subset) {
        std::string error;
        if (!plan_layout_moves(target, config_.legacy_layouts, shipped, stale, moves, migrating, error)) {
            fail(result, ErrorKind::Io, error + "; target left unchanged");
            return result;
        }
    }
    for (const auto& move : moves) {
        if (move.superseded) {
            result.legacy_removed.push_back(move.from);
        } else {
            result.migrated.push_back(move.from);
        }
    }
    result.stale_removed.assign(stale.begin(), stale.end());

    // ------------------------------------------------------------------------
    // Dry run: classify only
    // ------------------------------------------------------------------------

    if (options.dry_run) {
        for (const auto& rel : files) {
            auto content = read_file_bytes(join_path(source_root, rel));
            if (!content) {
                result.errors.push_back(rel + ": cannot read source file");
                continue;
            }
            std::string rendered = render(rel, *content, replacement_root);
            auto hash = compute_sha256_bytes(rendered);

            PlannedFile planned;
            planned.relative_path = rel;
            planned.size = rendered.size();
            planned.hash = hash.prefixed();

            std::string existing = join_path(target, rel);
            if (!fs::exists(existing, ec)) {
                planned.action = PlannedAction::Create;
            } else {
                auto current = compute_sha256_file(existing);
                planned.action = (current.ok && current.hex_digest == hash.hex_digest)
                                     ? PlannedAction::Unchanged
                                     : PlannedAction::Overwrite;
            }
            result.planned.push_back(planned);
        }
        result.ok = result.errors.empty();
        if (!result.ok) {
            result.error = std::to_string(result.errors.size()) + " file(s) could not be read";
            result.error_kind = ErrorKind::Io;
        }
        return result;
    }

    // ------------------------------------------------------------------------
    // Stage
    // ------------------------------------------------------------------------

    std::string staging = join_path(parent, "." + get_filename(swap_target) + ".staging-" + generate_uuid());
    fs::create_directory(staging, ec);
    if (ec) {
        fail(result, classify_error(ec), "failed to create staging directory: " + ec.message());
        return result;
    }
    StagingGuard guard(staging);
    spdlog::debug("staging into {}", staging);

    std::vector<StagedFile> staged;
    for (const auto& rel : files) {
        if (interrupted()) {
            fail(result, ErrorKind::Interrupted, "installation interrupted; target left unchanged");
            return result;
        }

        std::string src = join_path(source_root, rel);
        auto content = read_file_bytes(src);
        if (!content) {
            result.errors.push_back(rel + ": cannot read source file");
            continue;
        }

        std::string rendered = render(rel, *content, replacement_root);
        std::string dest = join_path(staging, rel);

        fs::create_directories(get_parent_directory(dest), ec);
        if (ec) {
            result.errors.push_back(rel + ": " + ec.message());
            continue;
        }
        auto write = atomic_write_file(dest, rendered);
        if (!write.ok) {
            result.errors.push_back(rel + ": " + write.error);
            continue;
        }
        auto src_status = fs::status(src, ec);
        if (!ec) fs::permissions(dest, src_status.permissions(), ec);
        if (ec) {
            result.errors.push_back(rel + ": cannot copy permissions: " + ec.message());
            continue;
        }

        auto hash = compute_sha256_bytes(rendered);
        if (!hash.ok) {
            result.errors.push_back(rel + ": " + hash.error);
            continue;
        }

        staged.push_back({rel, static_cast<uint64_t>(rendered.size()), hash.prefixed()});
        result.staged_bytes += rendered.size();
        spdlog::debug("staged {}", rel);
    }

    if (!result.errors.empty()) {
        fail(result, ErrorKind::Io,
             std::to_string(result.errors.size()) + " file(s) failed to stage; target left unchanged");
        return result;
    }

    // Version marker, tracked like any bundle file
    if (write_version) {
        std::string content = config_.version + "\n";
        std::string dest = join_path(staging, version_rel);
        fs::create_directories(get_parent_directory(dest), ec);
        auto write = atomic_write_file(dest, content);
        if (ec || !write.ok) {
            fail(result, write.ok ? classify_error(ec) : write.error_kind,
                 "failed to write version marker; target left unchanged");
            return result;
        }
        staged.erase(std::remove_if(staged.begin(), staged.end(),
                                    [&](const StagedFile& f) { return f.relative_path == version_rel; }),
                     staged.end());
        staged.push_back({version_rel, content.size(), compute_sha256_bytes(content).prefixed()});
    }

    if (interrupted()) {
        fail(result, ErrorKind::Interrupted, "installation interrupted; target left unchanged");
        return result;
    }

    std::map<std::string, const StagedFile*> staged_by_path;
    for (const auto& f : staged) staged_by_path[f.relative_path] = &f;

    // ------------------------------------------------------------------------
    // Decide what the new bundle replaces or drops. The copies are taken
    // from the previous tree after the swap, so the target stays untouched.
    // ------------------------------------------------------------------------

    std::vector<PendingBackup> pending;
    if (target_exists) {
        for (const auto& f : staged) {
            if (interrupted()) {
                fail(result, ErrorKind::Interrupted, "installation interrupted; target left unchanged");
                return result;
            }
            std::string existing = join_path(target, f.relative_path);
            auto status = fs::symlink_status(existing, ec);
            if (!fs::exists(status)) continue;
            if (fs::is_directory(status)) {
                fail(result, ErrorKind::Precondition,
                     "a directory occupies bundle file path " + f.relative_path + "; target left unchanged");
                return result;
            }
            if (fs::is_regular_file(status)) {
                auto current = compute_sha256_file(existing);
                if (current.ok && hashes_equal(current.prefixed(), f.hash)) continue;
            }
            pending.push_back({f.relative_path, "overwrite"});
        }

        for (const auto& rel : stale) {
            pending.push_back({rel, "stale"});
        }
        for (const auto& move : moves) {
            if (move.superseded) pending.push_back({move.from, "legacy"});
        }
    }

    // ------------------------------------------------------------------------
    // Carry over everything else in the existing target
    // ------------------------------------------------------------------------

    if (target_exists) {
        fs::path from(swap_target);
        fs::recursive_directory_iterator it(from, ec);
        if (ec) {
            fail(result, classify_error(ec), "cannot read existing target: " + ec.message());
            return result;
        }
        for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
            if (ec) {
                fail(result, classify_error(ec), "cannot read existing target: " + ec.message() +
                                                     "; target left unchanged");
                return result;
            }
            std::string rel = it->path().lexically_relative(from).generic_string();
            auto status = it->symlink_status(ec);
            if (ec) {
                fail(result, classify_error(ec), "cannot stat " + rel + ": " + ec.message());
                return result;
            }

            if (rel == config_.manifest_relative_path()) continue;
            if (staged_by_path.count(rel) || stale.count(rel)) continue;
            if (std::any_of(migrating.begin(), migrating.end(),
                            [&](const std::string& dir) { return is_under(rel, dir); })) {
                it.disable_recursion_pending();
                continue;
            }

            if (options.on_carry_over) options.on_carry_over(rel);
            if (interrupted()) {
                fail(result, ErrorKind::Interrupted, "installation interrupted; target left unchanged");
                return result;
            }

            std::string error;
            if (!carry_over_entry(it->path(), fs::path(staging) / rel, status, error)) {
                fail(result, ErrorKind::Io,
                     "cannot preserve existing " + rel + ": " + error + "; target left unchanged");
                return result;
            }
            if (!fs::is_directory(status)) ++result.carried_over;
        }

        for (const auto& move : moves) {
            if (move.superseded) continue;
            if (interrupted()) {
                fail(result, ErrorKind::Interrupted, "installation interrupted; target left unchanged");
                return result;
            }
            std::string error;
            if (!carry_over_entry(fs::path(swap_target) / move.from, fs::path(staging) / move.to,
                                  move.status, error)) {
                fail(result, ErrorKind::Io,
                     "cannot move " + move.from + " to " + move.to + ": " + error + "; target left unchanged");
                return result;
            }
            spdlog::debug("migrated {} -> {}", move.from, move.to);
        }

        // Drop legacy parents the migration emptied
        for (const auto& dir : migrating) {
            for (fs::path p = fs::path(dir).parent_path(); !p.empty(); p = p.parent_path()) {
                fs::path candidate = fs::path(staging) / p;
                if (!fs::is_empty(candidate, ec) || ec) break;
                fs::remove(candidate, ec);
                if (ec) break;
            }
            ec.clear();
        }
    }

    // ------------------------------------------------------------------------
    // Manifest, saved inside staging so the swap publishes it
    // ------------------------------------------------------------------------

    Manifest manifest(staging, config_.manifest_relative_path());
    if (subset && have_previous) {
        for (const auto& e : previous.entries()) {
            if (e.relative_path == config_.manifest_relative_path()) continue;
            manifest.add_file(join_path(target, e.relative_path), e.relative_path, e.size, e.hash);
        }
    }
    for (const auto& f : staged) {
        manifest.add_file(join_path(target, f.relative_path), f.relative_path, f.size, f.hash);
    }

    auto saved = manifest.save();
    if (!saved.ok) {
        fail(result, saved.error_kind, saved.error + "; target left unchanged");
        return result;
    }
    manifest.rebase(target);

    if (interrupted()) {
        fail(result, ErrorKind::Interrupted, "installation interrupted; target left unchanged");
        return result;
    }

    // The root keeps its own mode across the swap
    if (target_exists) {
        fs::permissions(staging, fs::status(swap_target, ec).permissions(), ec);
        if (ec) {
            fail(result, classify_error(ec),
                 "cannot copy permissions of " + target + ": " + ec.message() + "; target left unchanged");
            return result;
        }
    }

    // ------------------------------------------------------------------------
    // Swap
    // ------------------------------------------------------------------------

    std::string previous_tree;
    if (!target_exists) {
        fs::rename(staging, swap_target, ec);
        if (ec) {
            fail(result, classify_error(ec), "failed to publish installation: " + ec.message());
            return result;
        }
        guard.commit();
    } else if (atomic_exchange(staging, swap_target, ec)) {
        // The staging path now holds the previous tree
        guard.commit();
        previous_tree = staging;
    } else if (ec == std::errc::function_not_supported) {
        previous_tree = join_path(parent, "." + get_filename(swap_target) + ".previous-" + generate_uuid());
        fs::rename(swap_target, previous_tree, ec);
        if (ec) {
            fail(result, classify_error(ec), "failed to move existing installation aside: " + ec.message());
            return result;
        }
        fs::rename(staging, swap_target, ec);
        if (ec) {
            std::error_code restore_ec;
            fs::rename(previous_tree, swap_target, restore_ec);
            if (restore_ec) {
                fail(result, ErrorKind::Io,
                     "failed to publish installation (" + ec.message() + ") and to restore " +
                     swap_target + " from " + previous_tree + " (" + restore_ec.message() + ")");
            } else {
                fail(result, classify_error(ec),
                     "failed to publish installation: " + ec.message() + "; target left unchanged");
            }
            return result;
        }
        guard.commit();
    } else {
        fail(result, classify_error(ec), "failed to swap installation: " + ec.message());
        return result;
    }
    sync_directory(parent);

    // ------------------------------------------------------------------------
    // Back up replaced files out of the previous tree, then drop it
    // ------------------------------------------------------------------------

    if (!previous_tree.empty()) {
        bool backups_complete = true;
        if (backups_) {
            for (const auto& p : pending) {
                auto backup = backups_->backup_file(join_path(previous_tree, p.relative_path),
                                                    p.relative_path, p.reason,
                                                    join_path(target, p.relative_path));
                if (backup.success && backup.backup_path) {
                    result.backed_up.push_back(p.relative_path);
                } else if (!backup.success) {
                    result.warnings.push_back(backup.error);
                    backups_complete = false;
                }
            }
        }

        if (!backups_complete) {
            result.warnings.push_back("previous installation kept at " + previous_tree +
                                      " because some files could not be backed up");
            spdlog::warn("previous installation kept at {}", previous_tree);
        } else {
            fs::remove_all(previous_tree, ec);
            if (ec) {
                result.warnings.push_back("previous installation left at " + previous_tree + ": " + ec.message());
                spdlog::warn("could not remove previous installation {}: {}", previous_tree, ec.message());
            }
        }
    }

    result.files_copied = static_cast<int>(files.size());
    result.manifest = manifest.entries();
    result.manifest_path = manifest.manifest_path();
    if (backups_) {
        result.backup_session = backups_->session_name();
        auto cleanup = backups_->cleanup_old_backups();
        for (const auto& e : cleanup.errors) result.warnings.push_back(e);
    }

    spdlog::info("installed {} files into {}", result.files_copied, target);
    result.ok = true;
    return result;
}

} // namespace assetkit
