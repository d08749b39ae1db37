#pragma once

#include "assetkit/namespace_filter.hpp"
#include "assetkit/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace assetkit {

// ============================================================================
// Installed Files Manifest
// ============================================================================
//
// Record of every file written by an install, persisted as a JSON array of
// {path, relativePath, size, hash}. The manifest is the primary source of
// truth for uninstall and integrity checks.

struct ManifestEntry {
    std::string path;            // Absolute path at write time
    std::string relative_path;   // Forward-slash, root-relative, no ".."
    uint64_t size = 0;
    std::string hash;            // "sha256:<hex>"
};

struct ManifestSaveResult {
    bool ok = false;
    std::string error;
    ErrorKind error_kind = ErrorKind::None;
    std::string path;
};

struct ManifestLoadResult {
    bool ok = false;
    bool found = false;          // false: no manifest, caller uses fallback mode
    std::string error;
    ErrorKind error_kind = ErrorKind::None;
    std::vector<ManifestEntry> entries;
    std::vector<std::string> warnings;   // Dropped unsafe entries
};

class Manifest {
public:
    Manifest(std::string install_root, std::string manifest_relative_path);

    // Adds or replaces the entry for relative_path. The relative path is
    // normalized; unsafe paths are rejected (nullopt).
    std::optional<ManifestEntry> add_file(const std::string& absolute_path,
                                          const std::string& relative_path,
                                          uint64_t size,
                                          const std::string& hash);

    ManifestSaveResult save() const;

    // Reads the manifest file. On success the in-memory entries are replaced.
    ManifestLoadResult load();

    const std::vector<ManifestEntry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    void clear() { entries_.clear(); }

    const ManifestEntry* find(const std::string& relative_path) const;
    bool remove(const std::string& relative_path);

    bool is_in_allowed_namespace(const std::string& path, const NamespaceFilter& filter) const;
    std::vector<ManifestEntry> files_in_namespaces(const NamespaceFilter& filter) const;

    // Move the manifest to another root; entry paths follow
    void rebase(const std::string& to_root);

    const std::string& manifest_path() const { return manifest_path_; }
    const std::string& install_root() const { return install_root_; }
    const std::string& manifest_relative_path() const { return manifest_relative_path_; }

private:
    std::string install_root_;
    std::string manifest_relative_path_;
    std::string manifest_path_;
    std::vector<ManifestEntry> entries_;
};

// Serialization helpers shared by the backup index and tests
std::string serialize_manifest(const std::vector<ManifestEntry>& entries);
ManifestLoadResult parse_manifest(const std::string& json_str, const std::string& install_root);

} // namespace assetkit
