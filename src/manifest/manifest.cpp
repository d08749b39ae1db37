#include "assetkit/manifest.hpp"
#include "assetkit/platform.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>

namespace assetkit {

namespace fs = std::filesystem;

Manifest::Manifest(std::string install_root, std::string manifest_relative_path)
    : install_root_(std::move(install_root)),
      manifest_relative_path_(std::move(manifest_relative_path)) {
    manifest_path_ = join_path(install_root_, manifest_relative_path_);
}

std::optional<ManifestEntry> Manifest::add_file(const std::string& absolute_path,
                                                const std::string& relative_path,
                                                uint64_t size,
                                                const std::string& hash) {
    auto normalized = NamespaceFilter::normalize(relative_path);
    if (!normalized) {
        return std::nullopt;
    }

    ManifestEntry entry;
    entry.path = to_portable_path(absolute_path);
    entry.relative_path = *normalized;
    entry.size = size;
    entry.hash = hash;

    for (auto& existing : entries_) {
        if (existing.relative_path == entry.relative_path) {
            existing = entry;
            return entry;
        }
    }
    entries_.push_back(entry);
    return entry;
}

const ManifestEntry* Manifest::find(const std::string& relative_path) const {
    auto normalized = NamespaceFilter::normalize(relative_path);
    if (!normalized) return nullptr;
    for (const auto& e : entries_) {
        if (e.relative_path == *normalized) return &e;
    }
    return nullptr;
}

bool Manifest::remove(const std::string& relative_path) {
    auto normalized = NamespaceFilter::normalize(relative_path);
    if (!normalized) return false;
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        if (it->relative_path == *normalized) {
            entries_.erase(it);
            return true;
        }
    }
    return false;
}

bool Manifest::is_in_allowed_namespace(const std::string& path,
                                       const NamespaceFilter& filter) const {
    return filter.is_owned(path, install_root_);
}

std::vector<ManifestEntry> Manifest::files_in_namespaces(const NamespaceFilter& filter) const {
    std::vector<ManifestEntry> out;
    for (const auto& e : entries_) {
        if (filter.is_owned(e.relative_path)) {
            out.push_back(e);
        }
    }
    return out;
}

void Manifest::rebase(const std::string& to_root) {
    for (auto& e : entries_) {
        e.path = join_path(to_root, e.relative_path);
    }
    install_root_ = to_root;
    manifest_path_ = join_path(install_root_, manifest_relative_path_);
}

ManifestSaveResult Manifest::save() const {
    ManifestSaveResult result;
    result.path = manifest_path_;

    std::error_code ec;
    fs::create_directories(get_parent_directory(manifest_path_), ec);
    if (ec) {
        result.error = "failed to create manifest directory: " + ec.message();
        result.error_kind = classify_error(ec);
        return result;
    }

    auto write = atomic_write_file(manifest_path_, serialize_manifest(entries_));
    if (!write.ok) {
        result.error = "failed to write manifest: " + write.error;
        result.error_kind = write.error_kind;
        return result;
    }

    result.ok = true;
    return result;
}

ManifestLoadResult Manifest::load() {
    ManifestLoadResult result;

    std::error_code ec;
    if (!fs::exists(manifest_path_, ec)) {
        if (ec) {
            result.error = "cannot access manifest: " + ec.message();
            result.error_kind = classify_error(ec);
            return result;
        }
        entries_.clear();
        result.ok = true;
        return result;
    }

    auto content = read_file_bytes(manifest_path_);
    if (!content) {
        result.found = true;
        result.error = "failed to read manifest: " + manifest_path_;
        result.error_kind = ErrorKind::Io;
        return result;
    }

    result = parse_manifest(*content, install_root_);
    if (result.ok) {
        entries_ = result.entries;
    }
    return result;
}

std::string serialize_manifest(const std::vector<ManifestEntry>& entries) {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& e : entries) {
        j.push_back({
            {"path", e.path},
            {"relativePath", e.relative_path},
            {"size", e.size},
            {"hash", e.hash},
        });
    }
    return j.dump(2);
}

ManifestLoadResult parse_manifest(const std::string& json_str, const std::string& install_root) {
    ManifestLoadResult result;
    result.found = true;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_array()) {
            result.error = "manifest must be a JSON array";
            result.error_kind = ErrorKind::Corruption;
            return result;
        }

        for (const auto& item : j) {
            if (!item.is_object() || !item.contains("relativePath") ||
                !item["relativePath"].is_string()) {
                result.error = "manifest entry without relativePath";
                result.error_kind = ErrorKind::Corruption;
                result.entries.clear();
                return result;
            }

            std::string raw = item["relativePath"].get<std::string>();
            auto normalized = NamespaceFilter::normalize(raw);
            if (!normalized) {
                result.warnings.push_back("ignoring unsafe manifest path: " + raw);
                continue;
            }

            ManifestEntry entry;
            entry.relative_path = *normalized;
            entry.path = join_path(install_root, entry.relative_path);
            if (item.contains("size") && item["size"].is_number_unsigned()) {
                entry.size = item["size"].get<uint64_t>();
            }
            if (item.contains("hash") && item["hash"].is_string()) {
                entry.hash = item["hash"].get<std::string>();
            }

            bool replaced = false;
            for (auto& existing : result.entries) {
                if (existing.relative_path == entry.relative_path) {
                    existing = entry;
                    replaced = true;
                    break;
                }
            }
            if (!replaced) result.entries.push_back(entry);
        }

        result.ok = true;

    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("manifest JSON parse error: ") + e.what();
        result.error_kind = ErrorKind::Corruption;
    }

    return result;
}

} // namespace assetkit
