#pragma once

#include "assetkit/namespace_filter.hpp"
#include "assetkit/types.hpp"

#include <string>
#include <vector>

namespace assetkit {

// ============================================================================
// Bundle Configuration
// ============================================================================
//
// Describes one installable bundle. Read once from bundle.json at the bundle
// source root; every field has a default so the file is optional.

constexpr const char* BUNDLE_CONFIG_FILENAME = "bundle.json";
constexpr const char* MANIFEST_FILENAME = "INSTALLED_FILES.json";
constexpr const char* VERSION_FILENAME = "VERSION";

// A directory the bundle used to install into, and where it lives now
struct LegacyLayout {
    std::string legacy;
    std::string current;
};

struct BundleConfig {
    std::string name = "gsd-opencode";
    std::string version;                       // Empty means unknown

    std::string path_token = "@gsd-opencode/";
    std::vector<std::string> rewrite_extensions = {".md"};

    std::string owned_dir = "get-shit-done";   // Holds manifest and version marker
    std::vector<std::string> include;          // Empty = whole source tree

    std::vector<NamespaceRule> namespaces = {
        NamespaceRule::prefix("agents/gsd-"),
        NamespaceRule::prefix("command/gsd/"),
        NamespaceRule::prefix("commands/gsd/"),
        NamespaceRule::prefix("skills/gsd-"),
        NamespaceRule::prefix("get-shit-done/"),
    };

    std::vector<std::string> required_paths = {"agents", "commands", "get-shit-done"};

    // Full installs move these into their current location
    std::vector<LegacyLayout> legacy_layouts = {{"command/gsd", "commands/gsd"}};

    std::vector<std::string> integrity_samples;
    size_t integrity_sample_limit = 200;

    std::string backup_dir = ".backups";
    int backup_retention = 5;

    std::string global_dir = ".config/opencode";
    std::string local_dir = ".opencode";
    std::string config_dir_env = "OPENCODE_CONFIG_DIR";

    // Where the config was read from (empty for defaults)
    std::string source_path;

    // Root-relative locations derived from owned_dir
    std::string manifest_relative_path() const;
    std::string version_relative_path() const;

    bool should_rewrite(const std::string& relative_path) const;

    NamespaceFilter make_filter() const;
};

struct BundleConfigParseResult {
    bool ok = false;
    std::string error;
    BundleConfig config;
    std::vector<std::string> warnings;
};

// Parse bundle.json contents
BundleConfigParseResult parse_bundle_config(const std::string& json_str,
                                            const std::string& source_path = "");

// Load <source_root>/bundle.json, or defaults when the file does not exist
BundleConfigParseResult load_bundle_config(const std::string& source_root);

} // namespace assetkit
