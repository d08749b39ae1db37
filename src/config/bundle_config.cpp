#include "assetkit/bundle_config.hpp"
#include "assetkit/platform.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <set>

namespace assetkit {

namespace {

const std::set<std::string> KNOWN_KEYS = {
    "name", "version", "path_token", "rewrite_extensions", "owned_dir", "include",
    "namespaces", "required_paths", "integrity_samples", "integrity_sample_limit",
    "backup_dir", "backup_retention", "global_dir", "local_dir", "config_dir_env",
    "legacy_layouts",
};

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

// Reads an optional string field. Returns false if present with the wrong type.
bool read_string(const nlohmann::json& j, const std::string& key, std::string& out,
                 std::string& error) {
    if (!j.contains(key)) return true;
    if (!j[key].is_string()) {
        error = key + " must be a string";
        return false;
    }
    out = j[key].get<std::string>();
    return true;
}

bool read_string_array(const nlohmann::json& j, const std::string& key,
                       std::vector<std::string>& out, std::string& error) {
    if (!j.contains(key)) return true;
    if (!j[key].is_array()) {
        error = key + " must be an array of strings";
        return false;
    }
    std::vector<std::string> values;
    for (const auto& elem : j[key]) {
        if (!elem.is_string()) {
            error = key + " must be an array of strings";
            return false;
        }
        values.push_back(elem.get<std::string>());
    }
    out = std::move(values);
    return true;
}

bool read_non_negative(const nlohmann::json& j, const std::string& key, int64_t& out,
                       std::string& error) {
    if (!j.contains(key)) return true;
    if (!j[key].is_number_integer() || j[key].get<int64_t>() < 0) {
        error = key + " must be a non-negative integer";
        return false;
    }
    out = j[key].get<int64_t>();
    return true;
}

bool is_safe_relative(const std::string& p) {
    return NamespaceFilter::normalize(p).has_value();
}

} // namespace

std::string BundleConfig::manifest_relative_path() const {
    return owned_dir + "/" + MANIFEST_FILENAME;
}

std::string BundleConfig::version_relative_path() const {
    return owned_dir + "/" + VERSION_FILENAME;
}

bool BundleConfig::should_rewrite(const std::string& relative_path) const {
    std::string ext = get_extension(relative_path);
    return std::find(rewrite_extensions.begin(), rewrite_extensions.end(), ext) !=
           rewrite_extensions.end();
}

NamespaceFilter BundleConfig::make_filter() const {
    return NamespaceFilter(namespaces);
}

BundleConfigParseResult parse_bundle_config(const std::string& json_str,
                                            const std::string& source_path) {
    BundleConfigParseResult result;
    result.config.source_path = source_path;
    auto& cfg = result.config;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "bundle config must be a JSON object";
            return result;
        }

        for (auto it = j.begin(); it != j.end(); ++it) {
            if (KNOWN_KEYS.count(it.key()) == 0) {
                result.warnings.push_back("unknown bundle config key: " + it.key());
            }
        }

        std::string err;
        if (!read_string(j, "name", cfg.name, err) ||
            !read_string(j, "version", cfg.version, err) ||
            !read_string(j, "path_token", cfg.path_token, err) ||
            !read_string(j, "owned_dir", cfg.owned_dir, err) ||
            !read_string(j, "backup_dir", cfg.backup_dir, err) ||
            !read_string(j, "global_dir", cfg.global_dir, err) ||
            !read_string(j, "local_dir", cfg.local_dir, err) ||
            !read_string(j, "config_dir_env", cfg.config_dir_env, err) ||
            !read_string_array(j, "rewrite_extensions", cfg.rewrite_extensions, err) ||
            !read_string_array(j, "include", cfg.include, err) ||
            !read_string_array(j, "required_paths", cfg.required_paths, err) ||
            !read_string_array(j, "integrity_samples", cfg.integrity_samples, err)) {
            result.error = err;
            return result;
        }

        int64_t sample_limit = static_cast<int64_t>(cfg.integrity_sample_limit);
        int64_t retention = cfg.backup_retention;
        if (!read_non_negative(j, "integrity_sample_limit", sample_limit, err) ||
            !read_non_negative(j, "backup_retention", retention, err)) {
            result.error = err;
            return result;
        }
        cfg.integrity_sample_limit = static_cast<size_t>(sample_limit);
        cfg.backup_retention = static_cast<int>(retention);

        // namespaces: strings are prefix rules, objects are regex rules
        if (j.contains("namespaces")) {
            if (!j["namespaces"].is_array()) {
                result.error = "namespaces must be an array";
                return result;
            }
            std::vector<NamespaceRule> rules;
            for (const auto& elem : j["namespaces"]) {
                if (elem.is_string()) {
                    std::string prefix = elem.get<std::string>();
                    if (trim(prefix).empty() || !is_safe_relative(prefix)) {
                        result.error = "namespace prefix must be a non-empty relative path";
                        return result;
                    }
                    rules.push_back(NamespaceRule::prefix(prefix));
                } else if (elem.is_object()) {
                    std::string regex;
                    std::string scan_root;
                    if (!read_string(elem, "regex", regex, err) ||
                        !read_string(elem, "scan_root", scan_root, err)) {
                        result.error = "namespaces: " + err;
                        return result;
                    }
                    if (regex.empty() || scan_root.empty() || !is_safe_relative(scan_root)) {
                        result.error = "regex namespace requires 'regex' and a relative 'scan_root'";
                        return result;
                    }
                    rules.push_back(NamespaceRule::regex(regex, scan_root));
                } else {
                    result.error = "namespaces entries must be strings or objects";
                    return result;
                }
            }
            if (rules.empty()) {
                result.error = "namespaces must not be empty";
                return result;
            }
            cfg.namespaces = std::move(rules);
        }

        // legacy_layouts: [{"from": "command/gsd", "to": "commands/gsd"}]
        if (j.contains("legacy_layouts")) {
            if (!j["legacy_layouts"].is_array()) {
                result.error = "legacy_layouts must be an array";
                return result;
            }
            std::vector<LegacyLayout> layouts;
            for (const auto& elem : j["legacy_layouts"]) {
                LegacyLayout layout;
                if (!elem.is_object() || !read_string(elem, "from", layout.legacy, err) ||
                    !read_string(elem, "to", layout.current, err)) {
                    result.error = "legacy_layouts entries must be objects with 'from' and 'to'";
                    return result;
                }
                auto from = NamespaceFilter::normalize(layout.legacy);
                auto to = NamespaceFilter::normalize(layout.current);
                if (!from || !to || *from == *to || from->rfind(*to + "/", 0) == 0 ||
                    to->rfind(*from + "/", 0) == 0) {
                    result.error = "legacy layout needs two separate relative paths";
                    return result;
                }
                layouts.push_back({*from, *to});
            }
            cfg.legacy_layouts = std::move(layouts);
        }

        cfg.version = trim(cfg.version);

        if (trim(cfg.path_token).empty()) {
            result.error = "path_token empty";
            return result;
        }
        if (!is_safe_relative(cfg.owned_dir) || cfg.owned_dir.find('/') != std::string::npos) {
            result.error = "owned_dir must be a single relative directory name";
            return result;
        }
        if (!is_safe_relative(cfg.backup_dir)) {
            result.error = "backup_dir must be a relative path";
            return result;
        }
        for (auto& ext : cfg.rewrite_extensions) {
            std::transform(ext.begin(), ext.end(), ext.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            if (!ext.empty() && ext[0] != '.') ext = "." + ext;
        }
        for (const auto& p : cfg.required_paths) {
            if (!is_safe_relative(p)) {
                result.error = "required_paths entry is not a relative path: " + p;
                return result;
            }
        }

        // The manifest must live inside the namespace or uninstall could never remove it
        if (!cfg.make_filter().is_owned(cfg.manifest_relative_path())) {
            result.warnings.push_back("manifest location " + cfg.manifest_relative_path() +
                                      " is outside every namespace rule");
        }

        result.ok = true;

    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON parse error: ") + e.what();
    }

    return result;
}

BundleConfigParseResult load_bundle_config(const std::string& source_root) {
    std::string path = join_path(source_root, BUNDLE_CONFIG_FILENAME);

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        BundleConfigParseResult result;
        result.ok = true;
        return result;
    }

    auto content = read_file_bytes(path);
    if (!content) {
        BundleConfigParseResult result;
        result.error = "failed to read " + path;
        return result;
    }
    return parse_bundle_config(*content, path);
}

} // namespace assetkit
