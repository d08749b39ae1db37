#include "assetkit/namespace_filter.hpp"
#include "assetkit/platform.hpp"

#include <filesystem>
#include <set>

#include <spdlog/spdlog.h>

namespace assetkit {

namespace fs = std::filesystem;

namespace {

bool looks_absolute(const std::string& p) {
    if (p.empty()) return false;
    if (p[0] == '/') return true;
    // Drive letter (C:/...)
    return p.size() > 1 && p[1] == ':';
}

std::string strip_trailing_slashes(std::string s) {
    while (s.size() > 1 && s.back() == '/') s.pop_back();
    return s;
}

void collect_tree(const fs::path& dir, const fs::path& root, std::set<std::string>& out) {
    std::error_code ec;
    fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        spdlog::debug("fallback scan: cannot list {}: {}", dir.string(), ec.message());
        return;
    }
    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            spdlog::debug("fallback scan: error under {}: {}", dir.string(), ec.message());
            break;
        }
        auto status = it->symlink_status(ec);
        if (ec) continue;
        if (fs::is_regular_file(status) || fs::is_symlink(status)) {
            out.insert(it->path().lexically_relative(root).generic_string());
        }
    }
}

} // namespace

NamespaceRule NamespaceRule::prefix(const std::string& p) {
    NamespaceRule rule;
    rule.kind = NamespaceRuleKind::Prefix;
    rule.pattern = to_portable_path(p);
    return rule;
}

NamespaceRule NamespaceRule::regex(const std::string& expr, const std::string& scan_root) {
    NamespaceRule rule;
    rule.kind = NamespaceRuleKind::Regex;
    rule.pattern = expr;
    rule.scan_root = to_portable_path(scan_root);
    return rule;
}

NamespaceFilter::NamespaceFilter(std::vector<NamespaceRule> rules) {
    for (auto& rule : rules) {
        if (rule.pattern.empty()) {
            spdlog::warn("ignoring empty namespace rule");
            continue;
        }
        CompiledRule compiled;
        if (rule.kind == NamespaceRuleKind::Regex) {
            auto root = normalize(rule.scan_root);
            if (!root) {
                spdlog::warn("ignoring regex namespace rule '{}': scan root must be a relative path",
                             rule.pattern);
                continue;
            }
            rule.scan_root = *root;
            // Grouped so every alternative is anchored
            std::string source = "^(?:" + rule.pattern + ")";
            try {
                compiled.expr = std::regex(source, std::regex::ECMAScript);
            } catch (const std::regex_error& e) {
                spdlog::warn("ignoring invalid namespace regex '{}': {}", rule.pattern, e.what());
                continue;
            }
        }
        compiled.rule = rule;
        rules_.push_back(rule);
        compiled_.push_back(std::move(compiled));
    }
}

std::optional<std::string> NamespaceFilter::normalize(const std::string& path,
                                                      const std::string& root) {
    std::string p = to_portable_path(path);
    if (p.empty()) return std::nullopt;

    if (looks_absolute(p)) {
        if (root.empty()) return std::nullopt;
        std::string r = strip_trailing_slashes(
            fs::path(to_portable_path(root)).lexically_normal().generic_string());
        p = fs::path(p).lexically_normal().generic_string();
        if (p.size() <= r.size() + 1 || p.compare(0, r.size(), r) != 0 || p[r.size()] != '/') {
            return std::nullopt;
        }
        p = p.substr(r.size() + 1);
    }

    std::string out;
    size_t start = 0;
    while (start <= p.size()) {
        size_t slash = p.find('/', start);
        if (slash == std::string::npos) slash = p.size();
        std::string segment = p.substr(start, slash - start);
        start = slash + 1;

        if (segment.empty() || segment == ".") continue;
        if (segment == "..") return std::nullopt;

        if (!out.empty()) out += '/';
        out += segment;
    }

    if (out.empty() || looks_absolute(out)) return std::nullopt;
    return out;
}

bool NamespaceFilter::matches(const std::string& normalized) const {
    for (const auto& c : compiled_) {
        if (c.rule.kind == NamespaceRuleKind::Prefix) {
            if (normalized.compare(0, c.rule.pattern.size(), c.rule.pattern) == 0) {
                return true;
            }
        } else if (std::regex_search(normalized, c.expr)) {
            return true;
        }
    }
    return false;
}

bool NamespaceFilter::is_owned(const std::string& path, const std::string& root) const {
    auto normalized = normalize(path, root);
    if (!normalized) return false;
    return matches(*normalized);
}

std::vector<std::string> NamespaceFilter::scan(const std::string& root) const {
    std::set<std::string> found;
    fs::path root_path(root);
    std::error_code ec;

    for (const auto& c : compiled_) {
        if (c.rule.kind == NamespaceRuleKind::Regex) {
            fs::path dir = root_path / c.rule.scan_root;
            auto status = fs::symlink_status(dir, ec);
            if (ec || !fs::is_directory(status)) continue;
            collect_tree(dir, root_path, found);
            continue;
        }

        const std::string& pattern = c.rule.pattern;
        size_t slash = pattern.rfind('/');
        std::string scan_dir = slash == std::string::npos ? "" : pattern.substr(0, slash);
        std::string name_prefix = slash == std::string::npos ? pattern : pattern.substr(slash + 1);

        fs::path dir = scan_dir.empty() ? root_path : root_path / scan_dir;
        auto dir_status = fs::symlink_status(dir, ec);
        if (ec || !fs::is_directory(dir_status)) continue;

        fs::directory_iterator it(dir, ec);
        if (ec) {
            spdlog::debug("fallback scan: cannot list {}: {}", dir.string(), ec.message());
            continue;
        }
        for (fs::directory_iterator end; it != end; it.increment(ec)) {
            if (ec) break;
            std::string name = it->path().filename().string();
            if (name.compare(0, name_prefix.size(), name_prefix) != 0) continue;

            auto status = it->symlink_status(ec);
            if (ec) continue;
            if (fs::is_directory(status)) {
                collect_tree(it->path(), root_path, found);
            } else if (fs::is_regular_file(status) || fs::is_symlink(status)) {
                found.insert(it->path().lexically_relative(root_path).generic_string());
            }
        }
    }

    std::vector<std::string> result;
    for (const auto& rel : found) {
        if (is_owned(rel)) {
            result.push_back(rel);
        }
    }
    return result;
}

std::vector<std::string> NamespaceFilter::describe() const {
    std::vector<std::string> out;
    for (const auto& rule : rules_) {
        if (rule.kind == NamespaceRuleKind::Prefix) {
            out.push_back(rule.pattern + "*");
        } else {
            out.push_back("/" + rule.pattern + "/ in " + rule.scan_root + "/");
        }
    }
    return out;
}

} // namespace assetkit
