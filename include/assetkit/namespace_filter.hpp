#pragma once

#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace assetkit {

// ============================================================================
// Namespace Rules
// ============================================================================
//
// A rule describes a part of the installation root that the bundle owns
// outright. Only paths matching at least one rule may ever be deleted.

enum class NamespaceRuleKind {
    Prefix,   // e.g. "agents/gsd-" or "get-shit-done/"
    Regex     // anchored expression with an explicit scan root
};

struct NamespaceRule {
    NamespaceRuleKind kind = NamespaceRuleKind::Prefix;
    std::string pattern;     // Prefix text or regex source
    std::string scan_root;   // Directory walked in fallback mode (Regex only)

    static NamespaceRule prefix(const std::string& p);
    static NamespaceRule regex(const std::string& expr, const std::string& scan_root);
};

class NamespaceFilter {
public:
    NamespaceFilter() = default;
    explicit NamespaceFilter(std::vector<NamespaceRule> rules);

    // Normalize a path to the root-relative, forward-slash form.
    // Absolute paths outside the root, ".." segments and empty paths
    // yield nullopt.
    static std::optional<std::string> normalize(const std::string& path,
                                                const std::string& root = "");

    // True if the path is owned by the bundle.
    bool is_owned(const std::string& path, const std::string& root = "") const;

    // Structural fallback enumeration: root-relative paths of files that lie
    // under the sub-paths the rules describe, sorted. Never walks the whole root.
    std::vector<std::string> scan(const std::string& root) const;

    const std::vector<NamespaceRule>& rules() const { return rules_; }
    bool empty() const { return rules_.empty(); }

    // Human-readable list, e.g. for uninstall summaries
    std::vector<std::string> describe() const;

private:
    struct CompiledRule {
        NamespaceRule rule;
        std::regex expr;
    };

    bool matches(const std::string& normalized) const;

    std::vector<NamespaceRule> rules_;
    std::vector<CompiledRule> compiled_;
};

} // namespace assetkit
