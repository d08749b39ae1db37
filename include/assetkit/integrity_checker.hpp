#pragma once

#include "assetkit/bundle_config.hpp"
#include "assetkit/namespace_filter.hpp"

#include <optional>
#include <string>
#include <vector>

namespace assetkit {

// ============================================================================
// Health Report
// ============================================================================

enum class IssueKind {
    None,
    Missing,       // Tracked file or required directory absent
    Unreadable,    // Exists but cannot be read, or is unexpectedly empty
    Drift,         // Content hash differs from the manifest
    Unrewritten,   // Still contains the path token
    Structural     // Manifest or version marker unusable
};

const char* issue_kind_to_string(IssueKind kind);

struct HealthCheck {
    std::string name;
    bool passed = false;
    std::string path;               // Root-relative
    std::string error;
    std::string hash;               // Current hash when computed
    IssueKind issue = IssueKind::None;
};

struct HealthCategory {
    bool passed = true;
    std::vector<HealthCheck> checks;
};

struct HealthReport {
    bool passed = false;
    int exit_code = 1;
    HealthCategory files;
    std::optional<HealthCategory> version;   // Only when an expected version is given
    HealthCategory integrity;
    bool used_manifest = false;               // Integrity tracked manifest entries
    size_t tracked_files = 0;                 // Before sampling
};

struct CheckOptions {
    std::string expected_version;             // Empty skips the version category
};

// Classified problems, consumed by repair
struct IssueSet {
    std::vector<std::string> missing;
    std::vector<std::string> drifted;
    std::vector<std::string> unrewritten;
    std::vector<std::string> unreadable;
    std::vector<std::string> structural;      // Human-readable descriptions

    bool empty() const {
        return missing.empty() && drifted.empty() && unrewritten.empty() &&
               unreadable.empty() && structural.empty();
    }
    size_t total() const {
        return missing.size() + drifted.size() + unrewritten.size() +
               unreadable.size() + structural.size();
    }
};

class IntegrityChecker {
public:
    IntegrityChecker(std::string root, BundleConfig config);

    HealthReport check_all(const CheckOptions& options = {}) const;

    HealthCategory check_files() const;
    HealthCategory check_version(const std::string& expected_version) const;
    HealthCategory check_integrity(bool* used_manifest = nullptr,
                                   size_t* tracked_files = nullptr) const;

    // Installed version marker contents, trimmed
    std::optional<std::string> installed_version() const;

    IssueSet detect_issues(const HealthReport& report) const;

    const std::string& root() const { return root_; }

private:
    std::string root_;
    BundleConfig config_;
};

// ============================================================================
// Directory Layout
// ============================================================================

enum class LayoutState {
    None,      // Neither directory exists
    Current,   // Only the current directory exists
    Legacy,    // Only the legacy directory exists
    Dual       // Both exist; a migration is unfinished
};

const char* layout_state_to_string(LayoutState state);

LayoutState detect_layout(const std::string& root, const LegacyLayout& layout);

// Every n-th element so that at most limit elements remain, first element kept
std::vector<size_t> evenly_spaced_sample(size_t count, size_t limit);

} // namespace assetkit
