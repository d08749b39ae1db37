#include "assetkit/integrity_checker.hpp"
#include "assetkit/hash.hpp"
#include "assetkit/manifest.hpp"
#include "assetkit/platform.hpp"

#include <cctype>
#include <filesystem>

#include <spdlog/spdlog.h>

namespace assetkit {

namespace fs = std::filesystem;

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

void add_check(HealthCategory& category, HealthCheck check) {
    if (!check.passed) category.passed = false;
    category.checks.push_back(std::move(check));
}

struct TrackedFile {
    std::string relative_path;
    std::optional<uint64_t> size;
    std::string hash;
};

} // namespace

const char* issue_kind_to_string(IssueKind kind) {
    switch (kind) {
        case IssueKind::None: return "none";
        case IssueKind::Missing: return "missing";
        case IssueKind::Unreadable: return "unreadable";
        case IssueKind::Drift: return "drift";
        case IssueKind::Unrewritten: return "unrewritten";
        case IssueKind::Structural: return "structural";
    }
    return "unknown";
}

const char* layout_state_to_string(LayoutState state) {
    switch (state) {
        case LayoutState::None: return "none";
        case LayoutState::Current: return "current";
        case LayoutState::Legacy: return "legacy";
        case LayoutState::Dual: return "dual";
    }
    return "unknown";
}

LayoutState detect_layout(const std::string& root, const LegacyLayout& layout) {
    std::error_code ec;
    bool legacy = fs::is_directory(fs::symlink_status(join_path(root, layout.legacy), ec));
    bool current = fs::is_directory(fs::symlink_status(join_path(root, layout.current), ec));
    if (legacy && current) return LayoutState::Dual;
    if (legacy) return LayoutState::Legacy;
    if (current) return LayoutState::Current;
    return LayoutState::None;
}

std::vector<size_t> evenly_spaced_sample(size_t count, size_t limit) {
    std::vector<size_t> indices;
    if (limit == 0 || count <= limit) {
        for (size_t i = 0; i < count; ++i) indices.push_back(i);
        return indices;
    }
    for (size_t i = 0; i < limit; ++i) {
        indices.push_back(i * count / limit);
    }
    return indices;
}

IntegrityChecker::IntegrityChecker(std::string root, BundleConfig config)
    : root_(std::move(root)), config_(std::move(config)) {}

std::optional<std::string> IntegrityChecker::installed_version() const {
    auto content = read_file_bytes(join_path(root_, config_.version_relative_path()));
    if (!content) return std::nullopt;
    return trim(*content);
}

HealthCategory IntegrityChecker::check_files() const {
    HealthCategory category;
    std::error_code ec;

    for (const auto& dir : config_.required_paths) {
        HealthCheck check;
        check.name = dir + " directory";
        check.path = dir;
        check.passed = fs::is_directory(join_path(root_, dir), ec);
        if (!check.passed) {
            check.error = "directory not found";
            check.issue = IssueKind::Structural;
        }
        add_check(category, check);
    }

    for (const auto& layout : config_.legacy_layouts) {
        auto state = detect_layout(root_, layout);
        if (state != LayoutState::Legacy && state != LayoutState::Dual) continue;
        HealthCheck check;
        check.name = layout.legacy + " layout";
        check.path = layout.legacy;
        check.error = std::string(state == LayoutState::Dual ? "unfinished migration" : "legacy layout") +
                      "; run repair or update to move it to " + layout.current;
        check.issue = IssueKind::Structural;
        add_check(category, check);
    }

    // An unversioned bundle writes no marker; a shipped one is tracked
    // by the manifest and checked with the other files
    if (!config_.version.empty()) {
        HealthCheck version;
        version.name = "VERSION file";
        version.path = config_.version_relative_path();
        version.passed = fs::is_regular_file(join_path(root_, version.path), ec);
        if (!version.passed) {
            version.error = "version marker not found";
            version.issue = IssueKind::Structural;
        }
        add_check(category, version);
    }

    return category;
}

HealthCategory IntegrityChecker::check_version(const std::string& expected_version) const {
    HealthCategory category;

    HealthCheck check;
    check.name = "version match";
    check.path = config_.version_relative_path();

    auto installed = installed_version();
    if (!installed) {
        check.error = "version marker missing or unreadable";
        check.issue = IssueKind::Structural;
    } else if (*installed != trim(expected_version)) {
        check.error = "installed " + *installed + ", expected " + trim(expected_version);
    } else {
        check.passed = true;
    }
    add_check(category, check);
    return category;
}

HealthCategory IntegrityChecker::check_integrity(bool* used_manifest,
                                                 size_t* tracked_files) const {
    HealthCategory category;

    Manifest manifest(root_, config_.manifest_relative_path());
    auto loaded = manifest.load();

    std::vector<TrackedFile> tracked;
    if (loaded.ok && loaded.found) {
        for (const auto& e : loaded.entries) {
            tracked.push_back({e.relative_path, e.size, e.hash});
        }
        if (used_manifest) *used_manifest = true;
    } else {
        if (!loaded.ok) {
            HealthCheck check;
            check.name = "manifest";
            check.path = config_.manifest_relative_path();
            check.error = loaded.error;
            check.issue = IssueKind::Structural;
            add_check(category, check);
        }
        for (const auto& sample : config_.integrity_samples) {
            if (auto rel = NamespaceFilter::normalize(sample)) {
                tracked.push_back({*rel, std::nullopt, ""});
            }
        }
        if (used_manifest) *used_manifest = false;
    }
    if (tracked_files) *tracked_files = tracked.size();

    for (size_t index : evenly_spaced_sample(tracked.size(), config_.integrity_sample_limit)) {
        const auto& file = tracked[index];
        std::string full = join_path(root_, file.relative_path);

        HealthCheck check;
        check.name = file.relative_path;
        check.path = file.relative_path;

        std::error_code ec;
        if (!fs::exists(fs::symlink_status(full, ec))) {
            check.error = "missing";
            check.issue = IssueKind::Missing;
            add_check(category, check);
            continue;
        }

        auto content = read_file_bytes(full);
        if (!content) {
            check.error = "unreadable";
            check.issue = IssueKind::Unreadable;
            add_check(category, check);
            continue;
        }

        bool empty_expected = file.size && *file.size == 0;
        if (content->empty() && !empty_expected) {
            check.error = "empty file";
            check.issue = IssueKind::Unreadable;
            add_check(category, check);
            continue;
        }

        auto hash = compute_sha256_bytes(*content);
        if (hash.ok) check.hash = hash.prefixed();

        if (!file.hash.empty() && !hashes_equal(check.hash, file.hash)) {
            check.error = "drift: content differs from installed version";
            check.issue = IssueKind::Drift;
        } else if (config_.should_rewrite(file.relative_path) &&
                   content->find(config_.path_token) != std::string::npos) {
            check.error = "unreplaced path token " + config_.path_token;
            check.issue = IssueKind::Unrewritten;
        } else {
            check.passed = true;
        }
        add_check(category, check);
    }

    return category;
}

HealthReport IntegrityChecker::check_all(const CheckOptions& options) const {
    HealthReport report;

    report.files = check_files();
    if (!options.expected_version.empty()) {
        report.version = check_version(options.expected_version);
    }
    report.integrity = check_integrity(&report.used_manifest, &report.tracked_files);

    report.passed = report.files.passed && report.integrity.passed &&
                    (!report.version || report.version->passed);
    report.exit_code = report.passed ? 0 : 1;

    spdlog::debug("health check of {}: {}", root_, report.passed ? "passed" : "failed");
    return report;
}

IssueSet IntegrityChecker::detect_issues(const HealthReport& report) const {
    IssueSet issues;

    auto classify = [&issues](const HealthCategory& category) {
        for (const auto& check : category.checks) {
            if (check.passed) continue;
            switch (check.issue) {
                case IssueKind::Missing: issues.missing.push_back(check.path); break;
                case IssueKind::Unreadable: issues.unreadable.push_back(check.path); break;
                case IssueKind::Drift: issues.drifted.push_back(check.path); break;
                case IssueKind::Unrewritten: issues.unrewritten.push_back(check.path); break;
                case IssueKind::Structural:
                    issues.structural.push_back(check.name + ": " + check.error);
                    break;
                case IssueKind::None: break;
            }
        }
    };

    classify(report.files);
    classify(report.integrity);
    return issues;
}

} // namespace assetkit
