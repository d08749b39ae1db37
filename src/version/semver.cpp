#include "assetkit/semver.hpp"

#include <cctype>

namespace assetkit {

namespace {

std::string trim(const std::string& in) {
    size_t start = 0;
    while (start < in.size() && std::isspace(static_cast<unsigned char>(in[start]))) ++start;
    size_t end = in.size();
    while (end > start && std::isspace(static_cast<unsigned char>(in[end - 1]))) --end;
    return in.substr(start, end - start);
}

} // namespace

std::optional<Version> parse_version(const std::string& str) {
    std::string s = trim(str);
    if (!s.empty() && (s[0] == 'v' || s[0] == 'V')) {
        s = s.substr(1);
    }
    if (s.empty()) return std::nullopt;

    try {
        return semver::version::parse(s);
    } catch (const semver::semver_exception&) {
        return std::nullopt;
    }
}

VersionRelation compare_versions(const std::string& installed, const std::string& available) {
    auto from = parse_version(installed);
    auto to = parse_version(available);
    if (!from || !to) {
        // Unparsable but textually identical versions are still the same
        if (!trim(installed).empty() && trim(installed) == trim(available)) {
            return VersionRelation::Same;
        }
        return VersionRelation::Unknown;
    }
    if (*to == *from) return VersionRelation::Same;
    return *from < *to ? VersionRelation::Newer : VersionRelation::Older;
}

const char* version_relation_to_string(VersionRelation relation) {
    switch (relation) {
        case VersionRelation::Newer: return "newer";
        case VersionRelation::Same: return "same";
        case VersionRelation::Older: return "older";
        case VersionRelation::Unknown: return "unknown";
    }
    return "unknown";
}

} // namespace assetkit
