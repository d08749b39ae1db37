#pragma once

// cpp-semver requires <cstdint> but doesn't include it (GCC strictness)
#include <cstdint>
#include <semver/semver.hpp>
#include <optional>
#include <string>

namespace assetkit {

/// Semantic version type (MAJOR.MINOR.PATCH[-prerelease][+build])
using Version = semver::version;

/**
 * @brief Parse a SemVer 2.0.0 version string
 * @param str Version string; surrounding whitespace and a leading "v" are ignored
 * @return Parsed version or nullopt on failure
 */
std::optional<Version> parse_version(const std::string& str);

/// Relation of an available bundle version to the installed one
enum class VersionRelation {
    Newer,       ///< available > installed
    Same,        ///< available == installed
    Older,       ///< available < installed (downgrade)
    Unknown      ///< either side missing or unparsable
};

VersionRelation compare_versions(const std::string& installed, const std::string& available);

const char* version_relation_to_string(VersionRelation relation);

} // namespace assetkit
