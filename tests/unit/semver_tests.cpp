#include <doctest/doctest.h>
#include <assetkit/semver.hpp>

using namespace assetkit;

TEST_CASE("parse_version accepts plain and prefixed versions") {
    auto v = parse_version(" v1.2.3\n");
    REQUIRE(v.has_value());
    CHECK(v->major() == 1);
    CHECK(v->minor() == 2);
    CHECK(v->patch() == 3);

    CHECK(parse_version("1.0.0-rc.1").has_value());
    CHECK_FALSE(parse_version("").has_value());
    CHECK_FALSE(parse_version("latest").has_value());
}

TEST_CASE("compare_versions classifies the available version") {
    CHECK(compare_versions("1.0.0", "1.1.0") == VersionRelation::Newer);
    CHECK(compare_versions("1.1.0", "1.1.0") == VersionRelation::Same);
    CHECK(compare_versions("v1.1.0", "1.1.0") == VersionRelation::Same);
    CHECK(compare_versions("2.0.0", "1.9.9") == VersionRelation::Older);
    CHECK(compare_versions("1.0.0-rc.1", "1.0.0") == VersionRelation::Newer);
}

TEST_CASE("compare_versions handles missing and unparsable versions") {
    CHECK(compare_versions("", "1.0.0") == VersionRelation::Unknown);
    CHECK(compare_versions("nightly", "1.0.0") == VersionRelation::Unknown);
    CHECK(compare_versions("nightly", "nightly") == VersionRelation::Same);
    CHECK(std::string(version_relation_to_string(VersionRelation::Older)) == "older");
}
