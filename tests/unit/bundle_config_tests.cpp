#include <doctest/doctest.h>
#include <assetkit/bundle_config.hpp>

#include "../test_helpers.hpp"

using namespace assetkit;
using namespace assetkit::test;

TEST_CASE("defaults describe the standard bundle") {
    BundleConfig config;
    CHECK(config.path_token == "@gsd-opencode/");
    CHECK(config.manifest_relative_path() == "get-shit-done/INSTALLED_FILES.json");
    CHECK(config.version_relative_path() == "get-shit-done/VERSION");
    CHECK(config.backup_retention == 5);
    CHECK(config.should_rewrite("agents/gsd-a.md"));
    CHECK(config.should_rewrite("agents/gsd-A.MD"));
    CHECK_FALSE(config.should_rewrite("get-shit-done/bin/helper.sh"));
    CHECK(config.make_filter().is_owned(config.manifest_relative_path()));
}

TEST_CASE("parse_bundle_config reads every field") {
    auto result = parse_bundle_config(R"({
        "name": "toolkit",
        "version": " 2.1.0 ",
        "path_token": "@toolkit/",
        "rewrite_extensions": ["MD", ".txt"],
        "owned_dir": "toolkit",
        "include": ["agents", "toolkit"],
        "namespaces": ["agents/tk-", "toolkit/", {"regex": "skills/tk-[a-z]+/", "scan_root": "skills"}],
        "required_paths": ["agents", "toolkit"],
        "integrity_samples": ["agents/tk-a.md"],
        "integrity_sample_limit": 10,
        "backup_dir": ".tk-backups",
        "backup_retention": 2,
        "global_dir": ".config/tk",
        "local_dir": ".tk",
        "config_dir_env": "TK_DIR",
        "legacy_layouts": [{"from": "cmd/tk/", "to": "commands/tk"}]
    })", "/src/bundle.json");

    REQUIRE(result.ok);
    CHECK(result.warnings.empty());
    const auto& c = result.config;
    CHECK(c.name == "toolkit");
    CHECK(c.version == "2.1.0");
    CHECK(c.path_token == "@toolkit/");
    CHECK(c.rewrite_extensions == std::vector<std::string>{".md", ".txt"});
    CHECK(c.manifest_relative_path() == "toolkit/INSTALLED_FILES.json");
    CHECK(c.namespaces.size() == 3);
    CHECK(c.namespaces[2].kind == NamespaceRuleKind::Regex);
    CHECK(c.integrity_sample_limit == 10);
    CHECK(c.backup_dir == ".tk-backups");
    CHECK(c.backup_retention == 2);
    CHECK(c.config_dir_env == "TK_DIR");
    CHECK(c.source_path == "/src/bundle.json");
    REQUIRE(c.legacy_layouts.size() == 1);
    CHECK(c.legacy_layouts[0].legacy == "cmd/tk");
    CHECK(c.legacy_layouts[0].current == "commands/tk");
}

TEST_CASE("parse_bundle_config warns about unknown keys") {
    auto result = parse_bundle_config(R"({"colour": "blue"})");
    REQUIRE(result.ok);
    REQUIRE(result.warnings.size() == 1);
    CHECK(result.warnings[0].find("colour") != std::string::npos);
}

TEST_CASE("parse_bundle_config warns when the manifest is not owned") {
    auto result = parse_bundle_config(R"({"namespaces": ["agents/gsd-"]})");
    REQUIRE(result.ok);
    REQUIRE(result.warnings.size() == 1);
    CHECK(result.warnings[0].find("outside every namespace") != std::string::npos);
}

TEST_CASE("parse_bundle_config rejects invalid documents") {
    CHECK_FALSE(parse_bundle_config("not json").ok);
    CHECK_FALSE(parse_bundle_config("[]").ok);
    CHECK_FALSE(parse_bundle_config(R"({"name": 3})").ok);
    CHECK_FALSE(parse_bundle_config(R"({"path_token": "  "})").ok);
    CHECK_FALSE(parse_bundle_config(R"({"owned_dir": "a/b"})").ok);
    CHECK_FALSE(parse_bundle_config(R"({"owned_dir": ".."})").ok);
    CHECK_FALSE(parse_bundle_config(R"({"backup_dir": "../backups"})").ok);
    CHECK_FALSE(parse_bundle_config(R"({"backup_retention": -1})").ok);
    CHECK_FALSE(parse_bundle_config(R"({"namespaces": []})").ok);
    CHECK_FALSE(parse_bundle_config(R"({"namespaces": ["/etc/"]})").ok);
    CHECK_FALSE(parse_bundle_config(R"({"namespaces": [{"regex": "x"}]})").ok);
    CHECK_FALSE(parse_bundle_config(R"({"required_paths": ["../x"]})").ok);
    CHECK_FALSE(parse_bundle_config(R"({"legacy_layouts": [{"from": "a"}]})").ok);
    CHECK_FALSE(parse_bundle_config(R"({"legacy_layouts": [{"from": "a", "to": "a/b"}]})").ok);
    CHECK_FALSE(parse_bundle_config(R"({"legacy_layouts": [{"from": "../a", "to": "b"}]})").ok);
}

TEST_CASE("load_bundle_config falls back to defaults without bundle.json") {
    TempDir dir;
    auto result = load_bundle_config(dir.path());
    REQUIRE(result.ok);
    CHECK(result.config.name == "gsd-opencode");
    CHECK(result.config.source_path.empty());
}

TEST_CASE("load_bundle_config reads bundle.json from the source root") {
    TempDir dir;
    write_file(dir.sub("bundle.json"), R"({"version": "3.0.0"})");
    auto result = load_bundle_config(dir.path());
    REQUIRE(result.ok);
    CHECK(result.config.version == "3.0.0");
}
