#include <doctest/doctest.h>
#include <assetkit/manifest.hpp>

#include "../test_helpers.hpp"

using namespace assetkit;
using namespace assetkit::test;

namespace {

const std::string MANIFEST_REL = "get-shit-done/INSTALLED_FILES.json";

} // namespace

TEST_CASE("add_file normalizes and replaces entries") {
    Manifest manifest("/root/install", MANIFEST_REL);

    auto added = manifest.add_file("/root/install/agents/gsd-a.md", "./agents//gsd-a.md", 3, "sha256:aa");
    REQUIRE(added.has_value());
    CHECK(added->relative_path == "agents/gsd-a.md");

    manifest.add_file("/root/install/agents/gsd-a.md", "agents/gsd-a.md", 5, "sha256:bb");
    REQUIRE(manifest.size() == 1);
    CHECK(manifest.entries()[0].size == 5);
    CHECK(manifest.entries()[0].hash == "sha256:bb");

    CHECK_FALSE(manifest.add_file("/etc/passwd", "../../etc/passwd", 1, "sha256:cc").has_value());
    CHECK(manifest.size() == 1);
}

TEST_CASE("find and remove use normalized paths") {
    Manifest manifest("/r", MANIFEST_REL);
    manifest.add_file("/r/commands/gsd/plan.md", "commands/gsd/plan.md", 1, "sha256:aa");

    REQUIRE(manifest.find("./commands/gsd/plan.md") != nullptr);
    CHECK(manifest.find("commands/gsd/other.md") == nullptr);
    CHECK(manifest.remove("commands/gsd/plan.md"));
    CHECK_FALSE(manifest.remove("commands/gsd/plan.md"));
    CHECK(manifest.size() == 0);
}

TEST_CASE("namespace queries") {
    Manifest manifest("/r", MANIFEST_REL);
    manifest.add_file("/r/agents/gsd-a.md", "agents/gsd-a.md", 1, "sha256:aa");
    manifest.add_file("/r/agents/custom.md", "agents/custom.md", 1, "sha256:bb");

    auto filter = BundleConfig{}.make_filter();
    auto owned = manifest.files_in_namespaces(filter);
    REQUIRE(owned.size() == 1);
    CHECK(owned[0].relative_path == "agents/gsd-a.md");

    CHECK(manifest.is_in_allowed_namespace("/r/agents/gsd-a.md", filter));
    CHECK_FALSE(manifest.is_in_allowed_namespace("/r/agents/custom.md", filter));
    CHECK_FALSE(manifest.is_in_allowed_namespace("/elsewhere/agents/gsd-a.md", filter));
}

TEST_CASE("save then load keeps entries and writes relativePath keys") {
    TempDir dir;
    Manifest manifest(dir.path(), MANIFEST_REL);
    manifest.add_file(dir.sub("agents/gsd-a.md"), "agents/gsd-a.md", 12, "sha256:abc");
    manifest.add_file(dir.sub("get-shit-done/VERSION"), "get-shit-done/VERSION", 6, "sha256:def");

    auto saved = manifest.save();
    REQUIRE(saved.ok);
    CHECK(saved.path == dir.sub(MANIFEST_REL));

    std::string raw = read_file(saved.path);
    CHECK(raw.find("\"relativePath\"") != std::string::npos);
    CHECK(raw.find("\"hash\": \"sha256:abc\"") != std::string::npos);

    Manifest reloaded(dir.path(), MANIFEST_REL);
    auto loaded = reloaded.load();
    REQUIRE(loaded.ok);
    CHECK(loaded.found);
    REQUIRE(reloaded.size() == 2);
    CHECK(reloaded.entries()[0].relative_path == "agents/gsd-a.md");
    CHECK(reloaded.entries()[0].size == 12);
    CHECK(reloaded.entries()[1].hash == "sha256:def");
}

TEST_CASE("load reports an absent manifest without error") {
    TempDir dir;
    Manifest manifest(dir.path(), MANIFEST_REL);
    auto loaded = manifest.load();
    CHECK(loaded.ok);
    CHECK_FALSE(loaded.found);
    CHECK(loaded.entries.empty());
}

TEST_CASE("load reports corruption") {
    TempDir dir;
    Manifest manifest(dir.path(), MANIFEST_REL);

    SUBCASE("invalid JSON") {
        write_file(dir.sub(MANIFEST_REL), "{not json");
    }
    SUBCASE("not an array") {
        write_file(dir.sub(MANIFEST_REL), R"({"files": []})");
    }
    SUBCASE("entry without relativePath") {
        write_file(dir.sub(MANIFEST_REL), R"([{"path": "/x/agents/gsd-a.md"}])");
    }

    auto loaded = manifest.load();
    CHECK_FALSE(loaded.ok);
    CHECK(loaded.found);
    CHECK(loaded.error_kind == ErrorKind::Corruption);
}

TEST_CASE("parse_manifest drops unsafe entries and recomputes absolute paths") {
    auto loaded = parse_manifest(R"([
        {"path": "/somewhere/else/agents/gsd-a.md", "relativePath": "agents/gsd-a.md", "size": 1, "hash": "sha256:aa"},
        {"path": "/etc/passwd", "relativePath": "../../etc/passwd", "size": 1, "hash": "sha256:bb"},
        {"relativePath": "/etc/shadow"},
        {"relativePath": "agents/gsd-a.md", "size": 2, "hash": "sha256:cc"}
    ])", "/install");

    REQUIRE(loaded.ok);
    CHECK(loaded.warnings.size() == 2);
    REQUIRE(loaded.entries.size() == 1);
    CHECK(loaded.entries[0].path == "/install/agents/gsd-a.md");
    CHECK(loaded.entries[0].size == 2);
    CHECK(loaded.entries[0].hash == "sha256:cc");
}

TEST_CASE("rebase moves entry paths to a new root") {
    Manifest manifest("/staging", MANIFEST_REL);
    manifest.add_file("/staging/agents/gsd-a.md", "agents/gsd-a.md", 1, "sha256:aa");
    manifest.rebase("/final");

    CHECK(manifest.install_root() == "/final");
    CHECK(manifest.manifest_path() == "/final/" + MANIFEST_REL);
    CHECK(manifest.entries()[0].path == "/final/agents/gsd-a.md");
}
