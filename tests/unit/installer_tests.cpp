#include <doctest/doctest.h>
#include <assetkit/backup_manager.hpp>
#include <assetkit/hash.hpp>
#include <assetkit/installer.hpp>

#include "../test_helpers.hpp"

#include <algorithm>

using namespace assetkit;
using namespace assetkit::test;

namespace {

bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

} // namespace

TEST_CASE("replace_all_literal replaces every occurrence verbatim") {
    CHECK(replace_all_literal("a @t/ b @t/", "@t/", "/root/") == "a /root/ b /root/");
    CHECK(replace_all_literal("no token", "@t/", "/root/") == "no token");
    CHECK(replace_all_literal("@t/x", "", "/root/") == "@t/x");
}

TEST_CASE("replace_all_literal gives no meaning to special characters") {
    CHECK(replace_all_literal("see @t/file", "@t/", "/home/$&$1\\/") == "see /home/$&$1\\/file");
    CHECK(replace_all_literal("@t/@t/", "@t/", "@t/@t/") == "@t/@t/@t/@t/");
}

TEST_CASE("render rewrites only configured extensions") {
    Installer installer(test_config());
    CHECK(installer.render("agents/gsd-a.md", "use @gsd-opencode/x", "/inst/") == "use /inst/x");
    CHECK(installer.render("get-shit-done/bin/helper.sh", "use @gsd-opencode/x", "/inst") ==
          "use @gsd-opencode/x");
}

TEST_CASE("list_source_files skips the bundle config and sorts") {
    TempDir source;
    make_bundle(source.path());
    write_file(source.sub("bundle.json"), "{}");

    Installer installer(test_config());
    auto listing = installer.list_source_files(source.path());
    REQUIRE(listing.ok);
    CHECK(listing.files.front() == "agents/gsd-executor.md");
    CHECK_FALSE(contains(listing.files, "bundle.json"));
    CHECK(std::is_sorted(listing.files.begin(), listing.files.end()));
    CHECK(listing.files.size() == 5);
}

TEST_CASE("list_source_files honors include") {
    TempDir source;
    make_bundle(source.path());

    auto config = test_config();
    config.include = {"agents"};
    Installer installer(config);
    auto listing = installer.list_source_files(source.path());
    REQUIRE(listing.ok);
    CHECK(listing.files.size() == 2);
}

#ifndef _WIN32
TEST_CASE("list_source_files rejects symlinks") {
    TempDir source;
    make_bundle(source.path());
    fs::create_symlink("/etc/passwd", source.sub("agents/gsd-link.md"));

    Installer installer(test_config());
    auto listing = installer.list_source_files(source.path());
    CHECK_FALSE(listing.ok);
    CHECK(listing.error.find("gsd-link.md") != std::string::npos);
}
#endif

TEST_CASE("install into a fresh target writes files and manifest") {
    TempDir source;
    TempDir parent;
    make_bundle(source.path());
    std::string target = parent.sub("opencode");

    Installer installer(test_config());
    auto result = installer.install(source.path(), target);

    REQUIRE(result.ok);
    CHECK(result.files_copied == 5);
    CHECK(result.error_kind == ErrorKind::None);

    std::string planner = read_file(target + "/agents/gsd-planner.md");
    CHECK(planner.find("@gsd-opencode/") == std::string::npos);
    CHECK(planner.find(result.target_root + "/get-shit-done/templates/plan.md") != std::string::npos);
    CHECK(read_file(target + "/get-shit-done/bin/helper.sh") == "echo @gsd-opencode/\n");
    CHECK(read_file(target + "/get-shit-done/VERSION") == "1.0.0\n");

    // Five bundle files plus the version marker
    CHECK(result.manifest.size() == 6);
    CHECK(result.manifest_path == result.target_root + "/get-shit-done/INSTALLED_FILES.json");

    Manifest manifest(target, "get-shit-done/INSTALLED_FILES.json");
    auto loaded = manifest.load();
    REQUIRE(loaded.ok);
    REQUIRE(loaded.found);
    for (const auto& e : loaded.entries) {
        auto hash = compute_sha256_file(target + "/" + e.relative_path);
        REQUIRE(hash.ok);
        CHECK(hashes_equal(hash.prefixed(), e.hash));
        CHECK(e.path == result.target_root + "/" + e.relative_path);
    }
    CHECK(manifest.find("get-shit-done/INSTALLED_FILES.json") == nullptr);
}

TEST_CASE("install leaves no staging directories behind") {
    TempDir source;
    TempDir parent;
    make_bundle(source.path());

    Installer installer(test_config());
    REQUIRE(installer.install(source.path(), parent.sub("opencode")).ok);
    REQUIRE(installer.install(source.path(), parent.sub("opencode")).ok);

    size_t entries = 0;
    for (const auto& entry : fs::directory_iterator(parent.path())) {
        (void)entry;
        ++entries;
    }
    CHECK(entries == 1);
}

TEST_CASE("install preserves user files and removes stale bundle files") {
    TempDir source;
    TempDir parent;
    make_bundle(source.path());
    std::string target = parent.sub("opencode");

    Installer first(test_config());
    REQUIRE(first.install(source.path(), target).ok);

    write_file(target + "/opencode.json", "{\"user\": true}");
    write_file(target + "/agents/custom.md", "mine");
    fs::remove(source.sub("agents/gsd-executor.md"));

    BackupManager backups(target);
    Installer second(test_config("1.1.0"), &backups);
    auto result = second.install(source.path(), target);

    REQUIRE(result.ok);
    CHECK(read_file(target + "/opencode.json") == "{\"user\": true}");
    CHECK(read_file(target + "/agents/custom.md") == "mine");
    CHECK_FALSE(exists(target + "/agents/gsd-executor.md"));
    CHECK(contains(result.stale_removed, "agents/gsd-executor.md"));
    CHECK(result.carried_over >= 2);

    // Stale file and changed version marker were backed up first
    CHECK(contains(result.backed_up, "agents/gsd-executor.md"));
    CHECK(contains(result.backed_up, "get-shit-done/VERSION"));
    REQUIRE_FALSE(result.backup_session.empty());
    CHECK(exists(target + "/.backups/" + result.backup_session + "/agents/gsd-executor.md"));
}

TEST_CASE("dry run classifies files and touches nothing") {
    TempDir source;
    TempDir parent;
    make_bundle(source.path());
    std::string target = parent.sub("opencode");

    Installer installer(test_config());
    REQUIRE(installer.install(source.path(), target).ok);
    write_file(target + "/agents/gsd-executor.md", "edited");
    write_file(source.sub("agents/gsd-new.md"), "new");

    InstallOptions options;
    options.dry_run = true;
    auto result = installer.install(source.path(), target, options);

    REQUIRE(result.ok);
    CHECK(result.dry_run);
    CHECK_FALSE(exists(target + "/agents/gsd-new.md"));
    CHECK(read_file(target + "/agents/gsd-executor.md") == "edited");

    for (const auto& p : result.planned) {
        if (p.relative_path == "agents/gsd-new.md") CHECK(p.action == PlannedAction::Create);
        if (p.relative_path == "agents/gsd-executor.md") CHECK(p.action == PlannedAction::Overwrite);
        if (p.relative_path == "agents/gsd-planner.md") CHECK(p.action == PlannedAction::Unchanged);
    }
    CHECK(std::string(planned_action_to_string(PlannedAction::Create)) == "would_create");
}

TEST_CASE("subset install replaces only selected files and keeps the manifest complete") {
    TempDir source;
    TempDir parent;
    make_bundle(source.path());
    std::string target = parent.sub("opencode");

    Installer installer(test_config());
    REQUIRE(installer.install(source.path(), target).ok);
    fs::remove(target + "/agents/gsd-planner.md");
    write_file(target + "/agents/gsd-executor.md", "edited");

    InstallOptions options;
    options.only = {"agents/gsd-planner.md"};
    auto result = installer.install(source.path(), target, options);

    REQUIRE(result.ok);
    CHECK(result.files_copied == 1);
    CHECK(exists(target + "/agents/gsd-planner.md"));
    CHECK(read_file(target + "/agents/gsd-executor.md") == "edited");
    CHECK(result.manifest.size() == 6);
}

TEST_CASE("install fails when the target parent does not exist") {
    TempDir source;
    TempDir parent;
    make_bundle(source.path());

    Installer installer(test_config());
    auto result = installer.install(source.path(), parent.sub("missing/opencode"));
    CHECK_FALSE(result.ok);
    CHECK(result.error_kind == ErrorKind::Precondition);
    CHECK_FALSE(exists(parent.sub("missing")));
}

TEST_CASE("install fails when the source does not exist") {
    TempDir parent;
    Installer installer(test_config());
    auto result = installer.install(parent.sub("no-source"), parent.sub("opencode"));
    CHECK_FALSE(result.ok);
    CHECK(result.error_kind == ErrorKind::Precondition);
    CHECK_FALSE(exists(parent.sub("opencode")));
}

TEST_CASE("cancelled install leaves the target unchanged") {
    TempDir source;
    TempDir parent;
    make_bundle(source.path());
    std::string target = parent.sub("opencode");
    write_file(target + "/opencode.json", "{}");

    CancellationToken token;
    token.request();
    InstallOptions options;
    options.cancel = &token;

    Installer installer(test_config());
    auto result = installer.install(source.path(), target, options);

    CHECK_FALSE(result.ok);
    CHECK(result.error_kind == ErrorKind::Interrupted);
    CHECK(exit_code_for(result.error_kind) == 130);
    CHECK_FALSE(exists(target + "/agents"));
    CHECK(read_file(target + "/opencode.json") == "{}");

    size_t entries = 0;
    for (const auto& entry : fs::directory_iterator(parent.path())) {
        (void)entry;
        ++entries;
    }
    CHECK(entries == 1);
}

TEST_CASE("path_prefix overrides the token replacement") {
    TempDir source;
    TempDir parent;
    make_bundle(source.path());

    InstallOptions options;
    options.path_prefix = "~/.config/opencode";
    Installer installer(test_config());
    auto result = installer.install(source.path(), parent.sub("opencode"), options);
    REQUIRE(result.ok);
    CHECK(read_file(parent.sub("opencode/commands/gsd/plan.md")) ==
          "Load ~/.config/opencode/agents/gsd-planner.md and ~/.config/opencode/agents/gsd-executor.md\n");
}

TEST_CASE("backups are taken from the previous tree and record the target path") {
    TempDir source;
    TempDir parent;
    make_bundle(source.path());
    std::string target = parent.sub("opencode");

    REQUIRE(Installer(test_config()).install(source.path(), target).ok);
    write_file(target + "/agents/gsd-planner.md", "edited by hand");

    BackupManager backups(target);
    auto result = Installer(test_config(), &backups).install(source.path(), target);
    REQUIRE(result.ok);
    CHECK(contains(result.backed_up, "agents/gsd-planner.md"));

    auto sessions = backups.list_sessions();
    REQUIRE(sessions.size() == 1);
    CHECK(read_file(sessions[0].path + "/agents/gsd-planner.md") == "edited by hand");
    REQUIRE(sessions[0].entries.size() == 1);
    CHECK(sessions[0].entries[0].original_path == target + "/agents/gsd-planner.md");
    CHECK(sessions[0].entries[0].reason == "overwrite");

    // Only the target remains in the parent
    size_t entries = 0;
    for (const auto& entry : fs::directory_iterator(parent.path())) {
        (void)entry;
        ++entries;
    }
    CHECK(entries == 1);
}

#ifndef _WIN32
TEST_CASE("install keeps the mode of the installation root") {
    TempDir source;
    TempDir parent;
    make_bundle(source.path());
    std::string target = parent.sub("opencode");
    write_file(target + "/auth.json", "{\"token\": \"x\"}");
    fs::permissions(target, fs::perms::owner_all);

    auto result = Installer(test_config()).install(source.path(), target);
    REQUIRE(result.ok);
    CHECK((fs::status(target).permissions() & fs::perms::mask) == fs::perms::owner_all);

    REQUIRE(Installer(test_config("1.1.0")).install(source.path(), target).ok);
    CHECK((fs::status(target).permissions() & fs::perms::mask) == fs::perms::owner_all);
    CHECK(read_file(target + "/auth.json") == "{\"token\": \"x\"}");
}

TEST_CASE("named pipes in the target are carried over") {
    TempDir source;
    TempDir parent;
    make_bundle(source.path());
    std::string target = parent.sub("opencode");

    REQUIRE(Installer(test_config()).install(source.path(), target).ok);
    write_file(target + "/agents/gsd-planner.md", "edited by hand");
    std::error_code ec;
    REQUIRE(create_fifo(target + "/user.fifo", fs::perms::owner_read | fs::perms::owner_write, ec));

    BackupManager backups(target);
    auto result = Installer(test_config("2.0.0"), &backups).install(source.path(), target);
    REQUIRE(result.ok);
    CHECK(fs::is_fifo(fs::symlink_status(target + "/user.fifo")));
    CHECK(contains(result.backed_up, "agents/gsd-planner.md"));
    CHECK(exists(target + "/.backups/" + result.backup_session + "/agents/gsd-planner.md"));
}
#endif

TEST_CASE("cancellation while preserving existing entries stops before the swap") {
    TempDir source;
    TempDir parent;
    make_bundle(source.path());
    std::string target = parent.sub("opencode");

    REQUIRE(Installer(test_config()).install(source.path(), target).ok);
    write_file(target + "/opencode.json", "{}");
    write_file(target + "/agents/gsd-planner.md", "edited by hand");

    CancellationToken token;
    std::vector<std::string> seen;
    InstallOptions options;
    options.cancel = &token;
    options.on_carry_over = [&](const std::string& rel) {
        seen.push_back(rel);
        token.request();
    };

    BackupManager backups(target);
    auto result = Installer(test_config("2.0.0"), &backups).install(source.path(), target, options);

    CHECK_FALSE(result.ok);
    CHECK(result.error_kind == ErrorKind::Interrupted);
    CHECK(seen.size() == 1);
    CHECK(read_file(target + "/agents/gsd-planner.md") == "edited by hand");
    CHECK(read_file(target + "/get-shit-done/VERSION") == "1.0.0\n");
    CHECK_FALSE(exists(target + "/.backups"));
    CHECK(backups.session_name().empty());
}

TEST_CASE("full install moves a legacy layout into the current one") {
    TempDir source;
    TempDir parent;
    make_bundle(source.path());
    std::string target = parent.sub("opencode");

    REQUIRE(Installer(test_config()).install(source.path(), target).ok);
    fs::create_directories(target + "/command");
    fs::rename(target + "/commands/gsd", target + "/command/gsd");
    write_file(target + "/command/gsd/mine.md", "mine");

    BackupManager backups(target);
    auto result = Installer(test_config(), &backups).install(source.path(), target);
    REQUIRE(result.ok);

    CHECK_FALSE(exists(target + "/command"));
    CHECK(read_file(target + "/commands/gsd/mine.md") == "mine");
    CHECK(exists(target + "/commands/gsd/plan.md"));
    CHECK(result.migrated == std::vector<std::string>{"command/gsd/mine.md"});
    CHECK(result.legacy_removed == std::vector<std::string>{"command/gsd/plan.md"});
    CHECK(contains(result.backed_up, "command/gsd/plan.md"));
    CHECK(exists(target + "/.backups/" + result.backup_session + "/command/gsd/plan.md"));
}

TEST_CASE("layout migration keeps unrelated content of the legacy parent") {
    TempDir source;
    TempDir parent;
    make_bundle(source.path());
    std::string target = parent.sub("opencode");

    REQUIRE(Installer(test_config()).install(source.path(), target).ok);
    write_file(target + "/command/gsd/plan.md", "old copy");
    write_file(target + "/command/other.md", "not ours");

    auto result = Installer(test_config()).install(source.path(), target);
    REQUIRE(result.ok);
    CHECK_FALSE(exists(target + "/command/gsd"));
    CHECK(read_file(target + "/command/other.md") == "not ours");
    CHECK(result.legacy_removed == std::vector<std::string>{"command/gsd/plan.md"});
    CHECK(result.migrated.empty());
}

TEST_CASE("dry run and subset installs leave a legacy layout in place") {
    TempDir source;
    TempDir parent;
    make_bundle(source.path());
    std::string target = parent.sub("opencode");

    REQUIRE(Installer(test_config()).install(source.path(), target).ok);
    write_file(target + "/command/gsd/mine.md", "mine");

    SUBCASE("dry run") {
        InstallOptions options;
        options.dry_run = true;
        auto result = Installer(test_config()).install(source.path(), target, options);
        REQUIRE(result.ok);
        CHECK(result.migrated == std::vector<std::string>{"command/gsd/mine.md"});
    }

    SUBCASE("subset") {
        InstallOptions options;
        options.only = {"agents/gsd-planner.md"};
        auto result = Installer(test_config()).install(source.path(), target, options);
        REQUIRE(result.ok);
        CHECK(result.migrated.empty());
    }

    CHECK(read_file(target + "/command/gsd/mine.md") == "mine");
    CHECK_FALSE(exists(target + "/commands/gsd/mine.md"));
}
