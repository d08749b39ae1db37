#include <doctest/doctest.h>
#include <assetkit/backup_manager.hpp>

#include "../test_helpers.hpp"

using namespace assetkit;
using namespace assetkit::test;

TEST_CASE("backup_file copies into a timestamped session") {
    TempDir root;
    write_file(root.sub("agents/gsd-a.md"), "original");

    BackupManager backups(root.path());
    CHECK(backups.session_name().empty());

    auto result = backups.backup_file(root.sub("agents/gsd-a.md"), "agents/gsd-a.md", "overwrite");
    REQUIRE(result.success);
    REQUIRE(result.backup_path.has_value());
    CHECK(read_file(*result.backup_path) == "original");
    CHECK(BackupManager::timestamp_prefix(backups.session_name()).has_value());
    CHECK(exists(backups.session_path() + "/" + BACKUP_INDEX_FILENAME));
    CHECK(backups.files_backed_up() == 1);
}

TEST_CASE("backup_file of a missing source is a no-op success") {
    TempDir root;
    BackupManager backups(root.path());
    auto result = backups.backup_file(root.sub("agents/gsd-missing.md"), "agents/gsd-missing.md");
    CHECK(result.success);
    CHECK_FALSE(result.backup_path.has_value());
    CHECK_FALSE(exists(root.sub(".backups")));
}

TEST_CASE("backup_file refuses unsafe relative paths") {
    TempDir root;
    write_file(root.sub("file.md"), "x");
    BackupManager backups(root.path());
    auto result = backups.backup_file(root.sub("file.md"), "../escape.md");
    CHECK_FALSE(result.success);
    CHECK_FALSE(result.error.empty());
}

TEST_CASE("timestamp_prefix groups session names") {
    CHECK(BackupManager::timestamp_prefix("2024-05-01T12-30-05-123Z") == "2024-05-01T12-30-05-123Z");
    CHECK(BackupManager::timestamp_prefix("2024-05-01T12-30-05-123Z_2") == "2024-05-01T12-30-05-123Z");
    CHECK(BackupManager::timestamp_prefix("2024-05-01_agents") == "2024-05-01");
    CHECK_FALSE(BackupManager::timestamp_prefix("notes").has_value());
    CHECK_FALSE(BackupManager::timestamp_prefix("2024-5-1").has_value());
}

TEST_CASE("cleanup_old_backups keeps the newest groups") {
    TempDir root;
    const char* sessions[] = {
        "2024-01-01T00-00-00-000Z", "2024-02-01T00-00-00-000Z", "2024-03-01T00-00-00-000Z",
        "2024-04-01T00-00-00-000Z", "2024-04-01T00-00-00-000Z_1",
    };
    for (const char* s : sessions) {
        write_file(root.sub(std::string(".backups/") + s + "/agents/gsd-a.md"), s);
    }
    write_file(root.sub(".backups/README.txt"), "user notes");

    BackupOptions options;
    options.retention = 2;
    BackupManager backups(root.path(), options);
    auto result = backups.cleanup_old_backups();

    CHECK(result.errors.empty());
    CHECK(result.kept == 2);
    CHECK(result.cleaned == 2);
    CHECK(exists(root.sub(".backups/2024-04-01T00-00-00-000Z")));
    CHECK(exists(root.sub(".backups/2024-04-01T00-00-00-000Z_1")));
    CHECK(exists(root.sub(".backups/2024-03-01T00-00-00-000Z")));
    CHECK_FALSE(exists(root.sub(".backups/2024-02-01T00-00-00-000Z")));
    CHECK_FALSE(exists(root.sub(".backups/2024-01-01T00-00-00-000Z")));
    CHECK(exists(root.sub(".backups/README.txt")));
}

TEST_CASE("cleanup_old_backups without a backup directory does nothing") {
    TempDir root;
    BackupManager backups(root.path());
    auto result = backups.cleanup_old_backups();
    CHECK(result.cleaned == 0);
    CHECK(result.kept == 0);
    CHECK(result.errors.empty());
}

TEST_CASE("list_sessions returns newest first with entries") {
    TempDir root;
    write_file(root.sub(".backups/2024-01-01T00-00-00-000Z/agents/gsd-old.md"), "old");
    write_file(root.sub("agents/gsd-a.md"), "current");

    BackupManager backups(root.path());
    backups.backup_file(root.sub("agents/gsd-a.md"), "agents/gsd-a.md", "overwrite");

    auto sessions = backups.list_sessions();
    REQUIRE(sessions.size() == 2);
    CHECK(sessions[0].name == backups.session_name());
    REQUIRE(sessions[0].entries.size() == 1);
    CHECK(sessions[0].entries[0].reason == "overwrite");
    CHECK(sessions[1].name == "2024-01-01T00-00-00-000Z");
    REQUIRE(sessions[1].entries.size() == 1);
    CHECK(sessions[1].entries[0].relative_path == "agents/gsd-old.md");
}

TEST_CASE("restore_session copies files back and backs up what it replaces") {
    TempDir root;
    write_file(root.sub(".backups/2024-01-01T00-00-00-000Z/agents/gsd-a.md"), "from backup");
    write_file(root.sub(".backups/2024-01-01T00-00-00-000Z/commands/gsd/plan.md"), "plan backup");
    write_file(root.sub("agents/gsd-a.md"), "edited");

    BackupManager backups(root.path());

    SUBCASE("whole session") {
        auto result = backups.restore_session("2024-01-01T00-00-00-000Z");
        REQUIRE(result.ok);
        CHECK(result.restored.size() == 2);
        CHECK(read_file(root.sub("agents/gsd-a.md")) == "from backup");
        CHECK(read_file(root.sub("commands/gsd/plan.md")) == "plan backup");
        REQUIRE_FALSE(result.backup_session.empty());
        CHECK(read_file(backups.session_path() + "/agents/gsd-a.md") == "edited");
    }

    SUBCASE("selected files only") {
        auto result = backups.restore_session("2024-01-01T00-00-00-000Z", {"commands/gsd/plan.md"});
        REQUIRE(result.ok);
        REQUIRE(result.restored.size() == 1);
        CHECK(read_file(root.sub("agents/gsd-a.md")) == "edited");
        CHECK(read_file(root.sub("commands/gsd/plan.md")) == "plan backup");
    }
}

TEST_CASE("restore_session validates the session name") {
    TempDir root;
    BackupManager backups(root.path());

    auto traversal = backups.restore_session("../../etc");
    CHECK_FALSE(traversal.ok);
    CHECK(traversal.error_kind == ErrorKind::PathTraversal);

    auto missing = backups.restore_session("2024-01-01T00-00-00-000Z");
    CHECK_FALSE(missing.ok);
    CHECK(missing.error_kind == ErrorKind::Precondition);
}
