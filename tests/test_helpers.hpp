#pragma once

#include <assetkit/bundle_config.hpp>
#include <assetkit/platform.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace assetkit::test {

namespace fs = std::filesystem;

// Helper to create temporary directory
class TempDir {
public:
    TempDir() {
        path_ = fs::temp_directory_path() / ("assetkit_test_" + generate_uuid());
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::permissions(path_, fs::perms::owner_all, fs::perm_options::add, ec);
        fs::remove_all(path_, ec);
    }

    std::string path() const { return path_.generic_string(); }
    std::string sub(const std::string& rel) const { return (path_ / rel).generic_string(); }

private:
    fs::path path_;
};

inline void write_file(const std::string& path, const std::string& content) {
    fs::create_directories(fs::path(path).parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

inline std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

inline bool exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(fs::symlink_status(path, ec));
}

// Small bundle laid out like the default configuration expects
inline void make_bundle(const std::string& source) {
    write_file(source + "/agents/gsd-planner.md",
               "# Planner\nSee @gsd-opencode/get-shit-done/templates/plan.md\n");
    write_file(source + "/agents/gsd-executor.md", "# Executor\nNo token here.\n");
    write_file(source + "/commands/gsd/plan.md",
               "Load @gsd-opencode/agents/gsd-planner.md and @gsd-opencode/agents/gsd-executor.md\n");
    write_file(source + "/get-shit-done/templates/plan.md", "template\n");
    write_file(source + "/get-shit-done/bin/helper.sh", "echo @gsd-opencode/\n");
}

inline BundleConfig test_config(const std::string& version = "1.0.0") {
    BundleConfig config;
    config.version = version;
    // Tests must never pick up the developer's real configuration directory
    config.config_dir_env = "ASSETKIT_TEST_CONFIG_DIR_UNSET";
    return config;
}

} // namespace assetkit::test
