#include "assetkit/platform.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

#ifdef _WIN32
#include <windows.h>
#include <io.h>
#else
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#endif

namespace assetkit {

namespace fs = std::filesystem;

namespace {

#ifndef _WIN32
// fsync a file descriptor
bool fsync_fd(int fd) {
#ifdef __APPLE__
    return fcntl(fd, F_FULLFSYNC, 0) == 0;
#else
    return fsync(fd) == 0;
#endif
}

ErrorKind kind_from_errno(int err) {
    return (err == EACCES || err == EPERM || err == EROFS) ? ErrorKind::Permission
                                                            : ErrorKind::Io;
}
#endif

// Generate a temporary filename next to base
std::string make_temp_filename(const std::string& base) {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::string hex_chars = "0123456789abcdef";
    std::string suffix;
    for (int i = 0; i < 8; ++i) {
        suffix += hex_chars[static_cast<size_t>(dis(gen))];
    }

    return base + ".tmp." + suffix;
}

} // namespace

void sync_directory(const std::string& dir_path) {
#ifndef _WIN32
    if (dir_path.empty()) return;
    int dir_fd = open(dir_path.c_str(), O_RDONLY);
    if (dir_fd < 0) return;
    fsync_fd(dir_fd);
    close(dir_fd);
#else
    (void)dir_path;
#endif
}

AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content) {
    return atomic_write_file(path, std::vector<uint8_t>(content.begin(), content.end()));
}

AtomicWriteResult atomic_write_file(const std::string& path, const std::vector<uint8_t>& content) {
    AtomicWriteResult result;
    std::string temp_path = make_temp_filename(path);

#ifdef _WIN32
    std::ofstream temp_file(temp_path, std::ios::binary);
    if (!temp_file) {
        result.error = "failed to create temp file";
        result.error_kind = ErrorKind::Io;
        return result;
    }

    temp_file.write(reinterpret_cast<const char*>(content.data()),
                    static_cast<std::streamsize>(content.size()));
    temp_file.flush();
    temp_file.close();

    if (!MoveFileExA(temp_path.c_str(), path.c_str(),
                     MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH)) {
        DeleteFileA(temp_path.c_str());
        result.error = "failed to rename temp file";
        result.error_kind = ErrorKind::Io;
        return result;
    }

    result.ok = true;
#else
    // POSIX implementation: temp + fsync(file) + rename + fsync(dir)
    std::string dir_path = get_parent_directory(path);

    int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        int err = errno;
        result.error = "failed to create temp file: " + std::string(strerror(err));
        result.error_kind = kind_from_errno(err);
        return result;
    }

    size_t offset = 0;
    while (offset < content.size()) {
        ssize_t written = write(fd, content.data() + offset, content.size() - offset);
        if (written < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            close(fd);
            unlink(temp_path.c_str());
            result.error = "failed to write content: " + std::string(strerror(err));
            result.error_kind = kind_from_errno(err);
            return result;
        }
        offset += static_cast<size_t>(written);
    }

    if (!fsync_fd(fd)) {
        close(fd);
        unlink(temp_path.c_str());
        result.error = "failed to fsync temp file";
        result.error_kind = ErrorKind::Io;
        return result;
    }

    close(fd);

    if (rename(temp_path.c_str(), path.c_str()) != 0) {
        int err = errno;
        unlink(temp_path.c_str());
        result.error = "failed to rename temp file: " + std::string(strerror(err));
        result.error_kind = kind_from_errno(err);
        return result;
    }

    sync_directory(dir_path);

    result.ok = true;
#endif

    return result;
}

bool atomic_exchange(const std::string& a, const std::string& b, std::error_code& ec) {
    ec.clear();
#if defined(__linux__) && defined(RENAME_EXCHANGE)
    if (renameat2(AT_FDCWD, a.c_str(), AT_FDCWD, b.c_str(), RENAME_EXCHANGE) == 0) {
        sync_directory(get_parent_directory(a));
        return true;
    }
    int err = errno;
    if (err == EINVAL || err == ENOSYS || err == ENOTSUP) {
        ec = std::make_error_code(std::errc::function_not_supported);
    } else {
        ec = std::error_code(err, std::generic_category());
    }
    return false;
#else
    (void)a;
    (void)b;
    ec = std::make_error_code(std::errc::function_not_supported);
    return false;
#endif
}

bool create_fifo(const std::string& path, std::filesystem::perms mode, std::error_code& ec) {
    ec.clear();
#ifndef _WIN32
    if (mkfifo(path.c_str(), static_cast<mode_t>(mode) & 07777) == 0) {
        return true;
    }
    ec = std::error_code(errno, std::generic_category());
    return false;
#else
    (void)path;
    (void)mode;
    ec = std::make_error_code(std::errc::function_not_supported);
    return false;
#endif
}

std::optional<std::string> read_file_bytes(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return std::nullopt;
    }
    return ss.str();
}

std::string to_portable_path(const std::string& path) {
    std::string result = path;
    std::replace(result.begin(), result.end(), '\\', '/');
    return result;
}

std::string get_parent_directory(const std::string& path) {
    fs::path p(path);
    return p.parent_path().string();
}

std::string get_filename(const std::string& path) {
    fs::path p(path);
    return p.filename().string();
}

std::string get_extension(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::string join_path(const std::string& base, const std::string& rel) {
    fs::path p(base);
    p /= rel;
    return to_portable_path(p.string());
}

std::string expand_home(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    if (path.size() > 1 && path[1] != '/' && path[1] != '\\') return path;

    auto home = get_env("HOME");
    if (!home) home = get_env("USERPROFILE");
    if (!home) return path;

    return path.size() == 1 ? *home : join_path(*home, path.substr(2));
}

bool is_writable_directory(const std::string& dir) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return false;
#ifdef _WIN32
    return _access(dir.c_str(), 2) == 0;
#else
    return access(dir.c_str(), W_OK | X_OK) == 0;
#endif
}

ErrorKind classify_error(const std::error_code& ec) {
    if (!ec) return ErrorKind::None;
    if (ec == std::errc::permission_denied ||
        ec == std::errc::operation_not_permitted ||
        ec == std::errc::read_only_file_system) {
        return ErrorKind::Permission;
    }
    return ErrorKind::Io;
}

std::optional<std::string> get_env(const std::string& name) {
#ifdef _MSC_VER
    char* val = nullptr;
    size_t len = 0;
    if (_dupenv_s(&val, &len, name.c_str()) == 0 && val != nullptr) {
        std::string result(val);
        free(val);
        return result;
    }
    return std::nullopt;
#else
    const char* val = std::getenv(name.c_str());
    if (val && *val) {
        return std::string(val);
    }
    return std::nullopt;
#endif
}

std::string get_current_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf;
#ifdef _WIN32
    gmtime_s(&tm_buf, &time_t_now);
#else
    gmtime_r(&time_t_now, &tm_buf);
#endif

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return buf;
}

std::string get_sortable_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    gmtime_s(&tm_buf, &time_t_now);
#else
    gmtime_r(&time_t_now, &tm_buf);
#endif

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H-%M-%S", &tm_buf);

    char out[40];
    std::snprintf(out, sizeof(out), "%s-%03dZ", buf, static_cast<int>(millis));
    return out;
}

std::string generate_uuid() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;

    uint64_t a = dis(gen);
    uint64_t b = dis(gen);

    // Set version 4 (random) and variant bits
    a = (a & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    b = (b & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    snprintf(buf, sizeof(buf),
             "%08x-%04x-%04x-%04x-%012llx",
             static_cast<uint32_t>(a >> 32),
             static_cast<uint16_t>((a >> 16) & 0xFFFF),
             static_cast<uint16_t>(a & 0xFFFF),
             static_cast<uint16_t>(b >> 48),
             static_cast<unsigned long long>(b & 0xFFFFFFFFFFFFULL));

    return buf;
}

} // namespace assetkit
