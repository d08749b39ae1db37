#pragma once

#include "assetkit/types.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace assetkit {

// ============================================================================
// Atomic File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
    ErrorKind error_kind = ErrorKind::None;
};

// Write content atomically using temp file + fsync + rename + fsync(dir)
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content);
AtomicWriteResult atomic_write_file(const std::string& path, const std::vector<uint8_t>& content);

// Exchange two existing directory entries in a single step.
// Returns false with ec set to std::errc::function_not_supported when the
// platform or filesystem has no atomic exchange; callers fall back to two renames.
bool atomic_exchange(const std::string& a, const std::string& b, std::error_code& ec);

// fsync a directory by path (no-op where unsupported)
void sync_directory(const std::string& dir_path);

// Create an empty named pipe at path with the given mode bits
bool create_fifo(const std::string& path, std::filesystem::perms mode, std::error_code& ec);

// ============================================================================
// File Contents
// ============================================================================

std::optional<std::string> read_file_bytes(const std::string& path);

// ============================================================================
// Path Utilities
// ============================================================================

// Convert a path to use forward slashes (portable format)
std::string to_portable_path(const std::string& path);

std::string get_parent_directory(const std::string& path);

std::string get_filename(const std::string& path);

// Lowercased extension including the dot, e.g. ".md"
std::string get_extension(const std::string& path);

std::string join_path(const std::string& base, const std::string& rel);

// Expand a leading "~" using HOME
std::string expand_home(const std::string& path);

// True if the process may create entries inside dir
bool is_writable_directory(const std::string& dir);

// Classify a filesystem error code
ErrorKind classify_error(const std::error_code& ec);

// ============================================================================
// Environment
// ============================================================================

std::optional<std::string> get_env(const std::string& name);

// ============================================================================
// Timestamps and identifiers
// ============================================================================

// Current time as RFC3339 string
std::string get_current_timestamp();

// Sortable, filename-safe UTC timestamp: 2024-05-01T12-30-05-123Z
std::string get_sortable_timestamp();

// Generate a UUID string
std::string generate_uuid();

} // namespace assetkit
