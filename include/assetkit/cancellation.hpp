#pragma once

#include <atomic>
#include <string>

namespace assetkit {

// ============================================================================
// Cancellation
// ============================================================================

class CancellationToken {
public:
    void request() { cancelled_.store(true); }
    bool is_cancelled() const { return cancelled_.load(); }
    void reset() { cancelled_.store(false); }

private:
    std::atomic<bool> cancelled_{false};
};

// Route SIGINT/SIGTERM into token. The handler only stores the flag.
void install_signal_handlers(CancellationToken& token);

// Restore the default dispositions and detach the token
void restore_signal_handlers();

// ============================================================================
// Staging Directory Guard
// ============================================================================
//
// Owns a staging directory for the duration of an install. Unless commit()
// is called after the swap, the directory is removed on destruction, so an
// aborted or interrupted install leaves no staging debris.

class StagingGuard {
public:
    explicit StagingGuard(std::string path);
    ~StagingGuard();

    StagingGuard(const StagingGuard&) = delete;
    StagingGuard& operator=(const StagingGuard&) = delete;

    void commit() { committed_ = true; }
    const std::string& path() const { return path_; }

private:
    std::string path_;
    bool committed_ = false;
};

} // namespace assetkit
