#include "assetkit/cancellation.hpp"

#include <csignal>
#include <filesystem>

#include <spdlog/spdlog.h>

namespace assetkit {

namespace {

std::atomic<CancellationToken*> g_signal_token{nullptr};

extern "C" void on_cancel_signal(int) {
    CancellationToken* token = g_signal_token.load();
    if (token) {
        token->request();
    }
}

} // namespace

void install_signal_handlers(CancellationToken& token) {
    g_signal_token.store(&token);
    std::signal(SIGINT, on_cancel_signal);
    std::signal(SIGTERM, on_cancel_signal);
}

void restore_signal_handlers() {
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    g_signal_token.store(nullptr);
}

StagingGuard::StagingGuard(std::string path) : path_(std::move(path)) {}

StagingGuard::~StagingGuard() {
    if (committed_ || path_.empty()) return;

    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        spdlog::warn("could not remove staging directory {}: {}", path_, ec.message());
    } else {
        spdlog::debug("removed staging directory {}", path_);
    }
}

} // namespace assetkit
