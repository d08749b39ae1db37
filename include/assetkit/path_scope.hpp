#pragma once

#include "assetkit/bundle_config.hpp"
#include "assetkit/types.hpp"

#include <optional>
#include <string>

namespace assetkit {

// ============================================================================
// Installation Root Resolution
// ============================================================================

struct PathScopeOptions {
    std::optional<Scope> scope;     // Explicit --global / --local
    std::string explicit_dir;       // --config-dir, wins over scope
    std::string home_override;      // Replaces $HOME (tests)
    std::string cwd_override;       // Replaces the working directory (tests)
};

struct PathScopeResult {
    bool ok = false;
    std::string error;
    std::string root;               // Absolute, lexically normalized
    Scope scope = Scope::Global;
    bool from_env = false;          // Global root taken from config_dir_env
};

// Root for one scope. Global honors config.config_dir_env before ~/global_dir.
PathScopeResult resolve_scope_root(const BundleConfig& config, Scope scope,
                                   const PathScopeOptions& options = {});

// Root for a command. Without an explicit scope this is the global root.
PathScopeResult resolve_install_root(const BundleConfig& config,
                                     const PathScopeOptions& options = {});

// True if root holds a manifest or version marker for this bundle
bool has_installation(const BundleConfig& config, const std::string& root);

// For commands acting on an existing installation: picks the only scope that
// has one. Fails when both or neither scope is installed.
PathScopeResult detect_installed_root(const BundleConfig& config,
                                      const PathScopeOptions& options = {});

} // namespace assetkit
