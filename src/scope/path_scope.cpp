#include "assetkit/path_scope.hpp"
#include "assetkit/platform.hpp"

#include <filesystem>

namespace assetkit {

namespace fs = std::filesystem;

namespace {

std::string normalize_root(const std::string& path) {
    std::error_code ec;
    fs::path p = fs::absolute(fs::path(expand_home(path)), ec);
    if (ec) p = fs::path(path);
    std::string out = p.lexically_normal().generic_string();
    while (out.size() > 1 && out.back() == '/') out.pop_back();
    return out;
}

} // namespace

PathScopeResult resolve_scope_root(const BundleConfig& config, Scope scope,
                                   const PathScopeOptions& options) {
    PathScopeResult result;
    result.scope = scope;

    if (scope == Scope::Local) {
        std::string cwd = options.cwd_override;
        if (cwd.empty()) {
            std::error_code ec;
            cwd = fs::current_path(ec).string();
            if (ec) {
                result.error = "cannot determine current directory: " + ec.message();
                return result;
            }
        }
        result.root = normalize_root(join_path(cwd, config.local_dir));
        result.ok = true;
        return result;
    }

    if (!config.config_dir_env.empty()) {
        if (auto env_dir = get_env(config.config_dir_env)) {
            result.root = normalize_root(*env_dir);
            result.from_env = true;
            result.ok = true;
            return result;
        }
    }

    std::string home = options.home_override;
    if (home.empty()) {
        auto env_home = get_env("HOME");
        if (!env_home) env_home = get_env("USERPROFILE");
        if (!env_home) {
            result.error = "HOME is not set; use --config-dir";
            return result;
        }
        home = *env_home;
    }

    result.root = normalize_root(join_path(home, config.global_dir));
    result.ok = true;
    return result;
}

PathScopeResult resolve_install_root(const BundleConfig& config,
                                     const PathScopeOptions& options) {
    if (!options.explicit_dir.empty()) {
        PathScopeResult result;
        result.root = normalize_root(options.explicit_dir);
        result.scope = options.scope.value_or(Scope::Global);
        result.ok = true;
        return result;
    }
    return resolve_scope_root(config, options.scope.value_or(Scope::Global), options);
}

bool has_installation(const BundleConfig& config, const std::string& root) {
    std::error_code ec;
    return fs::exists(join_path(root, config.manifest_relative_path()), ec) ||
           fs::exists(join_path(root, config.version_relative_path()), ec);
}

PathScopeResult detect_installed_root(const BundleConfig& config,
                                      const PathScopeOptions& options) {
    if (!options.explicit_dir.empty() || options.scope) {
        return resolve_install_root(config, options);
    }

    auto global = resolve_scope_root(config, Scope::Global, options);
    auto local = resolve_scope_root(config, Scope::Local, options);

    bool global_installed = global.ok && has_installation(config, global.root);
    bool local_installed = local.ok && has_installation(config, local.root);

    if (global_installed && local_installed) {
        PathScopeResult result;
        result.error = "installations found in both " + global.root + " and " + local.root +
                       "; choose one with --global or --local";
        return result;
    }
    if (global_installed) return global;
    if (local_installed) return local;

    PathScopeResult result;
    result.error = "no installation found in " + (global.ok ? global.root : std::string("~")) +
                   " or " + (local.ok ? local.root : std::string(".")) +
                   "; use --global, --local or --config-dir";
    return result;
}

} // namespace assetkit
