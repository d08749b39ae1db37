#pragma once

#include <optional>
#include <string>

namespace assetkit {

// ============================================================================
// Error Classification
// ============================================================================

enum class ErrorKind {
    None,
    Precondition,   // Missing source, missing target parent, bad config
    Permission,     // EACCES / EPERM on the target
    Corruption,     // Manifest exists but cannot be trusted
    Io,             // Any other filesystem failure
    Interrupted,    // Cancellation requested by the user
    PathTraversal   // A path escapes the installation root
};

// Process exit codes expected by the CLI layer
enum class ExitCode : int {
    Success = 0,
    GeneralError = 1,
    PermissionError = 2,
    PathTraversal = 3,
    Interrupted = 130
};

int exit_code_for(ErrorKind kind);

const char* error_kind_to_string(ErrorKind kind);

// ============================================================================
// Installation Scope
// ============================================================================

enum class Scope {
    Global,   // Shared per-user configuration directory
    Local     // Project directory under the current working directory
};

const char* scope_to_string(Scope scope);
std::optional<Scope> parse_scope(const std::string& s);

} // namespace assetkit
