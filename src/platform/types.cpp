#include "assetkit/types.hpp"

namespace assetkit {

int exit_code_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
            return static_cast<int>(ExitCode::Success);
        case ErrorKind::Permission:
            return static_cast<int>(ExitCode::PermissionError);
        case ErrorKind::PathTraversal:
            return static_cast<int>(ExitCode::PathTraversal);
        case ErrorKind::Interrupted:
            return static_cast<int>(ExitCode::Interrupted);
        case ErrorKind::Precondition:
        case ErrorKind::Corruption:
        case ErrorKind::Io:
        default:
            return static_cast<int>(ExitCode::GeneralError);
    }
}

const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::Precondition: return "precondition";
        case ErrorKind::Permission: return "permission";
        case ErrorKind::Corruption: return "corruption";
        case ErrorKind::Io: return "io";
        case ErrorKind::Interrupted: return "interrupted";
        case ErrorKind::PathTraversal: return "path_traversal";
    }
    return "unknown";
}

const char* scope_to_string(Scope scope) {
    return scope == Scope::Global ? "global" : "local";
}

std::optional<Scope> parse_scope(const std::string& s) {
    if (s == "global") return Scope::Global;
    if (s == "local") return Scope::Local;
    return std::nullopt;
}

} // namespace assetkit
