#pragma once

#include <string>
#include <string_view>

enum class ErrorKind {
    PermissionDenied,
    DeviceUnavailable,
    Configuration,
    UnsupportedProvider,
    BackendConnection,
    InvalidState,
};

struct Error {
    ErrorKind kind;
    std::string message;
};

inline std::string_view error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::PermissionDenied: return "permission_denied";
        case ErrorKind::DeviceUnavailable: return "device_unavailable";
        case ErrorKind::Configuration: return "configuration";
        case ErrorKind::UnsupportedProvider: return "unsupported_provider";
        case ErrorKind::BackendConnection: return "backend_connection";
        case ErrorKind::InvalidState: return "invalid_state";
    }
    return "unknown";
}
