#pragma once

#include <string>

namespace als {

enum class ErrorCode {
    NotFound,
    NotADirectory,
    IsADirectory,
    PermissionDenied,
    IOError,
    InvalidArgument,
    Persistence,
    Config
};

/**
 * @brief Error value carried by Result
 *
 * `code` drives control flow (the sync engine treats NotFound and
 * NotADirectory differently from transient I/O failures); `message` is
 * for humans and already includes the offending path.
 */
struct Error {
    ErrorCode code = ErrorCode::IOError;
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
};

inline const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NotFound: return "not_found";
        case ErrorCode::NotADirectory: return "not_a_directory";
        case ErrorCode::IsADirectory: return "is_a_directory";
        case ErrorCode::PermissionDenied: return "permission_denied";
        case ErrorCode::IOError: return "io_error";
        case ErrorCode::InvalidArgument: return "invalid_argument";
        case ErrorCode::Persistence: return "persistence";
        case ErrorCode::Config: return "config";
    }
    return "unknown";
}

} // namespace als
