#pragma once

#include <string>
#include <utility>

namespace vault {

/**
 * @brief Error categories shared by every fallible operation
 *
 * The HTTP layer maps each category onto a status code, the worker maps
 * them onto asset failures. Validation codes (InvalidToken, FileTooLarge,
 * TooManyFiles, InvalidRange) never leave partial state behind.
 */
enum class ErrorCode {
    InvalidArgument,
    InvalidToken,
    FileTooLarge,
    TooManyFiles,
    UnknownSession,
    UnknownBatch,
    BatchFinalized,
    InvalidRange,
    Transient,       // Remote store hiccup, caller may retry
    NotFound,
    AlreadyExists,
    Io,
    Storage,         // Metadata store failure
    Internal
};

struct Error {
    ErrorCode code = ErrorCode::Internal;
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string m) : code(c), message(std::move(m)) {}
};

inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidToken: return "InvalidToken";
        case ErrorCode::FileTooLarge: return "FileTooLarge";
        case ErrorCode::TooManyFiles: return "TooManyFiles";
        case ErrorCode::UnknownSession: return "UnknownSession";
        case ErrorCode::UnknownBatch: return "UnknownBatch";
        case ErrorCode::BatchFinalized: return "BatchFinalized";
        case ErrorCode::InvalidRange: return "InvalidRange";
        case ErrorCode::Transient: return "Transient";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::Io: return "Io";
        case ErrorCode::Storage: return "Storage";
        case ErrorCode::Internal: return "Internal";
    }
    return "Unknown";
}

inline std::string to_string(const Error& error) {
    return std::string(error_code_name(error.code)) + ": " + error.message;
}

} // namespace vault
