// SPDX-License-Identifier: MIT

// include/dbxfer/error.hpp
#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace dbxfer {

/// Error codes for all locator and transfer operations.
enum class ErrorCode {
    // Validation
    InvalidLocator,        ///< Locator string malformed or wrong scheme
    UnsupportedFeature,    ///< Operation, if_exists policy or argument not in Features
    InvalidArgument,       ///< Argument value could not be parsed

    // I/O
    IoError,               ///< Open/read/write/list failure on the underlying storage

    // Structural
    StructuralError,       ///< Unexpected content during traversal (wrong file type)
    SchemaMismatch,        ///< Schema incompatible with the destination or itself
    ParseError,            ///< Schema document or listing could not be parsed

    // Process
    ProcessFailed,         ///< External process failed to launch or exited non-zero

    // Database
    DatabaseError,         ///< Warehouse query or command failed

    // State
    NotSupported,          ///< Valid request the adapter cannot serve yet
};

/// Error payload returned by synchronous validation and carried by TransferError.
struct Error {
    ErrorCode code;                ///< Classified error code
    std::string message;           ///< Human-readable description
    int os_errno = 0;              ///< OS errno if applicable, 0 otherwise
};

/// Return a short category string for an error code (e.g. "validation", "io").
constexpr std::string_view error_category(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidLocator:
        case ErrorCode::UnsupportedFeature:
        case ErrorCode::InvalidArgument:
            return "validation";
        case ErrorCode::IoError:
            return "io";
        case ErrorCode::StructuralError:
        case ErrorCode::SchemaMismatch:
        case ErrorCode::ParseError:
            return "structural";
        case ErrorCode::ProcessFailed:
            return "process";
        case ErrorCode::DatabaseError:
            return "database";
        case ErrorCode::NotSupported:
            return "state";
    }
    return "unknown";
}

/// Exception used to carry an Error out of coroutines and background workers.
class TransferError : public std::runtime_error {
public:
    explicit TransferError(Error error)
        : std::runtime_error(error.message), error_(std::move(error)) {}

    TransferError(ErrorCode code, std::string message, int os_errno = 0)
        : TransferError(Error{code, std::move(message), os_errno}) {}

    const Error& error() const { return error_; }
    ErrorCode code() const { return error_.code; }

private:
    Error error_;
};

}  // namespace dbxfer
