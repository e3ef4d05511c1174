#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace ingest {

/**
 * @brief Error taxonomy shared by every component
 */
enum class ErrorCode {
    Validation,         ///< Same or nested roots, malformed arguments
    InsufficientSpace,
    Conflict,           ///< Destination exists and the policy needs a decision
    ChecksumMismatch,
    Permission,
    DriveDisconnected,
    Network,
    DiskFull,
    Cancelled,          ///< User initiated; not a failure
    InvalidState,       ///< Call not legal in the current state machine state
    NotFound,
    Io,
    Store
};

struct Error {
    ErrorCode code = ErrorCode::Io;
    std::string message;
};

/**
 * @brief Per-file failure category recorded on a FileTransferRecord
 */
enum class FileErrorKind {
    Network,
    DriveDisconnected,
    ChecksumMismatch,
    Permission,
    DiskFull,
    Other
};

const char* to_string(ErrorCode code) noexcept;
const char* to_string(FileErrorKind kind) noexcept;
std::optional<FileErrorKind> parse_file_error_kind(std::string_view text) noexcept;

/// Maps an errno value onto the per-file failure taxonomy.
FileErrorKind classify_errno(int error_number) noexcept;

/// Network and disconnect failures may succeed on a later attempt.
bool is_transient(FileErrorKind kind) noexcept;

ErrorCode to_error_code(FileErrorKind kind) noexcept;
FileErrorKind to_file_error_kind(ErrorCode code) noexcept;

} // namespace ingest
