#include "ingest/core/error.hpp"

#include <cerrno>

namespace ingest {

const char* to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Validation: return "validation";
        case ErrorCode::InsufficientSpace: return "insufficient_space";
        case ErrorCode::Conflict: return "conflict";
        case ErrorCode::ChecksumMismatch: return "checksum_mismatch";
        case ErrorCode::Permission: return "permission";
        case ErrorCode::DriveDisconnected: return "drive_disconnected";
        case ErrorCode::Network: return "network";
        case ErrorCode::DiskFull: return "disk_full";
        case ErrorCode::Cancelled: return "cancelled";
        case ErrorCode::InvalidState: return "invalid_state";
        case ErrorCode::NotFound: return "not_found";
        case ErrorCode::Io: return "io";
        case ErrorCode::Store: return "store";
    }
    return "unknown";
}

const char* to_string(FileErrorKind kind) noexcept {
    switch (kind) {
        case FileErrorKind::Network: return "network";
        case FileErrorKind::DriveDisconnected: return "drive_disconnected";
        case FileErrorKind::ChecksumMismatch: return "checksum_mismatch";
        case FileErrorKind::Permission: return "permission";
        case FileErrorKind::DiskFull: return "disk_full";
        case FileErrorKind::Other: return "other";
    }
    return "other";
}

std::optional<FileErrorKind> parse_file_error_kind(std::string_view text) noexcept {
    if (text == "network") return FileErrorKind::Network;
    if (text == "drive_disconnected") return FileErrorKind::DriveDisconnected;
    if (text == "checksum_mismatch") return FileErrorKind::ChecksumMismatch;
    if (text == "permission") return FileErrorKind::Permission;
    if (text == "disk_full") return FileErrorKind::DiskFull;
    if (text == "other") return FileErrorKind::Other;
    return std::nullopt;
}

FileErrorKind classify_errno(int error_number) noexcept {
    switch (error_number) {
        case EACCES:
        case EPERM:
            return FileErrorKind::Permission;
        case ENOSPC:
        case EDQUOT:
            return FileErrorKind::DiskFull;
        case ENOENT:
        case EIO:
        case EROFS:
        case ENODEV:
        case ENXIO:
            return FileErrorKind::DriveDisconnected;
        case ETIMEDOUT:
        case ECONNRESET:
        case ECONNABORTED:
        case EHOSTUNREACH:
        case ENETDOWN:
        case ENETUNREACH:
        case ESTALE:
            return FileErrorKind::Network;
        default:
            return FileErrorKind::Other;
    }
}

bool is_transient(FileErrorKind kind) noexcept {
    return kind == FileErrorKind::Network || kind == FileErrorKind::DriveDisconnected;
}

ErrorCode to_error_code(FileErrorKind kind) noexcept {
    switch (kind) {
        case FileErrorKind::Network: return ErrorCode::Network;
        case FileErrorKind::DriveDisconnected: return ErrorCode::DriveDisconnected;
        case FileErrorKind::ChecksumMismatch: return ErrorCode::ChecksumMismatch;
        case FileErrorKind::Permission: return ErrorCode::Permission;
        case FileErrorKind::DiskFull: return ErrorCode::DiskFull;
        case FileErrorKind::Other: return ErrorCode::Io;
    }
    return ErrorCode::Io;
}

FileErrorKind to_file_error_kind(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Network: return FileErrorKind::Network;
        case ErrorCode::DriveDisconnected: return FileErrorKind::DriveDisconnected;
        case ErrorCode::ChecksumMismatch: return FileErrorKind::ChecksumMismatch;
        case ErrorCode::Permission: return FileErrorKind::Permission;
        case ErrorCode::DiskFull: return FileErrorKind::DiskFull;
        default: return FileErrorKind::Other;
    }
}

} // namespace ingest
