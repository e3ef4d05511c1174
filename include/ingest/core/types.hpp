#pragma once

#include "ingest/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ingest {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

enum class BusClass {
    Usb,
    SdCard,
    Sata,
    Ata,
    Scsi,
    Nvme,
    Virtual,
    Unknown
};

enum class ConflictPolicy {
    Ask,
    Overwrite,
    Rename,
    Skip
};

enum class FileStatus {
    Pending,
    Transferring,
    Verifying,
    Complete,
    Error,
    Skipped
};

enum class SessionStatus {
    Transferring,
    Paused,
    Complete,
    Error,
    Cancelled
};

/**
 * @brief A storage unit with zero or more mount points
 *
 * Immutable once emitted for a poll cycle; a remount produces a new value.
 */
struct Device {
    std::string id;                                 ///< Stable handle, e.g. "sdb"
    std::string display_name;
    std::vector<std::filesystem::path> mount_points;
    std::uint64_t capacity_bytes = 0;
    std::uint64_t free_bytes = 0;
    bool removable = false;
    bool is_system = false;
    BusClass bus_class = BusClass::Unknown;
    std::string device_path;                        ///< e.g. "/dev/sdb1"
    std::string vendor;
    std::string model;
    std::string filesystem;
};

/**
 * @brief (device, inode) pair used to deduplicate hard links during a scan
 */
struct FileIdentity {
    std::uint64_t device = 0;
    std::uint64_t inode = 0;

    bool operator==(const FileIdentity& other) const noexcept {
        return device == other.device && inode == other.inode;
    }
};

struct FileIdentityHash {
    std::size_t operator()(const FileIdentity& id) const noexcept {
        return std::hash<std::uint64_t>{}(id.device) ^ (std::hash<std::uint64_t>{}(id.inode) << 1);
    }
};

struct ScannedFile {
    std::filesystem::path path;
    std::uint64_t size_bytes = 0;
    TimePoint created_at{};
    TimePoint modified_at{};
    FileIdentity identity;   ///< Scan-local, never persisted
};

struct RequestedFile {
    std::filesystem::path path;
    std::optional<std::uint64_t> size_hint;
};

struct TransferRequest {
    std::filesystem::path source_root;
    std::filesystem::path destination_root;
    std::vector<RequestedFile> files;
    ConflictPolicy conflict_policy = ConflictPolicy::Ask;
    std::optional<std::string> device_name;
};

struct ConflictInfo {
    std::string file_name;
    std::filesystem::path source_path;
    std::filesystem::path destination_path;
    std::uint64_t source_size = 0;
    TimePoint source_mtime{};
    std::uint64_t destination_size = 0;
    TimePoint destination_mtime{};
    ConflictPolicy suggested_resolution = ConflictPolicy::Rename;
};

enum class WarningType {
    SameDirectory,
    NestedDestInSource,
    NestedSourceInDest,
    FileConflicts,
    InsufficientSpace,
    UnreadableSources
};

struct ValidationWarning {
    WarningType type;
    std::string message;
};

struct ValidationResult {
    bool is_valid = true;
    bool can_proceed = true;
    bool requires_confirmation = false;
    std::vector<ValidationWarning> warnings;
    std::vector<ConflictInfo> conflicts;
    std::uint64_t space_required_bytes = 0;
    std::uint64_t space_available_bytes = 0;
    std::optional<std::string> hard_error;

    [[nodiscard]] bool has_warning(WarningType type) const noexcept;
};

struct FileTransferRecord {
    std::string source_path;
    std::string destination_path;
    std::string file_name;
    std::uint64_t size_bytes = 0;
    std::uint64_t bytes_transferred = 0;
    double percentage = 0.0;
    FileStatus status = FileStatus::Pending;
    std::optional<std::string> checksum;    ///< Only set once complete and verified
    bool checksum_verified = false;
    std::optional<FileErrorKind> error_kind;
    std::string error_message;
    std::optional<TimePoint> started_at;
    std::optional<TimePoint> completed_at;
};

struct TransferSession {
    std::string id;
    std::string device_id;
    std::string device_name;
    std::string source_root;
    std::string destination_root;
    TimePoint start_time{};
    std::optional<TimePoint> end_time;
    SessionStatus status = SessionStatus::Transferring;
    std::size_t file_count = 0;
    std::uint64_t total_bytes = 0;
    std::vector<FileTransferRecord> files;
    std::string error_message;
    std::optional<std::string> retry_of;
    std::optional<std::string> manifest_path;

    [[nodiscard]] const FileTransferRecord* find_file(std::string_view source_path) const noexcept;
    [[nodiscard]] std::size_t count_with_status(FileStatus status) const noexcept;
};

const char* to_string(BusClass bus) noexcept;
const char* to_string(ConflictPolicy policy) noexcept;
const char* to_string(FileStatus status) noexcept;
const char* to_string(SessionStatus status) noexcept;
const char* to_string(WarningType type) noexcept;

std::optional<ConflictPolicy> parse_conflict_policy(std::string_view text) noexcept;
std::optional<FileStatus> parse_file_status(std::string_view text) noexcept;
std::optional<SessionStatus> parse_session_status(std::string_view text) noexcept;

bool is_terminal(SessionStatus status) noexcept;

/// transferring -> paused -> transferring ... -> complete | error | cancelled
bool is_legal_transition(SessionStatus from, SessionStatus to) noexcept;

} // namespace ingest
