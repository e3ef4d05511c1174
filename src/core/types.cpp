#include "ingest/core/types.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace ingest {

bool ValidationResult::has_warning(WarningType type) const noexcept {
    return std::any_of(warnings.begin(), warnings.end(),
                       [type](const ValidationWarning& w) { return w.type == type; });
}

const FileTransferRecord* TransferSession::find_file(std::string_view source_path) const noexcept {
    for (const auto& record : files) {
        if (record.source_path == source_path) {
            return &record;
        }
    }
    return nullptr;
}

std::size_t TransferSession::count_with_status(FileStatus wanted) const noexcept {
    return static_cast<std::size_t>(std::count_if(files.begin(), files.end(),
        [wanted](const FileTransferRecord& r) { return r.status == wanted; }));
}

const char* to_string(BusClass bus) noexcept {
    switch (bus) {
        case BusClass::Usb: return "usb";
        case BusClass::SdCard: return "sd_card";
        case BusClass::Sata: return "sata";
        case BusClass::Ata: return "ata";
        case BusClass::Scsi: return "scsi";
        case BusClass::Nvme: return "nvme";
        case BusClass::Virtual: return "virtual";
        case BusClass::Unknown: return "unknown";
    }
    return "unknown";
}

const char* to_string(ConflictPolicy policy) noexcept {
    switch (policy) {
        case ConflictPolicy::Ask: return "ask";
        case ConflictPolicy::Overwrite: return "overwrite";
        case ConflictPolicy::Rename: return "rename";
        case ConflictPolicy::Skip: return "skip";
    }
    return "ask";
}

const char* to_string(FileStatus status) noexcept {
    switch (status) {
        case FileStatus::Pending: return "pending";
        case FileStatus::Transferring: return "transferring";
        case FileStatus::Verifying: return "verifying";
        case FileStatus::Complete: return "complete";
        case FileStatus::Error: return "error";
        case FileStatus::Skipped: return "skipped";
    }
    return "pending";
}

const char* to_string(SessionStatus status) noexcept {
    switch (status) {
        case SessionStatus::Transferring: return "transferring";
        case SessionStatus::Paused: return "paused";
        case SessionStatus::Complete: return "complete";
        case SessionStatus::Error: return "error";
        case SessionStatus::Cancelled: return "cancelled";
    }
    return "error";
}

const char* to_string(WarningType type) noexcept {
    switch (type) {
        case WarningType::SameDirectory: return "same_directory";
        case WarningType::NestedDestInSource: return "nested_dest_in_source";
        case WarningType::NestedSourceInDest: return "nested_source_in_dest";
        case WarningType::FileConflicts: return "file_conflicts";
        case WarningType::InsufficientSpace: return "insufficient_space";
        case WarningType::UnreadableSources: return "unreadable_sources";
    }
    return "unknown";
}

std::optional<ConflictPolicy> parse_conflict_policy(std::string_view text) noexcept {
    if (text == "ask") return ConflictPolicy::Ask;
    if (text == "overwrite") return ConflictPolicy::Overwrite;
    if (text == "rename") return ConflictPolicy::Rename;
    if (text == "skip") return ConflictPolicy::Skip;
    return std::nullopt;
}

std::optional<FileStatus> parse_file_status(std::string_view text) noexcept {
    if (text == "pending") return FileStatus::Pending;
    if (text == "transferring") return FileStatus::Transferring;
    if (text == "verifying") return FileStatus::Verifying;
    if (text == "complete") return FileStatus::Complete;
    if (text == "error") return FileStatus::Error;
    if (text == "skipped") return FileStatus::Skipped;
    return std::nullopt;
}

std::optional<SessionStatus> parse_session_status(std::string_view text) noexcept {
    if (text == "transferring") return SessionStatus::Transferring;
    if (text == "paused") return SessionStatus::Paused;
    if (text == "complete") return SessionStatus::Complete;
    if (text == "error") return SessionStatus::Error;
    if (text == "cancelled") return SessionStatus::Cancelled;
    return std::nullopt;
}

bool is_terminal(SessionStatus status) noexcept {
    return status == SessionStatus::Complete
        || status == SessionStatus::Error
        || status == SessionStatus::Cancelled;
}

bool is_legal_transition(SessionStatus from, SessionStatus to) noexcept {
    static const std::unordered_map<SessionStatus, std::vector<SessionStatus>> transitions {
        {SessionStatus::Transferring, {SessionStatus::Paused, SessionStatus::Complete,
                                       SessionStatus::Error, SessionStatus::Cancelled}},
        {SessionStatus::Paused, {SessionStatus::Transferring, SessionStatus::Complete,
                                 SessionStatus::Error, SessionStatus::Cancelled}},
    };

    if (from == to) {
        return !is_terminal(from);
    }

    const auto it = transitions.find(from);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed = it->second;
    return std::find(allowed.begin(), allowed.end(), to) != allowed.end();
}

} // namespace ingest
