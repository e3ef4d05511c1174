#include "ingest/store/session_store.hpp"
#include "ingest/store/session_json.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <random>
#include <sstream>
#include <unordered_set>

namespace ingest::store {
namespace fs = std::filesystem;
using nlohmann::json;

struct SessionStore::Entry {
    enum class Op {
        CreateSession,
        AddFile,
        UpdateFile,
        UpdateSession
    };

    Op op = Op::CreateSession;
    std::string session_id;
    TransferSession session;
    FileTransferRecord record;
    std::string source_path;
    FilePatch file_patch;
    SessionPatch session_patch;
};

namespace {

constexpr const char* kInterrupted = "interrupted";

bool is_final(FileStatus status) noexcept {
    return status == FileStatus::Complete || status == FileStatus::Error || status == FileStatus::Skipped;
}

json patch_to_json(const FilePatch& patch) {
    json j = json::object();
    if (patch.destination_path) j["destination_path"] = *patch.destination_path;
    if (patch.status) j["status"] = to_string(*patch.status);
    if (patch.bytes_transferred) j["bytes_transferred"] = *patch.bytes_transferred;
    if (patch.percentage) j["percentage"] = *patch.percentage;
    if (patch.checksum) j["checksum"] = *patch.checksum;
    if (patch.checksum_verified) j["checksum_verified"] = *patch.checksum_verified;
    if (patch.error_kind) j["error_kind"] = to_string(*patch.error_kind);
    if (patch.error_message) j["error_message"] = *patch.error_message;
    if (patch.started_at) j["started_at"] = to_epoch_ns(*patch.started_at);
    if (patch.completed_at) j["completed_at"] = to_epoch_ns(*patch.completed_at);
    return j;
}

json patch_to_json(const SessionPatch& patch) {
    json j = json::object();
    if (patch.status) j["status"] = to_string(*patch.status);
    if (patch.end_time) j["end_time"] = to_epoch_ns(*patch.end_time);
    if (patch.error_message) j["error_message"] = *patch.error_message;
    if (patch.manifest_path) j["manifest_path"] = *patch.manifest_path;
    return j;
}

template<typename Enum, typename Parser>
std::optional<Enum> enum_field(const json& j, const char* key, Parser parser) {
    if (!j.contains(key)) {
        return std::nullopt;
    }
    const auto text = j.at(key).get<std::string>();
    auto parsed = parser(text);
    if (!parsed) {
        throw std::invalid_argument("unknown value '" + text + "' for " + key);
    }
    return parsed;
}

FilePatch file_patch_from_json(const json& j) {
    FilePatch patch;
    if (j.contains("destination_path")) patch.destination_path = j.at("destination_path").get<std::string>();
    patch.status = enum_field<FileStatus>(j, "status", parse_file_status);
    if (j.contains("bytes_transferred")) patch.bytes_transferred = j.at("bytes_transferred").get<std::uint64_t>();
    if (j.contains("percentage")) patch.percentage = j.at("percentage").get<double>();
    if (j.contains("checksum")) patch.checksum = j.at("checksum").get<std::string>();
    if (j.contains("checksum_verified")) patch.checksum_verified = j.at("checksum_verified").get<bool>();
    patch.error_kind = enum_field<FileErrorKind>(j, "error_kind", parse_file_error_kind);
    if (j.contains("error_message")) patch.error_message = j.at("error_message").get<std::string>();
    if (j.contains("started_at")) patch.started_at = from_epoch_ns(j.at("started_at").get<std::int64_t>());
    if (j.contains("completed_at")) patch.completed_at = from_epoch_ns(j.at("completed_at").get<std::int64_t>());
    return patch;
}

SessionPatch session_patch_from_json(const json& j) {
    SessionPatch patch;
    patch.status = enum_field<SessionStatus>(j, "status", parse_session_status);
    if (j.contains("end_time")) patch.end_time = from_epoch_ns(j.at("end_time").get<std::int64_t>());
    if (j.contains("error_message")) patch.error_message = j.at("error_message").get<std::string>();
    if (j.contains("manifest_path")) patch.manifest_path = j.at("manifest_path").get<std::string>();
    return patch;
}

Result<void> write_all(int fd, const std::string& data) {
    std::size_t written = 0;
    while (written < data.size()) {
        const ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return Err<void>(Error{ErrorCode::Store, std::string("journal write failed: ") + std::strerror(errno)});
        }
        written += static_cast<std::size_t>(n);
    }
    if (::fsync(fd) != 0) {
        return Err<void>(Error{ErrorCode::Store, std::string("journal fsync failed: ") + std::strerror(errno)});
    }
    return Ok();
}

void fsync_directory(const fs::path& directory) {
    const int fd = ::open(directory.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        spdlog::warn("[Store] cannot open directory for fsync path={} error={}", directory.string(), std::strerror(errno));
        return;
    }
    if (::fsync(fd) != 0) {
        spdlog::warn("[Store] directory fsync failed path={} error={}", directory.string(), std::strerror(errno));
    }
    ::close(fd);
}

} // namespace

void apply_patch(FileTransferRecord& record, const FilePatch& patch) {
    if (patch.destination_path) record.destination_path = *patch.destination_path;
    if (patch.status) record.status = *patch.status;
    if (patch.bytes_transferred) record.bytes_transferred = *patch.bytes_transferred;
    if (patch.percentage) record.percentage = *patch.percentage;
    if (patch.checksum) record.checksum = *patch.checksum;
    if (patch.checksum_verified) record.checksum_verified = *patch.checksum_verified;
    if (patch.error_kind) record.error_kind = *patch.error_kind;
    if (patch.error_message) record.error_message = *patch.error_message;
    if (patch.started_at) record.started_at = *patch.started_at;
    if (patch.completed_at) record.completed_at = *patch.completed_at;
}

void apply_patch(TransferSession& session, const SessionPatch& patch) {
    if (patch.status) session.status = *patch.status;
    if (patch.end_time) session.end_time = *patch.end_time;
    if (patch.error_message) session.error_message = *patch.error_message;
    if (patch.manifest_path) session.manifest_path = *patch.manifest_path;
}

std::string generate_session_id() {
    static thread_local std::mt19937_64 engine{std::random_device{}()};
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::now().time_since_epoch()).count();

    std::ostringstream oss;
    oss << "ses_" << millis << '_'
        << std::hex << std::setw(8) << std::setfill('0') << (engine() & 0xffffffffULL);
    return oss.str();
}

SessionStore::SessionStore() = default;

SessionStore::SessionStore(fs::path journal_path)
    : journal_path_(std::move(journal_path)) {
    const auto parent = journal_path_->parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            throw StoreIoError("Cannot create journal directory " + parent.string() + ": " + ec.message());
        }
    }

    replay();

    journal_fd_ = ::open(journal_path_->c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
    if (journal_fd_ < 0) {
        throw StoreIoError("Cannot open journal " + journal_path_->string() + ": " + std::strerror(errno));
    }

    try {
        recover_interrupted();
    } catch (const std::exception&) {
        ::close(journal_fd_);
        journal_fd_ = -1;
        throw;
    }

    spdlog::info("[Store] opened journal={} sessions={} entries={} recovered={}",
                 journal_path_->string(), sessions_.size(), journal_entries_, recovered_sessions_);
}

SessionStore::~SessionStore() {
    if (journal_fd_ >= 0) {
        ::close(journal_fd_);
    }
}

// ============================================================================
// Journal replay and recovery
// ============================================================================

void SessionStore::replay() {
    std::error_code ec;
    if (!fs::exists(*journal_path_, ec)) {
        return;
    }

    std::ifstream input(*journal_path_, std::ios::binary);
    if (!input) {
        throw StoreIoError("Cannot read journal " + journal_path_->string());
    }
    const std::string content((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    input.close();

    std::size_t position = 0;
    std::size_t valid_end = 0;
    std::size_t line_number = 0;

    while (position < content.size()) {
        ++line_number;
        const auto newline = content.find('\n', position);
        if (newline == std::string::npos) {
            spdlog::warn("[Store] journal ends with a partial line at line {}", line_number);
            break;
        }

        const std::string line = content.substr(position, newline - position);
        const bool is_last = newline + 1 == content.size();
        position = newline + 1;

        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            valid_end = position;
            continue;
        }

        Entry entry;
        try {
            const json document = json::parse(line);
            const auto op = document.at("op").get<std::string>();
            if (op == "create_session") {
                entry.op = Entry::Op::CreateSession;
                entry.session = document.at("session").get<TransferSession>();
                entry.session_id = entry.session.id;
            } else if (op == "add_file") {
                entry.op = Entry::Op::AddFile;
                entry.session_id = document.at("session_id").get<std::string>();
                entry.record = document.at("record").get<FileTransferRecord>();
            } else if (op == "update_file") {
                entry.op = Entry::Op::UpdateFile;
                entry.session_id = document.at("session_id").get<std::string>();
                entry.source_path = document.at("source_path").get<std::string>();
                entry.file_patch = file_patch_from_json(document.at("patch"));
            } else if (op == "update_session") {
                entry.op = Entry::Op::UpdateSession;
                entry.session_id = document.at("session_id").get<std::string>();
                entry.session_patch = session_patch_from_json(document.at("patch"));
            } else {
                throw std::invalid_argument("unknown op '" + op + "'");
            }
        } catch (const std::exception& e) {
            if (is_last) {
                spdlog::warn("[Store] discarding unreadable final journal line {}: {}", line_number, e.what());
                break;
            }
            throw StoreCorruptedError("Journal " + journal_path_->string() + " line "
                                      + std::to_string(line_number) + ": " + e.what());
        }

        const bool known = sessions_.count(entry.session_id) > 0;
        if ((entry.op == Entry::Op::CreateSession) == known) {
            throw StoreCorruptedError("Journal " + journal_path_->string() + " line "
                                      + std::to_string(line_number) + " references session '"
                                      + entry.session_id + "' out of order");
        }
        if (entry.op == Entry::Op::UpdateFile
            && find_record(entry.session_id, entry.source_path) == nullptr) {
            throw StoreCorruptedError("Journal " + journal_path_->string() + " line "
                                      + std::to_string(line_number) + " updates unknown file '"
                                      + entry.source_path + "'");
        }

        apply(entry);
        ++journal_entries_;
        valid_end = position;
    }

    if (valid_end < content.size()) {
        if (::truncate(journal_path_->c_str(), static_cast<off_t>(valid_end)) != 0) {
            throw StoreIoError("Cannot truncate torn journal tail: " + std::string(std::strerror(errno)));
        }
        spdlog::warn("[Store] truncated journal from {} to {} bytes", content.size(), valid_end);
    }
}

void SessionStore::recover_interrupted() {
    std::lock_guard write_lock(write_mutex_);

    std::vector<std::string> interrupted;
    for (const auto& [id, session] : sessions_) {
        if (session.status == SessionStatus::Transferring) {
            interrupted.push_back(id);
        }
    }

    for (const auto& id : interrupted) {
        std::vector<std::string> in_flight;
        for (const auto& record : sessions_.at(id).files) {
            if (record.status == FileStatus::Transferring || record.status == FileStatus::Verifying) {
                in_flight.push_back(record.source_path);
            }
        }

        for (const auto& source_path : in_flight) {
            Entry entry;
            entry.op = Entry::Op::UpdateFile;
            entry.session_id = id;
            entry.source_path = source_path;
            entry.file_patch.status = FileStatus::Error;
            entry.file_patch.error_kind = FileErrorKind::Other;
            entry.file_patch.error_message = kInterrupted;
            if (auto result = commit(entry); result.is_error()) {
                throw StoreIoError("Cannot record interrupted file: " + result.error().message);
            }
        }

        Entry entry;
        entry.op = Entry::Op::UpdateSession;
        entry.session_id = id;
        entry.session_patch.status = SessionStatus::Error;
        entry.session_patch.end_time = Clock::now();
        entry.session_patch.error_message = kInterrupted;
        if (auto result = commit(entry); result.is_error()) {
            throw StoreIoError("Cannot close interrupted session: " + result.error().message);
        }

        ++recovered_sessions_;
        spdlog::warn("[Store] session={} was interrupted; marked error files_in_flight={}", id, in_flight.size());
    }
}

// ============================================================================
// Mutations
// ============================================================================

Result<std::string> SessionStore::create_session(TransferSession session) {
    std::lock_guard write_lock(write_mutex_);

    if (session.id.empty()) {
        do {
            session.id = generate_session_id();
        } while (sessions_.count(session.id) > 0);
    } else if (sessions_.count(session.id) > 0) {
        return Err<std::string>(ErrorCode::Validation, "Session already exists: " + session.id);
    }

    if (is_terminal(session.status)) {
        return Err<std::string>(ErrorCode::Validation,
            std::string("Cannot create a session in terminal status ") + to_string(session.status));
    }
    if (session.status == SessionStatus::Transferring && device_busy(session.device_id, session.id)) {
        return Err<std::string>(ErrorCode::InvalidState,
            "Device " + session.device_id + " already has a transfer in progress");
    }

    std::unordered_set<std::string> seen;
    seen.reserve(session.files.size());
    session.total_bytes = 0;
    for (const auto& record : session.files) {
        if (!seen.insert(record.source_path).second) {
            return Err<std::string>(ErrorCode::Validation, "Duplicate file in session: " + record.source_path);
        }
        if (record.checksum && !(record.status == FileStatus::Complete && record.checksum_verified)) {
            return Err<std::string>(ErrorCode::Validation,
                "Checksum stored on an unverified record: " + record.source_path);
        }
        session.total_bytes += record.size_bytes;
    }
    session.file_count = session.files.size();

    Entry entry;
    entry.op = Entry::Op::CreateSession;
    entry.session_id = session.id;
    entry.session = std::move(session);

    if (auto result = commit(entry); result.is_error()) {
        return Err<std::string>(result.error());
    }

    spdlog::debug("[Store] created session={} device={} files={}",
                  entry.session_id, entry.session.device_id, entry.session.file_count);
    return Ok(entry.session_id);
}

Result<void> SessionStore::add_file(const std::string& session_id, FileTransferRecord record) {
    std::lock_guard write_lock(write_mutex_);

    const auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return Err<void>(Error{ErrorCode::NotFound, "Unknown session: " + session_id});
    }
    if (is_terminal(it->second.status)) {
        return Err<void>(Error{ErrorCode::InvalidState, "Session is finished: " + session_id});
    }
    if (find_record(session_id, record.source_path) != nullptr) {
        return Err<void>(Error{ErrorCode::Validation, "File already recorded: " + record.source_path});
    }
    if (record.checksum && !(record.status == FileStatus::Complete && record.checksum_verified)) {
        return Err<void>(Error{ErrorCode::Validation, "Checksum stored on an unverified record: " + record.source_path});
    }

    Entry entry;
    entry.op = Entry::Op::AddFile;
    entry.session_id = session_id;
    entry.record = std::move(record);
    return commit(entry);
}

Result<void> SessionStore::update_file_status(const std::string& session_id,
                                              const std::string& source_path,
                                              const FilePatch& patch) {
    std::lock_guard write_lock(write_mutex_);

    const auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return Err<void>(Error{ErrorCode::NotFound, "Unknown session: " + session_id});
    }
    if (is_terminal(it->second.status)) {
        return Err<void>(Error{ErrorCode::InvalidState, "Session is finished: " + session_id});
    }
    const FileTransferRecord* current = find_record(session_id, source_path);
    if (current == nullptr) {
        return Err<void>(Error{ErrorCode::NotFound, "Unknown file in session " + session_id + ": " + source_path});
    }
    if (is_final(current->status)) {
        return Err<void>(Error{ErrorCode::InvalidState,
            std::string("File is already ") + to_string(current->status) + ": " + source_path});
    }

    FileTransferRecord updated = *current;
    apply_patch(updated, patch);
    if (updated.checksum && !(updated.status == FileStatus::Complete && updated.checksum_verified)) {
        return Err<void>(Error{ErrorCode::Validation, "Checksum stored on an unverified record: " + source_path});
    }

    Entry entry;
    entry.op = Entry::Op::UpdateFile;
    entry.session_id = session_id;
    entry.source_path = source_path;
    entry.file_patch = patch;
    return commit(entry);
}

Result<void> SessionStore::update_session(const std::string& session_id, const SessionPatch& patch) {
    std::lock_guard write_lock(write_mutex_);

    const auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return Err<void>(Error{ErrorCode::NotFound, "Unknown session: " + session_id});
    }
    const TransferSession& session = it->second;
    if (is_terminal(session.status)) {
        return Err<void>(Error{ErrorCode::InvalidState,
            std::string("Session is already ") + to_string(session.status) + ": " + session_id});
    }
    if (patch.status) {
        if (!is_legal_transition(session.status, *patch.status)) {
            return Err<void>(Error{ErrorCode::InvalidState,
                std::string("Illegal session transition ") + to_string(session.status)
                + " -> " + to_string(*patch.status)});
        }
        if (*patch.status == SessionStatus::Transferring
            && session.status != SessionStatus::Transferring
            && device_busy(session.device_id, session_id)) {
            return Err<void>(Error{ErrorCode::InvalidState,
                "Device " + session.device_id + " already has a transfer in progress"});
        }
    }

    Entry entry;
    entry.op = Entry::Op::UpdateSession;
    entry.session_id = session_id;
    entry.session_patch = patch;
    return commit(entry);
}

Result<std::size_t> SessionStore::delete_sessions_older_than(TimePoint cutoff) {
    std::lock_guard write_lock(write_mutex_);

    std::vector<TransferSession> kept;
    std::vector<std::string> doomed;
    for (const auto& [id, session] : sessions_) {
        if (is_terminal(session.status) && session.start_time < cutoff) {
            doomed.push_back(id);
        } else {
            kept.push_back(session);
        }
    }
    if (doomed.empty()) {
        return Ok(std::size_t{0});
    }

    if (auto result = rewrite_journal(sorted_newest_first(kept)); result.is_error()) {
        return Err<std::size_t>(result.error());
    }

    {
        std::unique_lock state_lock(state_mutex_);
        for (const auto& id : doomed) {
            sessions_.erase(id);
            file_index_.erase(id);
            sequence_.erase(id);
        }
        journal_entries_ = sessions_.size();
    }

    spdlog::info("[Store] deleted {} session(s) older than retention cutoff", doomed.size());
    return Ok(doomed.size());
}

Result<void> SessionStore::clear() {
    std::lock_guard write_lock(write_mutex_);

    if (auto result = rewrite_journal({}); result.is_error()) {
        return result;
    }

    std::unique_lock state_lock(state_mutex_);
    sessions_.clear();
    file_index_.clear();
    sequence_.clear();
    journal_entries_ = 0;
    spdlog::info("[Store] cleared all sessions");
    return Ok();
}

// ============================================================================
// Queries
// ============================================================================

Result<TransferSession> SessionStore::get_session(const std::string& session_id) const {
    std::shared_lock state_lock(state_mutex_);
    const auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return Err<TransferSession>(ErrorCode::NotFound, "Unknown session: " + session_id);
    }
    return Ok(it->second);
}

std::vector<TransferSession> SessionStore::get_all_sessions() const {
    std::vector<TransferSession> all;
    {
        std::shared_lock state_lock(state_mutex_);
        all.reserve(sessions_.size());
        for (const auto& [id, session] : sessions_) {
            all.push_back(session);
        }
    }
    return sorted_newest_first(std::move(all));
}

std::vector<TransferSession> SessionStore::sessions_in_range(TimePoint from, TimePoint to) const {
    std::vector<TransferSession> matching;
    {
        std::shared_lock state_lock(state_mutex_);
        for (const auto& [id, session] : sessions_) {
            if (session.start_time >= from && session.start_time <= to) {
                matching.push_back(session);
            }
        }
    }
    return sorted_newest_first(std::move(matching));
}

std::vector<TransferSession> SessionStore::sessions_with_status(SessionStatus status) const {
    std::vector<TransferSession> matching;
    {
        std::shared_lock state_lock(state_mutex_);
        for (const auto& [id, session] : sessions_) {
            if (session.status == status) {
                matching.push_back(session);
            }
        }
    }
    return sorted_newest_first(std::move(matching));
}

Result<std::vector<FileTransferRecord>> SessionStore::files_with_status(const std::string& session_id,
                                                                       FileStatus status) const {
    std::shared_lock state_lock(state_mutex_);
    const auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return Err<std::vector<FileTransferRecord>>(ErrorCode::NotFound, "Unknown session: " + session_id);
    }

    std::vector<FileTransferRecord> matching;
    for (const auto& record : it->second.files) {
        if (record.status == status) {
            matching.push_back(record);
        }
    }
    return Ok(std::move(matching));
}

StoreStats SessionStore::stats() const {
    std::shared_lock state_lock(state_mutex_);
    StoreStats stats;
    stats.sessions = sessions_.size();
    stats.journal_entries = journal_entries_;
    for (const auto& [id, session] : sessions_) {
        if (!is_terminal(session.status)) {
            ++stats.active_sessions;
        }
        stats.files += session.files.size();
        for (const auto& record : session.files) {
            if (record.status == FileStatus::Complete) {
                ++stats.complete_files;
                stats.bytes_transferred += record.size_bytes;
            } else if (record.status == FileStatus::Error) {
                ++stats.failed_files;
            }
        }
    }
    return stats;
}

// ============================================================================
// Internals
// ============================================================================

Result<void> SessionStore::commit(const Entry& entry) {
    if (journal_path_) {
        json line;
        switch (entry.op) {
            case Entry::Op::CreateSession:
                line = json{{"op", "create_session"}, {"session", entry.session}};
                break;
            case Entry::Op::AddFile:
                line = json{{"op", "add_file"}, {"session_id", entry.session_id}, {"record", entry.record}};
                break;
            case Entry::Op::UpdateFile:
                line = json{{"op", "update_file"}, {"session_id", entry.session_id},
                            {"source_path", entry.source_path}, {"patch", patch_to_json(entry.file_patch)}};
                break;
            case Entry::Op::UpdateSession:
                line = json{{"op", "update_session"}, {"session_id", entry.session_id},
                            {"patch", patch_to_json(entry.session_patch)}};
                break;
        }

        if (auto result = append_line(line.dump() + "\n"); result.is_error()) {
            spdlog::error("[Store] {}", result.error().message);
            return result;
        }
    }

    std::unique_lock state_lock(state_mutex_);
    apply(entry);
    ++journal_entries_;
    return Ok();
}

Result<void> SessionStore::append_line(const std::string& line) {
    if (failed_) {
        return Err<void>(Error{ErrorCode::Store, "Journal is in an unknown state; refusing to append"});
    }
    if (journal_fd_ < 0) {
        return Err<void>(Error{ErrorCode::Store, "Journal is not open"});
    }

    const off_t end = ::lseek(journal_fd_, 0, SEEK_END);
    if (end < 0) {
        return Err<void>(Error{ErrorCode::Store, std::string("journal seek failed: ") + std::strerror(errno)});
    }

    auto written = write_all(journal_fd_, line);
    if (written.is_ok()) {
        return written;
    }

    // Cut off whatever part of the line landed so the next entry starts on a clean line.
    if (::ftruncate(journal_fd_, end) != 0 || ::fsync(journal_fd_) != 0) {
        failed_ = true;
        spdlog::error("[Store] cannot roll back partial journal entry at offset {}: {}", end, std::strerror(errno));
    }
    return written;
}

Result<void> SessionStore::rewrite_journal(const std::vector<TransferSession>& sessions) {
    if (!journal_path_) {
        return Ok();
    }

    // Oldest first so replay assigns the same insertion order.
    std::string content;
    for (auto it = sessions.rbegin(); it != sessions.rend(); ++it) {
        content += json{{"op", "create_session"}, {"session", *it}}.dump();
        content += '\n';
    }

    fs::path temp_path = *journal_path_;
    temp_path += ".tmp";

    const int fd = ::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return Err<void>(Error{ErrorCode::Store, "Cannot create " + temp_path.string() + ": " + std::strerror(errno)});
    }
    auto written = write_all(fd, content);
    ::close(fd);
    if (written.is_error()) {
        std::error_code ec;
        fs::remove(temp_path, ec);
        return written;
    }

    if (::rename(temp_path.c_str(), journal_path_->c_str()) != 0) {
        const std::string reason = std::strerror(errno);
        std::error_code ec;
        fs::remove(temp_path, ec);
        return Err<void>(Error{ErrorCode::Store, "Cannot replace journal: " + reason});
    }
    fsync_directory(journal_path_->parent_path().empty() ? fs::path(".") : journal_path_->parent_path());

    const int reopened = ::open(journal_path_->c_str(), O_WRONLY | O_APPEND | O_CLOEXEC);
    const int open_error = errno;
    if (journal_fd_ >= 0) {
        ::close(journal_fd_);
        journal_fd_ = -1;
    }
    if (reopened < 0) {
        // The old descriptor points at the replaced file; appending there would be lost.
        failed_ = true;
        spdlog::error("[Store] cannot reopen rewritten journal: {}", std::strerror(open_error));
        return Err<void>(Error{ErrorCode::Store, "Cannot reopen journal: " + std::string(std::strerror(open_error))});
    }
    journal_fd_ = reopened;
    failed_ = false;
    return Ok();
}

void SessionStore::apply(const Entry& entry) {
    switch (entry.op) {
        case Entry::Op::CreateSession:
            sessions_[entry.session_id] = entry.session;
            sequence_[entry.session_id] = next_sequence_++;
            index_files(entry.session);
            break;
        case Entry::Op::AddFile: {
            auto& session = sessions_.at(entry.session_id);
            file_index_[entry.session_id][entry.record.source_path] = session.files.size();
            session.files.push_back(entry.record);
            session.file_count = session.files.size();
            session.total_bytes += entry.record.size_bytes;
            break;
        }
        case Entry::Op::UpdateFile: {
            const auto& index = file_index_.at(entry.session_id);
            const auto slot = index.find(entry.source_path);
            if (slot != index.end()) {
                apply_patch(sessions_.at(entry.session_id).files[slot->second], entry.file_patch);
            }
            break;
        }
        case Entry::Op::UpdateSession:
            apply_patch(sessions_.at(entry.session_id), entry.session_patch);
            break;
    }
}

void SessionStore::index_files(const TransferSession& session) {
    auto& index = file_index_[session.id];
    index.clear();
    index.reserve(session.files.size());
    for (std::size_t i = 0; i < session.files.size(); ++i) {
        index.emplace(session.files[i].source_path, i);
    }
}

const FileTransferRecord* SessionStore::find_record(const std::string& session_id,
                                                    const std::string& source_path) const {
    const auto index = file_index_.find(session_id);
    if (index == file_index_.end()) {
        return nullptr;
    }
    const auto slot = index->second.find(source_path);
    if (slot == index->second.end()) {
        return nullptr;
    }
    return &sessions_.at(session_id).files[slot->second];
}

std::vector<TransferSession> SessionStore::sorted_newest_first(std::vector<TransferSession> sessions) const {
    // Callers must not hold state_mutex_.
    std::shared_lock state_lock(state_mutex_);
    std::stable_sort(sessions.begin(), sessions.end(),
                     [this](const TransferSession& a, const TransferSession& b) {
                         if (a.start_time != b.start_time) {
                             return a.start_time > b.start_time;
                         }
                         const auto sa = sequence_.find(a.id);
                         const auto sb = sequence_.find(b.id);
                         const std::uint64_t qa = sa == sequence_.end() ? 0 : sa->second;
                         const std::uint64_t qb = sb == sequence_.end() ? 0 : sb->second;
                         return qa > qb;
                     });
    return sessions;
}

bool SessionStore::device_busy(const std::string& device_id, const std::string& except_id) const {
    if (device_id.empty()) {
        return false;
    }
    return std::any_of(sessions_.begin(), sessions_.end(), [&](const auto& item) {
        return item.first != except_id
            && item.second.device_id == device_id
            && item.second.status == SessionStatus::Transferring;
    });
}

} // namespace ingest::store
