#pragma once

/**
 * @file session_store.hpp
 * @brief Durable record of every transfer session and its files
 *
 * WHAT PROBLEM IT SOLVES:
 * - Transfer workers update file records from several threads at once
 * - A crash mid-transfer must leave the history consistent with the last
 *   completed update, never a half-written one
 * - The history view needs newest-first listing and status/date queries
 *
 * HOW IT WORKS:
 * Every mutating call is one journal line (JSON) appended and fsync'ed
 * before the in-memory maps change. Opening the store replays the journal.
 * A torn final line (the crash happened mid-write) is truncated; any other
 * unreadable line means the journal is corrupted and the constructor throws.
 *
 * THREAD SAFETY PATTERN:
 * - One writer at a time (write_mutex_), held across validate + write + apply
 * - Readers take a shared lock on the in-memory state only
 *
 * INVARIANTS ENFORCED HERE:
 * - A session's records are append-only by source path
 * - Session status only moves along legal transitions; terminal is final
 * - At most one transferring session per device id
 * - A checksum is only stored on a complete, verified record
 */

#include "ingest/core/result.hpp"
#include "ingest/core/types.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace ingest::store {

/// Thrown when a journal line other than the last cannot be parsed.
class StoreCorruptedError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Thrown when the journal cannot be opened or read.
class StoreIoError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Partial update of one FileTransferRecord; unset fields are kept
 */
struct FilePatch {
    std::optional<std::string> destination_path;
    std::optional<FileStatus> status;
    std::optional<std::uint64_t> bytes_transferred;
    std::optional<double> percentage;
    std::optional<std::string> checksum;
    std::optional<bool> checksum_verified;
    std::optional<FileErrorKind> error_kind;
    std::optional<std::string> error_message;
    std::optional<TimePoint> started_at;
    std::optional<TimePoint> completed_at;
};

struct SessionPatch {
    std::optional<SessionStatus> status;
    std::optional<TimePoint> end_time;
    std::optional<std::string> error_message;
    std::optional<std::string> manifest_path;
};

struct StoreStats {
    std::size_t sessions = 0;
    std::size_t active_sessions = 0;      ///< transferring or paused
    std::size_t files = 0;
    std::size_t complete_files = 0;
    std::size_t failed_files = 0;
    std::uint64_t bytes_transferred = 0;
    std::size_t journal_entries = 0;
};

class SessionStore {
public:
    /// Memory-only store; nothing survives the process.
    SessionStore();

    /**
     * @brief Opens (or creates) the journal at @p journal_path and replays it
     *
     * Sessions still transferring from a previous run are closed as error
     * ("interrupted") before the constructor returns.
     *
     * @throws StoreCorruptedError on an unreadable journal line
     * @throws StoreIoError when the journal cannot be opened
     */
    explicit SessionStore(std::filesystem::path journal_path);
    ~SessionStore();

    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

    /// Generates an id when session.id is empty. Returns the stored id.
    Result<std::string> create_session(TransferSession session);

    Result<void> add_file(const std::string& session_id, FileTransferRecord record);

    Result<void> update_file_status(const std::string& session_id,
                                    const std::string& source_path,
                                    const FilePatch& patch);

    Result<void> update_session(const std::string& session_id, const SessionPatch& patch);

    [[nodiscard]] Result<TransferSession> get_session(const std::string& session_id) const;

    /// Newest first.
    [[nodiscard]] std::vector<TransferSession> get_all_sessions() const;

    /// Sessions whose start_time lies in [from, to], newest first.
    [[nodiscard]] std::vector<TransferSession> sessions_in_range(TimePoint from, TimePoint to) const;
    [[nodiscard]] std::vector<TransferSession> sessions_with_status(SessionStatus status) const;

    [[nodiscard]] Result<std::vector<FileTransferRecord>> files_with_status(const std::string& session_id,
                                                                            FileStatus status) const;

    /// Drops finished sessions that started before @p cutoff. Returns how many went.
    Result<std::size_t> delete_sessions_older_than(TimePoint cutoff);

    Result<void> clear();

    [[nodiscard]] StoreStats stats() const;

    [[nodiscard]] bool is_persistent() const noexcept { return journal_path_.has_value(); }
    [[nodiscard]] std::size_t recovered_sessions() const noexcept { return recovered_sessions_; }

private:
    struct Entry;

    void replay();
    void recover_interrupted();

    /// Journal, then apply. Caller holds write_mutex_.
    Result<void> commit(const Entry& entry);
    Result<void> append_line(const std::string& line);
    Result<void> rewrite_journal(const std::vector<TransferSession>& sessions);
    void apply(const Entry& entry);
    void index_files(const TransferSession& session);
    [[nodiscard]] const FileTransferRecord* find_record(const std::string& session_id,
                                                        const std::string& source_path) const;

    std::vector<TransferSession> sorted_newest_first(std::vector<TransferSession> sessions) const;
    [[nodiscard]] bool device_busy(const std::string& device_id, const std::string& except_id) const;

    std::optional<std::filesystem::path> journal_path_;
    int journal_fd_ = -1;
    bool failed_ = false;                             ///< Journal state unknown; commits refused

    std::mutex write_mutex_;
    mutable std::shared_mutex state_mutex_;
    std::map<std::string, TransferSession> sessions_;
    std::map<std::string, std::unordered_map<std::string, std::size_t>> file_index_;   ///< source path -> files[]
    std::map<std::string, std::uint64_t> sequence_;   ///< Insertion order, breaks start_time ties
    std::uint64_t next_sequence_ = 0;
    std::size_t journal_entries_ = 0;
    std::size_t recovered_sessions_ = 0;
};

void apply_patch(FileTransferRecord& record, const FilePatch& patch);
void apply_patch(TransferSession& session, const SessionPatch& patch);

/// "ses_<epoch-ms>_<8 hex>"
std::string generate_session_id();

} // namespace ingest::store
