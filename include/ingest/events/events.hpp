/**
 * @file events.hpp
 * @brief Events published by the ingest services
 *
 * NAMING CONVENTION:
 * Events are past-tense facts (SessionStartedEvent, FileCompletedEvent).
 * Progress events are snapshots; consumers must tolerate coalesced or
 * skipped intermediate snapshots.
 */

#pragma once

#include "ingest/core/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace ingest::events {

// ════════════════════════════════════════════════════════
// Device Events
// ════════════════════════════════════════════════════════

/**
 * @brief A device appeared, or reappeared with different mount points
 *
 * WHO EMITS: DeviceScanner polling loop
 */
struct DeviceAddedEvent {
    Device device;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief A device vanished, or is about to be re-added after a remount
 */
struct DeviceRemovedEvent {
    Device device;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Session Events
// ════════════════════════════════════════════════════════

struct SessionStartedEvent {
    std::string session_id;
    std::string device_id;
    std::size_t file_count = 0;
    std::uint64_t total_bytes = 0;
    std::size_t skipped_files = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct SessionPausedEvent {
    std::string session_id;
    std::size_t pending_files = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct SessionResumedEvent {
    std::string session_id;
    std::size_t pending_files = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Terminal outcome of a session: complete, error or cancelled
 */
struct SessionFinishedEvent {
    std::string session_id;
    SessionStatus status = SessionStatus::Complete;
    std::size_t completed_files = 0;
    std::size_t failed_files = 0;
    std::size_t skipped_files = 0;
    std::uint64_t bytes_transferred = 0;
    std::chrono::milliseconds duration{0};
    std::string error_message;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Transfer Events
// ════════════════════════════════════════════════════════

struct ActiveFileProgress {
    std::string source_path;
    std::string file_name;
    std::uint64_t bytes_transferred = 0;
    std::uint64_t size_bytes = 0;
    double percentage = 0.0;
};

/**
 * @brief Coalesced snapshot of a running session
 *
 * Emitted at most once per configured progress interval, plus once after
 * each file finishes.
 */
struct TransferProgressEvent {
    std::string session_id;
    std::vector<ActiveFileProgress> active_files;
    std::uint64_t bytes_transferred = 0;
    std::uint64_t total_bytes = 0;
    double percentage = 0.0;
    std::size_t completed_count = 0;
    std::size_t total_files = 0;
    std::vector<std::string> completed_files;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct FileCompletedEvent {
    std::string session_id;
    FileTransferRecord record;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct FileFailedEvent {
    std::string session_id;
    FileTransferRecord record;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace ingest::events
