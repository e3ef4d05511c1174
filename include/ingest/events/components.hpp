/**
 * @file components.hpp
 * @brief Ready-made subscribers for ingest events
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // every session, file and device event is now logged and counted
 */

#pragma once

#include "ingest/events/event_bus.hpp"
#include "ingest/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <vector>

namespace ingest::events {

/**
 * @brief Logs every ingest event with spdlog
 *
 * Progress snapshots are logged at debug level only.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) {
        subscriptions_.push_back(bus.subscribe_scoped<DeviceAddedEvent>(
            [](const DeviceAddedEvent& e) {
                spdlog::info("[DeviceAdded] id={} name={} bus={} mounts={}",
                             e.device.id, e.device.display_name, to_string(e.device.bus_class),
                             e.device.mount_points.size());
            }));

        subscriptions_.push_back(bus.subscribe_scoped<DeviceRemovedEvent>(
            [](const DeviceRemovedEvent& e) {
                spdlog::info("[DeviceRemoved] id={} name={}", e.device.id, e.device.display_name);
            }));

        subscriptions_.push_back(bus.subscribe_scoped<SessionStartedEvent>(
            [](const SessionStartedEvent& e) {
                spdlog::info("[SessionStarted] session={} device={} files={} bytes={} skipped={}",
                             e.session_id, e.device_id, e.file_count, e.total_bytes, e.skipped_files);
            }));

        subscriptions_.push_back(bus.subscribe_scoped<SessionPausedEvent>(
            [](const SessionPausedEvent& e) {
                spdlog::info("[SessionPaused] session={} pending={}", e.session_id, e.pending_files);
            }));

        subscriptions_.push_back(bus.subscribe_scoped<SessionResumedEvent>(
            [](const SessionResumedEvent& e) {
                spdlog::info("[SessionResumed] session={} pending={}", e.session_id, e.pending_files);
            }));

        subscriptions_.push_back(bus.subscribe_scoped<SessionFinishedEvent>(
            [](const SessionFinishedEvent& e) {
                if (e.status == SessionStatus::Error) {
                    spdlog::warn("[SessionFinished] session={} status={} completed={} failed={} reason={}",
                                 e.session_id, to_string(e.status), e.completed_files,
                                 e.failed_files, e.error_message);
                    return;
                }
                spdlog::info("[SessionFinished] session={} status={} completed={} skipped={} bytes={} duration={}ms",
                             e.session_id, to_string(e.status), e.completed_files, e.skipped_files,
                             e.bytes_transferred, e.duration.count());
            }));

        subscriptions_.push_back(bus.subscribe_scoped<TransferProgressEvent>(
            [](const TransferProgressEvent& e) {
                spdlog::debug("[Progress] session={} bytes={}/{} pct={:.1f} files={}/{} active={}",
                              e.session_id, e.bytes_transferred, e.total_bytes, e.percentage,
                              e.completed_count, e.total_files, e.active_files.size());
            }));

        subscriptions_.push_back(bus.subscribe_scoped<FileCompletedEvent>(
            [](const FileCompletedEvent& e) {
                spdlog::info("[FileCompleted] session={} path={} bytes={} checksum={} duration={}ms",
                             e.session_id, e.record.destination_path, e.record.size_bytes,
                             e.record.checksum.value_or("-"), e.duration.count());
            }));

        subscriptions_.push_back(bus.subscribe_scoped<FileFailedEvent>(
            [](const FileFailedEvent& e) {
                spdlog::warn("[FileFailed] session={} path={} kind={} error={}",
                             e.session_id, e.record.source_path,
                             e.record.error_kind ? to_string(*e.record.error_kind) : "other",
                             e.record.error_message);
            }));
    }

private:
    std::vector<Subscription> subscriptions_;
};

/**
 * @brief Counts transfers and device activity
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // later
 * metrics.print_stats();
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<std::uint64_t> sessions_started{0};
        std::atomic<std::uint64_t> sessions_completed{0};
        std::atomic<std::uint64_t> sessions_failed{0};
        std::atomic<std::uint64_t> sessions_cancelled{0};
        std::atomic<std::uint64_t> files_completed{0};
        std::atomic<std::uint64_t> files_failed{0};
        std::atomic<std::uint64_t> bytes_completed{0};
        std::atomic<std::uint64_t> progress_events{0};
        std::atomic<std::uint64_t> devices_added{0};
        std::atomic<std::uint64_t> devices_removed{0};
    };

    explicit MetricsComponent(EventBus& bus) {
        subscriptions_.push_back(bus.subscribe_scoped<SessionStartedEvent>(
            [this](const SessionStartedEvent&) { stats_.sessions_started++; }));

        subscriptions_.push_back(bus.subscribe_scoped<SessionFinishedEvent>(
            [this](const SessionFinishedEvent& e) { on_session_finished(e); }));

        subscriptions_.push_back(bus.subscribe_scoped<FileCompletedEvent>(
            [this](const FileCompletedEvent& e) {
                stats_.files_completed++;
                stats_.bytes_completed += e.record.size_bytes;
            }));

        subscriptions_.push_back(bus.subscribe_scoped<FileFailedEvent>(
            [this](const FileFailedEvent&) { stats_.files_failed++; }));

        subscriptions_.push_back(bus.subscribe_scoped<TransferProgressEvent>(
            [this](const TransferProgressEvent&) { stats_.progress_events++; }));

        subscriptions_.push_back(bus.subscribe_scoped<DeviceAddedEvent>(
            [this](const DeviceAddedEvent&) { stats_.devices_added++; }));

        subscriptions_.push_back(bus.subscribe_scoped<DeviceRemovedEvent>(
            [this](const DeviceRemovedEvent&) { stats_.devices_removed++; }));
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Ingest Statistics:");
        spdlog::info("  Sessions started:   {}", stats_.sessions_started.load());
        spdlog::info("  Sessions complete:  {}", stats_.sessions_completed.load());
        spdlog::info("  Sessions failed:    {}", stats_.sessions_failed.load());
        spdlog::info("  Sessions cancelled: {}", stats_.sessions_cancelled.load());
        spdlog::info("  Files completed:    {}", stats_.files_completed.load());
        spdlog::info("  Files failed:       {}", stats_.files_failed.load());
        spdlog::info("  Bytes completed:    {}", stats_.bytes_completed.load());
        spdlog::info("  Devices added:      {}", stats_.devices_added.load());
        spdlog::info("  Devices removed:    {}", stats_.devices_removed.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    void on_session_finished(const SessionFinishedEvent& e) {
        switch (e.status) {
            case SessionStatus::Complete:
                stats_.sessions_completed++;
                break;
            case SessionStatus::Cancelled:
                stats_.sessions_cancelled++;
                break;
            default:
                stats_.sessions_failed++;
                break;
        }
    }

    Stats stats_;
    std::vector<Subscription> subscriptions_;
};

} // namespace ingest::events
