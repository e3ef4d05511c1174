#pragma once

#include "ingest/core/config.hpp"
#include "ingest/core/result.hpp"
#include "ingest/core/types.hpp"
#include "ingest/events/event_bus.hpp"
#include "ingest/events/events.hpp"
#include "ingest/path/path_resolver.hpp"
#include "ingest/store/session_store.hpp"
#include "ingest/transfer/file_copier.hpp"
#include "ingest/transfer/progress_throttle.hpp"

#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ingest::transfer {

/**
 * @brief Everything start() needs to open a session
 */
struct SessionSpec {
    std::string device_id;                 ///< Defaults to source_root when empty
    std::optional<std::string> device_name;
    std::filesystem::path source_root;
    std::filesystem::path destination_root;
    std::vector<std::filesystem::path> files;

    std::optional<ConflictPolicy> conflict_policy;     ///< Defaults to the configured policy
    std::map<std::string, ConflictPolicy> decisions;   ///< Per source path, answers to an ask
};

enum class EngineState {
    Idle,
    Transferring,
    Paused
};

const char* to_string(EngineState state) noexcept;

/**
 * @brief Runs one transfer session at a time on a bounded worker pool
 *
 *   idle -> transferring <-> paused -> complete | error | cancelled -> idle
 *
 * Every record is in the SessionStore before the first worker starts, and
 * each state change of a file is committed there as it happens. Progress
 * and outcomes go out on the EventBus from worker threads. The
 * SessionFinishedEvent is delivered before the engine returns to idle.
 */
class TransferEngine {
public:
    TransferEngine(IngestConfig config,
                   store::SessionStore& store,
                   events::EventBus& bus,
                   std::shared_ptr<FileCopier> copier = std::make_shared<FileCopier>());
    ~TransferEngine();

    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    /// Resolves, records and schedules @p spec. Returns the new session id.
    Result<std::string> start(SessionSpec spec);

    /// Stops dequeuing; the session turns paused once in-flight files finish.
    Result<void> pause();

    /// Re-enqueues the records still pending.
    Result<void> resume();

    /// Aborts in-flight copies at their next chunk; complete files are kept.
    Result<void> cancel();

    /**
     * @brief Starts a new session for transient failures of the last session
     *
     * Only files whose record ended with a network or drive_disconnected
     * error qualify. An empty list selects every qualifying file.
     */
    Result<std::string> retry(const std::vector<std::filesystem::path>& files = {});

    [[nodiscard]] bool is_transferring() const;
    [[nodiscard]] EngineState state() const;
    [[nodiscard]] std::optional<std::string> current_session_id() const;
    [[nodiscard]] std::optional<std::string> last_session_id() const;

    /// Blocks until the engine is no longer transferring (idle or paused).
    void wait();
    bool wait_for(std::chrono::milliseconds timeout);

    [[nodiscard]] const IngestConfig& config() const noexcept { return config_; }

private:
    struct Job {
        std::string source_path;
        std::filesystem::path destination;
        std::string file_name;
        std::uint64_t size = 0;
    };

    Result<std::string> launch(TransferSession session, std::size_t skipped);
    void schedule_locked(std::unique_lock<std::mutex>& lock);
    void worker_loop();
    void run_job(const Job& job);
    void finish_run();
    void abort_pending();
    void finalize(SessionStatus status, std::string message);

    void update_record(const std::string& source_path, const store::FilePatch& patch);
    void report_progress(const Job& job, std::uint64_t bytes, std::chrono::milliseconds interval);
    void emit_progress_now();
    events::TransferProgressEvent snapshot_locked() const;
    [[nodiscard]] FileTransferRecord record_copy(const std::string& source_path) const;

    IngestConfig config_;
    store::SessionStore& store_;
    events::EventBus& bus_;
    std::shared_ptr<FileCopier> copier_;
    path::PathResolver resolver_;
    boost::asio::thread_pool pool_;

    std::mutex launch_mutex_;

    mutable std::mutex mutex_;
    std::condition_variable state_cv_;
    EngineState state_ = EngineState::Idle;
    std::string session_id_;
    std::optional<std::string> last_session_id_;
    std::deque<Job> queue_;
    std::vector<std::string> order_;
    std::map<std::string, FileTransferRecord> records_;
    std::size_t active_workers_ = 0;
    bool pause_requested_ = false;
    bool cancel_requested_ = false;
    bool abort_requested_ = false;
    std::atomic<bool> stop_{false};
    std::chrono::steady_clock::time_point run_started_{};

    mutable std::mutex progress_mutex_;
    std::string progress_session_id_;
    ProgressThrottle throttle_;
    std::map<std::string, events::ActiveFileProgress> active_;
    std::vector<std::string> completed_files_;
    std::uint64_t completed_bytes_ = 0;
    std::uint64_t total_bytes_ = 0;
    std::size_t total_files_ = 0;
};

} // namespace ingest::transfer
