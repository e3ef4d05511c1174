#include "ingest/transfer/transfer_engine.hpp"

#include "ingest/core/file_stat.hpp"
#include "ingest/core/retry.hpp"
#include "ingest/transfer/manifest.hpp"

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>
#include <system_error>

namespace ingest::transfer {
namespace fs = std::filesystem;

namespace {

constexpr const char* kAbortedMessage = "aborted after source device disconnected";
constexpr const char* kCancelledMessage = "Cancelled by user";

bool is_retryable(const FileTransferRecord& record) {
    return record.status == FileStatus::Error && record.error_kind
        && (*record.error_kind == FileErrorKind::Network || *record.error_kind == FileErrorKind::DriveDisconnected);
}

std::string failed_message(std::size_t failed) {
    return std::to_string(failed) + " file(s) failed";
}

} // namespace

const char* to_string(EngineState state) noexcept {
    switch (state) {
        case EngineState::Idle: return "idle";
        case EngineState::Transferring: return "transferring";
        case EngineState::Paused: return "paused";
    }
    return "unknown";
}

TransferEngine::TransferEngine(IngestConfig config,
                               store::SessionStore& store,
                               events::EventBus& bus,
                               std::shared_ptr<FileCopier> copier)
    : config_(std::move(config)),
      store_(store),
      bus_(bus),
      copier_(copier ? std::move(copier) : std::make_shared<FileCopier>()),
      resolver_(config_.path),
      pool_(std::clamp(config_.max_concurrency, kMinConcurrency, kMaxConcurrency)),
      throttle_(config_.progress_interval) {
    if (config_.buffer_tiers.empty()) {
        config_.buffer_tiers = default_buffer_tiers();
    }
}

TransferEngine::~TransferEngine() {
    bool active = false;
    {
        std::lock_guard lock(mutex_);
        active = state_ != EngineState::Idle;
    }
    if (active) {
        if (auto cancelled = cancel(); cancelled.is_error()) {
            spdlog::debug("[Transfer] cancel on shutdown: {}", cancelled.error().message);
        }
    }
    {
        std::unique_lock lock(mutex_);
        state_cv_.wait(lock, [this]() { return state_ == EngineState::Idle; });
    }
    pool_.join();
}

// ============================================================================
// Control
// ============================================================================

Result<std::string> TransferEngine::start(SessionSpec spec) {
    std::lock_guard launch_lock(launch_mutex_);
    {
        std::lock_guard lock(mutex_);
        if (state_ != EngineState::Idle) {
            return Err<std::string>(ErrorCode::InvalidState, "A transfer is already running");
        }
    }

    if (spec.files.empty()) {
        return Err<std::string>(ErrorCode::Validation, "No files to transfer");
    }
    if (spec.files.size() > kMaxFilesPerTransfer) {
        return Err<std::string>(ErrorCode::Validation,
            "Too many files in one transfer: " + std::to_string(spec.files.size()));
    }
    if (spec.source_root.empty() || spec.destination_root.empty()) {
        return Err<std::string>(ErrorCode::Validation, "Source and destination roots are required");
    }

    const ConflictPolicy policy = spec.conflict_policy.value_or(config_.conflict_policy);
    const fs::path source_root = path::normalize_root(spec.source_root);
    const fs::path destination_root = path::normalize_root(spec.destination_root);

    std::error_code ec;
    if (fs::is_directory(destination_root, ec)) {
        auto cleaned = cleanup_orphaned_parts(destination_root, config_.orphan_max_age);
        if (cleaned.is_error()) {
            spdlog::warn("[Transfer] orphan cleanup skipped: {}", cleaned.error().message);
        }
    }

    TransferSession session;
    session.device_id = spec.device_id.empty() ? source_root.string() : spec.device_id;
    session.device_name = spec.device_name.value_or("");
    session.source_root = source_root.string();
    session.destination_root = destination_root.string();
    session.start_time = Clock::now();
    session.status = SessionStatus::Transferring;

    std::set<std::string> seen;
    std::set<std::string> reserved;
    std::vector<std::string> unresolved;
    std::size_t skipped = 0;

    const auto taken = [&reserved](const fs::path& candidate) {
        std::error_code exists_ec;
        return reserved.count(candidate.string()) > 0 || fs::exists(fs::symlink_status(candidate, exists_ec));
    };
    const auto add_failed = [&session](FileTransferRecord record, FileErrorKind kind, std::string message) {
        record.status = FileStatus::Error;
        record.error_kind = kind;
        record.error_message = std::move(message);
        session.files.push_back(std::move(record));
    };

    for (const auto& file : spec.files) {
        const std::string source_path = file.string();
        if (!seen.insert(source_path).second) {
            spdlog::debug("[Transfer] dropping duplicate source={}", source_path);
            continue;
        }

        FileTransferRecord record;
        record.source_path = source_path;
        record.file_name = file.filename().string();

        const auto info = stat_path(file, true);
        if (info.is_error()) {
            add_failed(std::move(record), to_file_error_kind(info.error().code), info.error().message);
            continue;
        }
        if (info.value().type != EntryType::Regular) {
            add_failed(std::move(record), FileErrorKind::Other, "Not a regular file: " + source_path);
            continue;
        }
        record.size_bytes = info.value().size;

        const path::SourceFile source{file, spec.source_root, info.value().created_at, info.value().modified_at};
        const auto resolved = resolver_.resolve(source, destination_root, spec.device_name);
        fs::path destination = resolved.destination_path;
        record.file_name = resolved.file_name;

        std::error_code exists_ec;
        if (fs::exists(fs::symlink_status(destination, exists_ec))) {
            const auto decision = spec.decisions.find(source_path);
            const ConflictPolicy choice = decision != spec.decisions.end() ? decision->second : policy;

            if (choice == ConflictPolicy::Ask) {
                unresolved.push_back(source_path);
                continue;
            }
            if (choice == ConflictPolicy::Skip) {
                record.status = FileStatus::Skipped;
                record.destination_path = destination.string();
                session.files.push_back(std::move(record));
                ++skipped;
                continue;
            }
            if (choice == ConflictPolicy::Rename) {
                const auto unique = path::unique_destination(destination, taken);
                if (!unique) {
                    add_failed(std::move(record), FileErrorKind::Other, "No free name for " + destination.string());
                    continue;
                }
                destination = *unique;
            }
        }

        // Two sources flattened onto one name never overwrite each other.
        if (reserved.count(destination.string()) > 0) {
            const auto unique = path::unique_destination(destination, taken);
            if (!unique) {
                add_failed(std::move(record), FileErrorKind::Other, "No free name for " + destination.string());
                continue;
            }
            destination = *unique;
        }

        reserved.insert(destination.string());
        record.destination_path = destination.string();
        record.file_name = destination.filename().string();
        session.files.push_back(std::move(record));
    }

    if (!unresolved.empty()) {
        spdlog::info("[Transfer] start refused: {} conflict(s) need a decision", unresolved.size());
        return Err<std::string>(ErrorCode::Conflict,
            std::to_string(unresolved.size()) + " file(s) already exist and need a decision, first: " + unresolved.front());
    }

    return launch(std::move(session), skipped);
}

Result<void> TransferEngine::pause() {
    std::lock_guard lock(mutex_);
    if (state_ == EngineState::Paused) {
        return Err<void>(Error{ErrorCode::InvalidState, "Transfer is already paused"});
    }
    if (state_ != EngineState::Transferring || cancel_requested_ || abort_requested_) {
        return Err<void>(Error{ErrorCode::InvalidState, "No running transfer to pause"});
    }
    pause_requested_ = true;
    spdlog::info("[Transfer] pause requested session={} pending={}", session_id_, queue_.size());
    return Ok();
}

Result<void> TransferEngine::resume() {
    std::lock_guard launch_lock(launch_mutex_);
    std::unique_lock lock(mutex_);

    if (state_ == EngineState::Transferring && pause_requested_) {
        pause_requested_ = false;
        spdlog::info("[Transfer] pause withdrawn session={}", session_id_);
        return Ok();
    }
    if (state_ != EngineState::Paused || cancel_requested_) {
        return Err<void>(Error{ErrorCode::InvalidState, "Transfer is not paused"});
    }

    store::SessionPatch patch;
    patch.status = SessionStatus::Transferring;
    if (auto updated = store_.update_session(session_id_, patch); updated.is_error()) {
        return updated;
    }

    queue_.clear();
    for (const auto& source_path : order_) {
        const auto& record = records_.at(source_path);
        if (record.status == FileStatus::Pending) {
            queue_.push_back(Job{record.source_path, record.destination_path, record.file_name, record.size_bytes});
        }
    }
    state_ = EngineState::Transferring;

    const std::string session_id = session_id_;
    const std::size_t pending = queue_.size();
    spdlog::info("[Transfer] resumed session={} pending={}", session_id, pending);

    if (queue_.empty()) {
        lock.unlock();
        bus_.emit(events::SessionResumedEvent{session_id, pending});
        finish_run();
        return Ok();
    }

    schedule_locked(lock);
    lock.unlock();
    bus_.emit(events::SessionResumedEvent{session_id, pending});
    return Ok();
}

Result<void> TransferEngine::cancel() {
    std::unique_lock lock(mutex_);
    if (state_ == EngineState::Idle) {
        return Err<void>(Error{ErrorCode::InvalidState, "No active transfer to cancel"});
    }
    if (cancel_requested_) {
        return Ok();
    }

    cancel_requested_ = true;
    stop_.store(true);
    spdlog::info("[Transfer] cancel requested session={} state={}", session_id_, to_string(state_));

    if (state_ == EngineState::Paused) {
        lock.unlock();
        finalize(SessionStatus::Cancelled, kCancelledMessage);
    }
    return Ok();
}

Result<std::string> TransferEngine::retry(const std::vector<fs::path>& files) {
    std::lock_guard launch_lock(launch_mutex_);

    std::optional<std::string> previous_id;
    {
        std::lock_guard lock(mutex_);
        if (state_ != EngineState::Idle) {
            return Err<std::string>(ErrorCode::InvalidState, "A transfer is already running");
        }
        previous_id = last_session_id_;
    }
    if (!previous_id) {
        return Err<std::string>(ErrorCode::InvalidState, "No finished session to retry");
    }

    auto previous = store_.get_session(*previous_id);
    if (previous.is_error()) {
        return Err<std::string>(previous.error());
    }
    const TransferSession& original = previous.value();

    std::set<std::string> wanted;
    for (const auto& file : files) {
        wanted.insert(file.string());
    }

    TransferSession session;
    session.device_id = original.device_id;
    session.device_name = original.device_name;
    session.source_root = original.source_root;
    session.destination_root = original.destination_root;
    session.start_time = Clock::now();
    session.status = SessionStatus::Transferring;
    session.retry_of = original.id;

    for (const auto& record : original.files) {
        if (!wanted.empty() && wanted.count(record.source_path) == 0) {
            continue;
        }
        if (!is_retryable(record)) {
            spdlog::warn("[Transfer] not retryable source={} status={} kind={}", record.source_path,
                         to_string(record.status), record.error_kind ? to_string(*record.error_kind) : "none");
            continue;
        }

        FileTransferRecord fresh;
        fresh.source_path = record.source_path;
        fresh.destination_path = record.destination_path;
        fresh.file_name = record.file_name;
        fresh.size_bytes = record.size_bytes;
        if (const auto info = stat_path(record.source_path, true); info.is_ok()) {
            fresh.size_bytes = info.value().size;
        }
        session.files.push_back(std::move(fresh));
    }

    if (session.files.empty()) {
        return Err<std::string>(ErrorCode::Validation, "None of the requested files can be retried");
    }

    spdlog::info("[Transfer] retrying {} file(s) of session={}", session.files.size(), original.id);
    return launch(std::move(session), 0);
}

bool TransferEngine::is_transferring() const {
    std::lock_guard lock(mutex_);
    return state_ == EngineState::Transferring;
}

EngineState TransferEngine::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

std::optional<std::string> TransferEngine::current_session_id() const {
    std::lock_guard lock(mutex_);
    if (state_ == EngineState::Idle) {
        return std::nullopt;
    }
    return session_id_;
}

std::optional<std::string> TransferEngine::last_session_id() const {
    std::lock_guard lock(mutex_);
    return last_session_id_;
}

void TransferEngine::wait() {
    std::unique_lock lock(mutex_);
    state_cv_.wait(lock, [this]() { return state_ != EngineState::Transferring; });
}

bool TransferEngine::wait_for(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return state_cv_.wait_for(lock, timeout, [this]() { return state_ != EngineState::Transferring; });
}

// ============================================================================
// Scheduling
// ============================================================================

Result<std::string> TransferEngine::launch(TransferSession session, std::size_t skipped) {
    auto created = store_.create_session(session);
    if (created.is_error()) {
        spdlog::warn("[Transfer] cannot open session: {}", created.error().message);
        return created;
    }
    session.id = created.value();

    std::uint64_t work_bytes = 0;
    std::size_t work_files = 0;
    for (const auto& record : session.files) {
        if (record.status == FileStatus::Pending) {
            work_bytes += record.size_bytes;
            ++work_files;
        }
    }

    {
        std::lock_guard progress_lock(progress_mutex_);
        progress_session_id_ = session.id;
        throttle_.reset();
        active_.clear();
        completed_files_.clear();
        completed_bytes_ = 0;
        total_bytes_ = work_bytes;
        total_files_ = work_files;
    }

    bus_.emit(events::SessionStartedEvent{session.id, session.device_id, session.files.size(), work_bytes, skipped});
    spdlog::info("[Transfer] session started id={} device={} files={} bytes={} skipped={}",
                 session.id, session.device_id, work_files, work_bytes, skipped);

    std::unique_lock lock(mutex_);
    session_id_ = session.id;
    queue_.clear();
    order_.clear();
    records_.clear();
    for (auto& record : session.files) {
        order_.push_back(record.source_path);
        if (record.status == FileStatus::Pending) {
            queue_.push_back(Job{record.source_path, record.destination_path, record.file_name, record.size_bytes});
        }
        records_.emplace(record.source_path, std::move(record));
    }
    pause_requested_ = false;
    cancel_requested_ = false;
    abort_requested_ = false;
    stop_.store(false);
    run_started_ = std::chrono::steady_clock::now();
    state_ = EngineState::Transferring;

    if (queue_.empty()) {
        lock.unlock();
        finish_run();
    } else {
        schedule_locked(lock);
    }
    return Ok(session.id);
}

void TransferEngine::schedule_locked(std::unique_lock<std::mutex>& lock) {
    (void)lock;
    std::uint64_t largest = 0;
    for (const auto& job : queue_) {
        largest = std::max(largest, job.size);
    }
    const BufferTier& tier = select_tier(config_.buffer_tiers, largest);

    std::size_t workers = std::min(tier.concurrency, config_.max_concurrency);
    workers = std::clamp<std::size_t>(workers, 1, queue_.size());

    active_workers_ += workers;
    for (std::size_t i = 0; i < workers; ++i) {
        boost::asio::post(pool_, [this]() { worker_loop(); });
    }
    spdlog::debug("[Transfer] scheduled workers={} tier={} queued={}", workers, tier.name, queue_.size());
}

void TransferEngine::worker_loop() {
    while (true) {
        Job job;
        {
            std::lock_guard lock(mutex_);
            if (pause_requested_ || cancel_requested_ || abort_requested_ || queue_.empty()) {
                break;
            }
            job = std::move(queue_.front());
            queue_.pop_front();
        }

        try {
            run_job(job);
        } catch (const std::exception& e) {
            spdlog::error("[Transfer] unexpected failure source={}: {}", job.source_path, e.what());
            store::FilePatch patch;
            patch.status = FileStatus::Error;
            patch.error_kind = FileErrorKind::Other;
            patch.error_message = e.what();
            patch.completed_at = Clock::now();
            update_record(job.source_path, patch);
        }
    }

    bool last = false;
    {
        std::lock_guard lock(mutex_);
        last = --active_workers_ == 0;
    }
    if (last) {
        finish_run();
    }
}

void TransferEngine::run_job(const Job& job) {
    const BufferTier& tier = select_tier(config_.buffer_tiers, job.size);
    const auto started = std::chrono::steady_clock::now();

    store::FilePatch begin;
    begin.status = FileStatus::Transferring;
    begin.started_at = Clock::now();
    begin.bytes_transferred = 0;
    begin.percentage = 0.0;
    update_record(job.source_path, begin);

    {
        std::lock_guard progress_lock(progress_mutex_);
        active_[job.source_path] = events::ActiveFileProgress{job.source_path, job.file_name, 0, job.size, 0.0};
    }

    CopyJob copy_job;
    copy_job.source = job.source_path;
    copy_job.destination = job.destination;
    copy_job.buffer_size = tier.buffer_size;
    copy_job.verify = config_.verify_checksums;
    copy_job.on_progress = [this, &job, &tier](std::uint64_t bytes) {
        report_progress(job, bytes, tier.progress_interval);
    };
    copy_job.on_verifying = [this, &job]() {
        store::FilePatch patch;
        patch.status = FileStatus::Verifying;
        update_record(job.source_path, patch);
    };
    copy_job.should_stop = [this]() { return stop_.load(); };

    CopyResult result = with_retry(
        config_.retry,
        [&](std::size_t attempt) {
            if (attempt > 1) {
                spdlog::warn("[Transfer] retrying source={} attempt={}/{}",
                             job.source_path, attempt, config_.retry.max_attempts);
            }
            return copier_->copy(copy_job);
        },
        [](const CopyFailure& failure) { return !failure.stopped && failure.kind == FileErrorKind::Network; },
        &stop_);

    {
        std::lock_guard progress_lock(progress_mutex_);
        active_.erase(job.source_path);
        throttle_.forget(job.source_path);
        if (result.is_ok()) {
            completed_files_.push_back(job.source_path);
            completed_bytes_ += result.value().bytes;
        }
    }

    if (result.is_ok()) {
        const CopyOutcome& outcome = result.value();
        store::FilePatch done;
        done.status = FileStatus::Complete;
        done.bytes_transferred = outcome.bytes;
        done.percentage = 100.0;
        done.completed_at = Clock::now();
        if (outcome.verified) {
            done.checksum = outcome.checksum;
            done.checksum_verified = true;
        }
        update_record(job.source_path, done);

        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        spdlog::info("[Transfer] complete source={} bytes={} verified={} time={}ms",
                     job.source_path, outcome.bytes, outcome.verified, elapsed.count());
        bus_.emit(events::FileCompletedEvent{progress_session_id_, record_copy(job.source_path), elapsed});
        emit_progress_now();
        return;
    }

    const CopyFailure& failure = result.error();
    const bool interrupted = failure.stopped || (failure.kind == FileErrorKind::Network && stop_.load());
    bool cancelled = false;
    {
        std::lock_guard lock(mutex_);
        cancelled = cancel_requested_;
    }

    store::FilePatch patch;
    if (interrupted && cancelled) {
        patch.status = FileStatus::Pending;
        patch.bytes_transferred = 0;
        patch.percentage = 0.0;
        update_record(job.source_path, patch);
        spdlog::info("[Transfer] cancelled in flight source={}", job.source_path);
        emit_progress_now();
        return;
    }

    patch.status = FileStatus::Error;
    patch.completed_at = Clock::now();
    if (interrupted) {
        patch.error_kind = FileErrorKind::DriveDisconnected;
        patch.error_message = kAbortedMessage;
    } else {
        patch.error_kind = failure.kind;
        patch.error_message = failure.message;
        if (failure.kind == FileErrorKind::DriveDisconnected) {
            {
                std::lock_guard lock(mutex_);
                abort_requested_ = true;
            }
            stop_.store(true);
            spdlog::error("[Transfer] source device disconnected; aborting remaining files");
        }
    }
    update_record(job.source_path, patch);

    spdlog::warn("[Transfer] failed source={} kind={} error={}",
                 job.source_path, to_string(*patch.error_kind), *patch.error_message);
    bus_.emit(events::FileFailedEvent{progress_session_id_, record_copy(job.source_path)});
    emit_progress_now();
}

void TransferEngine::finish_run() {
    std::unique_lock lock(mutex_);

    if (cancel_requested_) {
        lock.unlock();
        finalize(SessionStatus::Cancelled, kCancelledMessage);
        return;
    }

    if (abort_requested_) {
        lock.unlock();
        abort_pending();
        std::size_t failed = 0;
        {
            std::lock_guard relock(mutex_);
            for (const auto& [path, record] : records_) {
                failed += record.status == FileStatus::Error ? 1 : 0;
            }
        }
        finalize(SessionStatus::Error, "Source device disconnected; " + failed_message(failed));
        return;
    }

    if (pause_requested_ && !queue_.empty()) {
        pause_requested_ = false;
        const std::string session_id = session_id_;
        const std::size_t pending = queue_.size();
        lock.unlock();

        store::SessionPatch patch;
        patch.status = SessionStatus::Paused;
        if (auto updated = store_.update_session(session_id, patch); updated.is_error()) {
            spdlog::error("[Transfer] cannot record pause session={}: {}", session_id, updated.error().message);
        }
        spdlog::info("[Transfer] paused session={} pending={}", session_id, pending);
        bus_.emit(events::SessionPausedEvent{session_id, pending});

        lock.lock();
        state_ = EngineState::Paused;
        const bool cancel_pending = cancel_requested_;
        lock.unlock();
        state_cv_.notify_all();

        if (cancel_pending) {
            finalize(SessionStatus::Cancelled, kCancelledMessage);
        }
        return;
    }

    pause_requested_ = false;
    if (!queue_.empty()) {
        // A pause was withdrawn after the workers had already stopped.
        schedule_locked(lock);
        return;
    }

    std::size_t failed = 0;
    for (const auto& [path, record] : records_) {
        failed += record.status == FileStatus::Error ? 1 : 0;
    }
    lock.unlock();

    if (failed > 0) {
        finalize(SessionStatus::Error, failed_message(failed));
    } else {
        finalize(SessionStatus::Complete, "");
    }
}

void TransferEngine::abort_pending() {
    std::vector<Job> remaining;
    {
        std::lock_guard lock(mutex_);
        remaining.assign(queue_.begin(), queue_.end());
        queue_.clear();
    }

    for (const auto& job : remaining) {
        store::FilePatch patch;
        patch.status = FileStatus::Error;
        patch.error_kind = FileErrorKind::DriveDisconnected;
        patch.error_message = kAbortedMessage;
        patch.completed_at = Clock::now();
        update_record(job.source_path, patch);
        bus_.emit(events::FileFailedEvent{progress_session_id_, record_copy(job.source_path)});
    }
    if (!remaining.empty()) {
        spdlog::warn("[Transfer] marked {} queued file(s) as aborted", remaining.size());
    }
}

void TransferEngine::finalize(SessionStatus status, std::string message) {
    std::string session_id;
    {
        std::lock_guard lock(mutex_);
        session_id = session_id_;
    }

    store::SessionPatch patch;
    patch.status = status;
    patch.end_time = Clock::now();
    if (!message.empty()) {
        patch.error_message = message;
    }

    if (config_.generate_manifest && status != SessionStatus::Cancelled) {
        auto snapshot = store_.get_session(session_id);
        if (snapshot.is_ok()) {
            auto written = write_manifest(snapshot.value());
            if (written.is_ok()) {
                patch.manifest_path = written.value().string();
            } else {
                spdlog::error("[Transfer] manifest failed session={}: {}", session_id, written.error().message);
            }
        } else {
            spdlog::error("[Transfer] manifest skipped session={}: {}", session_id, snapshot.error().message);
        }
    }

    if (auto updated = store_.update_session(session_id, patch); updated.is_error()) {
        spdlog::error("[Transfer] cannot record outcome session={}: {}", session_id, updated.error().message);
    }

    events::SessionFinishedEvent finished;
    finished.session_id = session_id;
    finished.status = status;
    finished.error_message = message;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [path, record] : records_) {
            switch (record.status) {
                case FileStatus::Complete:
                    ++finished.completed_files;
                    finished.bytes_transferred += record.bytes_transferred;
                    break;
                case FileStatus::Error:
                    ++finished.failed_files;
                    break;
                case FileStatus::Skipped:
                    ++finished.skipped_files;
                    break;
                default:
                    break;
            }
        }
        finished.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - run_started_);
    }

    spdlog::info("[Transfer] session={} finished status={} complete={} failed={} skipped={} time={}ms",
                 session_id, to_string(status), finished.completed_files, finished.failed_files,
                 finished.skipped_files, finished.duration.count());
    bus_.emit(finished);

    {
        std::lock_guard lock(mutex_);
        state_ = EngineState::Idle;
        last_session_id_ = session_id;
        queue_.clear();
        pause_requested_ = false;
        cancel_requested_ = false;
        abort_requested_ = false;
    }
    state_cv_.notify_all();
}

// ============================================================================
// Records and progress
// ============================================================================

void TransferEngine::update_record(const std::string& source_path, const store::FilePatch& patch) {
    std::string session_id;
    {
        std::lock_guard lock(mutex_);
        session_id = session_id_;
        const auto it = records_.find(source_path);
        if (it != records_.end()) {
            store::apply_patch(it->second, patch);
        }
    }

    if (auto updated = store_.update_file_status(session_id, source_path, patch); updated.is_error()) {
        spdlog::error("[Transfer] store update failed session={} source={}: {}",
                      session_id, source_path, updated.error().message);
    }
}

FileTransferRecord TransferEngine::record_copy(const std::string& source_path) const {
    std::lock_guard lock(mutex_);
    const auto it = records_.find(source_path);
    return it != records_.end() ? it->second : FileTransferRecord{};
}

void TransferEngine::report_progress(const Job& job, std::uint64_t bytes, std::chrono::milliseconds interval) {
    events::TransferProgressEvent event;
    {
        std::lock_guard progress_lock(progress_mutex_);
        const auto it = active_.find(job.source_path);
        if (it == active_.end()) {
            return;
        }
        it->second.bytes_transferred = bytes;
        it->second.percentage = job.size > 0
            ? std::min(100.0, static_cast<double>(bytes) * 100.0 / static_cast<double>(job.size))
            : 100.0;

        if (!throttle_.should_emit(job.source_path, interval, std::chrono::steady_clock::now())) {
            return;
        }
        event = snapshot_locked();
    }
    bus_.emit(event);
}

void TransferEngine::emit_progress_now() {
    events::TransferProgressEvent event;
    {
        std::lock_guard progress_lock(progress_mutex_);
        throttle_.mark_emitted(std::chrono::steady_clock::now());
        event = snapshot_locked();
    }
    bus_.emit(event);
}

events::TransferProgressEvent TransferEngine::snapshot_locked() const {
    events::TransferProgressEvent event;
    event.session_id = progress_session_id_;

    std::uint64_t active_bytes = 0;
    for (const auto& [path, progress] : active_) {
        event.active_files.push_back(progress);
        active_bytes += progress.bytes_transferred;
    }

    event.bytes_transferred = completed_bytes_ + active_bytes;
    event.total_bytes = total_bytes_;
    if (total_bytes_ > 0) {
        event.percentage = std::min(100.0,
            static_cast<double>(event.bytes_transferred) * 100.0 / static_cast<double>(total_bytes_));
    } else {
        event.percentage = total_files_ > 0
            ? static_cast<double>(completed_files_.size()) * 100.0 / static_cast<double>(total_files_)
            : 100.0;
    }
    event.completed_count = completed_files_.size();
    event.total_files = total_files_;
    event.completed_files = completed_files_;
    return event;
}

} // namespace ingest::transfer
