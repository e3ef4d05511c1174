#include "ingest/transfer/transfer_engine.hpp"

#include "ingest/core/checksum.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using ingest::FileErrorKind;
using ingest::FileStatus;
using ingest::SessionStatus;
using ingest::transfer::CopyFailure;
using ingest::transfer::CopyJob;
using ingest::transfer::CopyOutcome;
using ingest::transfer::CopyResult;
using ingest::transfer::EngineState;
using ingest::transfer::FileCopier;
using ingest::transfer::SessionSpec;
using ingest::transfer::TransferEngine;

namespace {

fs::path create_temp_dir() {
    static std::atomic<uint64_t> counter{0};
    fs::path dir = fs::temp_directory_path() / ("ingest_engine_test_" + std::to_string(counter.fetch_add(1)));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

std::string read_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    std::ostringstream oss;
    oss << input.rdbuf();
    return oss.str();
}

bool has_part_files(const fs::path& root) {
    for (const auto& entry : fs::recursive_directory_iterator(root)) {
        if (entry.path().extension() == ingest::transfer::kPartSuffix) {
            return true;
        }
    }
    return false;
}

/// Holds every copy at the door until open() is called.
class GateCopier : public FileCopier {
public:
    CopyResult copy(const CopyJob& job) override {
        {
            std::unique_lock lock(mutex_);
            ++entered_;
            cv_.notify_all();
            cv_.wait(lock, [this]() { return open_; });
        }
        return FileCopier::copy(job);
    }

    void open() {
        std::lock_guard lock(mutex_);
        open_ = true;
        cv_.notify_all();
    }

    bool wait_entered(int count) {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, 5s, [&]() { return entered_ >= count; });
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    int entered_ = 0;
    bool open_ = false;
};

/// Blocks inside the first chunk until released, so a copy is caught mid-file.
class MidFileCopier : public FileCopier {
public:
    void release() {
        std::lock_guard lock(mutex_);
        released_ = true;
        cv_.notify_all();
    }

    bool wait_in_chunk() {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, 5s, [this]() { return in_chunk_; });
    }

protected:
    void on_chunk(const CopyJob&, std::uint64_t) override {
        std::unique_lock lock(mutex_);
        in_chunk_ = true;
        cv_.notify_all();
        cv_.wait(lock, [this]() { return released_; });
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool in_chunk_ = false;
    bool released_ = false;
};

/// Fails copies of chosen file names with a given error kind while armed.
class FaultyCopier : public FileCopier {
public:
    explicit FaultyCopier(std::map<std::string, FileErrorKind> kinds)
        : kinds_(std::move(kinds)) {}

    FaultyCopier(std::string file_name, FileErrorKind kind)
        : FaultyCopier(std::map<std::string, FileErrorKind>{{std::move(file_name), kind}}) {}

    CopyResult copy(const CopyJob& job) override {
        const auto it = kinds_.find(job.source.filename().string());
        if (armed_.load() && it != kinds_.end()) {
            attempts_.fetch_add(1);
            return ingest::Err<CopyOutcome, CopyFailure>(CopyFailure{it->second, "injected failure", false});
        }
        return FileCopier::copy(job);
    }

    void disarm() { armed_.store(false); }
    int attempts() const { return attempts_.load(); }

private:
    std::map<std::string, FileErrorKind> kinds_;
    std::atomic<bool> armed_{true};
    std::atomic<int> attempts_{0};
};

/// Damages the temp file after its first chunk so verification fails.
class CorruptingCopier : public FileCopier {
protected:
    void on_chunk(const CopyJob& job, std::uint64_t) override {
        std::fstream part(ingest::transfer::part_path_for(job.destination),
                          std::ios::in | std::ios::out | std::ios::binary);
        part.seekp(0);
        part.put('X');
    }
};

} // namespace

class TransferEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = create_temp_dir();
        source_ = root_ / "card";
        destination_ = root_ / "backup";
        fs::create_directories(source_);
        fs::create_directories(destination_);

        started_sub_ = bus_.subscribe_scoped<ingest::events::SessionStartedEvent>(
            [this](const ingest::events::SessionStartedEvent& e) {
                std::lock_guard lock(events_mutex_);
                started_.push_back(e);
            });
        finished_sub_ = bus_.subscribe_scoped<ingest::events::SessionFinishedEvent>(
            [this](const ingest::events::SessionFinishedEvent& e) {
                std::lock_guard lock(events_mutex_);
                finished_.push_back(e);
            });
        failed_sub_ = bus_.subscribe_scoped<ingest::events::FileFailedEvent>(
            [this](const ingest::events::FileFailedEvent&) { failed_events_.fetch_add(1); });
        completed_sub_ = bus_.subscribe_scoped<ingest::events::FileCompletedEvent>(
            [this](const ingest::events::FileCompletedEvent&) { completed_events_.fetch_add(1); });
    }

    void TearDown() override {
        fs::remove_all(root_);
    }

    ingest::IngestConfig config() const {
        ingest::IngestConfig c;
        c.retry.initial_delay = 1ms;
        c.retry.max_delay = 5ms;
        c.progress_interval = 0ms;
        return c;
    }

    fs::path add_source(const std::string& relative, const std::string& content) {
        const fs::path path = source_ / relative;
        write_file(path, content);
        return path;
    }

    SessionSpec spec(std::vector<fs::path> files) const {
        SessionSpec s;
        s.source_root = source_;
        s.destination_root = destination_;
        s.device_name = "Test Card";
        s.files = std::move(files);
        return s;
    }

    ingest::TransferSession session(const std::string& id) {
        auto loaded = store_.get_session(id);
        EXPECT_TRUE(loaded.is_ok());
        return loaded.is_ok() ? loaded.value() : ingest::TransferSession{};
    }

    fs::path root_;
    fs::path source_;
    fs::path destination_;

    ingest::store::SessionStore store_;
    ingest::events::EventBus bus_;

    std::mutex events_mutex_;
    std::vector<ingest::events::SessionStartedEvent> started_;
    std::vector<ingest::events::SessionFinishedEvent> finished_;
    std::atomic<int> failed_events_{0};
    std::atomic<int> completed_events_{0};
    ingest::events::Subscription started_sub_;
    ingest::events::Subscription finished_sub_;
    ingest::events::Subscription failed_sub_;
    ingest::events::Subscription completed_sub_;
};

TEST_F(TransferEngineTest, CopiesEveryFileAndVerifies) {
    const auto a = add_source("DCIM/a.jpg", "alpha");
    const auto b = add_source("DCIM/b.jpg", std::string(5000, 'b'));
    const auto c = add_source("c.wav", "");

    TransferEngine engine(config(), store_, bus_);
    auto id = engine.start(spec({a, b, c}));
    ASSERT_TRUE(id.is_ok()) << id.error().message;
    engine.wait();

    EXPECT_EQ(engine.state(), EngineState::Idle);
    EXPECT_EQ(engine.last_session_id(), id.value());
    EXPECT_FALSE(engine.current_session_id().has_value());

    const auto stored = session(id.value());
    EXPECT_EQ(stored.status, SessionStatus::Complete);
    EXPECT_TRUE(stored.end_time.has_value());
    ASSERT_EQ(stored.files.size(), 3u);
    for (const auto& record : stored.files) {
        EXPECT_EQ(record.status, FileStatus::Complete) << record.source_path;
        EXPECT_TRUE(record.checksum_verified);
        ASSERT_TRUE(record.checksum.has_value());
        EXPECT_EQ(*record.checksum, ingest::checksum_bytes(read_file(record.source_path)));
        EXPECT_EQ(read_file(record.destination_path), read_file(record.source_path));
    }
    EXPECT_EQ(read_file(destination_ / "a.jpg"), "alpha");
    EXPECT_TRUE(fs::exists(destination_ / "c.wav"));
    EXPECT_EQ(read_file(a), "alpha");
    EXPECT_FALSE(has_part_files(destination_));

    std::lock_guard lock(events_mutex_);
    ASSERT_EQ(started_.size(), 1u);
    EXPECT_EQ(started_[0].file_count, 3u);
    EXPECT_EQ(started_[0].total_bytes, 5005u);
    ASSERT_EQ(finished_.size(), 1u);
    EXPECT_EQ(finished_[0].status, SessionStatus::Complete);
    EXPECT_EQ(finished_[0].completed_files, 3u);
    EXPECT_EQ(finished_[0].bytes_transferred, 5005u);
    EXPECT_EQ(completed_events_.load(), 3);
}

TEST_F(TransferEngineTest, RejectsBadRequests) {
    TransferEngine engine(config(), store_, bus_);

    auto empty = engine.start(spec({}));
    ASSERT_TRUE(empty.is_error());
    EXPECT_EQ(empty.error().code, ingest::ErrorCode::Validation);

    EXPECT_TRUE(engine.pause().is_error());
    EXPECT_TRUE(engine.resume().is_error());
    EXPECT_TRUE(engine.cancel().is_error());

    auto retry = engine.retry();
    ASSERT_TRUE(retry.is_error());
    EXPECT_EQ(retry.error().code, ingest::ErrorCode::InvalidState);
    EXPECT_TRUE(store_.get_all_sessions().empty());
}

TEST_F(TransferEngineTest, AskPolicyRefusesUntilDecided) {
    const auto a = add_source("a.jpg", "new");
    const auto b = add_source("b.jpg", "fresh");
    write_file(destination_ / "a.jpg", "old");

    TransferEngine engine(config(), store_, bus_);
    auto refused = engine.start(spec({a, b}));
    ASSERT_TRUE(refused.is_error());
    EXPECT_EQ(refused.error().code, ingest::ErrorCode::Conflict);
    EXPECT_NE(refused.error().message.find(a.string()), std::string::npos);
    EXPECT_TRUE(store_.get_all_sessions().empty());
    EXPECT_EQ(read_file(destination_ / "a.jpg"), "old");

    auto decided = spec({a, b});
    decided.decisions[a.string()] = ingest::ConflictPolicy::Overwrite;
    auto id = engine.start(decided);
    ASSERT_TRUE(id.is_ok()) << id.error().message;
    engine.wait();

    EXPECT_EQ(session(id.value()).status, SessionStatus::Complete);
    EXPECT_EQ(read_file(destination_ / "a.jpg"), "new");
    EXPECT_EQ(read_file(destination_ / "b.jpg"), "fresh");
}

TEST_F(TransferEngineTest, SkipPolicyLeavesExistingFiles) {
    const auto a = add_source("a.jpg", "new");
    const auto b = add_source("b.jpg", "fresh");
    write_file(destination_ / "a.jpg", "old");

    TransferEngine engine(config(), store_, bus_);
    auto request = spec({a, b});
    request.conflict_policy = ingest::ConflictPolicy::Skip;
    auto id = engine.start(request);
    ASSERT_TRUE(id.is_ok());
    engine.wait();

    const auto stored = session(id.value());
    EXPECT_EQ(stored.status, SessionStatus::Complete);
    ASSERT_NE(stored.find_file(a.string()), nullptr);
    EXPECT_EQ(stored.find_file(a.string())->status, FileStatus::Skipped);
    EXPECT_EQ(stored.find_file(b.string())->status, FileStatus::Complete);
    EXPECT_EQ(read_file(destination_ / "a.jpg"), "old");

    std::lock_guard lock(events_mutex_);
    ASSERT_EQ(started_.size(), 1u);
    EXPECT_EQ(started_[0].skipped_files, 1u);
    ASSERT_EQ(finished_.size(), 1u);
    EXPECT_EQ(finished_[0].skipped_files, 1u);
}

TEST_F(TransferEngineTest, RenamePolicyAndFlattenedNamesNeverCollide) {
    const auto a = add_source("day1/a.jpg", "one");
    const auto b = add_source("day2/a.jpg", "two");
    write_file(destination_ / "a.jpg", "old");

    TransferEngine engine(config(), store_, bus_);
    auto request = spec({a, b});
    request.conflict_policy = ingest::ConflictPolicy::Rename;
    auto id = engine.start(request);
    ASSERT_TRUE(id.is_ok());
    engine.wait();

    const auto stored = session(id.value());
    EXPECT_EQ(stored.status, SessionStatus::Complete);
    EXPECT_EQ(stored.find_file(a.string())->destination_path, (destination_ / "a_1.jpg").string());
    EXPECT_EQ(stored.find_file(b.string())->destination_path, (destination_ / "a_2.jpg").string());
    EXPECT_EQ(read_file(destination_ / "a.jpg"), "old");
    EXPECT_EQ(read_file(destination_ / "a_1.jpg"), "one");
    EXPECT_EQ(read_file(destination_ / "a_2.jpg"), "two");
}

TEST_F(TransferEngineTest, MissingSourceIsRecordedAsFailed) {
    const auto a = add_source("a.jpg", "here");

    TransferEngine engine(config(), store_, bus_);
    auto id = engine.start(spec({a, source_ / "gone.jpg"}));
    ASSERT_TRUE(id.is_ok());
    engine.wait();

    const auto stored = session(id.value());
    EXPECT_EQ(stored.status, SessionStatus::Error);
    EXPECT_EQ(stored.error_message, "1 file(s) failed");
    const auto* gone = stored.find_file((source_ / "gone.jpg").string());
    ASSERT_NE(gone, nullptr);
    EXPECT_EQ(gone->status, FileStatus::Error);
    EXPECT_TRUE(gone->error_kind.has_value());
    EXPECT_EQ(stored.find_file(a.string())->status, FileStatus::Complete);
}

TEST_F(TransferEngineTest, SecondStartWhileRunningIsRejected) {
    const auto a = add_source("a.jpg", "a");
    const auto b = add_source("b.jpg", "b");

    auto copier = std::make_shared<GateCopier>();
    TransferEngine engine(config(), store_, bus_, copier);
    auto id = engine.start(spec({a}));
    ASSERT_TRUE(id.is_ok());
    ASSERT_TRUE(copier->wait_entered(1));

    EXPECT_TRUE(engine.is_transferring());
    EXPECT_EQ(engine.current_session_id(), id.value());
    auto second = engine.start(spec({b}));
    ASSERT_TRUE(second.is_error());
    EXPECT_EQ(second.error().code, ingest::ErrorCode::InvalidState);

    copier->open();
    engine.wait();
    EXPECT_EQ(session(id.value()).status, SessionStatus::Complete);
}

TEST_F(TransferEngineTest, PauseLetsInFlightFinishThenResumes) {
    const auto a = add_source("a.jpg", "a");
    const auto b = add_source("b.jpg", "b");
    const auto c = add_source("c.jpg", "c");

    auto cfg = config();
    cfg.max_concurrency = 1;
    auto copier = std::make_shared<GateCopier>();
    TransferEngine engine(cfg, store_, bus_, copier);

    std::atomic<int> paused_events{0};
    auto paused_sub = bus_.subscribe_scoped<ingest::events::SessionPausedEvent>(
        [&](const ingest::events::SessionPausedEvent& e) {
            EXPECT_EQ(e.pending_files, 2u);
            paused_events.fetch_add(1);
        });

    auto id = engine.start(spec({a, b, c}));
    ASSERT_TRUE(id.is_ok());
    ASSERT_TRUE(copier->wait_entered(1));

    ASSERT_TRUE(engine.pause().is_ok());
    copier->open();
    engine.wait();

    EXPECT_EQ(engine.state(), EngineState::Paused);
    EXPECT_EQ(paused_events.load(), 1);
    auto paused = session(id.value());
    EXPECT_EQ(paused.status, SessionStatus::Paused);
    EXPECT_EQ(paused.find_file(a.string())->status, FileStatus::Complete);
    EXPECT_EQ(paused.find_file(b.string())->status, FileStatus::Pending);
    EXPECT_EQ(paused.find_file(c.string())->status, FileStatus::Pending);
    EXPECT_TRUE(engine.pause().is_error());

    ASSERT_TRUE(engine.resume().is_ok());
    engine.wait();

    EXPECT_EQ(engine.state(), EngineState::Idle);
    const auto done = session(id.value());
    EXPECT_EQ(done.status, SessionStatus::Complete);
    EXPECT_EQ(done.count_with_status(FileStatus::Complete), 3u);
    EXPECT_EQ(read_file(destination_ / "c.jpg"), "c");
}

TEST_F(TransferEngineTest, CancelMidFileLeavesNoPartialCopy) {
    const std::string payload(64 * 1024, 'x');
    const auto big = add_source("big.mov", payload);
    const auto next = add_source("next.mov", "later");

    auto cfg = config();
    cfg.max_concurrency = 1;
    ingest::BufferTier tiny;
    tiny.name = "tiny";
    tiny.buffer_size = 1024;
    tiny.concurrency = 1;
    cfg.buffer_tiers = {tiny};

    auto copier = std::make_shared<MidFileCopier>();
    TransferEngine engine(cfg, store_, bus_, copier);
    auto id = engine.start(spec({big, next}));
    ASSERT_TRUE(id.is_ok());
    ASSERT_TRUE(copier->wait_in_chunk());

    EXPECT_TRUE(fs::exists(ingest::transfer::part_path_for(destination_ / "big.mov")));
    ASSERT_TRUE(engine.cancel().is_ok());
    EXPECT_TRUE(engine.cancel().is_ok());
    copier->release();
    engine.wait();

    EXPECT_EQ(engine.state(), EngineState::Idle);
    const auto stored = session(id.value());
    EXPECT_EQ(stored.status, SessionStatus::Cancelled);
    EXPECT_EQ(stored.find_file(big.string())->status, FileStatus::Pending);
    EXPECT_EQ(stored.find_file(big.string())->bytes_transferred, 0u);
    EXPECT_EQ(stored.find_file(next.string())->status, FileStatus::Pending);

    EXPECT_FALSE(fs::exists(destination_ / "big.mov"));
    EXPECT_FALSE(fs::exists(destination_ / "next.mov"));
    EXPECT_FALSE(has_part_files(destination_));
    EXPECT_EQ(read_file(big), payload);

    std::lock_guard lock(events_mutex_);
    ASSERT_EQ(finished_.size(), 1u);
    EXPECT_EQ(finished_[0].status, SessionStatus::Cancelled);
}

TEST_F(TransferEngineTest, NetworkFailureIsRetriedThenRetryableLater) {
    std::vector<fs::path> files;
    for (int i = 1; i <= 5; ++i) {
        files.push_back(add_source("file" + std::to_string(i) + ".mov", "clip " + std::to_string(i)));
    }

    auto cfg = config();
    cfg.retry.max_attempts = 2;
    auto copier = std::make_shared<FaultyCopier>("file3.mov", FileErrorKind::Network);
    TransferEngine engine(cfg, store_, bus_, copier);

    auto first = engine.start(spec(files));
    ASSERT_TRUE(first.is_ok());
    engine.wait();

    EXPECT_EQ(copier->attempts(), 2);
    const auto failed = session(first.value());
    EXPECT_EQ(failed.status, SessionStatus::Error);
    EXPECT_EQ(failed.error_message, "1 file(s) failed");
    EXPECT_EQ(failed.count_with_status(FileStatus::Complete), 4u);
    const auto* third = failed.find_file(files[2].string());
    ASSERT_NE(third, nullptr);
    EXPECT_EQ(third->status, FileStatus::Error);
    EXPECT_EQ(third->error_kind, FileErrorKind::Network);
    EXPECT_EQ(failed_events_.load(), 1);

    copier->disarm();
    auto second = engine.retry({files[2]});
    ASSERT_TRUE(second.is_ok()) << second.error().message;
    EXPECT_NE(second.value(), first.value());
    engine.wait();

    const auto retried = session(second.value());
    EXPECT_EQ(retried.retry_of, first.value());
    EXPECT_EQ(retried.status, SessionStatus::Complete);
    ASSERT_EQ(retried.files.size(), 1u);
    EXPECT_EQ(retried.files[0].status, FileStatus::Complete);
    EXPECT_EQ(read_file(destination_ / "file3.mov"), "clip 3");

    // The original session stays as it was.
    EXPECT_EQ(session(first.value()).status, SessionStatus::Error);

    auto nothing_left = engine.retry();
    ASSERT_TRUE(nothing_left.is_error());
    EXPECT_EQ(nothing_left.error().code, ingest::ErrorCode::Validation);
}

TEST_F(TransferEngineTest, DriveDisconnectAbortsRemainingFiles) {
    std::vector<fs::path> files;
    for (int i = 1; i <= 4; ++i) {
        files.push_back(add_source("file" + std::to_string(i) + ".jpg", "img " + std::to_string(i)));
    }

    auto cfg = config();
    cfg.max_concurrency = 1;
    auto copier = std::make_shared<FaultyCopier>("file2.jpg", FileErrorKind::DriveDisconnected);
    TransferEngine engine(cfg, store_, bus_, copier);

    auto first = engine.start(spec(files));
    ASSERT_TRUE(first.is_ok());
    engine.wait();

    EXPECT_EQ(copier->attempts(), 1);
    const auto aborted = session(first.value());
    EXPECT_EQ(aborted.status, SessionStatus::Error);
    EXPECT_EQ(aborted.error_message.rfind("Source device disconnected", 0), 0u);
    EXPECT_EQ(aborted.find_file(files[0].string())->status, FileStatus::Complete);
    for (std::size_t i = 1; i < files.size(); ++i) {
        const auto* record = aborted.find_file(files[i].string());
        ASSERT_NE(record, nullptr);
        EXPECT_EQ(record->status, FileStatus::Error);
        EXPECT_EQ(record->error_kind, FileErrorKind::DriveDisconnected);
    }
    EXPECT_FALSE(fs::exists(destination_ / "file3.jpg"));

    copier->disarm();
    auto again = engine.retry();
    ASSERT_TRUE(again.is_ok());
    engine.wait();

    const auto retried = session(again.value());
    EXPECT_EQ(retried.status, SessionStatus::Complete);
    EXPECT_EQ(retried.files.size(), 3u);
    EXPECT_EQ(read_file(destination_ / "file4.jpg"), "img 4");
}

TEST_F(TransferEngineTest, ChecksumMismatchIsFinal) {
    const auto a = add_source("a.jpg", "alpha");

    auto copier = std::make_shared<CorruptingCopier>();
    TransferEngine engine(config(), store_, bus_, copier);

    auto id = engine.start(spec({a}));
    ASSERT_TRUE(id.is_ok());
    engine.wait();

    const auto done = session(id.value());
    EXPECT_EQ(done.status, SessionStatus::Error);
    const auto* record = done.find_file(a.string());
    ASSERT_NE(record, nullptr);
    EXPECT_EQ(record->status, FileStatus::Error);
    ASSERT_TRUE(record->error_kind.has_value());
    EXPECT_EQ(*record->error_kind, FileErrorKind::ChecksumMismatch);
    EXPECT_EQ(failed_events_.load(), 1);

    EXPECT_FALSE(fs::exists(destination_ / "a.jpg"));
    EXPECT_FALSE(has_part_files(destination_));
    EXPECT_EQ(read_file(a), "alpha");

    auto again = engine.retry();
    ASSERT_TRUE(again.is_error());
    EXPECT_EQ(again.error().code, ingest::ErrorCode::Validation);
    EXPECT_EQ(store_.get_all_sessions().size(), 1u);
}

TEST_F(TransferEngineTest, PermissionAndDiskFullAreNotRetried) {
    const auto a = add_source("a.jpg", "alpha");
    const auto b = add_source("b.jpg", "bravo");
    const auto c = add_source("c.jpg", "charlie");

    auto copier = std::make_shared<FaultyCopier>(std::map<std::string, FileErrorKind>{
        {"a.jpg", FileErrorKind::Permission},
        {"b.jpg", FileErrorKind::DiskFull},
    });
    TransferEngine engine(config(), store_, bus_, copier);

    auto id = engine.start(spec({a, b, c}));
    ASSERT_TRUE(id.is_ok());
    engine.wait();

    // Neither kind goes through the network backoff.
    EXPECT_EQ(copier->attempts(), 2);
    const auto done = session(id.value());
    EXPECT_EQ(done.status, SessionStatus::Error);
    EXPECT_EQ(*done.find_file(a.string())->error_kind, FileErrorKind::Permission);
    EXPECT_EQ(*done.find_file(b.string())->error_kind, FileErrorKind::DiskFull);
    EXPECT_EQ(done.find_file(c.string())->status, FileStatus::Complete);

    copier->disarm();
    auto everything = engine.retry();
    ASSERT_TRUE(everything.is_error());
    EXPECT_EQ(everything.error().code, ingest::ErrorCode::Validation);

    auto just_a = engine.retry({a});
    ASSERT_TRUE(just_a.is_error());
    EXPECT_EQ(just_a.error().code, ingest::ErrorCode::Validation);

    EXPECT_EQ(store_.get_all_sessions().size(), 1u);
}

TEST_F(TransferEngineTest, DanglingSymlinkAtDestinationIsAConflict) {
    const auto a = add_source("a.jpg", "alpha");
    fs::create_symlink(root_ / "nowhere.jpg", destination_ / "a.jpg");

    TransferEngine engine(config(), store_, bus_);
    auto refused = engine.start(spec({a}));
    ASSERT_TRUE(refused.is_error());
    EXPECT_EQ(refused.error().code, ingest::ErrorCode::Conflict);
    EXPECT_TRUE(fs::is_symlink(destination_ / "a.jpg"));
    EXPECT_TRUE(store_.get_all_sessions().empty());
}

TEST_F(TransferEngineTest, WritesManifestWhenEnabled) {
    const auto a = add_source("a.jpg", "alpha");
    const auto b = add_source("b.jpg", "beta");

    auto cfg = config();
    cfg.generate_manifest = true;
    TransferEngine engine(cfg, store_, bus_);
    auto id = engine.start(spec({a, b}));
    ASSERT_TRUE(id.is_ok());
    engine.wait();

    const auto stored = session(id.value());
    ASSERT_TRUE(stored.manifest_path.has_value());
    EXPECT_EQ(fs::path(*stored.manifest_path), destination_ / ("ingest_" + id.value() + ".manifest"));

    const std::string manifest = read_file(*stored.manifest_path);
    EXPECT_NE(manifest.find("a.jpg\t" + ingest::checksum_bytes("alpha") + "\t5\n"), std::string::npos);
    EXPECT_NE(manifest.find("b.jpg\t" + ingest::checksum_bytes("beta") + "\t4\n"), std::string::npos);
}

TEST_F(TransferEngineTest, RemovesStaleTempFilesBeforeStarting) {
    const auto a = add_source("a.jpg", "alpha");
    const fs::path stale = destination_ / "old.mov.TBPART";
    write_file(stale, "leftover");
    fs::last_write_time(stale, fs::file_time_type::clock::now() - std::chrono::hours(48));

    TransferEngine engine(config(), store_, bus_);
    ASSERT_TRUE(engine.start(spec({a})).is_ok());
    engine.wait();

    EXPECT_FALSE(fs::exists(stale));
}
