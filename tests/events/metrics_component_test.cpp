#include "ingest/events/components.hpp"
#include "ingest/events/event_bus.hpp"
#include "ingest/events/events.hpp"

#include <gtest/gtest.h>

#include <chrono>

using namespace ingest::events;

TEST(MetricsComponentTest, CountsSessionsFilesAndDevices) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(SessionStartedEvent{"ses_1", "sdb1", 2, 3072, 0});

    ingest::FileTransferRecord record;
    record.source_path = "/media/card/DCIM/a.jpg";
    record.size_bytes = 1024;
    record.status = ingest::FileStatus::Complete;
    bus.emit(FileCompletedEvent{"ses_1", record, std::chrono::milliseconds{15}});

    record.source_path = "/media/card/DCIM/b.jpg";
    record.status = ingest::FileStatus::Error;
    bus.emit(FileFailedEvent{"ses_1", record});

    SessionFinishedEvent finished;
    finished.session_id = "ses_1";
    finished.status = ingest::SessionStatus::Error;
    bus.emit(finished);

    finished.session_id = "ses_2";
    finished.status = ingest::SessionStatus::Cancelled;
    bus.emit(finished);

    bus.emit(DeviceAddedEvent{ingest::Device{}});
    bus.emit(DeviceRemovedEvent{ingest::Device{}});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.sessions_started.load(), 1u);
    EXPECT_EQ(stats.files_completed.load(), 1u);
    EXPECT_EQ(stats.bytes_completed.load(), 1024u);
    EXPECT_EQ(stats.files_failed.load(), 1u);
    EXPECT_EQ(stats.sessions_failed.load(), 1u);
    EXPECT_EQ(stats.sessions_cancelled.load(), 1u);
    EXPECT_EQ(stats.devices_added.load(), 1u);
    EXPECT_EQ(stats.devices_removed.load(), 1u);
}

TEST(MetricsComponentTest, StopsCountingWhenDestroyed) {
    EventBus bus;
    {
        MetricsComponent metrics(bus);
        EXPECT_GT(bus.subscriber_count<SessionStartedEvent>(), 0u);
    }
    EXPECT_EQ(bus.subscriber_count<SessionStartedEvent>(), 0u);
    EXPECT_NO_THROW(bus.emit(SessionStartedEvent{}));
}
