#pragma once

#include "ingest/events/event_bus.hpp"
#include "ingest/events/event_queue.hpp"
#include "ingest/events/events.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <optional>
#include <variant>
#include <vector>

namespace ingest::events {

using ProgressMessage = std::variant<
    SessionStartedEvent,
    TransferProgressEvent,
    FileCompletedEvent,
    FileFailedEvent,
    SessionPausedEvent,
    SessionResumedEvent,
    SessionFinishedEvent>;

/**
 * @brief Moves transfer events from worker threads to one consumer thread
 *
 * Progress snapshots coalesce (newest wins) and are the only messages
 * evicted when the channel is full, so completion and terminal events are
 * never lost.
 */
class ProgressChannel {
public:
    explicit ProgressChannel(EventBus& bus, std::size_t capacity = 256);

    ProgressChannel(const ProgressChannel&) = delete;
    ProgressChannel& operator=(const ProgressChannel&) = delete;

    std::optional<ProgressMessage> try_next() { return queue_.try_pop(); }

    template<typename Rep, typename Period>
    std::optional<ProgressMessage> next_for(const std::chrono::duration<Rep, Period>& timeout) {
        return queue_.pop_for(timeout);
    }

    void close() { queue_.shutdown(); }

    [[nodiscard]] std::size_t pending() const { return queue_.size(); }
    [[nodiscard]] std::size_t dropped_snapshots() const noexcept { return dropped_.load(); }

private:
    template<typename EventType>
    void forward(EventBus& bus) {
        subscriptions_.push_back(bus.subscribe_scoped<EventType>(
            [this](const EventType& e) { enqueue(ProgressMessage{e}); }));
    }

    void enqueue(ProgressMessage message);

    ThreadSafeQueue<ProgressMessage> queue_;
    std::atomic<std::size_t> dropped_{0};
    std::vector<Subscription> subscriptions_;
};

} // namespace ingest::events
