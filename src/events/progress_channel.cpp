#include "ingest/events/progress_channel.hpp"

namespace ingest::events {

ProgressChannel::ProgressChannel(EventBus& bus, std::size_t capacity) : queue_(capacity) {
    forward<SessionStartedEvent>(bus);
    forward<TransferProgressEvent>(bus);
    forward<FileCompletedEvent>(bus);
    forward<FileFailedEvent>(bus);
    forward<SessionPausedEvent>(bus);
    forward<SessionResumedEvent>(bus);
    forward<SessionFinishedEvent>(bus);
}

void ProgressChannel::enqueue(ProgressMessage message) {
    const auto dropped = queue_.push_coalesced(std::move(message), [](const ProgressMessage& m) {
        return std::holds_alternative<TransferProgressEvent>(m);
    });
    if (dropped > 0) {
        dropped_ += dropped;
    }
}

} // namespace ingest::events
