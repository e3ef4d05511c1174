#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <unordered_map>

namespace ingest::transfer {

/**
 * @brief Caps how often progress snapshots go out
 *
 * Two limits apply: one per key (each file's tier interval) and one across
 * all keys (the session-wide interval). Not thread-safe; the owner locks.
 */
class ProgressThrottle {
public:
    using TimePoint = std::chrono::steady_clock::time_point;

    explicit ProgressThrottle(std::chrono::milliseconds global_interval)
        : global_interval_(global_interval) {}

    /// True (and both clocks are reset) when @p key may report at @p now.
    bool should_emit(const std::string& key, std::chrono::milliseconds key_interval, TimePoint now) {
        const auto it = last_by_key_.find(key);
        if (it != last_by_key_.end() && now - it->second < key_interval) {
            return false;
        }
        if (last_emit_ && now - *last_emit_ < global_interval_) {
            return false;
        }
        last_by_key_[key] = now;
        last_emit_ = now;
        return true;
    }

    /// Records an emission that bypassed the limits.
    void mark_emitted(TimePoint now) { last_emit_ = now; }

    void forget(const std::string& key) { last_by_key_.erase(key); }

    void reset() {
        last_emit_.reset();
        last_by_key_.clear();
    }

private:
    std::chrono::milliseconds global_interval_;
    std::optional<TimePoint> last_emit_;
    std::unordered_map<std::string, TimePoint> last_by_key_;
};

} // namespace ingest::transfer
