#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <thread>

namespace ingest {

/**
 * @brief Exponential back-off for transient per-file failures
 *
 * Attempt numbers start at 1. max_attempts == 1 disables retrying.
 */
struct RetryPolicy {
    std::size_t max_attempts = 3;
    std::chrono::milliseconds initial_delay{2000};
    std::chrono::milliseconds max_delay{10000};
    double multiplier = 2.0;

    /// Delay to wait after @p attempt has failed.
    [[nodiscard]] std::chrono::milliseconds delay_after(std::size_t attempt) const {
        double delay = static_cast<double>(initial_delay.count());
        for (std::size_t i = 1; i < attempt; ++i) {
            delay *= multiplier;
            if (delay >= static_cast<double>(max_delay.count())) {
                return max_delay;
            }
        }
        return std::min(max_delay, std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(delay)));
    }
};

/**
 * @brief Runs @p operation until it succeeds, @p should_retry declines, or
 * attempts run out
 *
 * @p operation receives the 1-based attempt number and returns a Result.
 * The back-off sleep wakes early when @p interrupt turns true, in which
 * case the last failure is returned as-is.
 */
template<typename Operation, typename Predicate>
auto with_retry(const RetryPolicy& policy,
                Operation&& operation,
                Predicate&& should_retry,
                const std::atomic<bool>* interrupt = nullptr) -> decltype(operation(std::size_t{1})) {
    const std::size_t attempts = std::max<std::size_t>(policy.max_attempts, 1);
    std::size_t attempt = 1;
    auto result = operation(attempt);

    while (result.is_error() && attempt < attempts && should_retry(result.error())) {
        const auto deadline = std::chrono::steady_clock::now() + policy.delay_after(attempt);
        while (std::chrono::steady_clock::now() < deadline) {
            if (interrupt != nullptr && interrupt->load()) {
                return result;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        ++attempt;
        result = operation(attempt);
    }
    return result;
}

} // namespace ingest
