#include "ingest/core/result.hpp"
#include "ingest/core/retry.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>

namespace {

ingest::RetryPolicy fast_policy(std::size_t attempts) {
    ingest::RetryPolicy policy;
    policy.max_attempts = attempts;
    policy.initial_delay = std::chrono::milliseconds(1);
    policy.max_delay = std::chrono::milliseconds(4);
    return policy;
}

} // namespace

TEST(RetryPolicyTest, DelayGrowsAndCaps) {
    ingest::RetryPolicy policy;
    EXPECT_EQ(policy.delay_after(1), std::chrono::milliseconds(2000));
    EXPECT_EQ(policy.delay_after(2), std::chrono::milliseconds(4000));
    EXPECT_EQ(policy.delay_after(3), std::chrono::milliseconds(8000));
    EXPECT_EQ(policy.delay_after(4), std::chrono::milliseconds(10000));
}

TEST(WithRetryTest, SucceedsAfterTransientFailures) {
    int calls = 0;
    auto result = ingest::with_retry(
        fast_policy(3),
        [&](std::size_t) -> ingest::Result<int> {
            ++calls;
            if (calls < 3) {
                return ingest::Err<int>(ingest::ErrorCode::Network, "timeout");
            }
            return ingest::Ok(7);
        },
        [](const ingest::Error& error) { return error.code == ingest::ErrorCode::Network; });

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), 7);
    EXPECT_EQ(calls, 3);
}

TEST(WithRetryTest, PermanentErrorIsNotRetried) {
    int calls = 0;
    auto result = ingest::with_retry(
        fast_policy(5),
        [&](std::size_t) -> ingest::Result<int> {
            ++calls;
            return ingest::Err<int>(ingest::ErrorCode::Permission, "denied");
        },
        [](const ingest::Error& error) { return error.code == ingest::ErrorCode::Network; });

    EXPECT_TRUE(result.is_error());
    EXPECT_EQ(calls, 1);
}

TEST(WithRetryTest, StopsAtMaxAttempts) {
    std::size_t last_attempt = 0;
    auto result = ingest::with_retry(
        fast_policy(4),
        [&](std::size_t attempt) -> ingest::Result<int> {
            last_attempt = attempt;
            return ingest::Err<int>(ingest::ErrorCode::Network, "timeout");
        },
        [](const ingest::Error&) { return true; });

    EXPECT_TRUE(result.is_error());
    EXPECT_EQ(last_attempt, 4u);
}

TEST(WithRetryTest, InterruptSkipsBackoff) {
    ingest::RetryPolicy policy;
    policy.max_attempts = 3;
    policy.initial_delay = std::chrono::milliseconds(5000);

    std::atomic<bool> interrupt{true};
    int calls = 0;
    const auto started = std::chrono::steady_clock::now();
    auto result = ingest::with_retry(
        policy,
        [&](std::size_t) -> ingest::Result<int> {
            ++calls;
            return ingest::Err<int>(ingest::ErrorCode::Network, "timeout");
        },
        [](const ingest::Error&) { return true; },
        &interrupt);

    EXPECT_TRUE(result.is_error());
    EXPECT_EQ(calls, 1);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(2));
}
