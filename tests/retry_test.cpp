#include <gtest/gtest.h>
#include <stop_token>
#include <thread>
#include "infra/retry.hpp"

using namespace chunkup;
using infra::ErrorCode;
using infra::RetryPolicy;

namespace {

RetryPolicy fast_policy(int attempts) {
    return RetryPolicy{ .max_attempts = attempts, .initial_delay = std::chrono::milliseconds(1), .backoff_factor = 2.0 };
}

} // namespace

TEST(RetryTest, DelayGrowsExponentially) {
    RetryPolicy policy{ .max_attempts = 5, .initial_delay = std::chrono::milliseconds(100), .backoff_factor = 2.0 };
    EXPECT_EQ(policy.delay_for(0), std::chrono::milliseconds(100));
    EXPECT_EQ(policy.delay_for(1), std::chrono::milliseconds(200));
    EXPECT_EQ(policy.delay_for(3), std::chrono::milliseconds(800));
}

TEST(RetryTest, TransientErrorsUseTheWholeBudget) {
    int calls = 0;
    auto result = infra::with_retry([&]() -> infra::VoidResult {
        ++calls;
        return std::unexpected(infra::make_error(ErrorCode::TransientUploadError, "503"));
    }, fast_policy(3));

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::TransientUploadError);
    EXPECT_EQ(calls, 3);
}

TEST(RetryTest, SucceedsAfterTransientFailures) {
    int calls = 0;
    auto result = infra::with_retry([&]() -> infra::Result<int> {
        if (++calls < 3) {
            return std::unexpected(infra::make_error(ErrorCode::TransientUploadError, "429"));
        }
        return 42;
    }, fast_policy(3));

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 42);
    EXPECT_EQ(calls, 3);
}

TEST(RetryTest, NonTransientErrorIsNotRetried) {
    int calls = 0;
    auto result = infra::with_retry([&]() -> infra::VoidResult {
        ++calls;
        return std::unexpected(infra::make_error(ErrorCode::NonRetryableUploadError, "403"));
    }, fast_policy(5));

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::NonRetryableUploadError);
    EXPECT_EQ(calls, 1);
}

TEST(RetryTest, StopDuringBackoffIsCancelled) {
    std::stop_source source;
    int calls = 0;
    RetryPolicy slow{ .max_attempts = 5, .initial_delay = std::chrono::seconds(30), .backoff_factor = 1.0 };

    std::jthread stopper([&source] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        source.request_stop();
    });

    const auto begin = std::chrono::steady_clock::now();
    auto result = infra::with_retry([&]() -> infra::VoidResult {
        ++calls;
        return std::unexpected(infra::make_error(ErrorCode::TransientUploadError, "502"));
    }, slow, source.get_token());

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Cancelled);
    EXPECT_EQ(calls, 1);
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(10));
}
