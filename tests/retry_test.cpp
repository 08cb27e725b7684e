#include <gtest/gtest.h>

#include <vector>

#include "infra/retry.hpp"

namespace infra = rescuecp::infra;

namespace {

auto media_error() -> infra::Result<int> {
    return std::unexpected(infra::make_error(infra::ErrorCode::MediaError, "bad sector"));
}

} // namespace

TEST(RetryTest, SucceedsWithoutRetry)
{
    int calls = 0;
    auto res = infra::with_retry([&]() -> infra::Result<int> { ++calls; return 42; },
                                 infra::RetryPolicy{.max_retries = 3});
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(*res, 42);
    EXPECT_EQ(calls, 1);
}

TEST(RetryTest, MakesRetriesPlusOneAttempts)
{
    int calls = 0;
    std::vector<int> attempts;
    auto res = infra::with_retry([&]() { ++calls; return media_error(); },
                                 infra::RetryPolicy{.max_retries = 3},
                                 [&](int attempt, const infra::Error&) { attempts.push_back(attempt); });
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(calls, 4);
    EXPECT_EQ(attempts, (std::vector<int>{1, 2, 3, 4}));
}

TEST(RetryTest, RecoversOnLaterAttempt)
{
    int calls = 0;
    auto res = infra::with_retry([&]() -> infra::Result<int> {
        if (++calls < 3) return media_error();
        return 7;
    }, infra::RetryPolicy{.max_retries = 2});
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(calls, 3);
}

TEST(RetryTest, StopsOnNonTransientError)
{
    int calls = 0;
    auto res = infra::with_retry([&]() -> infra::Result<int> {
        ++calls;
        return std::unexpected(infra::make_error(infra::ErrorCode::StreamFailure, "gone"));
    }, infra::RetryPolicy{.max_retries = 5});
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, infra::ErrorCode::StreamFailure);
    EXPECT_EQ(calls, 1);
}

TEST(RetryTest, DelayGrowsBetweenAttempts)
{
    int calls = 0;
    const auto start = std::chrono::steady_clock::now();
    auto res = infra::with_retry([&]() { ++calls; return media_error(); },
                                 infra::RetryPolicy{.max_retries = 2,
                                                    .initial_delay = std::chrono::milliseconds(5),
                                                    .backoff_factor = 2.0});
    const auto elapsed = std::chrono::steady_clock::now() - start;
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(calls, 3);
    // 5 ms + 10 ms
    EXPECT_GE(elapsed, std::chrono::milliseconds(15));
}
