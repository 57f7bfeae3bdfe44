// C++ Standard Library
#include <atomic>
#include <chrono>
#include <stdexcept>

// Core
#include <qb/utils/retry_policy.hpp>

#include "support/io_fixture.hpp"

using namespace std::chrono_literals;

TEST(RetryPolicy, DelayDoublesFromBaseAndIsCapped)
{
    const qb::RetryPolicy p{ 5, 100ms, 350ms };
    EXPECT_EQ(p.delay_after(0), 0ms);
    EXPECT_EQ(p.delay_after(1), 100ms);
    EXPECT_EQ(p.delay_after(2), 200ms);
    EXPECT_EQ(p.delay_after(3), 350ms);
    EXPECT_EQ(p.delay_after(40), 350ms);
}

TEST(RetryPolicy, JitterStaysBetweenFloorAndCap)
{
    const qb::RetryPolicy p{ 0, 2000ms, 30000ms };
    for (unsigned n = 1; n < 8; ++n)
    {
        const auto d = p.jittered_delay_after(n, 1000ms);
        EXPECT_GE(d, 1000ms);
        EXPECT_LE(d, p.delay_after(n));
    }
    EXPECT_EQ(p.jittered_delay_after(0, 1000ms), 1000ms);
}

class WithRetry : public qb_test::IoFixture
{
};

TEST_F(WithRetry, SucceedsOnALaterAttempt)
{
    std::atomic<unsigned> calls{ 0 };
    const int value = run(qb::with_retry(qb::RetryPolicy{ 3, 1ms, 5ms }, "flaky op",
                                         [&](unsigned attempt) -> boost::asio::awaitable<int> {
                                             ++calls;
                                             if (attempt < 3)
                                             {
                                                 throw std::runtime_error("not yet");
                                             }
                                             co_return 42;
                                         }));
    EXPECT_EQ(value, 42);
    EXPECT_EQ(calls.load(), 3u);
}

TEST_F(WithRetry, RethrowsTheLastFailureUnchanged)
{
    std::atomic<unsigned> calls{ 0 };
    auto op = [&](unsigned) -> boost::asio::awaitable<void> {
        ++calls;
        throw std::out_of_range("always");
        co_return;
    };
    EXPECT_THROW(run(qb::with_retry(qb::RetryPolicy{ 2, 1ms, 5ms }, "doomed op", op)), std::out_of_range);
    EXPECT_EQ(calls.load(), 2u);
}

TEST_F(WithRetry, ZeroAttemptsStillRunsOnce)
{
    std::atomic<unsigned> calls{ 0 };
    auto op = [&](unsigned) -> boost::asio::awaitable<void> {
        ++calls;
        throw std::runtime_error("once");
        co_return;
    };
    EXPECT_THROW(run(qb::with_retry(qb::RetryPolicy{ 0, 1ms, 5ms }, "single op", op)), std::runtime_error);
    EXPECT_EQ(calls.load(), 1u);
}
