// C++ Standard Library
#include <chrono>
#include <future>
#include <vector>
#include <utility>

// Boost.Asio
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_future.hpp>

// Chat
#include <qb/chat/chat_rate_limiter.hpp>
#include <qb/utils/stopwatch.hpp>

#include "support/io_fixture.hpp"

using namespace std::chrono_literals;
using quiz_bot::ChatRateLimiter;
using quiz_bot::RateLimits;

class ChatRateLimiterTest : public qb_test::IoFixture
{
protected:
    ChatRateLimiter limiter_{ io_.get_executor(), RateLimits{ 3, 300ms, 100ms } };

    std::chrono::milliseconds timed_acquire(const char* channel)
    {
        const qb::Stopwatch watch;
        run(limiter_.acquire(channel));
        return watch.elapsed_duration<std::chrono::milliseconds>();
    }
};

TEST_F(ChatRateLimiterTest, SameChannelIsSpacedByTheGap)
{
    EXPECT_LT(timed_acquire("quiz"), 80ms);
    EXPECT_GE(timed_acquire("quiz"), 90ms);
}

TEST_F(ChatRateLimiterTest, DifferentChannelsDoNotWaitOnEachOther)
{
    EXPECT_LT(timed_acquire("one"), 80ms);
    EXPECT_LT(timed_acquire("two"), 80ms);
}

TEST_F(ChatRateLimiterTest, GlobalBurstIsEnforced)
{
    EXPECT_LT(timed_acquire("a"), 80ms);
    EXPECT_LT(timed_acquire("b"), 80ms);
    EXPECT_LT(timed_acquire("c"), 80ms);
    EXPECT_GE(timed_acquire("d"), 250ms);
}

TEST_F(ChatRateLimiterTest, ConcurrentCallersGetDistinctSlots)
{
    const qb::Stopwatch watch;
    std::vector<std::future<void>> pending;
    for (int i = 0; i < 3; ++i)
    {
        pending.push_back(boost::asio::co_spawn(strand_, limiter_.acquire("quiz"), boost::asio::use_future));
    }
    for (auto& f : pending)
    {
        f.get();
    }
    // Three bookings on one channel: the last one sits two gaps out.
    EXPECT_GE(watch.elapsed_count<std::chrono::milliseconds>(), 190);
}

TEST_F(ChatRateLimiterTest, ResetForgetsBookings)
{
    (void)timed_acquire("quiz");
    run(limiter_.reset());
    EXPECT_LT(timed_acquire("quiz"), 80ms);
}
