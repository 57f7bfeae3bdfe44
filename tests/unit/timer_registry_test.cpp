// C++ Standard Library
#include <algorithm>
#include <atomic>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

// Core
#include <qb/quiz/errors.hpp>
#include <qb/quiz/timer_registry.hpp>

#include "support/io_fixture.hpp"

using namespace std::chrono_literals;
using quiz_bot::TimerRegistry;
using quiz_bot::TimerRegistryOptions;

namespace
{
    TimerRegistryOptions fast_options()
    {
        TimerRegistryOptions o;
        o.readiness = qb::RetryPolicy{ 3, 5ms, 20ms };
        o.creation = qb::RetryPolicy{ 3, 5ms, 20ms };
        o.cancel_ack_timeout = 150ms;
        o.countdown = quiz_bot::CountdownOptions{ 20ms, 5ms };
        return o;
    }

    quiz_bot::complete_callback_t counter(std::atomic<int>& n)
    {
        return [&n]() -> boost::asio::awaitable<void> {
            ++n;
            co_return;
        };
    }
} // namespace

class TimerRegistryTest : public qb_test::IoFixture
{
protected:
    void TearDown() override
    {
        (void)run(registry_.cancel_timer("#quiz"));
        IoFixture::TearDown();
    }

    TimerRegistry registry_{ strand_, fast_options() };
};

TEST_F(TimerRegistryTest, CompletedCountdownFreesTheSlot)
{
    std::atomic<int> done{ 0 };
    EXPECT_TRUE(registry_.is_ready("#quiz"));

    // Read back in the same strand turn as the start so the countdown cannot have moved yet.
    auto st = run([&]() -> boost::asio::awaitable<std::optional<quiz_bot::TimerStatus>> {
        co_await registry_.start_timer("#quiz", 2, {}, counter(done));
        EXPECT_FALSE(registry_.is_ready("#quiz"));
        co_return registry_.status("#quiz");
    }());
    ASSERT_TRUE(st.has_value());
    EXPECT_EQ(st->total_seconds, 2);

    ASSERT_TRUE(eventually([&] { return done.load() == 1; }));
    ASSERT_TRUE(eventually([&] { return registry_.size() == 0; }));
    EXPECT_TRUE(registry_.is_ready("#quiz"));
    EXPECT_FALSE(registry_.status("#quiz").has_value());
}

TEST_F(TimerRegistryTest, StatusCarriesTheDurationFromRegistration)
{
    auto st = run([&]() -> boost::asio::awaitable<std::optional<quiz_bot::TimerStatus>> {
        co_await registry_.start_timer("#quiz", 30, {}, {});
        co_return registry_.status("#quiz");
    }());

    ASSERT_TRUE(st.has_value());
    EXPECT_EQ(st->total_seconds, 30);
    EXPECT_EQ(st->remaining_seconds, 30);
    EXPECT_FALSE(st->paused);
    EXPECT_FALSE(st->cancelled);
}

TEST_F(TimerRegistryTest, StartingOverALiveCountdownReplacesIt)
{
    std::atomic<int> first{ 0 };
    std::atomic<int> second{ 0 };

    run(registry_.start_timer("#quiz", 100, {}, counter(first)));
    run(registry_.start_timer("#quiz", 1, {}, counter(second)));

    ASSERT_TRUE(eventually([&] { return second.load() == 1; }));
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(first.load(), 0);
}

TEST_F(TimerRegistryTest, ChannelsAreIndependent)
{
    std::atomic<int> a{ 0 };
    std::atomic<int> b{ 0 };

    run(registry_.start_timer("#quiz", 100, {}, counter(a)));
    run(registry_.start_timer("#other", 1, {}, counter(b)));

    ASSERT_TRUE(eventually([&] { return b.load() == 1; }));
    EXPECT_FALSE(registry_.is_ready("#quiz"));
    EXPECT_EQ(a.load(), 0);
}

TEST_F(TimerRegistryTest, CancelIsAcknowledgedAndLeavesTheSlotReady)
{
    std::atomic<int> done{ 0 };
    run(registry_.start_timer("#quiz", 100, {}, counter(done)));

    EXPECT_TRUE(run(registry_.cancel_timer("#quiz")));
    EXPECT_TRUE(registry_.is_ready("#quiz"));
    EXPECT_EQ(registry_.size(), 0u);
    EXPECT_EQ(done.load(), 0);

    // Nothing registered.
    EXPECT_TRUE(run(registry_.cancel_timer("#nobody")));
}

TEST_F(TimerRegistryTest, PauseAndResumeReachTheCountdown)
{
    EXPECT_FALSE(registry_.pause_timer("#quiz"));
    EXPECT_FALSE(registry_.resume_timer("#quiz"));

    std::atomic<int> done{ 0 };
    run(registry_.start_timer("#quiz", 3, {}, counter(done)));

    EXPECT_TRUE(registry_.pause_timer("#quiz"));
    ASSERT_TRUE(eventually([&] {
        auto st = registry_.status("#quiz");
        return st && st->state == quiz_bot::CountdownState::paused;
    }));
    std::this_thread::sleep_for(120ms);
    EXPECT_EQ(done.load(), 0);
    EXPECT_TRUE(registry_.status("#quiz")->paused);

    EXPECT_TRUE(registry_.resume_timer("#quiz"));
    ASSERT_TRUE(eventually([&] { return done.load() == 1; }));
}

TEST_F(TimerRegistryTest, WedgedCountdownIsEvictedByForce)
{
    std::atomic<bool> hung_finished{ false };
    auto hang_once = [&hung_finished](int remaining) -> boost::asio::awaitable<void> {
        if (remaining == 50)
        {
            // Suspended here, outside the countdown's own wait, so cancel() cannot reach it.
            co_await qb::async_sleep(500ms);
            hung_finished = true;
        }
    };

    run(registry_.start_timer("#quiz", 50, hang_once, {}));
    std::this_thread::sleep_for(20ms);

    EXPECT_FALSE(run(registry_.cancel_timer("#quiz")));
    EXPECT_TRUE(registry_.is_ready("#quiz"));

    // The successor must survive the wedged countdown finishing late.
    std::atomic<int> done{ 0 };
    run(registry_.start_timer("#quiz", 100, {}, counter(done)));
    ASSERT_TRUE(eventually([&] { return hung_finished.load(); }));
    std::this_thread::sleep_for(50ms);

    auto st = registry_.status("#quiz");
    ASSERT_TRUE(st.has_value());
    EXPECT_EQ(st->total_seconds, 100);
    EXPECT_EQ(registry_.size(), 1u);
}

TEST_F(TimerRegistryTest, CountdownFailuresReachTheErrorSink)
{
    std::mutex m;
    std::string failed_key;
    std::string failed_what;
    registry_.set_error_sink([&](std::string_view key, std::exception_ptr e) {
        std::lock_guard lk(m);
        failed_key = key;
        try
        {
            std::rethrow_exception(e);
        }
        catch (const std::exception& ex)
        {
            failed_what = ex.what();
        }
    });

    auto bad_tick = [](int) -> boost::asio::awaitable<void> {
        throw std::runtime_error("edit rejected");
        co_return;
    };
    run(registry_.start_timer("#quiz", 1, bad_tick, {}));

    ASSERT_TRUE(eventually([&] {
        std::lock_guard lk(m);
        return !failed_key.empty();
    }));
    std::lock_guard lk(m);
    EXPECT_EQ(failed_key, "#quiz");
    EXPECT_EQ(failed_what, "edit rejected");
}

class FailingFactoryTest : public qb_test::IoFixture
{
protected:
    std::atomic<int> calls_{ 0 };
};

TEST_F(FailingFactoryTest, CreationIsRetriedThenReportedAsStartError)
{
    TimerRegistry registry{ strand_, fast_options(), [this](auto, std::string_view, const auto&) {
                               ++calls_;
                               throw std::runtime_error("no timers today");
                               return std::shared_ptr<quiz_bot::CountdownTimer>{};
                           } };

    EXPECT_THROW(run(registry.start_timer("#quiz", 5, {}, {})), quiz_bot::TimerStartError);
    EXPECT_EQ(calls_.load(), 3);
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_TRUE(registry.is_ready("#quiz"));
}

TEST_F(FailingFactoryTest, NullCountdownCountsAsAFailure)
{
    TimerRegistry registry{ strand_, fast_options(), [this](auto, std::string_view, const auto&) {
                               ++calls_;
                               return std::shared_ptr<quiz_bot::CountdownTimer>{};
                           } };

    EXPECT_THROW(run(registry.start_timer("#quiz", 5, {}, {})), quiz_bot::TimerStartError);
    EXPECT_EQ(calls_.load(), 3);
}

TEST_F(FailingFactoryTest, TransientCreationFailureRecovers)
{
    TimerRegistry registry{ strand_, fast_options(),
                            [this](boost::asio::any_io_executor ex, std::string_view key,
                                   const quiz_bot::CountdownOptions& o) {
                                if (++calls_ < 2)
                                {
                                    throw std::runtime_error("busy");
                                }
                                return std::make_shared<quiz_bot::CountdownTimer>(std::move(ex), std::string{ key }, o);
                            } };

    std::atomic<int> done{ 0 };
    run(registry.start_timer("#quiz", 1, {}, counter(done)));
    EXPECT_EQ(calls_.load(), 2);
    ASSERT_TRUE(eventually([&] { return done.load() == 1; }));
}

TEST_F(FailingFactoryTest, ConcurrentStartsKeepAtMostOneLiveCountdown)
{
    std::mutex m;
    std::vector<std::shared_ptr<quiz_bot::CountdownTimer>> created;
    TimerRegistry registry{ strand_, fast_options(),
                            [&](boost::asio::any_io_executor ex, std::string_view key, const quiz_bot::CountdownOptions& o) {
                                auto t = std::make_shared<quiz_bot::CountdownTimer>(std::move(ex), std::string{ key }, o);
                                std::lock_guard lk(m);
                                created.push_back(t);
                                return t;
                            } };
    auto live_count = [&] {
        std::lock_guard lk(m);
        return std::count_if(created.begin(), created.end(), [](const auto& t) { return t->is_live(); });
    };

    std::atomic<int> done{ 0 };
    std::vector<std::future<void>> starts;
    for (int i = 0; i < 10; ++i)
    {
        starts.push_back(boost::asio::co_spawn(strand_, registry.start_timer("#quiz", 3, {}, counter(done)),
                                               boost::asio::use_future));
    }

    long worst = 0;
    const auto deadline = std::chrono::steady_clock::now() + 3s;
    while (std::chrono::steady_clock::now() < deadline &&
           std::any_of(starts.begin(), starts.end(),
                       [](auto& f) { return f.wait_for(0s) != std::future_status::ready; }))
    {
        worst = std::max<long>(worst, live_count());
        std::this_thread::sleep_for(1ms);
    }
    for (auto& f : starts)
    {
        try
        {
            f.get();
        }
        catch (const quiz_bot::TimerConflictError&)
        {
            // Lost the race for the slot; the slot itself stays consistent.
        }
    }

    EXPECT_LE(worst, 1);
    ASSERT_TRUE(eventually([&] { return live_count() == 0; }));
    EXPECT_EQ(done.load(), 1);
    EXPECT_EQ(registry.size(), 0u);
}
