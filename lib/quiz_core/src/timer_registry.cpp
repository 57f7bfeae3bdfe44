/*
Module Name:
- timer_registry.cpp

Abstract:
- Lifecycle of per-channel countdowns: clear the slot, create, spawn, cancel, evict.

Why:
- Readiness and creation retries share qb::RetryPolicy so the backoff shape is configured in one place.
- A generation number rides along with every record; only the owner of that generation may erase it.
- Cancellation waits on a fence rather than polling, and gives up after cancel_ack_timeout.
*/

// C++ Standard Library
#include <algorithm>
#include <iostream>
#include <utility>

// Boost.Asio
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

// Boost.System
#include <boost/system/error_code.hpp>

// Core
#include <qb/quiz/errors.hpp>
#include <qb/quiz/timer_registry.hpp>
#include <qb/utils/stopwatch.hpp>

namespace quiz_bot
{

    using boost::asio::use_awaitable;

    namespace
    {
        std::shared_ptr<CountdownTimer> make_default_timer(boost::asio::any_io_executor executor,
                                                           std::string_view key,
                                                           const CountdownOptions& options)
        {
            return std::make_shared<CountdownTimer>(std::move(executor), std::string{ key }, options);
        }
    } // namespace

    void TimerRegistry::Fence::signal()
    {
        finished.store(true, std::memory_order_release);
        for (auto& w : waiters)
        {
            if (auto t = w.lock())
            {
                t->cancel();
            }
        }
        waiters.clear();
    }

    TimerRegistry::TimerRegistry(boost::asio::any_io_executor executor,
                                 TimerRegistryOptions options,
                                 timer_factory_t factory) :
        executor_{ std::move(executor) },
        options_{ options },
        factory_{ factory ? std::move(factory) : timer_factory_t{ &make_default_timer } }
    {
        timers_.reserve(16);
    }

    void TimerRegistry::set_error_sink(timer_error_sink_t sink)
    {
        std::lock_guard lk(mutex_);
        error_sink_ = std::move(sink);
    }

    bool TimerRegistry::is_ready(std::string_view key)
    {
        std::lock_guard lk(mutex_);
        auto it = timers_.find(key);
        if (it == timers_.end())
        {
            return true;
        }
        if (is_live(it->second))
        {
            return false;
        }

        // Finished but not yet reaped: clear it so the next start is not blocked.
        std::cout << "[TimerRegistry] " << key << " evicting finished countdown ("
                  << to_string(it->second.timer->state()) << ")\n";
        timers_.erase(it);
        return true;
    }

    void TimerRegistry::erase_if_current(std::string_view key, std::uint64_t generation)
    {
        std::lock_guard lk(mutex_);
        if (auto it = timers_.find(key); it != timers_.end() && it->second.generation == generation)
        {
            timers_.erase(it);
        }
    }

    boost::asio::awaitable<void> TimerRegistry::start_timer(std::string key,
                                                            int duration_seconds,
                                                            tick_callback_t on_tick,
                                                            complete_callback_t on_complete)
    {
        co_await boost::asio::dispatch(executor_, use_awaitable);

        // 1) Make sure no live countdown occupies the channel.
        const unsigned readiness_attempts = std::max(options_.readiness.max_attempts, 1u);
        for (unsigned attempt = 1; !is_ready(key); ++attempt)
        {
            std::cerr << "[TimerRegistry] " << key << " still has a live countdown, clearing (attempt "
                      << attempt << '/' << readiness_attempts << ")\n";
            (void)co_await cancel_timer(key);
            if (is_ready(key))
            {
                break;
            }
            if (attempt >= readiness_attempts)
            {
                throw TimerConflictError("countdown for '" + key + "' is still live after " +
                                         std::to_string(readiness_attempts) + " attempts");
            }
            co_await qb::async_sleep(options_.readiness.delay_after(attempt));
        }

        // 2) Create, register and spawn. Any failure removes the partial record before the next attempt.
        auto create = [&](unsigned attempt) -> boost::asio::awaitable<void> {
            std::uint64_t generation = 0;
            try
            {
                auto timer = factory_(executor_, key, options_.countdown);
                if (!timer)
                {
                    throw TimerSubsystemError("timer factory returned no countdown");
                }

                timer->arm(duration_seconds);
                Entry entry{ std::move(timer), std::make_shared<Fence>(), 0 };
                {
                    std::lock_guard lk(mutex_);
                    entry.generation = generation = next_generation_++;
                    timers_.insert_or_assign(key, entry);
                }

                boost::asio::co_spawn(executor_,
                                      run_countdown(key, entry, duration_seconds, on_tick, on_complete),
                                      boost::asio::detached);
            }
            catch (...)
            {
                if (generation != 0)
                {
                    erase_if_current(key, generation);
                }
                throw;
            }

            std::cout << "[TimerRegistry] " << key << " countdown " << duration_seconds
                      << "s scheduled (attempt " << attempt << ")\n";
            co_return;
        };

        std::string failure;
        try
        {
            co_await qb::with_retry(options_.creation, "countdown start for " + key, create);
            co_return;
        }
        catch (const std::exception& e)
        {
            failure = e.what();
        }

        throw TimerStartError("could not start countdown for '" + key + "': " + failure);
    }

    boost::asio::awaitable<void> TimerRegistry::run_countdown(std::string key,
                                                              Entry entry,
                                                              int duration_seconds,
                                                              tick_callback_t on_tick,
                                                              complete_callback_t on_complete)
    {
        std::exception_ptr failure;
        try
        {
            co_await entry.timer->run(duration_seconds, std::move(on_tick), std::move(on_complete));
        }
        catch (const std::exception& e)
        {
            std::cerr << "[TimerRegistry] " << key << " countdown reported: " << e.what() << '\n';
            failure = std::current_exception();
        }
        catch (...)
        {
            std::cerr << "[TimerRegistry] " << key << " countdown reported: <unknown exception>\n";
            failure = std::current_exception();
        }

        entry.fence->signal();
        erase_if_current(key, entry.generation);

        if (failure)
        {
            timer_error_sink_t sink;
            {
                std::lock_guard lk(mutex_);
                sink = error_sink_;
            }
            if (sink)
            {
                sink(key, failure);
            }
        }
    }

    boost::asio::awaitable<bool> TimerRegistry::wait_fence(std::shared_ptr<Fence> fence,
                                                           std::chrono::milliseconds timeout)
    {
        if (fence->finished.load(std::memory_order_acquire))
        {
            co_return true;
        }

        auto waiter = std::make_shared<boost::asio::steady_timer>(executor_);
        waiter->expires_after(timeout);
        fence->waiters.push_back(waiter);

        // Cancelled by Fence::signal(), or expires on its own when the countdown is wedged.
        boost::system::error_code ec;
        co_await waiter->async_wait(boost::asio::redirect_error(use_awaitable, ec));
        co_return fence->finished.load(std::memory_order_acquire);
    }

    boost::asio::awaitable<bool> TimerRegistry::cancel_timer(std::string key)
    {
        co_await boost::asio::dispatch(executor_, use_awaitable);

        std::optional<Entry> entry;
        {
            std::lock_guard lk(mutex_);
            if (auto it = timers_.find(key); it != timers_.end())
            {
                entry = it->second;
            }
        }
        if (!entry)
        {
            co_return true;
        }

        const qb::Stopwatch watch;
        entry->timer->cancel();
        const bool acknowledged = co_await wait_fence(entry->fence, options_.cancel_ack_timeout);

        // Evict on both paths; a forced eviction must never leave a stale record behind.
        erase_if_current(key, entry->generation);

        if (acknowledged)
        {
            std::cout << "[TimerRegistry] " << key << " countdown cancelled in "
                      << watch.elapsed_count<std::chrono::milliseconds>() << "ms\n";
        }
        else
        {
            std::cerr << "[TimerRegistry] " << key << " countdown did not acknowledge cancel within "
                      << options_.cancel_ack_timeout.count() << "ms, evicted by force\n";
        }
        co_return acknowledged;
    }

    bool TimerRegistry::pause_timer(std::string_view key)
    {
        std::lock_guard lk(mutex_);
        auto it = timers_.find(key);
        if (it == timers_.end())
        {
            return false;
        }
        it->second.timer->pause();
        return true;
    }

    bool TimerRegistry::resume_timer(std::string_view key)
    {
        std::lock_guard lk(mutex_);
        auto it = timers_.find(key);
        if (it == timers_.end())
        {
            return false;
        }
        it->second.timer->resume();
        return true;
    }

    std::optional<TimerStatus> TimerRegistry::status(std::string_view key) const
    {
        std::lock_guard lk(mutex_);
        auto it = timers_.find(key);
        if (it == timers_.end())
        {
            return std::nullopt;
        }
        const auto& t = *it->second.timer;
        return TimerStatus{ t.remaining_seconds(), t.total_seconds(), t.is_paused(), t.is_cancelled(), t.state() };
    }

    std::size_t TimerRegistry::size() const
    {
        std::lock_guard lk(mutex_);
        return timers_.size();
    }

} // namespace quiz_bot
