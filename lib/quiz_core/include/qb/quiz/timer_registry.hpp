/*
Module Name:
- timer_registry.hpp

Abstract:
- Owns at most one live CountdownTimer per channel and makes creation race free.
- Each countdown runs as its own coroutine on the registry strand; the registry inserts the record
  before spawning and removes it when the coroutine finishes.
- cancel_timer() waits a bounded time for the coroutine to acknowledge, then evicts
  by force so a wedged countdown can never block the next question.

Why:
- The timer itself knows nothing of the map; identity checks on removal stop a late
  finishing countdown from evicting its successor.
- Map access is mutex guarded so status and readiness can be read from any thread.
*/
#pragma once

// C++ Standard Library
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <utility>

// Boost.Asio
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

// Core
#include <qb/quiz/countdown_timer.hpp>
#include <qb/utils/retry_policy.hpp>
#include <qb/utils/string_hash.hpp>

namespace quiz_bot
{

    struct TimerRegistryOptions
    {
        qb::RetryPolicy readiness{ 3, std::chrono::milliseconds{ 100 } }; // clearing an occupied slot
        qb::RetryPolicy creation{ 3, std::chrono::milliseconds{ 100 } }; // constructing and registering
        std::chrono::milliseconds cancel_ack_timeout{ 2000 };
        CountdownOptions countdown{};
    };

    // Read-only view of a registered countdown.
    struct TimerStatus
    {
        int remaining_seconds = 0;
        int total_seconds = 0;
        bool paused = false;
        bool cancelled = false;
        CountdownState state = CountdownState::idle;
    };

    // Builds the countdown for a channel. Replaceable so tests can inject failures.
    using timer_factory_t = std::function<std::shared_ptr<CountdownTimer>(
        boost::asio::any_io_executor executor, std::string_view key, const CountdownOptions& options)>;

    // Receives failures a countdown reported when it finished.
    using timer_error_sink_t = std::function<void(std::string_view key, std::exception_ptr error)>;

    class TimerRegistry
    {
    public:
        // executor should be the strand that also runs the session controller.
        explicit TimerRegistry(boost::asio::any_io_executor executor,
                               TimerRegistryOptions options = {},
                               timer_factory_t factory = {});

        TimerRegistry(const TimerRegistry&) = delete;
        TimerRegistry& operator=(const TimerRegistry&) = delete;

        // True when nothing live is registered for key. A finished record is evicted here.
        [[nodiscard]] bool is_ready(std::string_view key);

        // Registers and spawns a countdown; returns once it is scheduled, not when it ends.
        // Throws TimerConflictError if the slot cannot be cleared, TimerStartError if creation keeps failing.
        [[nodiscard]] boost::asio::awaitable<void> start_timer(std::string key,
                                                               int duration_seconds,
                                                               tick_callback_t on_tick,
                                                               complete_callback_t on_complete);

        // Returns true when the countdown acknowledged within cancel_ack_timeout (or none was registered).
        // Post: is_ready(key).
        [[nodiscard]] boost::asio::awaitable<bool> cancel_timer(std::string key);

        // False when no timer is registered for key.
        bool pause_timer(std::string_view key);
        bool resume_timer(std::string_view key);

        [[nodiscard]] std::optional<TimerStatus> status(std::string_view key) const;

        [[nodiscard]] std::size_t size() const;

        void set_error_sink(timer_error_sink_t sink);

        [[nodiscard]] boost::asio::any_io_executor executor() const noexcept
        {
            return executor_;
        }

    private:
        // Set once when the countdown coroutine returns. Waiters are woken by cancelling their timers.
        struct Fence
        {
            std::atomic<bool> finished{ false };
            std::vector<std::weak_ptr<boost::asio::steady_timer>> waiters; // strand only
            void signal();
        };

        struct Entry
        {
            std::shared_ptr<CountdownTimer> timer;
            std::shared_ptr<Fence> fence;
            std::uint64_t generation = 0;
        };

        [[nodiscard]] static bool is_live(const Entry& e) noexcept
        {
            return !e.fence->finished.load(std::memory_order_acquire) && e.timer->is_live();
        }

        boost::asio::awaitable<void> run_countdown(std::string key,
                                                   Entry entry,
                                                   int duration_seconds,
                                                   tick_callback_t on_tick,
                                                   complete_callback_t on_complete);

        boost::asio::awaitable<bool> wait_fence(std::shared_ptr<Fence> fence, std::chrono::milliseconds timeout);

        // Erase key only if it still maps to this generation.
        void erase_if_current(std::string_view key, std::uint64_t generation);

        boost::asio::any_io_executor executor_; // a strand; every coroutine here runs on it
        const TimerRegistryOptions options_;
        timer_factory_t factory_;

        mutable std::mutex mutex_; // guards timers_, next_generation_, error_sink_
        qb::StringMap<Entry> timers_;
        std::uint64_t next_generation_ = 1;
        timer_error_sink_t error_sink_;
    };

} // namespace quiz_bot
