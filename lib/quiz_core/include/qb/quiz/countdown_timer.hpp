/*
Module Name:
- countdown_timer.hpp

Abstract:
- Single-use, pausable, cancellable per-question countdown driven as an Asio coroutine.
- Ticks once per tick interval while running; while paused it polls without consuming time.
- cancel() interrupts the pending wait so run() returns within one poll interval.

Why:
- The timer knows nothing about channels or sessions; the registry owns placement
  and the controller owns what a tick or completion means.
- Callback failures are kept and rethrown from run() after the countdown ends so a
  flaky chat edit never cuts a question short and never goes unreported.
*/
#pragma once

// C++ Standard Library
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

// Boost.Asio
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

namespace quiz_bot
{

    enum class CountdownState : std::uint8_t
    {
        idle,
        running,
        paused,
        completed,
        cancelled,
    };

    [[nodiscard]] std::string_view to_string(CountdownState s) noexcept;

    // Invoked with the seconds left before each tick wait.
    using tick_callback_t = std::function<boost::asio::awaitable<void>(int remaining_seconds)>;

    // Invoked once on natural expiry. Never invoked after cancel().
    using complete_callback_t = std::function<boost::asio::awaitable<void>()>;

    struct CountdownOptions
    {
        std::chrono::milliseconds tick{ 1000 }; // one countdown "second"
        std::chrono::milliseconds poll{ 100 }; // pause re-check and cancel latency bound
    };

    class CountdownTimer : public std::enable_shared_from_this<CountdownTimer>
    {
    public:
        // executor should be the strand run() is spawned on.
        CountdownTimer(boost::asio::any_io_executor executor, std::string label, CountdownOptions options = {});

        CountdownTimer(const CountdownTimer&) = delete;
        CountdownTimer& operator=(const CountdownTimer&) = delete;

        // Records the duration before run() is scheduled so status reads are meaningful from registration.
        // No effect once the countdown has left idle.
        void arm(int duration_seconds) noexcept;

        // Idle -> Running -> {Completed, Cancelled}. Throws TimerSubsystemError if not idle.
        // Rethrows the first callback failure once the countdown has finished.
        [[nodiscard]] boost::asio::awaitable<void>
        run(int duration_seconds, tick_callback_t on_tick, complete_callback_t on_complete);

        // Idempotent.
        void pause() noexcept;
        void resume() noexcept;

        // Safe from any thread. Wakes a pending wait through the timer's executor.
        void cancel() noexcept;

        [[nodiscard]] CountdownState state() const noexcept
        {
            return state_.load(std::memory_order_acquire);
        }

        // Idle counts as live: the countdown has been handed out but not yet scheduled.
        [[nodiscard]] bool is_live() const noexcept
        {
            const auto s = state();
            return s != CountdownState::completed && s != CountdownState::cancelled;
        }

        [[nodiscard]] bool is_paused() const noexcept
        {
            return paused_.load(std::memory_order_acquire);
        }

        [[nodiscard]] bool is_cancelled() const noexcept
        {
            return cancelled_.load(std::memory_order_acquire);
        }

        [[nodiscard]] int remaining_seconds() const noexcept
        {
            return remaining_.load(std::memory_order_acquire);
        }

        [[nodiscard]] int total_seconds() const noexcept
        {
            return total_.load(std::memory_order_acquire);
        }

        [[nodiscard]] const std::string& label() const noexcept
        {
            return label_;
        }

    private:
        // Returns false when the wait was cut short by cancel().
        boost::asio::awaitable<bool> wait_for(std::chrono::milliseconds d);

        void transition(CountdownState to, std::string_view reason) noexcept;

        const std::string label_;
        const CountdownOptions options_;
        boost::asio::steady_timer wait_;

        std::atomic<CountdownState> state_{ CountdownState::idle };
        std::atomic<bool> paused_{ false };
        std::atomic<bool> cancelled_{ false };
        std::atomic<int> remaining_{ 0 };
        std::atomic<int> total_{ 0 };
    };

} // namespace quiz_bot
