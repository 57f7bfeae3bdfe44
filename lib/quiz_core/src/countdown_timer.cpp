// Countdown loop for a single question.
// Rationale:
// - All waits go through one steady_timer so cancel() has exactly one thing to interrupt.
// - Paused time is spent in short polls; remaining_ only moves after a full tick.

// C++ Standard Library
#include <exception>
#include <iostream>
#include <utility>

// Boost.Asio
#include <boost/asio/dispatch.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

// Boost.System
#include <boost/system/error_code.hpp>

// Core
#include <qb/quiz/countdown_timer.hpp>
#include <qb/quiz/errors.hpp>

namespace quiz_bot
{

    std::string_view to_string(CountdownState s) noexcept
    {
        switch (s)
        {
        case CountdownState::idle:
            return "idle";
        case CountdownState::running:
            return "running";
        case CountdownState::paused:
            return "paused";
        case CountdownState::completed:
            return "completed";
        case CountdownState::cancelled:
            return "cancelled";
        }
        return "unknown";
    }

    CountdownTimer::CountdownTimer(boost::asio::any_io_executor executor,
                                   std::string label,
                                   CountdownOptions options) :
        label_{ std::move(label) }, options_{ options }, wait_{ std::move(executor) }
    {
    }

    void CountdownTimer::transition(CountdownState to, std::string_view reason) noexcept
    {
        const auto from = state_.exchange(to, std::memory_order_acq_rel);
        if (from != to)
        {
            std::cout << "[Countdown] " << label_ << ' ' << to_string(from) << " -> " << to_string(to)
                      << " (" << reason << ")\n";
        }
    }

    boost::asio::awaitable<bool> CountdownTimer::wait_for(std::chrono::milliseconds d)
    {
        if (is_cancelled())
        {
            co_return false;
        }

        boost::system::error_code ec;
        wait_.expires_after(d);
        co_await wait_.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));

        // operation_aborted only comes from cancel(); the flag is set before the wake-up.
        co_return !is_cancelled();
    }

    void CountdownTimer::arm(int duration_seconds) noexcept
    {
        if (state() != CountdownState::idle)
        {
            return;
        }
        total_.store(duration_seconds, std::memory_order_release);
        remaining_.store(duration_seconds, std::memory_order_release);
    }

    boost::asio::awaitable<void>
    CountdownTimer::run(int duration_seconds, tick_callback_t on_tick, complete_callback_t on_complete)
    {
        auto expected = CountdownState::idle;
        if (!state_.compare_exchange_strong(expected, CountdownState::running, std::memory_order_acq_rel))
        {
            throw TimerSubsystemError("countdown '" + label_ + "' already started");
        }

        total_.store(duration_seconds, std::memory_order_release);
        remaining_.store(duration_seconds, std::memory_order_release);
        std::cout << "[Countdown] " << label_ << " started for " << duration_seconds << "s\n";

        // First failure wins; later ones are only logged.
        std::exception_ptr callback_error;
        auto keep_error = [&](std::exception_ptr e, std::string_view where) {
            try
            {
                std::rethrow_exception(e);
            }
            catch (const std::exception& ex)
            {
                std::cerr << "[Countdown] " << label_ << ' ' << where << " failed: " << ex.what() << '\n';
            }
            catch (...)
            {
                std::cerr << "[Countdown] " << label_ << ' ' << where << " failed: <unknown exception>\n";
            }
            if (!callback_error)
            {
                callback_error = e;
            }
        };

        while (remaining_seconds() > 0 && !is_cancelled())
        {
            if (is_paused())
            {
                transition(CountdownState::paused, "pause observed");
                (void)co_await wait_for(options_.poll);
                continue;
            }

            transition(CountdownState::running, "ticking");

            if (on_tick)
            {
                std::exception_ptr failure;
                try
                {
                    co_await on_tick(remaining_seconds());
                }
                catch (...)
                {
                    failure = std::current_exception();
                }
                if (failure)
                {
                    keep_error(failure, "tick callback");
                }
            }

            if (!co_await wait_for(options_.tick))
            {
                break;
            }
            remaining_.fetch_sub(1, std::memory_order_acq_rel);
        }

        if (is_cancelled())
        {
            transition(CountdownState::cancelled, "cancel observed");
        }
        else
        {
            transition(CountdownState::completed, "expired");
            if (on_complete)
            {
                std::exception_ptr failure;
                try
                {
                    co_await on_complete();
                }
                catch (...)
                {
                    failure = std::current_exception();
                }
                if (failure)
                {
                    keep_error(failure, "completion callback");
                }
            }
        }

        if (callback_error)
        {
            std::rethrow_exception(callback_error);
        }
    }

    void CountdownTimer::pause() noexcept
    {
        if (!paused_.exchange(true, std::memory_order_acq_rel))
        {
            std::cout << "[Countdown] " << label_ << " pause requested at " << remaining_seconds() << "s\n";
        }
    }

    void CountdownTimer::resume() noexcept
    {
        if (paused_.exchange(false, std::memory_order_acq_rel))
        {
            std::cout << "[Countdown] " << label_ << " resume requested at " << remaining_seconds() << "s\n";
        }
    }

    void CountdownTimer::cancel() noexcept
    {
        if (cancelled_.exchange(true, std::memory_order_acq_rel))
        {
            return;
        }

        // Not owned by a shared_ptr: the poll interval still bounds the latency.
        auto self = weak_from_this().lock();
        if (!self)
        {
            return;
        }

        try
        {
            boost::asio::dispatch(wait_.get_executor(), [self] { self->wait_.cancel(); });
        }
        catch (const std::exception& e)
        {
            std::cerr << "[Countdown] " << label_ << " cancel dispatch failed: " << e.what() << '\n';
        }
    }

} // namespace quiz_bot
