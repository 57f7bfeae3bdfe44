/*
Module Name:
- retry_policy.hpp

Abstract:
- One retry and backoff abstraction shared by timer start-up, timer readiness,
  chat sends and the reconnect supervisor.
- Exponential growth from base_delay, capped at max_delay, with optional full jitter.
- with_retry() drives an awaitable operation until it succeeds or attempts run out,
  then rethrows the last failure unchanged.
*/
#pragma once

// C++ Standard Library
#include <algorithm>
#include <chrono>
#include <exception>
#include <iostream>
#include <random>
#include <string>
#include <utility>

// Boost.Asio
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace qb
{

    struct RetryPolicy
    {
        unsigned max_attempts = 3;
        std::chrono::milliseconds base_delay{ 100 };
        std::chrono::milliseconds max_delay{ 30'000 };

        // Delay to wait after the given number of failed attempts (1-based).
        // 1 -> base, 2 -> 2*base, 3 -> 4*base ... capped at max_delay.
        [[nodiscard]] std::chrono::milliseconds delay_after(unsigned failed_attempts) const noexcept
        {
            if (failed_attempts == 0)
            {
                return std::chrono::milliseconds::zero();
            }
            const unsigned exp = std::min(failed_attempts - 1, 16u);
            const auto grown = base_delay * (1u << exp);
            return grown > max_delay ? max_delay : grown;
        }

        // Full jitter: uniform in [floor, delay_after(n)].
        [[nodiscard]] std::chrono::milliseconds jittered_delay_after(unsigned failed_attempts,
                                                                     std::chrono::milliseconds floor) const
        {
            static thread_local std::mt19937 rng{ std::random_device{}() };
            const auto cap = delay_after(failed_attempts);
            if (cap <= floor)
            {
                return floor;
            }
            std::uniform_int_distribution<long long> dist(floor.count(), cap.count());
            return std::chrono::milliseconds{ dist(rng) };
        }
    };

    // Suspend the calling coroutine on its own executor.
    inline boost::asio::awaitable<void> async_sleep(std::chrono::steady_clock::duration d)
    {
        auto exec = co_await boost::asio::this_coro::executor;
        boost::asio::steady_timer t{ exec };
        t.expires_after(d);
        co_await t.async_wait(boost::asio::use_awaitable);
    }

    // Run op(attempt) until it returns normally. op must return boost::asio::awaitable<T>.
    // The exception from the final attempt propagates to the caller.
    template<class Op>
    auto with_retry(RetryPolicy policy, std::string what, Op op) -> decltype(op(1u))
    {
        const unsigned attempts = std::max(policy.max_attempts, 1u);
        for (unsigned attempt = 1;; ++attempt)
        {
            std::exception_ptr failure;
            try
            {
                co_return co_await op(attempt);
            }
            catch (const std::exception& e)
            {
                if (attempt >= attempts)
                {
                    throw;
                }
                std::cerr << "[retry] " << what << " attempt " << attempt << '/' << attempts
                          << " failed: " << e.what() << '\n';
                failure = std::current_exception();
            }

            // co_await is not allowed inside a handler, so back off here.
            if (failure)
            {
                co_await async_sleep(policy.delay_after(attempt));
            }
        }
    }

} // namespace qb
