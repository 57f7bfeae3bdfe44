// C++ Standard Library
#include <algorithm>
#include <utility>

// Boost.Asio
#include <boost/asio/dispatch.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

// Core
#include <qb/chat/chat_rate_limiter.hpp>

namespace quiz_bot
{

    using boost::asio::use_awaitable;

    ChatRateLimiter::ChatRateLimiter(boost::asio::any_io_executor exec, RateLimits limits) :
        strand_{ std::move(exec) }, limits_{ limits }
    {
    }

    boost::asio::awaitable<void> ChatRateLimiter::acquire(std::string channel)
    {
        co_await boost::asio::dispatch(strand_, use_awaitable);

        const auto now = clock::now();

        while (!global_sends_.empty() && now - global_sends_.front() >= limits_.global_window)
        {
            global_sends_.pop_front();
        }

        clock::time_point ready_at = now;
        if (auto it = next_per_channel_.find(channel); it != next_per_channel_.end())
        {
            ready_at = std::max(ready_at, it->second);
        }

        // Window full: wait until the booking global_burst places back has rolled out.
        if (global_sends_.size() >= limits_.global_burst)
        {
            ready_at = std::max(ready_at, global_sends_[global_sends_.size() - limits_.global_burst] + limits_.global_window);
        }

        // Book before sleeping so the next caller sees this slot as taken.
        global_sends_.insert(std::upper_bound(global_sends_.begin(), global_sends_.end(), ready_at), ready_at);
        next_per_channel_.insert_or_assign(std::move(channel), ready_at + limits_.per_channel_gap);

        if (ready_at > now)
        {
            boost::asio::steady_timer t{ strand_ };
            t.expires_at(ready_at);
            co_await t.async_wait(use_awaitable);
        }
    }

    boost::asio::awaitable<void> ChatRateLimiter::reset()
    {
        co_await boost::asio::dispatch(strand_, use_awaitable);
        global_sends_.clear();
        next_per_channel_.clear();
    }

} // namespace quiz_bot
