/*
Module Name:
- chat_rate_limiter.hpp

Abstract:
- Twitch chat send limits: 20 PRIVMSG per 30 seconds overall and one per second per channel.
- acquire() books the earliest free slot for a channel and then sleeps until it arrives, so
  concurrent senders queue behind each other instead of all waking at the same instant.
*/
#pragma once

// C++ Standard Library
#include <chrono>
#include <cstddef>
#include <deque>
#include <string>
#include <utility>

// Boost.Asio
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/strand.hpp>

// Core
#include <qb/utils/string_hash.hpp>

namespace quiz_bot
{

    struct RateLimits
    {
        std::size_t global_burst = 20;
        std::chrono::milliseconds global_window{ 30'000 };
        std::chrono::milliseconds per_channel_gap{ 1'000 };
    };

    class ChatRateLimiter
    {
    public:
        explicit ChatRateLimiter(boost::asio::any_io_executor exec, RateLimits limits = {});

        // Returns once a message to channel may be sent. The slot counts as used.
        [[nodiscard]] boost::asio::awaitable<void> acquire(std::string channel);

        // Forget every booked slot, eg after a reconnect.
        [[nodiscard]] boost::asio::awaitable<void> reset();

    private:
        using clock = std::chrono::steady_clock;

        boost::asio::strand<boost::asio::any_io_executor> strand_;
        const RateLimits limits_;

        std::deque<clock::time_point> global_sends_; // booked slots inside the window
        qb::StringMap<clock::time_point> next_per_channel_;
    };

} // namespace quiz_bot
