/*
Module Name:
- quiz_bot.hpp

Abstract:
- Chat-side supervisor: owns the thread pool, the strand every quiz and IRC coroutine runs on,
  the TLS context, the IRC client, the command dispatcher and the rate limiter.
- run() connects, reads and reconnects with jittered exponential backoff until stop().
- say() and reply() are the only way out to chat; both respect the rate limits and throw on failure.

Why:
- One strand for IRC writes, session drivers and command handlers keeps ordering deterministic.
- Shutdown runs the registered hook first so sessions can stop before the pool winds down.
*/
#pragma once

// C++ Standard Library
#include <functional>
#include <string>
#include <thread>
#include <vector>
#include <utility>

// Boost.Asio
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>

// Core
#include <qb/chat/chat_rate_limiter.hpp>
#include <qb/chat/command_dispatcher.hpp>
#include <qb/chat/irc_client.hpp>
#include <qb/utils/retry_policy.hpp>

namespace quiz_bot
{

    class QuizBot
    {
    public:
        using shutdown_hook_t = std::function<boost::asio::awaitable<void>()>;

        // Pre: login and access_token are non-empty. channels carry no '#'.
        QuizBot(std::string login,
                std::string access_token,
                std::vector<std::string> channels,
                std::size_t threads = std::thread::hardware_concurrency());

        ~QuizBot() noexcept;

        QuizBot(const QuizBot&) = delete;
        QuizBot& operator=(const QuizBot&) = delete;

        // Blocks until stop() or SIGINT/SIGTERM.
        void run();

        // Runs the shutdown hook, closes the connection and lets run() return. Idempotent.
        void stop();

        // Called once on stop, on the strand, before the connection closes.
        void set_shutdown_hook(shutdown_hook_t hook)
        {
            shutdown_hook_ = std::move(hook);
        }

        [[nodiscard]] CommandDispatcher& dispatcher() noexcept
        {
            return dispatcher_;
        }

        // The strand.
        [[nodiscard]] boost::asio::any_io_executor executor() const noexcept
        {
            return strand_;
        }

        [[nodiscard]] const std::string& login() const noexcept
        {
            return login_;
        }

        [[nodiscard]] const std::vector<std::string>& channels() const noexcept
        {
            return channels_;
        }

        // Rate limited PRIVMSG. Throws boost::system::system_error when the connection is down or the write fails.
        [[nodiscard]] boost::asio::awaitable<void> say(std::string channel, std::string text);

        // Threaded reply; plain say() when parent_msg_id is empty.
        [[nodiscard]] boost::asio::awaitable<void>
        reply(std::string channel, std::string parent_msg_id, std::string text);

    private:
        boost::asio::awaitable<void> run_bot();
        boost::asio::awaitable<void> run_stop();

        // Reads until the connection drops; returns why.
        boost::asio::awaitable<std::string> read_until_disconnect();

        void handle_line(std::string_view raw, std::string& reconnect_reason);

        boost::asio::thread_pool pool_;
        boost::asio::strand<boost::asio::any_io_executor> strand_;
        boost::asio::ssl::context ssl_ctx_;

        const std::string login_;
        const std::vector<std::string> channels_;

        IrcClient irc_client_;
        CommandDispatcher dispatcher_;
        ChatRateLimiter limiter_;
        boost::asio::signal_set signals_;
        boost::asio::steady_timer backoff_timer_;

        const qb::RetryPolicy connect_backoff_{ 0, std::chrono::seconds{ 3 }, std::chrono::seconds{ 30 } };
        const qb::RetryPolicy reconnect_backoff_{ 0, std::chrono::seconds{ 2 }, std::chrono::seconds{ 30 } };

        shutdown_hook_t shutdown_hook_;
        bool stopping_ = false; // strand only
    };

} // namespace quiz_bot
