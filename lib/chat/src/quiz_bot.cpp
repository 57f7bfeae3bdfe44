// Chat supervisor.
// - Every state change and socket write runs on strand_.
// - Reconnects back off with full jitter so a fleet does not stampede the server.
// - The login channel is always joined.

// C++ Standard Library
#include <csignal>
#include <iostream>
#include <utility>

// Boost.Asio
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

// Core
#include <qb/chat/quiz_bot.hpp>

namespace quiz_bot
{

    using boost::asio::use_awaitable;

    namespace
    {
        constexpr auto k_min_backoff = std::chrono::milliseconds{ 150 };
    } // namespace

    QuizBot::QuizBot(std::string login,
                     std::string access_token,
                     std::vector<std::string> channels,
                     std::size_t threads) :
        pool_{ threads > 0 ? threads : 1 },
        strand_{ pool_.get_executor() },
        ssl_ctx_{ boost::asio::ssl::context::tlsv12_client },
        login_{ std::move(login) },
        channels_{ std::move(channels) },
        irc_client_{ strand_, ssl_ctx_, login_, std::move(access_token) },
        dispatcher_{ strand_ },
        limiter_{ strand_ },
        signals_{ strand_, SIGINT, SIGTERM },
        backoff_timer_{ strand_ }
    {
        ssl_ctx_.set_default_verify_paths();
    }

    QuizBot::~QuizBot() noexcept
    {
        irc_client_.close();
        pool_.stop();
        pool_.join();
    }

    void QuizBot::run()
    {
        signals_.async_wait([this](const boost::system::error_code& ec, int signo) {
            if (ec)
            {
                return;
            }
            std::cout << "[QuizBot] signal " << signo << ", shutting down\n";
            stop();
        });

        boost::asio::co_spawn(strand_, run_bot(), [](std::exception_ptr ep) {
            if (!ep)
            {
                return;
            }
            try
            {
                std::rethrow_exception(ep);
            }
            catch (const std::exception& e)
            {
                std::cerr << "[QuizBot] supervisor stopped: " << e.what() << '\n';
            }
        });
        pool_.join();
    }

    void QuizBot::stop()
    {
        boost::asio::co_spawn(strand_, run_stop(), boost::asio::detached);
    }

    boost::asio::awaitable<void> QuizBot::run_stop()
    {
        if (stopping_)
        {
            co_return;
        }
        stopping_ = true;

        if (shutdown_hook_)
        {
            std::string failure;
            try
            {
                co_await shutdown_hook_();
            }
            catch (const std::exception& e)
            {
                failure = e.what();
            }
            if (!failure.empty())
            {
                std::cerr << "[QuizBot] shutdown hook failed: " << failure << '\n';
            }
        }

        boost::system::error_code ignored;
        signals_.cancel(ignored);
        backoff_timer_.cancel();
        irc_client_.close();
        std::cout << "[QuizBot] stopped\n";
    }

    boost::asio::awaitable<void> QuizBot::say(std::string channel, std::string text)
    {
        co_await boost::asio::dispatch(strand_, use_awaitable);
        co_await limiter_.acquire(channel);
        co_await irc_client_.privmsg(std::move(channel), std::move(text));
    }

    boost::asio::awaitable<void> QuizBot::reply(std::string channel, std::string parent_msg_id, std::string text)
    {
        co_await boost::asio::dispatch(strand_, use_awaitable);
        co_await limiter_.acquire(channel);
        co_await irc_client_.privmsg(std::move(channel), std::move(text), std::move(parent_msg_id));
    }

    void QuizBot::handle_line(std::string_view raw, std::string& reconnect_reason)
    {
        const auto msg = parse_irc_line(raw);

        if (msg.command == "PING")
        {
            boost::asio::co_spawn(
                strand_,
                [this, payload = std::string{ msg.trailing }]() -> boost::asio::awaitable<void> {
                    try
                    {
                        co_await irc_client_.send_line("PONG :" + payload);
                    }
                    catch (const std::exception& e)
                    {
                        std::cerr << "[IRC] PONG failed: " << e.what() << '\n';
                    }
                },
                boost::asio::detached);
            return;
        }

        if (msg.command == "PRIVMSG")
        {
            dispatcher_.dispatch(msg);
            return;
        }

        std::cout << "[IRC] " << raw << '\n';

        if (msg.command == "RECONNECT")
        {
            reconnect_reason = "server-reconnect";
            irc_client_.close();
            return;
        }

        if (msg.command == "NOTICE")
        {
            const auto id = msg.get_tag("msg-id");
            if (id == "msg_auth_failed" || msg.trailing == "Login authentication failed" ||
                msg.trailing == "Improperly formatted auth")
            {
                std::cerr << "[IRC] authentication failed, check twitch.auth.access_token\n";
                reconnect_reason = "auth-fail";
                irc_client_.close();
            }
            return;
        }

        if (msg.command == "CAP" && msg.parameters().size() >= 2)
        {
            const auto sub = msg.parameters()[1];
            if (sub == "NAK")
            {
                std::cerr << "[IRC] CAP NAK " << msg.trailing << " (tags may be unavailable, moderator checks fail closed)\n";
            }
        }
    }

    boost::asio::awaitable<std::string> QuizBot::read_until_disconnect()
    {
        std::string reason;
        try
        {
            co_await irc_client_.read_loop([this, &reason](std::string_view raw) { handle_line(raw, reason); });
        }
        catch (const std::exception& e)
        {
            if (reason.empty())
            {
                reason = std::string{ "read-error: " } + e.what();
            }
        }
        co_return reason.empty() ? std::string{ "unknown" } : reason;
    }

    boost::asio::awaitable<void> QuizBot::run_bot()
    {
        unsigned connect_failures = 0;
        unsigned reconnects = 0;

        while (!stopping_)
        {
            std::string connect_error;
            try
            {
                co_await irc_client_.connect(channels_);
            }
            catch (const std::exception& e)
            {
                connect_error = e.what();
            }

            if (stopping_)
            {
                break;
            }

            std::chrono::milliseconds delay{};
            if (!connect_error.empty())
            {
                std::cerr << "[QuizBot] IRC connect error: " << connect_error << '\n';
                irc_client_.close();
                delay = connect_backoff_.jittered_delay_after(++connect_failures, k_min_backoff);
                std::cout << "[QuizBot] backoff#" << connect_failures << " reason=connect-error sleep=" << delay.count()
                          << "ms\n";
            }
            else
            {
                connect_failures = 0;
                co_await limiter_.reset();

                boost::asio::co_spawn(
                    strand_,
                    [this]() -> boost::asio::awaitable<void> {
                        try
                        {
                            co_await irc_client_.ping_loop();
                        }
                        catch (const std::exception& e)
                        {
                            std::cerr << "[IRC] keepalive stopped: " << e.what() << '\n';
                        }
                    },
                    boost::asio::detached);

                const auto reason = co_await read_until_disconnect();
                irc_client_.close();
                if (stopping_)
                {
                    break;
                }

                delay = reconnect_backoff_.jittered_delay_after(++reconnects, k_min_backoff);
                std::cout << "[QuizBot] backoff#" << reconnects << " reason=" << reason << " sleep=" << delay.count()
                          << "ms\n";
                if (reason == "server-reconnect")
                {
                    reconnects = 0;
                }
            }

            boost::system::error_code ec;
            backoff_timer_.expires_after(delay);
            co_await backoff_timer_.async_wait(boost::asio::redirect_error(use_awaitable, ec));
        }

        std::cout << "[QuizBot] supervisor finished\n";
    }

} // namespace quiz_bot
