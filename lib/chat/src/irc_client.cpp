// Twitch IRC over TLS WebSocket.
// - Connect, TLS and WebSocket handshakes each run under a 30 s deadline.
// - Peer verification with SNI and host name check.
// - Writes never overlap: a second writer parks on write_gate_ until the first completes.

// C++ Standard Library
#include <algorithm>
#include <array>
#include <chrono>
#include <iostream>
#include <utility>

// Boost.Asio
#include <boost/asio/dispatch.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/socket_base.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/this_coro.hpp>

// Boost.Beast
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

// Boost.System
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

// OpenSSL
#include <openssl/err.h>
#include <openssl/ssl.h>

// Core
#include <qb/chat/irc_client.hpp>
#include <qb/utils/utf8.hpp>

namespace quiz_bot
{

    using boost::asio::buffer;
    using boost::asio::const_buffer;
    using boost::asio::use_awaitable;
    using error_code = boost::system::error_code;
    namespace beast = boost::beast;

    IrcClient::IrcClient(boost::asio::any_io_executor executor,
                         boost::asio::ssl::context& ssl_context,
                         std::string login,
                         std::string access_token) :
        executor_{ executor },
        ssl_context_{ ssl_context },
        ping_timer_{ executor },
        login_{ std::move(login) },
        access_token_{ std::move(access_token) },
        write_gate_{ executor }
    {
        write_gate_.expires_at(std::chrono::steady_clock::time_point::max());
    }

    IrcClient::~IrcClient() noexcept
    {
        std::fill(access_token_.begin(), access_token_.end(), '\0');
    }

    boost::asio::awaitable<void> IrcClient::connect(std::vector<std::string> channels)
    {
        static const char host_name[] = "irc-ws.chat.twitch.tv";
        static const char port_str[] = "443";

        auto executor = co_await boost::asio::this_coro::executor;

        // A closed TLS stream cannot be handshaken again; start from a new one.
        while (write_inflight_)
        {
            error_code ec;
            write_gate_.expires_at(std::chrono::steady_clock::time_point::max());
            co_await write_gate_.async_wait(boost::asio::redirect_error(use_awaitable, ec));
        }
        reset();
        ws_stream_ = std::make_shared<websocket_stream_type>(executor_, ssl_context_);
        auto& ws = *ws_stream_;

        boost::asio::ip::tcp::resolver resolver{ executor };
        auto results = co_await resolver.async_resolve(host_name, port_str, use_awaitable);

        auto& tcp = beast::get_lowest_layer(ws);
        tcp.expires_after(std::chrono::seconds(30));
        co_await tcp.async_connect(results, use_awaitable);
        tcp.expires_never();

        tcp.socket().set_option(boost::asio::ip::tcp::no_delay(true));
        tcp.socket().set_option(boost::asio::socket_base::keep_alive(true));

        auto& ssl = ws.next_layer();
        if (!::SSL_set_tlsext_host_name(ssl.native_handle(), host_name))
        {
            throw boost::system::system_error{ error_code{ static_cast<int>(::ERR_get_error()),
                                                           boost::asio::error::get_ssl_category() },
                                               "SNI failure" };
        }
        if (::SSL_set1_host(ssl.native_handle(), host_name) != 1)
        {
            throw boost::system::system_error{ error_code{ static_cast<int>(::ERR_get_error()),
                                                           boost::asio::error::get_ssl_category() },
                                               "host name check setup failed" };
        }
        ssl.set_verify_mode(boost::asio::ssl::verify_peer);

        tcp.expires_after(std::chrono::seconds(30));
        co_await ssl.async_handshake(boost::asio::ssl::stream_base::client, use_awaitable);
        tcp.expires_never();

        ws.set_option(beast::websocket::stream_base::timeout::suggested(beast::role_type::client));
        ws.set_option(beast::websocket::stream_base::decorator([](beast::websocket::request_type& req) {
            req.set(beast::http::field::origin, "https://www.twitch.tv");
            req.set(beast::http::field::user_agent, "QuizBot/1.0 (+irc)");
        }));
        ws.auto_fragment(false);
        ws.read_message_max(k_read_buffer_size);

        tcp.expires_after(std::chrono::seconds(30));
        co_await ws.async_handshake(host_name, "/", use_awaitable);
        tcp.expires_never();

        ws.text(true);

        co_await send_line("PASS " + access_token_);
        co_await send_line("NICK " + login_);
        co_await send_line("CAP REQ :twitch.tv/membership twitch.tv/tags twitch.tv/commands");

        // JOIN lines stay under the 512 byte IRC limit, CRLF included.
        static constexpr std::size_t k_irc_max_line = 512;
        std::string line{ "JOIN " };
        for (const auto& ch : channels)
        {
            const std::size_t needed = (line.size() > 5 ? 1 : 0) + 1 + ch.size();
            if (line.size() > 5 && line.size() + needed + kCRLF.size() > k_irc_max_line)
            {
                co_await send_line(line);
                line.assign("JOIN ");
            }
            if (line.size() > 5)
            {
                line.push_back(',');
            }
            line.push_back('#');
            line.append(ch);
        }
        if (line.size() > 5)
        {
            co_await send_line(line);
        }

        std::cout << "[IRC] connected as " << login_ << ", joined " << channels.size() << " channel(s)\n";
    }

    boost::asio::awaitable<void> IrcClient::send_line(std::string line)
    {
        std::array<const_buffer, 2> bufs{ buffer(line), buffer(kCRLF) };
        co_await send_buffers(bufs);
    }

    boost::asio::awaitable<void> IrcClient::join(std::string channel)
    {
        co_await send_line("JOIN #" + channel);
    }

    boost::asio::awaitable<void>
    IrcClient::privmsg(std::string channel, std::string text, std::string parent_msg_id)
    {
        text.resize(qb::utf8_clip_len(text, kMaxChatBytes));
        std::replace_if(
            text.begin(), text.end(), [](char c) { return c == '\r' || c == '\n'; }, ' ');

        static constexpr std::string_view REPLY_TAG = "@reply-parent-msg-id=";
        static constexpr std::string_view SPACE = " ";
        static constexpr std::string_view PRIVMSG_HASH = "PRIVMSG #";
        static constexpr std::string_view SPACE_COLON = " :";

        if (parent_msg_id.empty())
        {
            std::array<const_buffer, 5> bufs{
                buffer(PRIVMSG_HASH), buffer(channel), buffer(SPACE_COLON), buffer(text), buffer(kCRLF)
            };
            co_await send_buffers(bufs);
            co_return;
        }

        std::array<const_buffer, 8> bufs{ buffer(REPLY_TAG), buffer(parent_msg_id), buffer(SPACE),
                                          buffer(PRIVMSG_HASH), buffer(channel), buffer(SPACE_COLON),
                                          buffer(text), buffer(kCRLF) };
        co_await send_buffers(bufs);
    }

    boost::asio::awaitable<void> IrcClient::send_buffers(std::span<const const_buffer> buffers)
    {
        while (write_inflight_)
        {
            error_code ec;
            write_gate_.expires_at(std::chrono::steady_clock::time_point::max());
            co_await write_gate_.async_wait(boost::asio::redirect_error(use_awaitable, ec));
        }

        auto ws = ws_stream_;
        if (!ws || !ws->is_open())
        {
            write_gate_.cancel();
            throw boost::system::system_error{ boost::asio::error::not_connected, "irc send" };
        }

        write_inflight_ = true;
        error_code ec;
        co_await ws->async_write(buffers, boost::asio::redirect_error(use_awaitable, ec));
        write_inflight_ = false;
        write_gate_.cancel();

        if (ec)
        {
            std::cerr << "[IRC] write failed: " << ec.message() << '\n';
            close();
            throw boost::system::system_error{ ec, "irc send" };
        }
    }

    boost::asio::awaitable<void> IrcClient::ping_loop()
    {
        for (;;)
        {
            ping_timer_.expires_after(std::chrono::minutes{ 4 });

            error_code ec;
            co_await ping_timer_.async_wait(boost::asio::redirect_error(use_awaitable, ec));
            if (ec || !is_open())
            {
                co_return;
            }

            co_await send_line("PING :tmi.twitch.tv");
        }
    }

    void IrcClient::close() noexcept
    {
        ping_timer_.cancel();

        auto ws = ws_stream_;
        if (!ws)
        {
            return;
        }
        if (!ws->is_open())
        {
            // Handshake never finished: drop the socket so pending operations fail.
            error_code ignored;
            beast::get_lowest_layer(*ws).socket().close(ignored);
            return;
        }

        boost::asio::dispatch(ws->get_executor(), [ws] {
            ws->async_close(beast::websocket::close_code::normal, [ws](error_code) {});
        });
    }

} // namespace quiz_bot
