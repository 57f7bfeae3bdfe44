/*
Module Name:
- irc_client.hpp

Abstract:
- TLS WebSocket client for Twitch IRC (irc-ws.chat.twitch.tv:443).
- read_loop() hands complete CRLF-terminated lines to a handler; partial frames are carried over.
- Writes are serialised through a gate so coroutines never overlap frames on the stream.
- Each connect() builds a fresh stream; coroutines still touching the previous one keep it alive
  through their own shared_ptr copy until they unwind.

Why:
- Quiz messages must not vanish silently, so every send throws on failure after closing the
  connection. The supervisor sees the closed socket and reconnects; callers decide whether to retry.
- Twitch limits a chat message to 500 bytes. privmsg() clips on a code point boundary and folds CR/LF.
*/
#pragma once

// C++ Standard Library
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>
#include <utility>

// Boost.Asio
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

// Boost.Beast
#include <boost/beast/core/flat_static_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <boost/beast/websocket/stream.hpp>

// Core
#include <qb/utils/attributes.hpp>

namespace quiz_bot
{

    /// Secure WebSocket IRC client.
    /// Thread-safety: not thread safe. Every call must run on the executor given at construction.
    class IrcClient
    {
    public:
        static constexpr std::size_t kMaxChatBytes = 500;

        /// executor should be a strand. access_token must carry the "oauth:" prefix.
        IrcClient(boost::asio::any_io_executor executor,
                  boost::asio::ssl::context& ssl_context,
                  std::string login,
                  std::string access_token);

        /// Wipes the token best-effort.
        ~IrcClient() noexcept;

        IrcClient(const IrcClient&) = delete;
        IrcClient& operator=(const IrcClient&) = delete;

        /// Resolve, connect, TLS and WebSocket handshakes, PASS/NICK/CAP, then JOIN every channel.
        /// Channel names carry no '#'. Throws on any failure.
        [[nodiscard]] boost::asio::awaitable<void> connect(std::vector<std::string> channels);

        /// One raw IRC line, CRLF appended. Throws boost::system::system_error and closes on failure.
        [[nodiscard]] boost::asio::awaitable<void> send_line(std::string line);

        /// PRIVMSG #channel :text, clipped to kMaxChatBytes with CR/LF folded to spaces.
        /// A non-empty parent_msg_id threads the message as a reply.
        [[nodiscard]] boost::asio::awaitable<void>
        privmsg(std::string channel, std::string text, std::string parent_msg_id = {});

        [[nodiscard]] boost::asio::awaitable<void> join(std::string channel);

        /// Read frames, split on CRLF and call handler(std::string_view) per complete line.
        /// The view is only valid during the call. Throws on read errors.
        template<typename Handler>
        [[nodiscard]] boost::asio::awaitable<void> read_loop(Handler handler);

        /// PING every four minutes until close() or a send failure.
        [[nodiscard]] boost::asio::awaitable<void> ping_loop();

        /// Cancel the keepalive and start a clean WebSocket close. Idempotent.
        void close() noexcept;

        /// Discard any carried partial line before a reconnect.
        void reset() noexcept
        {
            line_tail_.clear();
            read_buffer_.clear();
        }

        [[nodiscard]] bool is_open() const noexcept
        {
            return ws_stream_ && ws_stream_->is_open();
        }

    private:
        static constexpr std::size_t k_read_buffer_size = 64ULL * 1024ULL;
        static constexpr std::string_view kCRLF{ "\r\n" };

        [[nodiscard]] boost::asio::awaitable<void> send_buffers(std::span<const boost::asio::const_buffer> buffers);

        template<typename Handler>
        void split_lines(std::string_view chunk, Handler& handler);

        using tcp_stream_type = boost::beast::tcp_stream;
        using ssl_stream_type = boost::asio::ssl::stream<tcp_stream_type>;
        using websocket_stream_type = boost::beast::websocket::stream<ssl_stream_type>;

        boost::asio::any_io_executor executor_;
        boost::asio::ssl::context& ssl_context_;
        std::shared_ptr<websocket_stream_type> ws_stream_;
        boost::asio::steady_timer ping_timer_;
        boost::beast::flat_static_buffer<k_read_buffer_size> read_buffer_;

        // Partial line carried between frames.
        std::string line_tail_;

        std::string login_;
        std::string access_token_;

        boost::asio::steady_timer write_gate_;
        bool write_inflight_ = false;
    };

    template<typename Handler>
    void IrcClient::split_lines(std::string_view chunk, Handler& handler)
    {
        line_tail_.append(chunk.data(), chunk.size());

        std::size_t begin = 0;
        for (;;)
        {
            const auto r = line_tail_.find('\r', begin);
            if (r == std::string::npos || r + 1 >= line_tail_.size())
            {
                break; // no CR, or CR at the very end: wait for the next frame
            }
            if (QB_LIKELY(line_tail_[r + 1] == '\n'))
            {
                const std::string_view line{ line_tail_.data() + begin, r - begin };
                if (!line.empty())
                {
                    handler(line);
                }
                begin = r + 2;
            }
            else
            {
                begin = r + 1; // isolated CR is data
            }
        }
        if (begin > 0)
        {
            line_tail_.erase(0, begin);
        }
    }

    template<typename Handler>
    boost::asio::awaitable<void> IrcClient::read_loop(Handler handler)
    {
        static_assert(std::is_invocable_v<Handler&, std::string_view>,
                      "Handler must be callable as void(std::string_view)");

        auto ws = ws_stream_;
        if (!ws)
        {
            co_return;
        }
        for (;;)
        {
            co_await ws->async_read(read_buffer_, boost::asio::use_awaitable);

            const auto bs = read_buffer_.cdata();
            const auto total = boost::asio::buffer_size(bs);
            if (QB_UNLIKELY(total == 0))
            {
                continue;
            }

            split_lines(std::string_view{ static_cast<const char*>(bs.data()), total }, handler);
            read_buffer_.consume(total);
        }
    }

} // namespace quiz_bot
