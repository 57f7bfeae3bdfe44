/*
Module Name:
- command_dispatcher.hpp

Abstract:
- Routes "!name args" chat lines to registered coroutine handlers.
- Handlers receive an owning ChatCommand, never views into the read buffer, so they may suspend freely.
- A throwing handler is logged and contained; it cannot take the read loop down.
*/
#pragma once

// C++ Standard Library
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <utility>

// Boost.Asio
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

// Core
#include <qb/chat/irc_message.hpp>
#include <qb/utils/string_hash.hpp>

namespace quiz_bot
{

    struct ChatCommand
    {
        std::string name; // without '!', lower case
        std::string channel; // without '#'
        std::string user; // login
        std::string args; // text after the first space, trimmed
        std::string message_id; // "id" tag, empty when tags are off
        bool is_moderator = false;
        bool is_broadcaster = false;

        [[nodiscard]] bool is_privileged() const noexcept
        {
            return is_moderator || is_broadcaster;
        }
    };

    using command_handler_t = std::function<boost::asio::awaitable<void>(ChatCommand cmd)>;

    class CommandDispatcher
    {
    public:
        // Handlers are spawned on executor.
        explicit CommandDispatcher(boost::asio::any_io_executor executor);

        // First registration of a name wins; duplicates are ignored. Returns false for a duplicate.
        bool register_command(std::string_view name, command_handler_t handler);

        [[nodiscard]] bool has_command(std::string_view name) const;

        // Handles PRIVMSG lines that start with a registered command. Other lines are ignored.
        void dispatch(const IrcMessage& msg);

        // Extracts a command from a PRIVMSG. nullopt when the text is not "!name ...".
        [[nodiscard]] static std::optional<ChatCommand> to_command(const IrcMessage& msg);

    private:
        boost::asio::any_io_executor executor_;
        qb::StringMap<command_handler_t> commands_;
    };

} // namespace quiz_bot
