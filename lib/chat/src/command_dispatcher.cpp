// C++ Standard Library
#include <cctype>
#include <iostream>
#include <utility>

// Boost.Asio
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>

// Core
#include <qb/chat/command_dispatcher.hpp>

namespace quiz_bot
{

    namespace
    {
        std::string_view trim(std::string_view s) noexcept
        {
            while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
            {
                s.remove_prefix(1);
            }
            while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
            {
                s.remove_suffix(1);
            }
            return s;
        }

        std::string lower_ascii(std::string_view s)
        {
            std::string out;
            out.reserve(s.size());
            for (unsigned char c : s)
            {
                out.push_back(static_cast<char>(std::tolower(c)));
            }
            return out;
        }

        boost::asio::awaitable<void> invoke_command(command_handler_t handler, ChatCommand cmd)
        {
            const std::string name = cmd.name;
            const std::string channel = cmd.channel;
            try
            {
                co_await handler(std::move(cmd));
            }
            catch (const std::exception& e)
            {
                std::cerr << "[dispatcher] '!" << name << "' in #" << channel << " threw: " << e.what() << '\n';
            }
        }
    } // namespace

    CommandDispatcher::CommandDispatcher(boost::asio::any_io_executor executor) :
        executor_(std::move(executor))
    {
        commands_.reserve(16);
    }

    bool CommandDispatcher::register_command(std::string_view name, command_handler_t handler)
    {
        return commands_.try_emplace(lower_ascii(name), std::move(handler)).second;
    }

    bool CommandDispatcher::has_command(std::string_view name) const
    {
        return commands_.find(name) != commands_.end();
    }

    std::optional<ChatCommand> CommandDispatcher::to_command(const IrcMessage& msg)
    {
        if (msg.command != "PRIVMSG" || msg.param_count < 1)
        {
            return std::nullopt;
        }

        const auto text = trim(msg.trailing);
        if (text.size() < 2 || text.front() != '!')
        {
            return std::nullopt;
        }

        const auto space = text.find(' ');
        const auto name = text.substr(1, space == std::string_view::npos ? std::string_view::npos : space - 1);
        if (name.empty())
        {
            return std::nullopt;
        }

        auto channel = msg.params[0];
        if (!channel.empty() && channel.front() == '#')
        {
            channel.remove_prefix(1);
        }

        ChatCommand cmd;
        cmd.name = lower_ascii(name);
        cmd.channel = std::string{ channel };
        cmd.user = std::string{ msg.user() };
        cmd.args = space == std::string_view::npos ? std::string{} : std::string{ trim(text.substr(space + 1)) };
        cmd.message_id = std::string{ msg.get_tag("id") };
        cmd.is_moderator = msg.is_moderator;
        cmd.is_broadcaster = msg.is_broadcaster;
        return cmd;
    }

    void CommandDispatcher::dispatch(const IrcMessage& msg)
    {
        auto cmd = to_command(msg);
        if (!cmd)
        {
            return;
        }

        auto it = commands_.find(cmd->name);
        if (it == commands_.end())
        {
            return;
        }

        // The handler is copied into the coroutine frame.
        boost::asio::co_spawn(executor_, invoke_command(it->second, std::move(*cmd)), boost::asio::detached);
    }

} // namespace quiz_bot
