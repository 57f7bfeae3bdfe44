// C++ Standard Library
#include <cstring>

// Core
#include <qb/chat/irc_message.hpp>

namespace quiz_bot
{

    namespace
    {
        // Position of the next ' ' at or after pos, or s.size().
        QB_FORCE_INLINE std::size_t next_space(std::string_view s, std::size_t pos) noexcept
        {
            const auto p = s.find(' ', pos);
            return p == std::string_view::npos ? s.size() : p;
        }

        void parse_params(std::string_view rest, IrcMessage& msg) noexcept
        {
            std::size_t pos = 0;
            while (pos < rest.size())
            {
                if (rest[pos] == ':')
                {
                    msg.trailing = rest.substr(pos + 1);
                    return;
                }
                if (msg.param_count == IrcMessage::max_params)
                {
                    return;
                }
                const auto end = next_space(rest, pos);
                msg.params[msg.param_count++] = rest.substr(pos, end - pos);
                pos = end + 1;
            }
        }
    } // namespace

    std::string_view IrcMessage::get_tag(std::string_view key) const noexcept
    {
        Expects(!key.empty());

        std::size_t pos = 0;
        while (pos < raw_tags.size())
        {
            auto end = raw_tags.find(';', pos);
            if (end == std::string_view::npos)
            {
                end = raw_tags.size();
            }
            const auto entry = raw_tags.substr(pos, end - pos);
            if (entry.size() > key.size() && entry[key.size()] == '=' &&
                std::memcmp(entry.data(), key.data(), key.size()) == 0)
            {
                return entry.substr(key.size() + 1);
            }
            pos = end + 1;
        }
        return {};
    }

    IrcMessage parse_irc_line(std::string_view raw) noexcept
    {
        IrcMessage msg{};
        std::string_view rest = raw;

        // [1] tags
        if (!rest.empty() && rest.front() == '@')
        {
            const auto space = next_space(rest, 1);
            msg.raw_tags = rest.substr(1, space - 1);
            rest = space < rest.size() ? rest.substr(space + 1) : std::string_view{};

            const auto badges = msg.get_tag("badges");
            msg.is_broadcaster = badges.find("broadcaster/") != std::string_view::npos;
            msg.is_moderator = msg.get_tag("mod") == "1" || msg.get_tag("user-type") == "mod" ||
                               badges.find("moderator/") != std::string_view::npos;
        }

        // [2] prefix
        if (!rest.empty() && rest.front() == ':')
        {
            const auto space = next_space(rest, 1);
            msg.prefix = rest.substr(1, space - 1);
            rest = space < rest.size() ? rest.substr(space + 1) : std::string_view{};
        }

        // [3] command
        {
            const auto space = next_space(rest, 0);
            msg.command = rest.substr(0, space);
            rest = space < rest.size() ? rest.substr(space + 1) : std::string_view{};
        }

        // [4] params and trailing
        parse_params(rest, msg);

        Ensures(msg.param_count <= IrcMessage::max_params);
        return msg;
    }

} // namespace quiz_bot
