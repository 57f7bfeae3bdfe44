/*
Module Name:
- irc_message.hpp

Abstract:
- Single-line IRC parser for Twitch chat (IRCv3 tags, prefix, command, middle params, trailing).
- The result holds views into the input line and never allocates; copy what must outlive the line.
- Moderator and broadcaster flags are derived from the tag block while parsing.
*/
#pragma once

// C++ Standard Library
#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

// GSL
#include <gsl/gsl>

// Core
#include <qb/utils/attributes.hpp>

namespace quiz_bot
{

    // Parsed IRC line - views only, no ownership.
    struct IrcMessage
    {
        static constexpr std::size_t max_params = 16;

        std::string_view command; // "PRIVMSG", "PING", "001" ...
        std::array<std::string_view, max_params> params;
        std::uint8_t param_count = 0;

        bool is_moderator = false; // "mod=1" or "user-type=mod"
        bool is_broadcaster = false; // badges contain "broadcaster/"

        std::string_view raw_tags; // without the leading '@'
        std::string_view prefix; // without the leading ':'
        std::string_view trailing; // text after " :"

        [[nodiscard]] QB_FORCE_INLINE auto parameters() const noexcept -> gsl::span<const std::string_view>
        {
            return { params.data(), params.data() + param_count };
        }

        // Value of tag key, empty when absent. Escaped values are returned as sent.
        // Pre: key is non-empty.
        [[nodiscard]] std::string_view get_tag(std::string_view key) const noexcept;

        // "login" out of "login!login@login.tmi.twitch.tv".
        [[nodiscard]] std::string_view user() const noexcept
        {
            const auto bang = prefix.find('!');
            return bang == std::string_view::npos ? prefix : prefix.substr(0, bang);
        }
    };

    // Parse one line without its CRLF. Malformed input yields whatever fields could be read.
    // Post: param_count <= max_params.
    [[nodiscard]] IrcMessage parse_irc_line(std::string_view raw) noexcept;

} // namespace quiz_bot
