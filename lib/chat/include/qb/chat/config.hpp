/*
Module Name:
- config.hpp

Abstract:
- Immutable bot configuration loaded from a single TOML file (./config.toml by default).
- Sections: [twitch.bot] identity and channels, [twitch.auth] token, [quiz] defaults for sessions.
- Fails fast with EnvError on a missing file, a parse error or an out-of-range value.
*/
#pragma once

// C++ Standard Library
#include <chrono>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace env
{

    /// Configuration-loading failure.
    class EnvError final : public std::runtime_error
    {
    public:
        explicit EnvError(const std::string& msg) noexcept;
    };

    /// Bot identity. The login channel is always joined in addition to channels.
    struct BotConfig
    {
        std::string login; ///< bot username (lowercase)
        std::vector<std::string> channels; ///< without '#', lowercase
    };

    struct AuthConfig
    {
        std::string access_token; ///< "oauth:" prefix added when missing
    };

    /// Process-wide quiz defaults.
    struct QuizConfig
    {
        std::filesystem::path directory{ "./quizzes" };
        int timer_seconds = 30;
        std::optional<int> question_count; ///< absent = every question
        bool random_order = false;
        std::vector<int> announce_at{ 20, 10, 5, 3 }; ///< countdown values echoed to chat
        std::chrono::milliseconds settle_delay{ 3000 };
        std::chrono::minutes sweep_interval{ 60 };
    };

    class Config
    {
    public:
        /// Load from the file at path.
        static Config load_file(const std::filesystem::path& path);

        /// Load from "./config.toml".
        static Config load();

        /// Parse TOML text; source names it in error messages.
        static Config parse(std::string_view text, std::string_view source = "<memory>");

        [[nodiscard]] const BotConfig& bot() const noexcept
        {
            return bot_;
        }
        [[nodiscard]] const AuthConfig& auth() const noexcept
        {
            return auth_;
        }
        [[nodiscard]] const QuizConfig& quiz() const noexcept
        {
            return quiz_;
        }
        [[nodiscard]] const std::filesystem::path& path() const noexcept
        {
            return path_;
        }

        /// Login channel first, then the configured channels, without duplicates.
        [[nodiscard]] std::vector<std::string> channels_to_join() const;

    private:
        Config(std::filesystem::path path, BotConfig bot_cfg, AuthConfig auth_cfg, QuizConfig quiz_cfg) noexcept :
            path_{ std::move(path) },
            bot_{ std::move(bot_cfg) },
            auth_{ std::move(auth_cfg) },
            quiz_{ std::move(quiz_cfg) }
        {
        }

        std::filesystem::path path_;
        BotConfig bot_;
        AuthConfig auth_;
        QuizConfig quiz_;
    };

} // namespace env
