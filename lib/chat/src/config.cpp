// C++ Standard Library
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <utility>

// TOML++
#include <toml++/toml.hpp>

// Core
#include <qb/chat/config.hpp>
#include <qb/quiz/types.hpp>

namespace env
{

    namespace
    {
        using keys_t = std::initializer_list<std::string_view>;

        std::string dotted(keys_t keys)
        {
            std::string out;
            for (auto k : keys)
            {
                if (!out.empty())
                    out.push_back('.');
                out.append(k);
            }
            return out;
        }

        // Node at a dotted key path, nullptr when any part is missing.
        const toml::node* find_node(const toml::table& root, keys_t keys)
        {
            const toml::node* node = &root;
            for (auto key : keys)
            {
                const auto* table_ptr = node->as_table();
                if (!table_ptr)
                    return nullptr;
                node = table_ptr->get(key);
                if (!node)
                    return nullptr;
            }
            return node;
        }

        // Non-empty string at keys or EnvError.
        std::string fetch_string(const toml::table& root, keys_t keys, const std::string& source)
        {
            const auto* node = find_node(root, keys);
            if (!node)
                throw EnvError("Missing key '" + dotted(keys) + "' in " + source);
            if (auto opt = node->value<std::string>(); opt && !opt->empty())
                return *opt;
            throw EnvError("Invalid value for '" + dotted(keys) + "' in " + source);
        }

        std::optional<std::int64_t> fetch_optional_int(const toml::table& root, keys_t keys, const std::string& source)
        {
            const auto* node = find_node(root, keys);
            if (!node)
                return std::nullopt;
            if (!node->is_integer())
                throw EnvError("'" + dotted(keys) + "' must be an integer in " + source);
            return node->value<std::int64_t>();
        }

        std::optional<bool> fetch_optional_bool(const toml::table& root, keys_t keys, const std::string& source)
        {
            const auto* node = find_node(root, keys);
            if (!node)
                return std::nullopt;
            if (!node->is_boolean())
                throw EnvError("'" + dotted(keys) + "' must be true or false in " + source);
            return node->value<bool>();
        }

        const toml::array* fetch_optional_array(const toml::table& root, keys_t keys, const std::string& source)
        {
            const auto* node = find_node(root, keys);
            if (!node)
                return nullptr;
            const auto* arr = node->as_array();
            if (!arr)
                throw EnvError("'" + dotted(keys) + "' must be an array in " + source);
            return arr;
        }

        int checked_range(std::int64_t v, std::int64_t lo, std::int64_t hi, keys_t keys, const std::string& source)
        {
            if (v < lo || v > hi)
            {
                throw EnvError("'" + dotted(keys) + "' must be between " + std::to_string(lo) + " and " +
                               std::to_string(hi) + " in " + source);
            }
            return static_cast<int>(v);
        }

        std::string canonical_channel(std::string_view s)
        {
            if (!s.empty() && s.front() == '#')
                s.remove_prefix(1);
            std::string out;
            out.reserve(s.size());
            for (unsigned char c : s)
                out.push_back(static_cast<char>(std::tolower(c)));
            return out;
        }

        BotConfig read_bot(const toml::table& tbl, const std::string& source)
        {
            BotConfig bot_cfg{
                .login = canonical_channel(fetch_string(tbl, { "twitch", "bot", "login" }, source)),
                .channels = {},
            };
            if (const auto* arr = fetch_optional_array(tbl, { "twitch", "bot", "channels" }, source))
            {
                for (const auto& el : *arr)
                {
                    auto name = el.value<std::string>();
                    if (!name || name->empty())
                        throw EnvError("'twitch.bot.channels' entries must be non-empty strings in " + source);
                    bot_cfg.channels.push_back(canonical_channel(*name));
                }
            }
            return bot_cfg;
        }

        AuthConfig read_auth(const toml::table& tbl, const std::string& source)
        {
            AuthConfig auth_cfg{ .access_token = fetch_string(tbl, { "twitch", "auth", "access_token" }, source) };
            if (auth_cfg.access_token.rfind("oauth:", 0) != 0)
                auth_cfg.access_token.insert(0, "oauth:");
            return auth_cfg;
        }

        QuizConfig read_quiz(const toml::table& tbl, const std::string& source)
        {
            QuizConfig q;

            if (const auto* node = find_node(tbl, { "quiz", "directory" }))
            {
                auto dir = node->value<std::string>();
                if (!dir || dir->empty())
                    throw EnvError("'quiz.directory' must be a non-empty string in " + source);
                q.directory = *dir;
            }
            if (auto v = fetch_optional_int(tbl, { "quiz", "timer_seconds" }, source))
            {
                q.timer_seconds = checked_range(*v, quiz_bot::kMinTimerSeconds, quiz_bot::kMaxTimerSeconds,
                                                { "quiz", "timer_seconds" }, source);
            }
            if (auto v = fetch_optional_int(tbl, { "quiz", "question_count" }, source))
            {
                q.question_count = checked_range(*v, quiz_bot::kMinQuestionCount, quiz_bot::kMaxQuestionCount,
                                                 { "quiz", "question_count" }, source);
            }
            if (auto v = fetch_optional_bool(tbl, { "quiz", "random_order" }, source))
            {
                q.random_order = *v;
            }
            if (const auto* arr = fetch_optional_array(tbl, { "quiz", "announce_at" }, source))
            {
                q.announce_at.clear();
                for (const auto& el : *arr)
                {
                    auto v = el.value<std::int64_t>();
                    if (!el.is_integer() || !v || *v < 1 || *v > quiz_bot::kMaxTimerSeconds)
                        throw EnvError("'quiz.announce_at' entries must be integers between 1 and " +
                                       std::to_string(quiz_bot::kMaxTimerSeconds) + " in " + source);
                    q.announce_at.push_back(static_cast<int>(*v));
                }
                std::sort(q.announce_at.begin(), q.announce_at.end(), std::greater<>{});
                q.announce_at.erase(std::unique(q.announce_at.begin(), q.announce_at.end()), q.announce_at.end());
            }
            if (auto v = fetch_optional_int(tbl, { "quiz", "settle_delay_ms" }, source))
            {
                q.settle_delay = std::chrono::milliseconds{ checked_range(*v, 0, 60'000, { "quiz", "settle_delay_ms" }, source) };
            }
            if (auto v = fetch_optional_int(tbl, { "quiz", "sweep_interval_minutes" }, source))
            {
                q.sweep_interval = std::chrono::minutes{ checked_range(*v, 1, 24 * 60, { "quiz", "sweep_interval_minutes" }, source) };
            }
            return q;
        }
    } // namespace

    Config Config::parse(std::string_view text, std::string_view source)
    {
        const std::string source_str{ source };
        toml::table tbl;
        try
        {
            tbl = toml::parse(text, source);
        }
        catch (const toml::parse_error& e)
        {
            throw EnvError("TOML parse error in '" + source_str + "': " + std::string{ e.description() });
        }

        return Config(std::filesystem::path{ source_str },
                      read_bot(tbl, source_str),
                      read_auth(tbl, source_str),
                      read_quiz(tbl, source_str));
    }

    Config Config::load_file(const std::filesystem::path& path)
    {
        if (path.empty())
            throw EnvError("Config file path must not be empty");

        const auto path_str = path.string();
        toml::table tbl;
        try
        {
            tbl = toml::parse_file(path_str);
        }
        catch (const toml::parse_error& e)
        {
            throw EnvError("TOML parse error in '" + path_str + "': " + std::string{ e.description() });
        }
        catch (const std::filesystem::filesystem_error& e)
        {
            throw EnvError("Cannot read config file '" + path_str + "': " + std::string{ e.what() });
        }

        return Config(std::filesystem::absolute(path),
                      read_bot(tbl, path_str),
                      read_auth(tbl, path_str),
                      read_quiz(tbl, path_str));
    }

    Config Config::load()
    {
        const auto default_path = std::filesystem::current_path() / "config.toml";
        if (!std::filesystem::exists(default_path))
            throw EnvError("Config file not found at '" + default_path.string() + "'");
        return load_file(default_path);
    }

    std::vector<std::string> Config::channels_to_join() const
    {
        std::vector<std::string> out;
        out.reserve(bot_.channels.size() + 1);
        out.push_back(bot_.login);
        for (const auto& c : bot_.channels)
        {
            if (std::find(out.begin(), out.end(), c) == out.end())
                out.push_back(c);
        }
        return out;
    }

    EnvError::EnvError(const std::string& msg) noexcept :
        std::runtime_error{ msg }
    {
    }

} // namespace env
