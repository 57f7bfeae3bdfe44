// C++ Standard Library
#include <string>

// GoogleTest
#include <gtest/gtest.h>

// Chat
#include <qb/chat/config.hpp>

using env::Config;
using env::EnvError;

namespace
{
    constexpr const char* kMinimal = R"(
[twitch.bot]
login = "QuizMaster"

[twitch.auth]
access_token = "abc123"
)";

    std::string with_quiz(const std::string& quiz_section)
    {
        return std::string{ kMinimal } + "\n[quiz]\n" + quiz_section + "\n";
    }
} // namespace

TEST(Config, MinimalFileUsesQuizDefaults)
{
    const auto cfg = Config::parse(kMinimal);
    EXPECT_EQ(cfg.bot().login, "quizmaster");
    EXPECT_TRUE(cfg.bot().channels.empty());
    EXPECT_EQ(cfg.auth().access_token, "oauth:abc123");

    const auto& q = cfg.quiz();
    EXPECT_EQ(q.directory.string(), "./quizzes");
    EXPECT_EQ(q.timer_seconds, 30);
    EXPECT_FALSE(q.question_count.has_value());
    EXPECT_FALSE(q.random_order);
    EXPECT_EQ(q.announce_at, (std::vector<int>{ 20, 10, 5, 3 }));
    EXPECT_EQ(q.settle_delay, std::chrono::milliseconds{ 3000 });
    EXPECT_EQ(q.sweep_interval, std::chrono::minutes{ 60 });
}

TEST(Config, TokenPrefixIsNotDoubled)
{
    const auto cfg = Config::parse(R"(
[twitch.bot]
login = "bot"
[twitch.auth]
access_token = "oauth:xyz"
)");
    EXPECT_EQ(cfg.auth().access_token, "oauth:xyz");
}

TEST(Config, ChannelsAreCanonicalAndLoginComesFirst)
{
    const auto cfg = Config::parse(R"(
[twitch.bot]
login = "bot"
channels = ["#Streamer", "other", "BOT"]
[twitch.auth]
access_token = "t"
)");
    EXPECT_EQ(cfg.bot().channels, (std::vector<std::string>{ "streamer", "other", "bot" }));
    EXPECT_EQ(cfg.channels_to_join(), (std::vector<std::string>{ "bot", "streamer", "other" }));
}

TEST(Config, QuizSectionOverridesDefaults)
{
    const auto cfg = Config::parse(with_quiz(R"(
directory = "/srv/quizzes"
timer_seconds = 45
question_count = 10
random_order = true
announce_at = [5, 30, 10, 5]
settle_delay_ms = 1500
sweep_interval_minutes = 15
)"));
    const auto& q = cfg.quiz();
    EXPECT_EQ(q.directory.string(), "/srv/quizzes");
    EXPECT_EQ(q.timer_seconds, 45);
    EXPECT_EQ(q.question_count, 10);
    EXPECT_TRUE(q.random_order);
    EXPECT_EQ(q.announce_at, (std::vector<int>{ 30, 10, 5 }));
    EXPECT_EQ(q.settle_delay, std::chrono::milliseconds{ 1500 });
    EXPECT_EQ(q.sweep_interval, std::chrono::minutes{ 15 });
}

TEST(Config, MissingRequiredKeysFail)
{
    EXPECT_THROW((void)Config::parse("[twitch.auth]\naccess_token = \"t\"\n"), EnvError);
    EXPECT_THROW((void)Config::parse("[twitch.bot]\nlogin = \"bot\"\n"), EnvError);
}

TEST(Config, OutOfRangeQuizValuesFail)
{
    EXPECT_THROW((void)Config::parse(with_quiz("timer_seconds = 4")), EnvError);
    EXPECT_THROW((void)Config::parse(with_quiz("timer_seconds = 301")), EnvError);
    EXPECT_THROW((void)Config::parse(with_quiz("question_count = 0")), EnvError);
    EXPECT_THROW((void)Config::parse(with_quiz("question_count = 101")), EnvError);
    EXPECT_THROW((void)Config::parse(with_quiz("announce_at = [0]")), EnvError);
    EXPECT_THROW((void)Config::parse(with_quiz("settle_delay_ms = -1")), EnvError);
    EXPECT_THROW((void)Config::parse(with_quiz("sweep_interval_minutes = 0")), EnvError);
}

TEST(Config, WrongTypesFail)
{
    EXPECT_THROW((void)Config::parse(with_quiz("timer_seconds = \"thirty\"")), EnvError);
    EXPECT_THROW((void)Config::parse(with_quiz("random_order = 1")), EnvError);
    EXPECT_THROW((void)Config::parse(with_quiz("announce_at = 5")), EnvError);
    EXPECT_THROW((void)Config::parse(with_quiz("directory = \"\"")), EnvError);
}

TEST(Config, SyntaxErrorNamesTheSource)
{
    try
    {
        (void)Config::parse("[twitch.bot\nlogin = ", "broken.toml");
        FAIL() << "expected EnvError";
    }
    catch (const EnvError& e)
    {
        EXPECT_NE(std::string{ e.what() }.find("broken.toml"), std::string::npos);
    }
}

TEST(Config, MissingFileFails)
{
    EXPECT_THROW((void)Config::load_file("/nonexistent/quiz_bot/config.toml"), EnvError);
    EXPECT_THROW((void)Config::load_file(""), EnvError);
}
