// C++ Standard Library
#include <string>

// GoogleTest
#include <gtest/gtest.h>

// Chat
#include <qb/chat/irc_message.hpp>

using quiz_bot::parse_irc_line;

TEST(IrcMessage, ParsesTaggedPrivmsg)
{
    const auto m = parse_irc_line(
        "@badge-info=;badges=broadcaster/1;color=#FF0000;id=abc-123;mod=0;user-type= "
        ":streamer!streamer@streamer.tmi.twitch.tv PRIVMSG #streamer :!start geography");

    EXPECT_EQ(m.command, "PRIVMSG");
    ASSERT_EQ(m.param_count, 1);
    EXPECT_EQ(m.params[0], "#streamer");
    EXPECT_EQ(m.trailing, "!start geography");
    EXPECT_EQ(m.prefix, "streamer!streamer@streamer.tmi.twitch.tv");
    EXPECT_EQ(m.user(), "streamer");
    EXPECT_EQ(m.get_tag("id"), "abc-123");
    EXPECT_EQ(m.get_tag("color"), "#FF0000");
    EXPECT_TRUE(m.is_broadcaster);
    EXPECT_FALSE(m.is_moderator);
}

TEST(IrcMessage, ModeratorFlagFromAnyTagForm)
{
    EXPECT_TRUE(parse_irc_line("@mod=1 :u!u@u PRIVMSG #c :hi").is_moderator);
    EXPECT_TRUE(parse_irc_line("@user-type=mod :u!u@u PRIVMSG #c :hi").is_moderator);
    EXPECT_TRUE(parse_irc_line("@badges=moderator/1,subscriber/12 :u!u@u PRIVMSG #c :hi").is_moderator);
    EXPECT_FALSE(parse_irc_line("@badges=subscriber/12;mod=0 :u!u@u PRIVMSG #c :hi").is_moderator);
}

TEST(IrcMessage, TagLookupMatchesWholeKeys)
{
    const auto m = parse_irc_line("@room-id=42;id=7 :u!u@u PRIVMSG #c :x");
    EXPECT_EQ(m.get_tag("id"), "7");
    EXPECT_EQ(m.get_tag("room-id"), "42");
    EXPECT_TRUE(m.get_tag("room").empty());
    EXPECT_TRUE(m.get_tag("missing").empty());
}

TEST(IrcMessage, UntaggedLinesCarryNoRoles)
{
    const auto m = parse_irc_line(":viewer!viewer@viewer.tmi.twitch.tv PRIVMSG #chan :!stop");
    EXPECT_TRUE(m.raw_tags.empty());
    EXPECT_FALSE(m.is_moderator);
    EXPECT_FALSE(m.is_broadcaster);
    EXPECT_EQ(m.user(), "viewer");
}

TEST(IrcMessage, PingAndNumerics)
{
    const auto ping = parse_irc_line("PING :tmi.twitch.tv");
    EXPECT_EQ(ping.command, "PING");
    EXPECT_EQ(ping.param_count, 0);
    EXPECT_EQ(ping.trailing, "tmi.twitch.tv");
    EXPECT_TRUE(ping.prefix.empty());

    const auto welcome = parse_irc_line(":tmi.twitch.tv 001 quizbot :Welcome, GLHF!");
    EXPECT_EQ(welcome.command, "001");
    ASSERT_EQ(welcome.param_count, 1);
    EXPECT_EQ(welcome.params[0], "quizbot");
    EXPECT_EQ(welcome.parameters().size(), 1u);
}

TEST(IrcMessage, TooManyParamsAreCapped)
{
    std::string line = "CMD";
    for (int i = 0; i < 20; ++i)
    {
        line += " p" + std::to_string(i);
    }
    const auto m = parse_irc_line(line);
    EXPECT_EQ(m.param_count, quiz_bot::IrcMessage::max_params);
    EXPECT_EQ(m.params[15], "p15");
}

TEST(IrcMessage, EmptyLineYieldsEmptyMessage)
{
    const auto m = parse_irc_line("");
    EXPECT_TRUE(m.command.empty());
    EXPECT_EQ(m.param_count, 0);
}
