// C++ Standard Library
#include <atomic>
#include <mutex>
#include <stdexcept>
#include <string>

// Chat
#include <qb/chat/command_dispatcher.hpp>

#include "support/io_fixture.hpp"

using quiz_bot::ChatCommand;
using quiz_bot::CommandDispatcher;
using quiz_bot::parse_irc_line;

TEST(ToCommand, ExtractsNameArgsAndRoles)
{
    const auto m = parse_irc_line("@badges=moderator/1;id=msg-9 :mod!mod@mod.tmi.twitch.tv PRIVMSG #Chan :!Set_Timer   45  ");
    const auto cmd = CommandDispatcher::to_command(m);
    ASSERT_TRUE(cmd.has_value());
    EXPECT_EQ(cmd->name, "set_timer");
    EXPECT_EQ(cmd->channel, "Chan");
    EXPECT_EQ(cmd->user, "mod");
    EXPECT_EQ(cmd->args, "45");
    EXPECT_EQ(cmd->message_id, "msg-9");
    EXPECT_TRUE(cmd->is_moderator);
    EXPECT_TRUE(cmd->is_privileged());
}

TEST(ToCommand, BareCommandHasNoArgs)
{
    const auto cmd = CommandDispatcher::to_command(parse_irc_line(":v!v@v PRIVMSG #c :!status"));
    ASSERT_TRUE(cmd.has_value());
    EXPECT_EQ(cmd->name, "status");
    EXPECT_TRUE(cmd->args.empty());
    EXPECT_FALSE(cmd->is_privileged());
}

TEST(ToCommand, IgnoresNonCommands)
{
    EXPECT_FALSE(CommandDispatcher::to_command(parse_irc_line(":v!v@v PRIVMSG #c :hello there")));
    EXPECT_FALSE(CommandDispatcher::to_command(parse_irc_line(":v!v@v PRIVMSG #c :!")));
    EXPECT_FALSE(CommandDispatcher::to_command(parse_irc_line(":v!v@v PRIVMSG #c :! start")));
    EXPECT_FALSE(CommandDispatcher::to_command(parse_irc_line(":v!v@v NOTICE #c :!start")));
    EXPECT_FALSE(CommandDispatcher::to_command(parse_irc_line("PING :!start")));
}

class CommandDispatcherTest : public qb_test::IoFixture
{
protected:
    CommandDispatcher dispatcher_{ strand_ };
};

TEST_F(CommandDispatcherTest, FirstRegistrationWins)
{
    auto noop = [](ChatCommand) -> boost::asio::awaitable<void> { co_return; };
    EXPECT_TRUE(dispatcher_.register_command("Start", noop));
    EXPECT_FALSE(dispatcher_.register_command("start", noop));
    EXPECT_TRUE(dispatcher_.has_command("start"));
    EXPECT_FALSE(dispatcher_.has_command("stop"));
}

TEST_F(CommandDispatcherTest, DispatchRunsTheMatchingHandler)
{
    std::mutex m;
    std::string seen_args;
    std::atomic<int> calls{ 0 };
    dispatcher_.register_command("start", [&](ChatCommand cmd) -> boost::asio::awaitable<void> {
        {
            std::lock_guard lk(m);
            seen_args = cmd.args;
        }
        ++calls;
        co_return;
    });

    // The line buffer goes away before the handler runs.
    {
        std::string line = ":v!v@v PRIVMSG #c :!start history";
        dispatcher_.dispatch(parse_irc_line(line));
        line.assign(line.size(), 'x');
    }
    dispatcher_.dispatch(parse_irc_line(":v!v@v PRIVMSG #c :!unknown"));
    dispatcher_.dispatch(parse_irc_line(":v!v@v PRIVMSG #c :just chatting"));

    ASSERT_TRUE(eventually([&] { return calls.load() == 1; }));
    std::lock_guard lk(m);
    EXPECT_EQ(seen_args, "history");
}

TEST_F(CommandDispatcherTest, ThrowingHandlerIsContained)
{
    std::atomic<int> calls{ 0 };
    dispatcher_.register_command("boom", [&](ChatCommand) -> boost::asio::awaitable<void> {
        ++calls;
        throw std::runtime_error("handler failed");
        co_return;
    });
    dispatcher_.register_command("ok", [&](ChatCommand) -> boost::asio::awaitable<void> {
        ++calls;
        co_return;
    });

    dispatcher_.dispatch(parse_irc_line(":v!v@v PRIVMSG #c :!boom"));
    dispatcher_.dispatch(parse_irc_line(":v!v@v PRIVMSG #c :!ok"));
    EXPECT_TRUE(eventually([&] { return calls.load() == 2; }));
}
