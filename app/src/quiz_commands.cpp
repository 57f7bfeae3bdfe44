/*
Module: quiz_commands.cpp

Purpose:
- Chat front end of the session controller:
    !start [quiz]  !stop  !pause  !resume  !status
    !quizzes  !set_questions <n|all>  !set_timer <seconds>  !random_order  !reload  !help

Why:
- Handlers translate the quiz error taxonomy into one reply line each. Anything else escapes
  to the dispatcher, which logs it.
- Replies are computed inside the try block and sent after it, never from a catch handler.
*/

// C++ Standard Library
#include <charconv>
#include <iostream>
#include <string>
#include <string_view>

// Core
#include <qb/quiz/errors.hpp>
#include <qb/quiz/message_format.hpp>

// App
#include <app/irc_presenter.hpp>
#include <app/quiz_commands.hpp>

namespace app
{

    using boost::asio::awaitable;
    using quiz_bot::ChatCommand;

    namespace
    {
        constexpr std::string_view kNotAllowed = "Only the broadcaster or a moderator can do that.";
        constexpr std::string_view kNoQuiz = "No quiz is running here. Start one with !start [quiz].";

        std::string line(const quiz_bot::QuizMessage& m)
        {
            return IrcPresenter::render(m);
        }

        awaitable<void> answer(quiz_bot::QuizBot& bot, const ChatCommand& cmd, std::string text)
        {
            co_await bot.reply(cmd.channel, cmd.message_id, std::move(text));
        }

        std::string trimmed_first_word(std::string_view args)
        {
            const auto space = args.find(' ');
            return std::string{ args.substr(0, space) };
        }
    } // namespace

    std::string help_text()
    {
        return "Quiz commands: !start [quiz] | !stop | !pause | !resume | !status | !quizzes | "
               "!set_questions <n|all> | !set_timer <seconds> | !random_order | !reload | !help";
    }

    std::optional<int> parse_question_count(std::string_view arg)
    {
        if (arg == "all" || arg == "ALL")
        {
            return std::nullopt;
        }
        int n = 0;
        const auto* end = arg.data() + arg.size();
        const auto [ptr, ec] = std::from_chars(arg.data(), end, n);
        if (arg.empty() || ec != std::errc{} || ptr != end)
        {
            throw quiz_bot::ConfigurationError("Question count must be a number or 'all'");
        }
        quiz_bot::SettingsStore::validate_question_count(n);
        return n;
    }

    int parse_seconds(std::string_view arg)
    {
        int n = 0;
        const auto* end = arg.data() + arg.size();
        const auto [ptr, ec] = std::from_chars(arg.data(), end, n);
        if (arg.empty() || ec != std::errc{} || ptr != end)
        {
            throw quiz_bot::ConfigurationError("Timer duration must be a whole number of seconds");
        }
        return n;
    }

    void quiz_commands(quiz_bot::QuizBot& bot, QuizServices svc)
    {
        auto& d = bot.dispatcher();

        // ---------- !help ---------------------------------------------------------
        d.register_command("help", [&bot](ChatCommand cmd) -> awaitable<void> {
            co_await answer(bot, cmd, help_text());
        });

        // ---------- !quizzes ------------------------------------------------------
        d.register_command("quizzes", [&bot, svc](ChatCommand cmd) -> awaitable<void> {
            std::string text{ "Available quizzes: " };
            bool first = true;
            for (const auto& name : svc.questions.list_names())
            {
                if (!first)
                {
                    text.append(", ");
                }
                text.append(name).append(" (").append(std::to_string(svc.questions.question_count(name))).append(")");
                first = false;
            }
            if (svc.questions.fallback_active())
            {
                text.append(" | No quiz files could be loaded, only the built-in fallback quiz is available.");
            }
            else if (const auto errors = svc.questions.load_errors(); !errors.empty())
            {
                text.append(" | ").append(std::to_string(errors.size())).append(" file(s) failed to load");
            }
            co_await answer(bot, cmd, std::move(text));
        });

        // ---------- !start [quiz] -------------------------------------------------
        d.register_command("start", [&bot, svc](ChatCommand cmd) -> awaitable<void> {
            std::string reply;
            bool started = false;
            try
            {
                std::string name = trimmed_first_word(cmd.args);
                if (name.empty())
                {
                    const auto names = svc.questions.list_names();
                    if (names.empty())
                    {
                        throw quiz_bot::NoSuchQuestionSetError("no quizzes are loaded");
                    }
                    name = names.front();
                }

                if (!svc.sessions.resolve_stale_session(cmd.channel))
                {
                    throw quiz_bot::SessionConflictError("a quiz is already running in #" + cmd.channel);
                }

                const auto info = svc.sessions.start_session(cmd.channel, name);
                started = true;
                reply = line(quiz_bot::make_session_started_message(info));
                if (svc.questions.fallback_active())
                {
                    reply.append(" | Using the built-in fallback quiz.");
                }
                std::cout << "[Commands] " << cmd.user << " started '" << info.question_set_name << "' in #"
                          << cmd.channel << '\n';
            }
            catch (const quiz_bot::SessionConflictError&)
            {
                reply = "A quiz is already running here. Use !stop first.";
            }
            catch (const quiz_bot::NoSuchQuestionSetError& e)
            {
                reply = std::string{ "Cannot start: " } + e.what() + ". Try !quizzes.";
            }
            catch (const quiz_bot::ConfigurationError& e)
            {
                reply = std::string{ "Cannot start: " } + e.what();
            }

            // The announcement goes out before the first question, even if it fails to send.
            std::string send_failure;
            try
            {
                co_await answer(bot, cmd, std::move(reply));
            }
            catch (const std::exception& e)
            {
                send_failure = e.what();
            }
            if (started)
            {
                svc.sessions.begin_presentation(cmd.channel);
            }
            if (!send_failure.empty())
            {
                std::cerr << "[Commands] !start reply to #" << cmd.channel << " failed: " << send_failure << '\n';
            }
        });

        // ---------- !stop ---------------------------------------------------------
        d.register_command("stop", [&bot, svc](ChatCommand cmd) -> awaitable<void> {
            if (!cmd.is_privileged())
            {
                co_await answer(bot, cmd, std::string{ kNotAllowed });
                co_return;
            }

            std::string reply;
            try
            {
                const auto s = co_await svc.sessions.stop_session(cmd.channel);
                reply = "Quiz '" + s.question_set_name + "' stopped after " + std::to_string(s.cursor) + "/" +
                        std::to_string(s.total) + " questions.";
            }
            catch (const quiz_bot::SessionNotFoundError&)
            {
                reply = std::string{ kNoQuiz };
            }
            co_await answer(bot, cmd, std::move(reply));
        });

        // ---------- !pause / !resume ----------------------------------------------
        d.register_command("pause", [&bot, svc](ChatCommand cmd) -> awaitable<void> {
            if (!cmd.is_privileged())
            {
                co_await answer(bot, cmd, std::string{ kNotAllowed });
                co_return;
            }

            std::string reply;
            try
            {
                const auto r = svc.sessions.pause_session(cmd.channel);
                reply = r.changed ? "Quiz paused. Use !resume to continue." : "The quiz is already paused.";
            }
            catch (const quiz_bot::SessionNotFoundError&)
            {
                reply = std::string{ kNoQuiz };
            }
            co_await answer(bot, cmd, std::move(reply));
        });

        d.register_command("resume", [&bot, svc](ChatCommand cmd) -> awaitable<void> {
            if (!cmd.is_privileged())
            {
                co_await answer(bot, cmd, std::string{ kNotAllowed });
                co_return;
            }

            std::string reply;
            try
            {
                const auto r = svc.sessions.resume_session(cmd.channel);
                reply = r.changed ? "Quiz resumed." : "The quiz is not paused.";
            }
            catch (const quiz_bot::SessionNotFoundError&)
            {
                reply = std::string{ kNoQuiz };
            }
            co_await answer(bot, cmd, std::move(reply));
        });

        // ---------- !status -------------------------------------------------------
        d.register_command("status", [&bot, svc](ChatCommand cmd) -> awaitable<void> {
            std::string reply;
            if (const auto s = svc.sessions.get_progress(cmd.channel))
            {
                std::optional<int> remaining;
                if (const auto t = svc.timers.status(cmd.channel))
                {
                    remaining = t->remaining_seconds;
                }
                reply = line(quiz_bot::make_status_message(*s, remaining));
            }
            else if (const auto last = svc.sessions.last_result(cmd.channel))
            {
                reply = std::string{ kNoQuiz } + " Last quiz: '" + last->question_set_name + "', " +
                        std::to_string(last->cursor) + "/" + std::to_string(last->total) + " questions.";
            }
            else
            {
                reply = std::string{ kNoQuiz } + " Settings: " + svc.settings.summary();
            }
            co_await answer(bot, cmd, std::move(reply));
        });

        // ---------- settings ------------------------------------------------------
        d.register_command("set_questions", [&bot, svc](ChatCommand cmd) -> awaitable<void> {
            if (!cmd.is_privileged())
            {
                co_await answer(bot, cmd, std::string{ kNotAllowed });
                co_return;
            }

            std::string reply;
            try
            {
                svc.settings.set_question_count(parse_question_count(trimmed_first_word(cmd.args)));
                reply = line(quiz_bot::make_settings_message(svc.settings.settings()));
            }
            catch (const quiz_bot::ConfigurationError& e)
            {
                reply = std::string{ e.what() } + ". Usage: !set_questions <1-100|all>";
            }
            co_await answer(bot, cmd, std::move(reply));
        });

        d.register_command("set_timer", [&bot, svc](ChatCommand cmd) -> awaitable<void> {
            if (!cmd.is_privileged())
            {
                co_await answer(bot, cmd, std::string{ kNotAllowed });
                co_return;
            }

            std::string reply;
            try
            {
                svc.settings.set_timer_duration(parse_seconds(trimmed_first_word(cmd.args)));
                reply = line(quiz_bot::make_settings_message(svc.settings.settings()));
            }
            catch (const quiz_bot::ConfigurationError& e)
            {
                reply = std::string{ e.what() } + ". Usage: !set_timer <" + std::to_string(quiz_bot::kMinTimerSeconds) +
                        "-" + std::to_string(quiz_bot::kMaxTimerSeconds) + ">";
            }
            co_await answer(bot, cmd, std::move(reply));
        });

        d.register_command("random_order", [&bot, svc](ChatCommand cmd) -> awaitable<void> {
            if (!cmd.is_privileged())
            {
                co_await answer(bot, cmd, std::string{ kNotAllowed });
                co_return;
            }

            (void)svc.settings.toggle_random_order();
            co_await answer(bot, cmd, line(quiz_bot::make_settings_message(svc.settings.settings())));
        });

        // ---------- !reload -------------------------------------------------------
        d.register_command("reload", [&bot, svc](ChatCommand cmd) -> awaitable<void> {
            if (!cmd.is_privileged())
            {
                co_await answer(bot, cmd, std::string{ kNotAllowed });
                co_return;
            }

            const auto sets = svc.questions.reload();
            std::string reply = "Reloaded " + std::to_string(sets) + " quiz set(s)";
            if (const auto errors = svc.questions.load_errors(); !errors.empty())
            {
                reply.append(", ").append(std::to_string(errors.size())).append(" failed: ");
                reply.append(errors.front().source).append(" (").append(errors.front().reason).append(")");
            }
            co_await answer(bot, cmd, std::move(reply));
        });
    }

} // namespace app
