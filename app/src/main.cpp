/*
Module: main.cpp

Purpose:
- Entry point: load configuration, build the quiz core around the chat bot and run the event loop.

Notes:
- Config is read from the path given as the first argument, or ./config.toml (see env::Config).
  Fails fast with EnvError.
- Question sets are loaded once at startup from [quiz].directory; !reload rescans it.
- The timer registry and the session controller run on the bot's strand, the same one that
  carries IRC writes and command handlers.
- SIGINT/SIGTERM stop every running quiz before the connection closes.
*/

// C++ Standard Library
#include <cstdlib>
#include <iostream>

// Core
#include <qb/chat/config.hpp>
#include <qb/chat/quiz_bot.hpp>
#include <qb/quiz/errors.hpp>
#include <qb/quiz/question_repository.hpp>
#include <qb/quiz/session_controller.hpp>
#include <qb/quiz/settings_store.hpp>
#include <qb/quiz/timer_registry.hpp>

// App
#include <app/irc_presenter.hpp>
#include <app/quiz_commands.hpp>

int main(int argc, char** argv)
{
    try
    {
        // 1) Immutable configuration.
        const auto cfg = argc > 1 ? env::Config::load_file(argv[1]) : env::Config::load();
        const auto& quiz_cfg = cfg.quiz();

        // 2) Chat side.
        quiz_bot::QuizBot bot{ cfg.bot().login, cfg.auth().access_token, cfg.channels_to_join() };

        // 3) Quiz content and global defaults.
        quiz_bot::JsonQuestionRepository questions{ quiz_cfg.directory };
        quiz_bot::SettingsStore settings{ quiz_bot::QuizSettings{
            .question_count = quiz_cfg.question_count,
            .random_order = quiz_cfg.random_order,
            .timer_duration_seconds = quiz_cfg.timer_seconds,
        } };

        // 4) Session engine on the bot's strand.
        quiz_bot::TimerRegistry timers{ bot.executor() };
        app::IrcPresenter presenter{
            [&bot](std::string channel, std::string text) { return bot.say(std::move(channel), std::move(text)); },
            quiz_cfg.announce_at
        };

        quiz_bot::ControllerOptions options;
        options.settle_delay = quiz_cfg.settle_delay;
        options.sweep_interval = quiz_cfg.sweep_interval;
        quiz_bot::SessionController sessions{ bot.executor(), questions, settings, presenter, timers, options };

        // 5) Chat commands and housekeeping.
        app::quiz_commands(bot, app::QuizServices{ sessions, questions, settings, timers });
        sessions.start_sweeper();
        bot.set_shutdown_hook([&sessions] { return sessions.shutdown(); });

        std::cout << "[QuizBot] " << questions.list_names().size() << " quiz set(s), defaults "
                  << settings.summary() << '\n';

        // 6) Blocks until stopped.
        bot.run();
    }
    catch (const env::EnvError& e)
    {
        std::cerr << "Configuration error: " << e.what() << '\n';
        return EXIT_FAILURE;
    }
    catch (const quiz_bot::QuizError& e)
    {
        std::cerr << "Quiz setup error: " << e.what() << '\n';
        return EXIT_FAILURE;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Fatal startup error: " << e.what() << '\n';
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
