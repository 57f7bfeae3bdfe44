/*
Module: quiz_commands.hpp

Purpose:
- Register the quiz chat commands on the bot's dispatcher.

Notes:
- Anyone may !start a quiz or ask for !status, !quizzes and !help.
- Stopping, pausing and resuming a quiz, changing settings and reloading quizzes require the
  broadcaster or a moderator of the channel.
- Settings changed from chat are global: they apply to quizzes started afterwards in every channel.
*/
#pragma once

// C++ Standard Library
#include <optional>
#include <string>
#include <string_view>

// Core
#include <qb/chat/quiz_bot.hpp>
#include <qb/quiz/question_repository.hpp>
#include <qb/quiz/session_controller.hpp>
#include <qb/quiz/settings_store.hpp>
#include <qb/quiz/timer_registry.hpp>

namespace app
{

    // Everything the commands act on. Must outlive the bot's run().
    struct QuizServices
    {
        quiz_bot::SessionController& sessions;
        quiz_bot::JsonQuestionRepository& questions;
        quiz_bot::SettingsStore& settings;
        quiz_bot::TimerRegistry& timers;
    };

    void quiz_commands(quiz_bot::QuizBot& bot, QuizServices services);

    // Help line listing every command.
    [[nodiscard]] std::string help_text();

    // "5" -> 5, "all" -> nullopt. Throws ConfigurationError on anything else.
    [[nodiscard]] std::optional<int> parse_question_count(std::string_view arg);

    // Whole seconds. Throws ConfigurationError when arg is not a number.
    [[nodiscard]] int parse_seconds(std::string_view arg);

} // namespace app
