/*
Module Name:
- settings_store.hpp

Abstract:
- Process-wide quiz defaults adjusted from chat (!set_timer, !set_questions, !random_order).
- Every setter validates before it writes; a rejected value leaves the store unchanged.
- Sessions take a copy at start, so changes only affect quizzes started afterwards.
*/
#pragma once

// C++ Standard Library
#include <mutex>
#include <optional>
#include <string>

// Core
#include <qb/quiz/types.hpp>

namespace quiz_bot
{

    class SettingsStore
    {
    public:
        // defaults must already be valid; throws ConfigurationError otherwise.
        explicit SettingsStore(QuizSettings defaults = {});

        [[nodiscard]] QuizSettings settings() const;

        // nullopt = all questions. Range [kMinQuestionCount, kMaxQuestionCount].
        void set_question_count(std::optional<int> count);

        void set_random_order(bool random_order);

        // Returns the new value.
        bool toggle_random_order();

        // Range [kMinTimerSeconds, kMaxTimerSeconds].
        void set_timer_duration(int seconds);

        // Back to the values given at construction.
        void reset_to_defaults();

        // "questions=all order=sequential timer=30s"
        [[nodiscard]] std::string summary() const;

        // Throw ConfigurationError with a user-facing reason.
        static void validate_question_count(std::optional<int> count);
        static void validate_timer_duration(int seconds);

    private:
        const QuizSettings defaults_;

        mutable std::mutex mutex_;
        QuizSettings current_;
    };

} // namespace quiz_bot
