/*
Module Name:
- types.hpp

Abstract:
- Value types shared by the quiz core: questions, per-session settings and
  read-only session snapshots handed out to callers.
- Settings are copied into a session on start so later global changes never
  alter a running quiz.
*/
#pragma once

// C++ Standard Library
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace quiz_bot
{

    // Validation limits for user-adjustable settings.
    inline constexpr int kMinTimerSeconds = 5;
    inline constexpr int kMaxTimerSeconds = 300;
    inline constexpr int kDefaultTimerSeconds = 30;
    inline constexpr int kMinQuestionCount = 1;
    inline constexpr int kMaxQuestionCount = 100;

    // One question. Immutable once loaded.
    struct Question
    {
        std::string text;
        std::string answer;
        std::vector<std::string> options; // may be empty

        friend bool operator==(const Question&, const Question&) = default;
    };

    struct QuizSettings
    {
        std::optional<int> question_count; // nullopt = use every question
        bool random_order = false;
        int timer_duration_seconds = kDefaultTimerSeconds;

        friend bool operator==(const QuizSettings&, const QuizSettings&) = default;
    };

    // Returned by a successful start.
    struct SessionInfo
    {
        std::string question_set_name;
        std::size_t total_questions = 0;
        QuizSettings settings;
    };

    // Point-in-time copy of a session. cursor == total means complete.
    struct SessionSnapshot
    {
        std::string channel;
        std::string question_set_name;
        std::size_t cursor = 0;
        std::size_t total = 0;
        bool active = false;
        bool paused = false;
        QuizSettings settings;
        std::chrono::system_clock::time_point started_at{};
        std::chrono::steady_clock::duration elapsed{};
    };

    // Outcome of pause/resume. changed == false means the session was already in the requested state.
    struct ToggleResult
    {
        SessionSnapshot snapshot;
        bool changed = false;
    };

} // namespace quiz_bot
