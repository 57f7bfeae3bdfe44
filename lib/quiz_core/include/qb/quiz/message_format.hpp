/*
Module Name:
- message_format.hpp

Abstract:
- Structured chat content produced by the quiz core (question, countdown, reveal, notices, summaries).
- The core never formats transport text itself; a Presenter turns a QuizMessage into whatever its
  channel understands. render_plain() is the single-line rendering used by chat transports.
*/
#pragma once

// C++ Standard Library
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Core
#include <qb/quiz/types.hpp>

namespace quiz_bot
{

    enum class MessageKind : std::uint8_t
    {
        question,
        countdown,
        fallback_notice,
        reveal,
        completion,
        fatal_notice,
        info,
    };

    [[nodiscard]] std::string_view to_string(MessageKind k) noexcept;

    struct MessageField
    {
        std::string name;
        std::string value;

        friend bool operator==(const MessageField&, const MessageField&) = default;
    };

    struct QuizMessage
    {
        MessageKind kind = MessageKind::info;
        std::string title;
        std::string body;
        std::vector<MessageField> fields;
        std::string footer;
        int remaining_seconds = -1; // countdown content only

        friend bool operator==(const QuizMessage&, const QuizMessage&) = default;
    };

    // Position of a question inside its session; index is 0-based.
    struct QuestionContext
    {
        std::string_view set_name;
        std::size_t index = 0;
        std::size_t total = 0;
    };

    [[nodiscard]] QuizMessage make_question_message(const QuestionContext& ctx, const Question& q, int timer_seconds);

    [[nodiscard]] QuizMessage make_countdown_message(const QuestionContext& ctx, const Question& q, int remaining_seconds);

    // Shown when no countdown could be started and the answer follows after a plain delay.
    [[nodiscard]] QuizMessage make_fallback_notice(const QuestionContext& ctx, const Question& q, int delay_seconds);

    [[nodiscard]] QuizMessage
    make_reveal_message(const QuestionContext& ctx, const Question& q, bool last, int next_in_seconds);

    [[nodiscard]] QuizMessage make_completion_message(const SessionSnapshot& final_state);

    [[nodiscard]] QuizMessage make_fatal_notice(std::string_view set_name, std::string_view reason);

    [[nodiscard]] QuizMessage make_session_started_message(const SessionInfo& info);

    // remaining_seconds comes from the registry when a countdown is in flight.
    [[nodiscard]] QuizMessage make_status_message(const SessionSnapshot& s, std::optional<int> remaining_seconds);

    [[nodiscard]] QuizMessage make_settings_message(const QuizSettings& s);

    // "12m 5s"
    [[nodiscard]] std::string format_duration(std::int64_t total_seconds);

    // title | body | name: value | ... | footer. Empty parts are skipped.
    [[nodiscard]] std::string render_plain(const QuizMessage& m);

    // Truncates to at most max_bytes without splitting a UTF-8 sequence; appends "..." when cut.
    [[nodiscard]] std::string clip_utf8(std::string_view text, std::size_t max_bytes);

} // namespace quiz_bot
