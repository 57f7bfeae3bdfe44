// C++ Standard Library
#include <chrono>

// Core
#include <qb/quiz/message_format.hpp>
#include <qb/utils/utf8.hpp>

namespace quiz_bot
{

    namespace
    {
        std::string question_title(const QuestionContext& ctx)
        {
            std::string t{ "Question " };
            t.append(std::to_string(ctx.index + 1)).append("/").append(std::to_string(ctx.total));
            return t;
        }

        std::string seconds_text(int n)
        {
            std::string s = std::to_string(n);
            s.append(n == 1 ? " second" : " seconds");
            return s;
        }

        std::string join_options(const std::vector<std::string>& options)
        {
            std::string out;
            char letter = 'A';
            for (const auto& o : options)
            {
                if (!out.empty())
                {
                    out.append("  ");
                }
                out.push_back(letter);
                out.append(") ").append(o);
                letter = letter == 'Z' ? 'A' : static_cast<char>(letter + 1);
            }
            return out;
        }

        void add_question_fields(QuizMessage& m, const QuestionContext& ctx, const Question& q)
        {
            if (!q.options.empty())
            {
                m.fields.push_back({ "Options", join_options(q.options) });
            }
            m.fields.push_back({ "Quiz", std::string{ ctx.set_name } });
        }

        std::string count_text(const std::optional<int>& count)
        {
            return count ? std::to_string(*count) : std::string{ "all" };
        }
    } // namespace

    std::string_view to_string(MessageKind k) noexcept
    {
        switch (k)
        {
        case MessageKind::question:
            return "question";
        case MessageKind::countdown:
            return "countdown";
        case MessageKind::fallback_notice:
            return "fallback_notice";
        case MessageKind::reveal:
            return "reveal";
        case MessageKind::completion:
            return "completion";
        case MessageKind::fatal_notice:
            return "fatal_notice";
        case MessageKind::info:
            return "info";
        }
        return "unknown";
    }

    QuizMessage make_question_message(const QuestionContext& ctx, const Question& q, int timer_seconds)
    {
        QuizMessage m{ MessageKind::question, question_title(ctx), q.text, {}, {}, timer_seconds };
        add_question_fields(m, ctx, q);
        m.fields.insert(m.fields.begin(), MessageField{ "Time", seconds_text(timer_seconds) });
        m.footer = "Answer will be revealed when time expires";
        return m;
    }

    QuizMessage make_countdown_message(const QuestionContext& ctx, const Question& q, int remaining_seconds)
    {
        QuizMessage m{ MessageKind::countdown, question_title(ctx), q.text, {}, {}, remaining_seconds };
        m.fields.push_back({ "Time left", seconds_text(remaining_seconds) });
        add_question_fields(m, ctx, q);
        m.footer = remaining_seconds <= 3 ? "Time running out!" : "Answer will be revealed when time expires";
        return m;
    }

    QuizMessage make_fallback_notice(const QuestionContext& ctx, const Question& q, int delay_seconds)
    {
        QuizMessage m{ MessageKind::fallback_notice, question_title(ctx), q.text };
        m.fields.push_back({ "Time", seconds_text(delay_seconds) });
        add_question_fields(m, ctx, q);
        m.footer = "Live countdown unavailable, the answer follows when time is up";
        return m;
    }

    QuizMessage make_reveal_message(const QuestionContext& ctx, const Question& q, bool last, int next_in_seconds)
    {
        QuizMessage m{ MessageKind::reveal, "Time's up! " + question_title(ctx), q.text };
        m.fields.push_back({ "Answer", q.answer });
        m.fields.push_back({ "Quiz", std::string{ ctx.set_name } });
        if (last)
        {
            m.footer = "That was the final question";
        }
        else
        {
            m.footer = "Next question in " + seconds_text(next_in_seconds);
        }
        return m;
    }

    QuizMessage make_completion_message(const SessionSnapshot& s)
    {
        using std::chrono::duration_cast;
        using std::chrono::seconds;

        const auto total_seconds = duration_cast<seconds>(s.elapsed).count();

        QuizMessage m{ MessageKind::completion, "Quiz complete!", s.question_set_name + " has been completed" };
        m.fields.push_back({ "Questions", std::to_string(s.total) });
        m.fields.push_back({ "Duration", format_duration(total_seconds) });
        if (s.total > 0)
        {
            m.fields.push_back(
                { "Average", std::to_string(total_seconds / static_cast<std::int64_t>(s.total)) + "s per question" });
        }
        m.fields.push_back({ "Order", s.settings.random_order ? "random" : "sequential" });
        m.footer = "Thanks for playing! Type !start to play again";
        return m;
    }

    QuizMessage make_fatal_notice(std::string_view set_name, std::string_view reason)
    {
        QuizMessage m{ MessageKind::fatal_notice, "Quiz stopped", std::string{ reason } };
        if (!set_name.empty())
        {
            m.fields.push_back({ "Quiz", std::string{ set_name } });
        }
        m.footer = "Type !start to try again";
        return m;
    }

    QuizMessage make_session_started_message(const SessionInfo& info)
    {
        QuizMessage m{ MessageKind::info, "Starting quiz: " + info.question_set_name };
        m.fields.push_back({ "Questions", std::to_string(info.total_questions) });
        m.fields.push_back({ "Timer", seconds_text(info.settings.timer_duration_seconds) });
        m.fields.push_back({ "Order", info.settings.random_order ? "random" : "sequential" });
        return m;
    }

    QuizMessage make_status_message(const SessionSnapshot& s, std::optional<int> remaining_seconds)
    {
        QuizMessage m{ MessageKind::info, "Quiz status: " + s.question_set_name };
        const std::size_t shown = s.cursor < s.total ? s.cursor + 1 : s.total;
        m.fields.push_back({ "Question", std::to_string(shown) + "/" + std::to_string(s.total) });

        std::string state = !s.active ? "finished" : (s.paused ? "paused" : "running");
        m.fields.push_back({ "State", std::move(state) });
        if (remaining_seconds)
        {
            m.fields.push_back({ "Time left", seconds_text(*remaining_seconds) });
        }
        m.fields.push_back(
            { "Elapsed",
              format_duration(std::chrono::duration_cast<std::chrono::seconds>(s.elapsed).count()) });
        return m;
    }

    QuizMessage make_settings_message(const QuizSettings& s)
    {
        QuizMessage m{ MessageKind::info, "Quiz settings" };
        m.fields.push_back({ "Questions", count_text(s.question_count) });
        m.fields.push_back({ "Order", s.random_order ? "random" : "sequential" });
        m.fields.push_back({ "Timer", seconds_text(s.timer_duration_seconds) });
        return m;
    }

    std::string format_duration(std::int64_t total_seconds)
    {
        if (total_seconds < 0)
        {
            total_seconds = 0;
        }
        std::string out = std::to_string(total_seconds / 60);
        out.append("m ").append(std::to_string(total_seconds % 60)).append("s");
        return out;
    }

    std::string render_plain(const QuizMessage& m)
    {
        std::string out;
        out.reserve(256);
        auto part = [&out](std::string_view s) {
            if (s.empty())
            {
                return;
            }
            if (!out.empty())
            {
                out.append(" | ");
            }
            out.append(s);
        };

        part(m.title);
        part(m.body);
        for (const auto& f : m.fields)
        {
            if (f.value.empty())
            {
                continue;
            }
            std::string line = f.name;
            line.append(": ").append(f.value);
            part(line);
        }
        part(m.footer);

        // Chat lines are single line; fold any embedded newline.
        for (char& c : out)
        {
            if (c == '\r' || c == '\n')
            {
                c = ' ';
            }
        }
        return out;
    }

    std::string clip_utf8(std::string_view text, std::size_t max_bytes)
    {
        if (text.size() <= max_bytes)
        {
            return std::string{ text };
        }

        constexpr std::string_view ellipsis{ "..." };
        const bool room_for_ellipsis = max_bytes > ellipsis.size();
        const std::size_t cut = qb::utf8_clip_len(text, room_for_ellipsis ? max_bytes - ellipsis.size() : max_bytes);

        std::string out{ text.substr(0, cut) };
        if (room_for_ellipsis)
        {
            out.append(ellipsis);
        }
        return out;
    }

} // namespace quiz_bot
