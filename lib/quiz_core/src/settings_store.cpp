// C++ Standard Library
#include <iostream>

// Core
#include <qb/quiz/errors.hpp>
#include <qb/quiz/settings_store.hpp>

namespace quiz_bot
{

    namespace
    {
        const QuizSettings& validated(const QuizSettings& s)
        {
            SettingsStore::validate_question_count(s.question_count);
            SettingsStore::validate_timer_duration(s.timer_duration_seconds);
            return s;
        }
    } // namespace

    SettingsStore::SettingsStore(QuizSettings defaults) :
        defaults_{ validated(defaults) }, current_{ defaults }
    {
    }

    void SettingsStore::validate_question_count(std::optional<int> count)
    {
        if (!count)
        {
            return;
        }
        if (*count < kMinQuestionCount)
        {
            throw ConfigurationError("Question count must be at least " + std::to_string(kMinQuestionCount));
        }
        if (*count > kMaxQuestionCount)
        {
            throw ConfigurationError("Question count cannot exceed " + std::to_string(kMaxQuestionCount));
        }
    }

    void SettingsStore::validate_timer_duration(int seconds)
    {
        if (seconds < kMinTimerSeconds)
        {
            throw ConfigurationError("Timer duration must be at least " + std::to_string(kMinTimerSeconds) +
                                     " seconds");
        }
        if (seconds > kMaxTimerSeconds)
        {
            throw ConfigurationError("Timer duration cannot exceed " + std::to_string(kMaxTimerSeconds) +
                                     " seconds");
        }
    }

    QuizSettings SettingsStore::settings() const
    {
        std::lock_guard lk(mutex_);
        return current_;
    }

    void SettingsStore::set_question_count(std::optional<int> count)
    {
        validate_question_count(count);
        std::lock_guard lk(mutex_);
        current_.question_count = count;
        std::cout << "[Settings] question count set to " << (count ? std::to_string(*count) : "all") << '\n';
    }

    void SettingsStore::set_random_order(bool random_order)
    {
        std::lock_guard lk(mutex_);
        current_.random_order = random_order;
        std::cout << "[Settings] random order " << (random_order ? "enabled" : "disabled") << '\n';
    }

    bool SettingsStore::toggle_random_order()
    {
        std::lock_guard lk(mutex_);
        current_.random_order = !current_.random_order;
        std::cout << "[Settings] random order " << (current_.random_order ? "enabled" : "disabled") << '\n';
        return current_.random_order;
    }

    void SettingsStore::set_timer_duration(int seconds)
    {
        validate_timer_duration(seconds);
        std::lock_guard lk(mutex_);
        current_.timer_duration_seconds = seconds;
        std::cout << "[Settings] timer set to " << seconds << "s\n";
    }

    void SettingsStore::reset_to_defaults()
    {
        std::lock_guard lk(mutex_);
        current_ = defaults_;
    }

    std::string SettingsStore::summary() const
    {
        const auto s = settings();
        std::string out{ "questions=" };
        out.append(s.question_count ? std::to_string(*s.question_count) : std::string{ "all" })
            .append(" order=")
            .append(s.random_order ? "random" : "sequential")
            .append(" timer=")
            .append(std::to_string(s.timer_duration_seconds))
            .append("s");
        return out;
    }

} // namespace quiz_bot
