// GoogleTest
#include <gtest/gtest.h>

// Core
#include <qb/quiz/errors.hpp>
#include <qb/quiz/settings_store.hpp>

using quiz_bot::ConfigurationError;
using quiz_bot::QuizSettings;
using quiz_bot::SettingsStore;

TEST(SettingsStore, StartsFromDefaults)
{
    SettingsStore store;
    EXPECT_EQ(store.settings(), QuizSettings{});
    EXPECT_EQ(store.summary(), "questions=all order=sequential timer=30s");
}

TEST(SettingsStore, InvalidDefaultsAreRejected)
{
    QuizSettings bad;
    bad.timer_duration_seconds = 2;
    EXPECT_THROW(SettingsStore{ bad }, ConfigurationError);
}

TEST(SettingsStore, QuestionCountBounds)
{
    SettingsStore store;
    store.set_question_count(10);
    EXPECT_EQ(store.settings().question_count, 10);

    try
    {
        store.set_question_count(0);
        FAIL() << "expected ConfigurationError";
    }
    catch (const ConfigurationError& e)
    {
        EXPECT_STREQ(e.what(), "Question count must be at least 1");
    }
    try
    {
        store.set_question_count(101);
        FAIL() << "expected ConfigurationError";
    }
    catch (const ConfigurationError& e)
    {
        EXPECT_STREQ(e.what(), "Question count cannot exceed 100");
    }

    // Rejected values leave the store untouched.
    EXPECT_EQ(store.settings().question_count, 10);

    store.set_question_count(std::nullopt);
    EXPECT_FALSE(store.settings().question_count.has_value());
}

TEST(SettingsStore, TimerBounds)
{
    SettingsStore store;
    store.set_timer_duration(5);
    store.set_timer_duration(300);
    EXPECT_EQ(store.settings().timer_duration_seconds, 300);

    EXPECT_THROW(store.set_timer_duration(4), ConfigurationError);
    EXPECT_THROW(store.set_timer_duration(301), ConfigurationError);
    EXPECT_EQ(store.settings().timer_duration_seconds, 300);
}

TEST(SettingsStore, ToggleAndReset)
{
    QuizSettings defaults;
    defaults.timer_duration_seconds = 45;
    SettingsStore store{ defaults };

    EXPECT_TRUE(store.toggle_random_order());
    EXPECT_FALSE(store.toggle_random_order());
    store.set_random_order(true);
    store.set_question_count(3);
    EXPECT_EQ(store.summary(), "questions=3 order=random timer=45s");

    store.reset_to_defaults();
    EXPECT_EQ(store.settings(), defaults);
}
