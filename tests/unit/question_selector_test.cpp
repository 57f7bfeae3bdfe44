// C++ Standard Library
#include <algorithm>
#include <random>
#include <vector>

// GoogleTest
#include <gtest/gtest.h>

// Core
#include <qb/quiz/errors.hpp>
#include <qb/quiz/question_selector.hpp>

using quiz_bot::Question;
using quiz_bot::QuizSettings;

namespace
{
    std::vector<Question> numbered(int n)
    {
        std::vector<Question> out;
        for (int i = 0; i < n; ++i)
        {
            out.push_back({ "q" + std::to_string(i), "a" + std::to_string(i), {} });
        }
        return out;
    }

    bool same_multiset(std::vector<Question> a, std::vector<Question> b)
    {
        auto by_text = [](const Question& l, const Question& r) { return l.text < r.text; };
        std::sort(a.begin(), a.end(), by_text);
        std::sort(b.begin(), b.end(), by_text);
        return a == b;
    }
} // namespace

TEST(QuestionSelector, EmptyInputIsRejected)
{
    std::vector<Question> none;
    EXPECT_THROW((void)quiz_bot::select_questions(none, QuizSettings{}), quiz_bot::EmptyInputError);
}

TEST(QuestionSelector, SequentialKeepsSourceOrder)
{
    const auto all = numbered(5);
    EXPECT_EQ(quiz_bot::select_questions(all, QuizSettings{}), all);
}

TEST(QuestionSelector, CountTruncatesAfterOrdering)
{
    const auto all = numbered(5);
    QuizSettings s;
    s.question_count = 2;
    const auto picked = quiz_bot::select_questions(all, s);
    ASSERT_EQ(picked.size(), 2u);
    EXPECT_EQ(picked[0], all[0]);
    EXPECT_EQ(picked[1], all[1]);
}

TEST(QuestionSelector, CountLargerThanSetReturnsEverything)
{
    const auto all = numbered(3);
    QuizSettings s;
    s.question_count = 50;
    EXPECT_EQ(quiz_bot::select_questions(all, s).size(), 3u);
}

TEST(QuestionSelector, NonPositiveCountYieldsNothing)
{
    const auto all = numbered(3);
    QuizSettings s;
    s.question_count = 0;
    EXPECT_TRUE(quiz_bot::select_questions(all, s).empty());
    s.question_count = -4;
    EXPECT_TRUE(quiz_bot::select_questions(all, s).empty());
}

TEST(QuestionSelector, RandomOrderIsAPermutationAndLeavesInputAlone)
{
    const auto all = numbered(20);
    const auto copy = all;
    QuizSettings s;
    s.random_order = true;

    std::mt19937 rng{ 7 };
    const auto shuffled = quiz_bot::select_questions(all, s, rng);
    EXPECT_EQ(all, copy);
    EXPECT_EQ(shuffled.size(), all.size());
    EXPECT_TRUE(same_multiset(shuffled, all));
}

TEST(QuestionSelector, SeededEngineIsReproducible)
{
    const auto all = numbered(20);
    QuizSettings s;
    s.random_order = true;
    s.question_count = 8;

    std::mt19937 a{ 1234 };
    std::mt19937 b{ 1234 };
    EXPECT_EQ(quiz_bot::select_questions(all, s, a), quiz_bot::select_questions(all, s, b));
}
