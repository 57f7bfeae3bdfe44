/*
Module Name:
- question_selector.hpp

Abstract:
- Turns a loaded question set plus settings into the ordered list a session asks.
- Pure: the input is never mutated, and a caller-supplied engine makes the order reproducible.
*/
#pragma once

// C++ Standard Library
#include <algorithm>
#include <cstddef>
#include <span>
#include <vector>

// Core
#include <qb/quiz/errors.hpp>
#include <qb/quiz/types.hpp>

namespace quiz_bot
{

    // Throws EmptyInputError when questions is empty.
    // Shuffles a copy when settings.random_order, then truncates to settings.question_count.
    // A question_count below 1 yields an empty list; callers treat that as a failed start.
    template<class URBG>
    [[nodiscard]] std::vector<Question>
    select_questions(std::span<const Question> questions, const QuizSettings& settings, URBG&& rng)
    {
        if (questions.empty())
        {
            throw EmptyInputError("Cannot select questions from an empty list");
        }

        std::vector<Question> selected(questions.begin(), questions.end());

        if (settings.random_order)
        {
            std::shuffle(selected.begin(), selected.end(), rng);
        }

        if (settings.question_count)
        {
            const int count = *settings.question_count;
            if (count < 1)
            {
                selected.clear();
            }
            else if (static_cast<std::size_t>(count) < selected.size())
            {
                selected.resize(static_cast<std::size_t>(count));
            }
        }

        return selected;
    }

    // Same as above with a per-thread engine seeded from std::random_device.
    [[nodiscard]] std::vector<Question> select_questions(std::span<const Question> questions,
                                                         const QuizSettings& settings);

} // namespace quiz_bot
