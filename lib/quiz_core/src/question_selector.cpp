// C++ Standard Library
#include <random>

// Core
#include <qb/quiz/question_selector.hpp>

namespace quiz_bot
{

    std::vector<Question> select_questions(std::span<const Question> questions, const QuizSettings& settings)
    {
        static thread_local std::mt19937 rng{ std::random_device{}() };
        return select_questions(questions, settings, rng);
    }

} // namespace quiz_bot
