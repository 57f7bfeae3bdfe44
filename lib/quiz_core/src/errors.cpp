// Project
#include <qb/quiz/errors.hpp>

namespace quiz_bot
{

    QuizError::QuizError(const std::string& msg) noexcept :
        std::runtime_error{ msg }
    {
    }

    EmptyInputError::EmptyInputError(const std::string& msg) noexcept :
        QuizError{ msg }
    {
    }

    ConfigurationError::ConfigurationError(const std::string& msg) noexcept :
        QuizError{ msg }
    {
    }

    EmptyQuestionSetError::EmptyQuestionSetError(const std::string& msg) noexcept :
        ConfigurationError{ msg }
    {
    }

    NotFoundError::NotFoundError(const std::string& msg) noexcept :
        QuizError{ msg }
    {
    }

    NoSuchQuestionSetError::NoSuchQuestionSetError(const std::string& msg) noexcept :
        NotFoundError{ msg }
    {
    }

    SessionNotFoundError::SessionNotFoundError(const std::string& msg) noexcept :
        NotFoundError{ msg }
    {
    }

    ConflictError::ConflictError(const std::string& msg) noexcept :
        QuizError{ msg }
    {
    }

    SessionConflictError::SessionConflictError(const std::string& msg) noexcept :
        ConflictError{ msg }
    {
    }

    TimerConflictError::TimerConflictError(const std::string& msg) noexcept :
        ConflictError{ msg }
    {
    }

    TimerSubsystemError::TimerSubsystemError(const std::string& msg) noexcept :
        QuizError{ msg }
    {
    }

    TimerStartError::TimerStartError(const std::string& msg) noexcept :
        TimerSubsystemError{ msg }
    {
    }

    PresentationError::PresentationError(const std::string& msg) noexcept :
        QuizError{ msg }
    {
    }

} // namespace quiz_bot
