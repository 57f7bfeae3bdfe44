/*
Module Name:
- errors.hpp

Abstract:
- Exception taxonomy of the quiz core.
- Callers catch by family (NotFoundError, ConflictError ...) to decide between an
  informational reply, an automatic recovery or a degraded mode.

Families:
- ConfigurationError   invalid settings or nothing left to ask
- NotFoundError        unknown question set or no session in the channel
- ConflictError        a session or timer already occupies the channel
- TimerSubsystemError  countdown could not be created or torn down
- PresentationError    the chat side failed to send or edit a message
*/
#pragma once

// C++ Standard Library
#include <stdexcept>
#include <string>

namespace quiz_bot
{

    class QuizError : public std::runtime_error
    {
    public:
        explicit QuizError(const std::string& msg) noexcept;
    };

    // Selector called with no questions at all.
    class EmptyInputError final : public QuizError
    {
    public:
        explicit EmptyInputError(const std::string& msg) noexcept;
    };

    class ConfigurationError : public QuizError
    {
    public:
        explicit ConfigurationError(const std::string& msg) noexcept;
    };

    // Selection produced zero questions for the effective settings.
    class EmptyQuestionSetError final : public ConfigurationError
    {
    public:
        explicit EmptyQuestionSetError(const std::string& msg) noexcept;
    };

    class NotFoundError : public QuizError
    {
    public:
        explicit NotFoundError(const std::string& msg) noexcept;
    };

    class NoSuchQuestionSetError final : public NotFoundError
    {
    public:
        explicit NoSuchQuestionSetError(const std::string& msg) noexcept;
    };

    class SessionNotFoundError final : public NotFoundError
    {
    public:
        explicit SessionNotFoundError(const std::string& msg) noexcept;
    };

    class ConflictError : public QuizError
    {
    public:
        explicit ConflictError(const std::string& msg) noexcept;
    };

    class SessionConflictError final : public ConflictError
    {
    public:
        explicit SessionConflictError(const std::string& msg) noexcept;
    };

    // A running countdown could not be cleared for the channel.
    class TimerConflictError final : public ConflictError
    {
    public:
        explicit TimerConflictError(const std::string& msg) noexcept;
    };

    class TimerSubsystemError : public QuizError
    {
    public:
        explicit TimerSubsystemError(const std::string& msg) noexcept;
    };

    class TimerStartError final : public TimerSubsystemError
    {
    public:
        explicit TimerStartError(const std::string& msg) noexcept;
    };

    class PresentationError final : public QuizError
    {
    public:
        explicit PresentationError(const std::string& msg) noexcept;
    };

} // namespace quiz_bot
