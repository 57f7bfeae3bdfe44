/*
Module Name:
- presenter.hpp

Abstract:
- Presentation channel the session controller talks to: send a message, later edit it.
- Arguments are taken by value; the coroutine frame owns them across suspension.
- Implementations report transient failures by throwing PresentationError; the controller
  decides whether to retry, log or stop the session.
*/
#pragma once

// C++ Standard Library
#include <cstdint>
#include <string>
#include <utility>

// Boost.Asio
#include <boost/asio/awaitable.hpp>

// Core
#include <qb/quiz/message_format.hpp>

namespace quiz_bot
{

    // Opaque per-presenter identifier of a sent message.
    using message_handle_t = std::uint64_t;

    class Presenter
    {
    public:
        virtual ~Presenter() = default;

        [[nodiscard]] virtual boost::asio::awaitable<message_handle_t> send(std::string channel,
                                                                       QuizMessage message) = 0;

        virtual boost::asio::awaitable<void> edit(std::string channel,
                                                  message_handle_t handle,
                                                  QuizMessage message) = 0;
    };

} // namespace quiz_bot
