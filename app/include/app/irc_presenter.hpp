/*
Module Name:
- irc_presenter.hpp

Abstract:
- Presenter over Twitch chat. A QuizMessage becomes one chat line (render_plain, clipped to 500 bytes).
- Chat lines cannot be edited, so edit() republishes instead: question, reveal and notice content
  always, countdown content only when the remaining seconds hit an announce point.
- Re-publishing identical text for the same handle is suppressed.
- Send failures surface as PresentationError; the session controller owns retry policy.
*/
#pragma once

// C++ Standard Library
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <utility>

// Boost.Asio
#include <boost/asio/awaitable.hpp>

// Core
#include <qb/quiz/presenter.hpp>

namespace app
{

    class IrcPresenter final : public quiz_bot::Presenter
    {
    public:
        // Delivers one line to a channel; throws on failure.
        using send_line_t = std::function<boost::asio::awaitable<void>(std::string channel, std::string text)>;

        static constexpr std::size_t kMaxLineBytes = 500;
        static constexpr std::size_t kMaxTrackedHandles = 256;

        IrcPresenter(send_line_t send_line, std::vector<int> announce_at);

        [[nodiscard]] boost::asio::awaitable<quiz_bot::message_handle_t> send(std::string channel,
                                                                              quiz_bot::QuizMessage message) override;

        boost::asio::awaitable<void> edit(std::string channel,
                                          quiz_bot::message_handle_t handle,
                                          quiz_bot::QuizMessage message) override;

        // The line a message is published as.
        [[nodiscard]] static std::string render(const quiz_bot::QuizMessage& message);

        // Whether an edit carrying message would reach chat at all.
        [[nodiscard]] bool is_announced(const quiz_bot::QuizMessage& message) const;

    private:
        boost::asio::awaitable<void> publish(std::string channel, std::string line);

        // Records line as the latest for handle; false when it is a repeat.
        bool remember(quiz_bot::message_handle_t handle, const std::string& line, bool final_edit);

        send_line_t send_line_;
        const std::vector<int> announce_at_;

        std::mutex mutex_; // guards the members below
        quiz_bot::message_handle_t next_handle_ = 1;
        std::map<quiz_bot::message_handle_t, std::string> last_line_;
    };

} // namespace app
