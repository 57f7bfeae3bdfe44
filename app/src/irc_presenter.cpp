// C++ Standard Library
#include <algorithm>
#include <iostream>

// Core
#include <qb/quiz/errors.hpp>

// App
#include <app/irc_presenter.hpp>

namespace app
{

    using quiz_bot::MessageKind;
    using quiz_bot::message_handle_t;
    using quiz_bot::QuizMessage;

    IrcPresenter::IrcPresenter(send_line_t send_line, std::vector<int> announce_at) :
        send_line_{ std::move(send_line) }, announce_at_{ std::move(announce_at) }
    {
    }

    std::string IrcPresenter::render(const QuizMessage& message)
    {
        return quiz_bot::clip_utf8(quiz_bot::render_plain(message), kMaxLineBytes);
    }

    bool IrcPresenter::is_announced(const QuizMessage& message) const
    {
        if (message.kind != MessageKind::countdown)
        {
            return true;
        }
        return std::find(announce_at_.begin(), announce_at_.end(), message.remaining_seconds) != announce_at_.end();
    }

    bool IrcPresenter::remember(message_handle_t handle, const std::string& line, bool final_edit)
    {
        std::lock_guard lk(mutex_);
        auto it = last_line_.find(handle);
        const bool repeat = it != last_line_.end() && it->second == line;

        if (final_edit)
        {
            if (it != last_line_.end())
            {
                last_line_.erase(it);
            }
        }
        else if (!repeat)
        {
            last_line_.insert_or_assign(handle, line);
            while (last_line_.size() > kMaxTrackedHandles)
            {
                last_line_.erase(last_line_.begin()); // handles only grow, so this is the oldest
            }
        }
        return !repeat;
    }

    boost::asio::awaitable<void> IrcPresenter::publish(std::string channel, std::string line)
    {
        std::string failure;
        try
        {
            co_await send_line_(channel, std::move(line));
        }
        catch (const std::exception& e)
        {
            failure = e.what();
        }
        if (!failure.empty())
        {
            throw quiz_bot::PresentationError("chat send to #" + channel + " failed: " + failure);
        }
    }

    boost::asio::awaitable<message_handle_t> IrcPresenter::send(std::string channel, QuizMessage message)
    {
        auto line = render(message);

        message_handle_t handle = 0;
        {
            std::lock_guard lk(mutex_);
            handle = next_handle_++;
        }

        co_await publish(channel, line);

        // Only a question is ever edited afterwards.
        if (message.kind == MessageKind::question)
        {
            (void)remember(handle, line, false);
        }
        co_return handle;
    }

    boost::asio::awaitable<void> IrcPresenter::edit(std::string channel, message_handle_t handle, QuizMessage message)
    {
        if (!is_announced(message))
        {
            co_return;
        }

        auto line = render(message);
        const bool final_edit = message.kind == MessageKind::reveal || message.kind == MessageKind::fatal_notice;
        if (!remember(handle, line, final_edit))
        {
            co_return;
        }

        co_await publish(std::move(channel), std::move(line));
    }

} // namespace app
