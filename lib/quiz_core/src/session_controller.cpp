// C++ Standard Library
#include <algorithm>
#include <exception>
#include <iostream>
#include <iterator>
#include <utility>

// Boost.Asio
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

// Boost.System
#include <boost/system/error_code.hpp>

// GSL
#include <gsl/gsl>

// Core
#include <qb/quiz/errors.hpp>
#include <qb/quiz/message_format.hpp>
#include <qb/quiz/question_selector.hpp>
#include <qb/quiz/session_controller.hpp>

namespace quiz_bot
{

    using boost::asio::use_awaitable;
    using steady = std::chrono::steady_clock;

    SessionController::SessionController(boost::asio::any_io_executor executor,
                                         const QuestionRepository& questions,
                                         const SettingsStore& settings,
                                         Presenter& presenter,
                                         TimerRegistry& timers,
                                         ControllerOptions options) :
        executor_{ std::move(executor) },
        questions_{ questions },
        settings_{ settings },
        presenter_{ presenter },
        timers_{ timers },
        options_{ options },
        sweep_timer_{ executor_ }
    {
        timers_.set_error_sink([this](std::string_view key, std::exception_ptr error) {
            try
            {
                std::rethrow_exception(error);
            }
            catch (const std::exception& e)
            {
                record_error(key, "countdown", e.what());
            }
            catch (...)
            {
                record_error(key, "countdown", "unknown failure");
            }
        });
    }

    SessionController::~SessionController()
    {
        timers_.set_error_sink({});
    }

    // ---------------------------------------------------------------------
    // Start
    // ---------------------------------------------------------------------

    QuizSettings SessionController::effective_settings(const std::optional<QuizSettings>& requested) const
    {
        if (!requested)
        {
            return settings_.settings();
        }

        const int t = requested->timer_duration_seconds;
        if (t < options_.min_timer_seconds || t > options_.max_timer_seconds)
        {
            throw ConfigurationError("Timer duration must be between " + std::to_string(options_.min_timer_seconds) +
                                     " and " + std::to_string(options_.max_timer_seconds) + " seconds");
        }
        if (requested->question_count && *requested->question_count > kMaxQuestionCount)
        {
            throw ConfigurationError("Question count cannot exceed " + std::to_string(kMaxQuestionCount));
        }
        return *requested;
    }

    SessionInfo SessionController::start_session(std::string_view key,
                                                 std::string_view set_name,
                                                 std::optional<QuizSettings> requested)
    {
        {
            std::lock_guard lk(mutex_);
            if (stopping_)
            {
                throw SessionConflictError("The quiz bot is shutting down");
            }
            if (sessions_.find(key) != sessions_.end())
            {
                throw SessionConflictError("A quiz is already running in this channel");
            }
        }

        const std::string name{ set_name };
        if (!questions_.exists(name))
        {
            throw NoSuchQuestionSetError("Quiz '" + name + "' not found");
        }

        const QuizSettings settings = effective_settings(requested);
        const auto pool = questions_.get_questions(name);

        std::vector<Question> selected;
        try
        {
            selected = select_questions(pool, settings);
        }
        catch (const EmptyInputError&)
        {
            throw EmptyQuestionSetError("Quiz '" + name + "' has no questions");
        }
        if (selected.empty())
        {
            throw EmptyQuestionSetError("No questions selected from '" + name + "' with the current settings");
        }

        auto s = std::make_shared<Session>();
        s->channel = std::string{ key };
        s->set_name = name;
        s->questions = std::move(selected);
        s->settings = settings;
        s->started_at = std::chrono::system_clock::now();
        s->started_steady = steady::now();
        s->wake = std::make_shared<boost::asio::steady_timer>(executor_);

        SessionInfo info{ name, s->questions.size(), settings };
        {
            std::lock_guard lk(mutex_);
            if (stopping_)
            {
                throw SessionConflictError("The quiz bot is shutting down");
            }
            if (sessions_.find(key) != sessions_.end())
            {
                throw SessionConflictError("A quiz is already running in this channel");
            }
            s->id = next_session_id_++;
            sessions_.emplace(s->channel, s);
        }

        std::cout << "[SessionController] " << key << " session #" << s->id << " started '" << name << "' with "
                  << info.total_questions
                  << " question(s), " << settings.timer_duration_seconds << "s each\n";
        return info;
    }

    void SessionController::begin_presentation(std::string_view key)
    {
        std::shared_ptr<Session> s;
        {
            std::lock_guard lk(mutex_);
            auto it = sessions_.find(key);
            if (stopping_ || it == sessions_.end() || it->second->driven)
            {
                return;
            }
            it->second->driven = true;
            s = it->second;
        }
        boost::asio::co_spawn(executor_, run_session(std::move(s)), boost::asio::detached);
    }

    // ---------------------------------------------------------------------
    // Driver
    // ---------------------------------------------------------------------

    boost::asio::awaitable<void> SessionController::run_session(std::shared_ptr<Session> s)
    {
        bool crashed = false;
        std::string failure;
        try
        {
            co_await drive(s);
        }
        catch (const std::exception& e)
        {
            crashed = true;
            failure = e.what();
        }

        if (crashed)
        {
            std::cerr << "[SessionController] " << s->channel << " driver failed: " << failure << '\n';
            co_await fail_session(s, "Internal error: " + failure);
        }
        std::cout << "[SessionController] " << s->channel << " driver finished\n";
    }

    boost::asio::awaitable<void> SessionController::drive(std::shared_ptr<Session> s)
    {
        for (;;)
        {
            if (!co_await wait_until_runnable(s))
            {
                co_return;
            }

            std::size_t step = 0;
            {
                std::lock_guard lk(mutex_);
                step = s->cursor;
            }

            const auto presented = co_await present_current_question(s);
            if (presented == PresentOutcome::stopped || presented == PresentOutcome::failed)
            {
                co_return;
            }

            if (presented == PresentOutcome::countdown_started)
            {
                bool expired = false;
                while (!expired)
                {
                    const auto ev = co_await next_event(s, steady::time_point::max());
                    if (!ev)
                    {
                        continue;
                    }
                    if (ev->kind == SessionEvent::Kind::stopped)
                    {
                        co_return;
                    }
                    // Expiries of an earlier question are stale.
                    expired = ev->kind == SessionEvent::Kind::expired && ev->step == step;
                }
            }

            if (co_await reveal_and_advance(s, step) != AdvanceOutcome::advanced)
            {
                co_return;
            }

            if (!co_await sleep_unless_stopped(s, options_.settle_delay))
            {
                co_return;
            }

            if (!co_await ensure_timer_ready(s->channel))
            {
                co_await fail_session(s, "The countdown for the next question could not be prepared");
                co_return;
            }
        }
    }

    boost::asio::awaitable<SessionController::PresentOutcome>
    SessionController::present_current_question(std::shared_ptr<Session> s)
    {
        const std::string key = s->channel;
        const std::string set_name = s->set_name;

        Question q;
        std::size_t step = 0;
        std::size_t total = 0;
        int seconds = 0;
        bool applicable = false;
        {
            std::lock_guard lk(mutex_);
            if (is_live_locked(s) && !s->paused && s->cursor < s->questions.size())
            {
                applicable = true;
                step = s->cursor;
                total = s->questions.size();
                q = s->questions[step];
                seconds = s->settings.timer_duration_seconds;
                s->message.reset();
            }
        }
        if (!applicable)
        {
            co_return PresentOutcome::stopped;
        }

        const QuestionContext ctx{ set_name, step, total };

        // 1) Question message
        std::optional<message_handle_t> handle;
        std::string send_error;
        try
        {
            handle = co_await qb::with_retry(options_.presentation, "question send for " + key, [&](unsigned) {
                return presenter_.send(key, make_question_message(ctx, q, seconds));
            });
        }
        catch (const std::exception& e)
        {
            send_error = e.what();
            record_error(key, "send_question", send_error);
        }
        if (!handle)
        {
            co_await fail_session(s, "Could not post the question: " + send_error);
            co_return PresentOutcome::failed;
        }

        {
            std::lock_guard lk(mutex_);
            applicable = is_live_locked(s);
            if (applicable)
            {
                s->message = handle;
            }
        }
        if (!applicable)
        {
            co_return PresentOutcome::stopped;
        }

        // 2) Countdown. Completion only queues an event; the driver does the reveal.
        const message_handle_t h = *handle;
        const std::weak_ptr<Session> weak = s;

        tick_callback_t on_tick = [this, weak, key, set_name, step, total, q, h](int remaining) -> boost::asio::awaitable<void> {
            if (!is_live(weak.lock()))
            {
                co_return;
            }
            co_await presenter_.edit(key, h, make_countdown_message(QuestionContext{ set_name, step, total }, q, remaining));
        };

        complete_callback_t on_complete = [this, weak, step]() -> boost::asio::awaitable<void> {
            if (auto live = weak.lock())
            {
                push_event(live, SessionEvent{ SessionEvent::Kind::expired, step });
            }
            co_return;
        };

        bool conflict = false;
        bool start_failed = false;
        std::string timer_error;
        try
        {
            co_await timers_.start_timer(key, seconds, std::move(on_tick), std::move(on_complete));
        }
        catch (const TimerConflictError& e)
        {
            conflict = true;
            timer_error = e.what();
        }
        catch (const TimerStartError& e)
        {
            start_failed = true;
            timer_error = e.what();
        }

        if (conflict)
        {
            record_error(key, "start_timer", timer_error);
            co_await fail_session(s, "Another countdown is still running in this channel");
            co_return PresentOutcome::failed;
        }

        if (!start_failed)
        {
            bool live = false;
            bool paused = false;
            bool replaced = false;
            {
                std::lock_guard lk(mutex_);
                live = is_live_locked(s);
                paused = s->paused;
                replaced = !live && sessions_.find(key) != sessions_.end();
            }
            if (!live)
            {
                // Stopped while the countdown was being scheduled. A newer session clears it on its own start.
                if (!replaced)
                {
                    (void)co_await timers_.cancel_timer(key);
                }
                co_return PresentOutcome::stopped;
            }
            if (paused)
            {
                timers_.pause_timer(key);
            }
            co_return PresentOutcome::countdown_started;
        }

        // 3) Fallback: plain delay, then the same reveal
        std::cerr << "[SessionController] " << key << " countdown unavailable, using a plain delay: " << timer_error
                  << '\n';
        record_error(key, "start_timer", timer_error);
        try
        {
            co_await presenter_.edit(key, h, make_fallback_notice(ctx, q, seconds));
        }
        catch (const std::exception& e)
        {
            std::cerr << "[SessionController] " << key << " fallback notice failed: " << e.what() << '\n';
            record_error(key, "fallback_notice", e.what());
        }

        if (!co_await sleep_unless_stopped(s, std::chrono::seconds{ seconds }))
        {
            co_return PresentOutcome::stopped;
        }
        co_return PresentOutcome::fallback_elapsed;
    }

    boost::asio::awaitable<SessionController::AdvanceOutcome>
    SessionController::reveal_and_advance(std::shared_ptr<Session> s, std::size_t step)
    {
        const std::string key = s->channel;
        const std::string set_name = s->set_name;

        Question q;
        std::size_t total = 0;
        std::optional<message_handle_t> handle;
        bool applicable = false;
        {
            std::lock_guard lk(mutex_);
            if (is_live_locked(s) && s->cursor == step && step < s->questions.size())
            {
                applicable = true;
                q = s->questions[step];
                total = s->questions.size();
                handle = s->message;
            }
        }
        if (!applicable)
        {
            co_return AdvanceOutcome::aborted;
        }

        // Expired countdowns are already gone; anything still registered must not tick over the answer.
        (void)co_await timers_.cancel_timer(key);

        const bool last = step + 1 >= total;
        const int settle_seconds =
            gsl::narrow_cast<int>(std::chrono::duration_cast<std::chrono::seconds>(options_.settle_delay).count());

        if (handle)
        {
            try
            {
                co_await presenter_.edit(key, *handle, make_reveal_message({ set_name, step, total }, q, last, settle_seconds));
            }
            catch (const std::exception& e)
            {
                std::cerr << "[SessionController] " << key << " reveal failed: " << e.what() << '\n';
                record_error(key, "reveal_answer", e.what());
            }
        }

        if (!last)
        {
            bool moved = false;
            {
                std::lock_guard lk(mutex_);
                if (is_live_locked(s) && s->cursor == step)
                {
                    ++s->cursor;
                    s->message.reset();
                    moved = true;
                }
            }
            co_return moved ? AdvanceOutcome::advanced : AdvanceOutcome::aborted;
        }

        std::optional<SessionSnapshot> final_state;
        {
            std::lock_guard lk(mutex_);
            if (is_live_locked(s) && s->cursor == step)
            {
                s->cursor = s->questions.size();
                s->active = false;
                s->paused = false;
                final_state = retire_locked(s);
            }
        }
        if (!final_state)
        {
            co_return AdvanceOutcome::aborted;
        }

        std::cout << "[SessionController] " << key << " completed '" << set_name << "' (" << total
                  << " question(s) in " << format_duration(std::chrono::duration_cast<std::chrono::seconds>(final_state->elapsed).count())
                  << ")\n";
        try
        {
            (void)co_await presenter_.send(key, make_completion_message(*final_state));
        }
        catch (const std::exception& e)
        {
            std::cerr << "[SessionController] " << key << " completion summary failed: " << e.what() << '\n';
            record_error(key, "completion_summary", e.what());
        }
        co_return AdvanceOutcome::completed;
    }

    boost::asio::awaitable<void> SessionController::fail_session(std::shared_ptr<Session> s, std::string reason)
    {
        const std::string key = s->channel;
        bool retired = false;
        {
            std::lock_guard lk(mutex_);
            s->active = false;
            s->paused = false;
            retired = retire_locked(s).has_value();
        }
        if (!retired)
        {
            co_return; // already stopped by someone else
        }

        std::cerr << "[SessionController] " << key << " session force-stopped: " << reason << '\n';
        record_error(key, "session", reason);

        (void)co_await timers_.cancel_timer(key);
        try
        {
            (void)co_await presenter_.send(key, make_fatal_notice(s->set_name, reason));
        }
        catch (const std::exception& e)
        {
            std::cerr << "[SessionController] " << key << " fatal notice failed: " << e.what() << '\n';
        }
    }

    boost::asio::awaitable<bool> SessionController::ensure_timer_ready(const std::string& key)
    {
        const unsigned checks = std::max(options_.readiness_checks, 1u);
        for (unsigned i = 1; i <= checks; ++i)
        {
            if (timers_.is_ready(key))
            {
                co_return true;
            }
            std::cerr << "[SessionController] " << key << " countdown slot busy before next question (check " << i
                      << '/' << checks << ")\n";
            (void)co_await timers_.cancel_timer(key);
            co_await qb::async_sleep(options_.cleanup_delay);
        }
        co_return timers_.is_ready(key);
    }

    // ---------------------------------------------------------------------
    // Events
    // ---------------------------------------------------------------------

    void SessionController::push_event(const std::shared_ptr<Session>& s, SessionEvent ev)
    {
        {
            std::lock_guard lk(mutex_);
            s->events.push_back(ev);
        }
        boost::asio::dispatch(executor_, [wake = s->wake] { wake->cancel(); });
    }

    boost::asio::awaitable<std::optional<SessionController::SessionEvent>>
    SessionController::next_event(std::shared_ptr<Session> s, steady::time_point deadline)
    {
        for (;;)
        {
            std::optional<SessionEvent> ev;
            {
                std::lock_guard lk(mutex_);
                if (!s->events.empty())
                {
                    ev = s->events.front();
                    s->events.pop_front();
                }
            }
            if (ev)
            {
                co_return ev;
            }
            if (steady::now() >= deadline)
            {
                co_return std::nullopt;
            }

            // push_event() cancels this wait; running on the strand means no event slips in between.
            s->wake->expires_at(deadline);
            boost::system::error_code ec;
            co_await s->wake->async_wait(boost::asio::redirect_error(use_awaitable, ec));
        }
    }

    boost::asio::awaitable<bool> SessionController::wait_until_runnable(std::shared_ptr<Session> s)
    {
        bool logged = false;
        for (;;)
        {
            bool live = false;
            bool paused = false;
            {
                std::lock_guard lk(mutex_);
                live = is_live_locked(s);
                paused = s->paused;
            }
            if (!live)
            {
                co_return false;
            }
            if (!paused)
            {
                co_return true;
            }
            if (!logged)
            {
                std::cout << "[SessionController] " << s->channel << " paused between questions\n";
                logged = true;
            }

            const auto ev = co_await next_event(s, steady::time_point::max());
            if (ev && ev->kind == SessionEvent::Kind::stopped)
            {
                co_return false;
            }
        }
    }

    boost::asio::awaitable<bool> SessionController::sleep_unless_stopped(std::shared_ptr<Session> s,
                                                                         steady::duration d)
    {
        const auto deadline = steady::now() + d;
        for (;;)
        {
            const auto ev = co_await next_event(s, deadline);
            if (!ev)
            {
                co_return is_live(s);
            }
            if (ev->kind == SessionEvent::Kind::stopped)
            {
                co_return false;
            }
        }
    }

    // ---------------------------------------------------------------------
    // Controls
    // ---------------------------------------------------------------------

    ToggleResult SessionController::pause_session(std::string_view key)
    {
        ToggleResult result;
        {
            std::lock_guard lk(mutex_);
            auto it = sessions_.find(key);
            if (it == sessions_.end() || !it->second->active)
            {
                throw SessionNotFoundError("No active quiz in this channel");
            }
            auto& s = *it->second;
            result.changed = !s.paused;
            s.paused = true;
            result.snapshot = snapshot_locked(s);
        }

        if (!result.changed)
        {
            std::cout << "[SessionController] " << key << " already paused\n";
            return result;
        }
        if (!timers_.pause_timer(key))
        {
            std::cout << "[SessionController] " << key << " no countdown in flight, pausing before the next question\n";
        }
        std::cout << "[SessionController] " << key << " paused at question " << result.snapshot.cursor + 1 << '/'
                  << result.snapshot.total << '\n';
        return result;
    }

    ToggleResult SessionController::resume_session(std::string_view key)
    {
        ToggleResult result;
        std::shared_ptr<Session> s;
        {
            std::lock_guard lk(mutex_);
            auto it = sessions_.find(key);
            if (it == sessions_.end() || !it->second->active)
            {
                throw SessionNotFoundError("No active quiz in this channel");
            }
            s = it->second;
            result.changed = s->paused;
            s->paused = false;
            result.snapshot = snapshot_locked(*s);
        }

        if (!result.changed)
        {
            std::cout << "[SessionController] " << key << " not paused\n";
            return result;
        }
        timers_.resume_timer(key);
        push_event(s, SessionEvent{ SessionEvent::Kind::resumed });
        std::cout << "[SessionController] " << key << " resumed at question " << result.snapshot.cursor + 1 << '/'
                  << result.snapshot.total << '\n';
        return result;
    }

    boost::asio::awaitable<SessionSnapshot> SessionController::stop_session(std::string key)
    {
        co_await boost::asio::dispatch(executor_, use_awaitable);

        std::shared_ptr<Session> s;
        SessionSnapshot as_stopped;
        {
            std::lock_guard lk(mutex_);
            auto it = sessions_.find(key);
            if (it == sessions_.end())
            {
                throw SessionNotFoundError("No quiz is running in this channel");
            }
            s = it->second;
            as_stopped = snapshot_locked(*s);
            s->active = false;
            s->paused = false;
            retire_locked(s);
        }

        push_event(s, SessionEvent{ SessionEvent::Kind::stopped });
        const bool clean = co_await timers_.cancel_timer(key);

        std::cout << "[SessionController] " << key << " stopped at question "
                  << std::min(as_stopped.cursor + 1, as_stopped.total) << '/' << as_stopped.total
                  << (clean ? "" : " (countdown evicted by force)") << '\n';
        co_return as_stopped;
    }

    // ---------------------------------------------------------------------
    // Queries
    // ---------------------------------------------------------------------

    bool SessionController::is_live_locked(const std::shared_ptr<Session>& s) const
    {
        if (!s || !s->active)
        {
            return false;
        }
        auto it = sessions_.find(s->channel);
        return it != sessions_.end() && it->second == s;
    }

    bool SessionController::is_live(const std::shared_ptr<Session>& s) const
    {
        std::lock_guard lk(mutex_);
        return is_live_locked(s);
    }

    SessionSnapshot SessionController::snapshot_locked(const Session& s) const
    {
        return SessionSnapshot{ s.channel,
                                s.set_name,
                                s.cursor,
                                s.questions.size(),
                                s.active,
                                s.paused,
                                s.settings,
                                s.started_at,
                                steady::now() - s.started_steady };
    }

    std::optional<SessionSnapshot> SessionController::retire_locked(const std::shared_ptr<Session>& s)
    {
        auto it = sessions_.find(s->channel);
        if (it == sessions_.end() || it->second != s)
        {
            return std::nullopt;
        }
        auto snap = snapshot_locked(*s);
        sessions_.erase(it);
        last_results_.insert_or_assign(s->channel, LastResult{ snap, steady::now() });
        return snap;
    }

    std::optional<SessionSnapshot> SessionController::get_progress(std::string_view key) const
    {
        std::lock_guard lk(mutex_);
        auto it = sessions_.find(key);
        if (it == sessions_.end())
        {
            return std::nullopt;
        }
        return snapshot_locked(*it->second);
    }

    std::optional<SessionSnapshot> SessionController::last_result(std::string_view key) const
    {
        std::lock_guard lk(mutex_);
        auto it = last_results_.find(key);
        if (it == last_results_.end())
        {
            return std::nullopt;
        }
        return it->second.snapshot;
    }

    std::vector<SessionSnapshot> SessionController::active_sessions() const
    {
        std::vector<SessionSnapshot> out;
        std::lock_guard lk(mutex_);
        out.reserve(sessions_.size());
        for (const auto& [key, s] : sessions_)
        {
            if (s->active)
            {
                out.push_back(snapshot_locked(*s));
            }
        }
        return out;
    }

    SessionDiagnostics SessionController::diagnose_locked(std::string_view key) const
    {
        SessionDiagnostics d;
        auto it = sessions_.find(key);
        if (it == sessions_.end())
        {
            return d;
        }
        d.exists = true;

        const auto& s = *it->second;
        const auto n = s.questions.size();
        if (n == 0)
        {
            d.issues.emplace_back("session has no questions");
        }
        if (s.cursor > n)
        {
            d.issues.push_back("cursor " + std::to_string(s.cursor) + " is beyond " + std::to_string(n) + " questions");
        }
        if (s.paused && !s.active)
        {
            d.issues.emplace_back("paused but not active");
        }
        if (!s.active)
        {
            d.issues.emplace_back("inactive session still registered");
        }
        else if (n > 0 && s.cursor == n)
        {
            d.issues.emplace_back("active past the last question");
        }
        return d;
    }

    SessionDiagnostics SessionController::validate_session(std::string_view key) const
    {
        std::lock_guard lk(mutex_);
        return diagnose_locked(key);
    }

    bool SessionController::resolve_stale_session(std::string_view key)
    {
        std::shared_ptr<Session> stale;
        std::vector<std::string> issues;
        {
            std::lock_guard lk(mutex_);
            auto d = diagnose_locked(key);
            if (!d.exists)
            {
                return true;
            }
            if (d.issues.empty())
            {
                return false;
            }
            stale = sessions_.find(key)->second;
            stale->active = false;
            stale->paused = false;
            retire_locked(stale);
            issues = std::move(d.issues);
        }

        std::cerr << "[SessionController] " << key << " removed stale session:";
        for (const auto& i : issues)
        {
            std::cerr << ' ' << i << ';';
        }
        std::cerr << '\n';
        push_event(stale, SessionEvent{ SessionEvent::Kind::stopped });
        return true;
    }

    void SessionController::record_error(std::string_view key, std::string_view operation, std::string_view message)
    {
        std::lock_guard lk(mutex_);
        auto& log = errors_[std::string{ key }];
        log.push_back(ErrorRecord{ std::chrono::system_clock::now(), std::string{ operation }, std::string{ message } });
        while (log.size() > options_.max_error_log)
        {
            log.pop_front();
        }
    }

    std::vector<ErrorRecord> SessionController::error_log(std::string_view key) const
    {
        std::lock_guard lk(mutex_);
        auto it = errors_.find(key);
        if (it == errors_.end())
        {
            return {};
        }
        return { it->second.begin(), it->second.end() };
    }

    // ---------------------------------------------------------------------
    // Housekeeping
    // ---------------------------------------------------------------------

    std::size_t SessionController::sweep_inactive()
    {
        std::vector<std::shared_ptr<Session>> removed;
        {
            std::lock_guard lk(mutex_);

            std::vector<std::string> stale_keys;
            for (const auto& [key, s] : sessions_)
            {
                if (!diagnose_locked(key).issues.empty())
                {
                    stale_keys.push_back(key);
                }
            }
            for (const auto& key : stale_keys)
            {
                auto s = sessions_.find(key)->second;
                s->active = false;
                s->paused = false;
                retire_locked(s);
                removed.push_back(std::move(s));
            }

            for (auto it = errors_.begin(); it != errors_.end();)
            {
                while (it->second.size() > options_.max_error_log)
                {
                    it->second.pop_front();
                }
                it = it->second.empty() ? errors_.erase(it) : std::next(it);
            }

            const auto now = steady::now();
            for (auto it = last_results_.begin(); it != last_results_.end();)
            {
                it = now - it->second.recorded > options_.sweep_interval ? last_results_.erase(it) : std::next(it);
            }
        }

        for (const auto& s : removed)
        {
            push_event(s, SessionEvent{ SessionEvent::Kind::stopped });
        }
        if (!removed.empty())
        {
            std::cout << "[SessionController] sweep removed " << removed.size() << " inactive session(s)\n";
        }
        return removed.size();
    }

    void SessionController::start_sweeper()
    {
        boost::asio::co_spawn(executor_, sweep_loop(), boost::asio::detached);
    }

    boost::asio::awaitable<void> SessionController::sweep_loop()
    {
        while (!stopping_)
        {
            sweep_timer_.expires_after(options_.sweep_interval);
            boost::system::error_code ec;
            co_await sweep_timer_.async_wait(boost::asio::redirect_error(use_awaitable, ec));
            if (ec == boost::asio::error::operation_aborted || stopping_)
            {
                break;
            }
            sweep_inactive();
        }
    }

    boost::asio::awaitable<void> SessionController::shutdown()
    {
        co_await boost::asio::dispatch(executor_, use_awaitable);
        sweep_timer_.cancel();

        // Set under the lock so a concurrent start is either collected here or rejected.
        std::vector<std::string> keys;
        {
            std::lock_guard lk(mutex_);
            stopping_ = true;
            for (const auto& [key, _] : sessions_)
            {
                keys.push_back(key);
            }
        }

        for (auto& key : keys)
        {
            bool gone = false;
            try
            {
                (void)co_await stop_session(key);
            }
            catch (const SessionNotFoundError&)
            {
                gone = true; // finished while we were stopping the others
            }
            if (gone)
            {
                std::cout << "[SessionController] " << key << " already finished at shutdown\n";
            }
        }
        std::cout << "[SessionController] shut down\n";
    }

} // namespace quiz_bot
