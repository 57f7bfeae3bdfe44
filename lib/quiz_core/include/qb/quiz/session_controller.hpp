/*
Module Name:
- session_controller.hpp

Abstract:
- One trivia session per channel: start, present, reveal, advance, pause, resume, stop.
- Each started session is driven by a single loop coroutine on the controller strand. The loop
  waits on a per-session event queue (countdown expired, resumed, stopped) instead of chaining
  callbacks, so a session never re-enters itself.
- Countdown completion only enqueues an event; revealing the answer and moving on happens in
  reveal_and_advance(), which the timer path and the no-timer fallback path share.

Why:
- Sessions are shared_ptr owned so the driver keeps its session alive after stop removes it
  from the map; liveness is "still mapped under this key and active".
- The map and every session field are guarded by one mutex, never held across a suspension,
  so snapshots can be read from any thread.
- A periodic sweep removes anything left inactive and trims the per-channel error history.
*/
#pragma once

// C++ Standard Library
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <utility>

// Boost.Asio
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

// Core
#include <qb/quiz/presenter.hpp>
#include <qb/quiz/question_repository.hpp>
#include <qb/quiz/settings_store.hpp>
#include <qb/quiz/timer_registry.hpp>
#include <qb/quiz/types.hpp>
#include <qb/utils/retry_policy.hpp>
#include <qb/utils/string_hash.hpp>

namespace quiz_bot
{

    struct ControllerOptions
    {
        std::chrono::milliseconds settle_delay{ 3000 }; // reveal -> next question
        std::chrono::milliseconds cleanup_delay{ 200 }; // between readiness re-checks
        unsigned readiness_checks = 3;
        qb::RetryPolicy presentation{ 3, std::chrono::milliseconds{ 500 }, std::chrono::milliseconds{ 5000 } };
        std::chrono::minutes sweep_interval{ 60 };
        std::size_t max_error_log = 10;
        // Bounds for settings passed explicitly to start_session(). The store applies the stricter chat limits.
        int min_timer_seconds = 1;
        int max_timer_seconds = kMaxTimerSeconds;
    };

    struct SessionDiagnostics
    {
        bool exists = false;
        std::vector<std::string> issues; // empty = consistent

        [[nodiscard]] bool valid() const noexcept
        {
            return exists && issues.empty();
        }
    };

    struct ErrorRecord
    {
        std::chrono::system_clock::time_point at;
        std::string operation;
        std::string message;
    };

    class SessionController
    {
    public:
        // executor must be the strand the registry runs on. Collaborators must outlive the controller.
        SessionController(boost::asio::any_io_executor executor,
                          const QuestionRepository& questions,
                          const SettingsStore& settings,
                          Presenter& presenter,
                          TimerRegistry& timers,
                          ControllerOptions options = {});
        ~SessionController();

        SessionController(const SessionController&) = delete;
        SessionController& operator=(const SessionController&) = delete;

        // Creates the session (active, cursor 0). Nothing is shown until begin_presentation().
        // Rejected with SessionConflictError once shutdown() has begun.
        // Throws SessionConflictError, NoSuchQuestionSetError, EmptyQuestionSetError, ConfigurationError.
        SessionInfo start_session(std::string_view key,
                                  std::string_view set_name,
                                  std::optional<QuizSettings> settings = std::nullopt);

        // Spawns the driver loop of a started session. No-op when the session is gone or already driven.
        void begin_presentation(std::string_view key);

        // Throws SessionNotFoundError when no active session exists. changed == false: already in that state.
        ToggleResult pause_session(std::string_view key);
        ToggleResult resume_session(std::string_view key);

        // Removes the session and cancels its countdown. Returns the session as it stood when stopped.
        // Throws SessionNotFoundError.
        [[nodiscard]] boost::asio::awaitable<SessionSnapshot> stop_session(std::string key);

        [[nodiscard]] std::optional<SessionSnapshot> get_progress(std::string_view key) const;

        // Final state of the most recent completed or stopped session in the channel.
        [[nodiscard]] std::optional<SessionSnapshot> last_result(std::string_view key) const;

        [[nodiscard]] std::vector<SessionSnapshot> active_sessions() const;

        [[nodiscard]] SessionDiagnostics validate_session(std::string_view key) const;

        // Frees the channel when its session is inactive or inconsistent. A healthy session is left alone.
        // Returns true when the channel is free afterwards.
        bool resolve_stale_session(std::string_view key);

        [[nodiscard]] std::vector<ErrorRecord> error_log(std::string_view key) const;

        // Returns the number of sessions removed.
        std::size_t sweep_inactive();

        // Runs sweep_inactive() every sweep_interval until shutdown().
        void start_sweeper();

        // Stops every session and the sweeper.
        [[nodiscard]] boost::asio::awaitable<void> shutdown();

    private:
        struct SessionEvent
        {
            enum class Kind : std::uint8_t
            {
                expired,
                resumed,
                stopped,
            };
            Kind kind;
            std::size_t step = 0; // question index the expiry belongs to
        };

        struct Session
        {
            std::uint64_t id = 0;
            std::string channel;
            std::string set_name;
            std::vector<Question> questions;
            std::size_t cursor = 0;
            bool active = true;
            bool paused = false;
            bool driven = false;
            QuizSettings settings;
            std::chrono::system_clock::time_point started_at;
            std::chrono::steady_clock::time_point started_steady;
            std::optional<message_handle_t> message; // current question
            std::deque<SessionEvent> events;
            std::shared_ptr<boost::asio::steady_timer> wake; // cancelled whenever an event is queued
        };

        struct LastResult
        {
            SessionSnapshot snapshot;
            std::chrono::steady_clock::time_point recorded;
        };

        enum class PresentOutcome : std::uint8_t
        {
            countdown_started,
            fallback_elapsed,
            stopped,
            failed,
        };

        enum class AdvanceOutcome : std::uint8_t
        {
            advanced,
            completed,
            aborted,
        };

        boost::asio::awaitable<void> run_session(std::shared_ptr<Session> s);
        boost::asio::awaitable<void> drive(std::shared_ptr<Session> s);

        // Sends the question at the cursor and starts its countdown, or falls back to a plain delay.
        boost::asio::awaitable<PresentOutcome> present_current_question(std::shared_ptr<Session> s);

        // Cancels any residual countdown, reveals the answer, then completes or moves the cursor on.
        boost::asio::awaitable<AdvanceOutcome> reveal_and_advance(std::shared_ptr<Session> s, std::size_t step);

        // Forced stop with a notice to the channel.
        boost::asio::awaitable<void> fail_session(std::shared_ptr<Session> s, std::string reason);

        // Readiness re-check before the next question, with cleanup in between.
        boost::asio::awaitable<bool> ensure_timer_ready(const std::string& key);

        // Next queued event, or nullopt once deadline passes.
        boost::asio::awaitable<std::optional<SessionEvent>> next_event(std::shared_ptr<Session> s,
                                                                       std::chrono::steady_clock::time_point deadline);

        // Blocks while paused. False once the session is stopped or gone.
        boost::asio::awaitable<bool> wait_until_runnable(std::shared_ptr<Session> s);

        // Waits d unless stopped first. Pause is not observed here.
        boost::asio::awaitable<bool> sleep_unless_stopped(std::shared_ptr<Session> s, std::chrono::steady_clock::duration d);

        boost::asio::awaitable<void> sweep_loop();

        void push_event(const std::shared_ptr<Session>& s, SessionEvent ev);

        // Under mutex_.
        [[nodiscard]] bool is_live_locked(const std::shared_ptr<Session>& s) const;
        [[nodiscard]] SessionSnapshot snapshot_locked(const Session& s) const;
        [[nodiscard]] SessionDiagnostics diagnose_locked(std::string_view key) const;
        // Erases key if it maps to s and stores the final snapshot. Returns that snapshot.
        std::optional<SessionSnapshot> retire_locked(const std::shared_ptr<Session>& s);

        [[nodiscard]] bool is_live(const std::shared_ptr<Session>& s) const;

        void record_error(std::string_view key, std::string_view operation, std::string_view message);

        [[nodiscard]] QuizSettings effective_settings(const std::optional<QuizSettings>& requested) const;

        boost::asio::any_io_executor executor_; // strand
        const QuestionRepository& questions_;
        const SettingsStore& settings_;
        Presenter& presenter_;
        TimerRegistry& timers_;
        const ControllerOptions options_;

        mutable std::mutex mutex_; // guards the maps below and every Session field
        qb::StringMap<std::shared_ptr<Session>> sessions_;
        qb::StringMap<LastResult> last_results_;
        qb::StringMap<std::deque<ErrorRecord>> errors_;
        std::uint64_t next_session_id_ = 1;

        boost::asio::steady_timer sweep_timer_;
        std::atomic<bool> stopping_{ false }; // written under mutex_, once
    };

} // namespace quiz_bot
