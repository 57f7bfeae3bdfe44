/*
Module Name:
- stopwatch.hpp

Abstract:
- Monotonic stopwatch on std::chrono::steady_clock paired with a wall-clock start stamp.
- Sessions use the steady part for elapsed time and the wall part for display.
- Converts elapsed time to caller-specified durations via a constrained concept.
*/
#pragma once

// C++ standard library
#include <chrono>
#include <concepts>
#include <type_traits>

// GSL
#include <gsl/gsl>

namespace qb
{

    // D must be a std::chrono::duration (cv/ref-qualified types are accepted)
    template<class D>
    concept ChronoDuration = requires {
        typename std::remove_cvref_t<D>::rep;
        typename std::remove_cvref_t<D>::period;
    } && std::same_as<std::remove_cvref_t<D>, std::chrono::duration<typename std::remove_cvref_t<D>::rep, typename std::remove_cvref_t<D>::period>>;

    class Stopwatch
    {
    public:
        using clock = std::chrono::steady_clock;
        using wall_clock = std::chrono::system_clock;
        static_assert(clock::is_steady, "Stopwatch requires a steady clock");

        Stopwatch() noexcept = default;

        void reset() noexcept
        {
            start_ = clock::now();
            wall_start_ = wall_clock::now();
        }

        [[nodiscard]] auto elapsed() const noexcept -> clock::duration
        {
            const auto d = clock::now() - start_;
            Ensures(d >= clock::duration::zero()); // relies on monotonic clock
            return d;
        }

        template<ChronoDuration D>
        [[nodiscard]] auto elapsed_count() const noexcept -> typename std::remove_cvref_t<D>::rep
        {
            using DT = std::remove_cvref_t<D>;
            return std::chrono::duration_cast<DT>(elapsed()).count();
        }

        template<ChronoDuration D>
        [[nodiscard]] auto elapsed_duration() const noexcept -> std::remove_cvref_t<D>
        {
            using DT = std::remove_cvref_t<D>;
            return std::chrono::duration_cast<DT>(elapsed());
        }

        // Wall-clock time of construction or last reset.
        [[nodiscard]] auto started_at() const noexcept -> wall_clock::time_point
        {
            return wall_start_;
        }

    private:
        clock::time_point start_ = clock::now();
        wall_clock::time_point wall_start_ = wall_clock::now();
    };

} // namespace qb
