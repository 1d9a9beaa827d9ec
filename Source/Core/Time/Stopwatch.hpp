// ============================================================================
// Lapwatch - Source/Core/Time/Stopwatch.hpp
// ----------------------------------------------------------------------------
// Purpose : Elapsed-time value type with Start/Stop/Split/Reset/Restart over
//           a monotonic clock.
// Contract: Header-only, no exceptions/RTTI, no allocations (ToString aside).
//           Every operation is total and noexcept. Copies are independent
//           timers; no state is shared between instances. Callers serialize
//           access to a single instance.
// Notes   : Stop() on a stopped watch returns a zero duration, the same value
//           a near-instant measurement can produce. Query IsRunning() first
//           when the two cases must be told apart.
// ============================================================================

#pragma once

#include "Core/Contracts/Time.hpp"
#include "Core/Time/SteadyClock.hpp"
#include "Core/Diagnostics/Check.hpp"
#include "Core/Logger.hpp"

#include <chrono>
#include <format>
#include <optional>
#include <string>
#include <type_traits>

namespace lap::time
{
    template <MonotonicClock Clock>
    class BasicStopwatch
    {
        static_assert(QueryCaps<Clock>().monotonic, "Stopwatch clocks must report monotonic caps.");

    public:
        using ClockType = Clock;
        using Instant   = typename Clock::time_point;
        using Duration  = Nanoseconds;

        // Stopped, no split, zero elapsed.
        constexpr BasicStopwatch() noexcept = default;

        [[nodiscard]] static BasicStopwatch StartNew() noexcept
        {
            BasicStopwatch sw{};
            sw.Start();
            return sw;
        }

        // Begins a fresh interval. Discards any split and elapsed value, even
        // when already running.
        void Start() noexcept
        {
            mStartTime = Clock::now();
            mLastSplit.reset();
            mElapsed = Duration::zero();
        }

        // Returns the measured interval, or zero if the watch was not running.
        Duration Stop() noexcept
        {
            if (!mStartTime)
            {
                LAP_CHECK(!mLastSplit);
                LAP_LOG_VERBOSE("Time", "Stopwatch::Stop ignored: not running");
                return Duration::zero();
            }

            mElapsed = MeasureSince(*mStartTime, Clock::now());
            mStartTime.reset();
            mLastSplit.reset();
            return mElapsed;
        }

        void Reset() noexcept
        {
            *this = BasicStopwatch{};
        }

        void Restart() noexcept
        {
            Reset();
            Start();
        }

        // Records the time since Start() without stopping. Splits are measured
        // from the original start, not from the previous split.
        std::optional<Duration> Split() noexcept
        {
            if (!mStartTime)
            {
                LAP_CHECK(!mLastSplit);
                LAP_LOG_VERBOSE("Time", "Stopwatch::Split ignored: not running");
                return std::nullopt;
            }

            const Instant now = Clock::now();
            mLastSplit = now;
            mElapsed = MeasureSince(*mStartTime, now);
            return mElapsed;
        }

        [[nodiscard]] constexpr bool IsRunning() const noexcept { return mStartTime.has_value(); }
        [[nodiscard]] constexpr const std::optional<Instant>& StartTime() const noexcept { return mStartTime; }
        [[nodiscard]] constexpr const std::optional<Instant>& LastSplit() const noexcept { return mLastSplit; }

        // Last value captured by Stop() or Split(); stale while running.
        [[nodiscard]] constexpr Duration Elapsed() const noexcept { return mElapsed; }

        [[nodiscard]] constexpr std::chrono::milliseconds::rep ElapsedMilliseconds() const noexcept
        {
            return std::chrono::duration_cast<std::chrono::milliseconds>(mElapsed).count();
        }

    private:
        [[nodiscard]] static Duration MeasureSince(Instant start, Instant now) noexcept
        {
            // Steady clocks never run backwards; clamp anyway so Elapsed() stays non-negative.
            return (now > start) ? std::chrono::duration_cast<Duration>(now - start) : Duration::zero();
        }

        std::optional<Instant> mStartTime{};
        std::optional<Instant> mLastSplit{};
        Duration               mElapsed = Duration::zero();
    };

    using Stopwatch = BasicStopwatch<SteadyClock>;

    static_assert(std::is_nothrow_copy_constructible_v<Stopwatch>);
    static_assert(std::is_nothrow_copy_assignable_v<Stopwatch>);

    // "<whole milliseconds>ms", e.g. "1500ms".
    template <MonotonicClock Clock>
    [[nodiscard]] std::string ToString(const BasicStopwatch<Clock>& sw)
    {
        return std::format("{}ms", sw.ElapsedMilliseconds());
    }

} // namespace lap::time

template <lap::time::MonotonicClock Clock>
struct std::formatter<lap::time::BasicStopwatch<Clock>, char>
{
    constexpr auto parse(std::format_parse_context& ctx)
    {
        return ctx.begin();
    }

    template <class FormatContext>
    auto format(const lap::time::BasicStopwatch<Clock>& sw, FormatContext& ctx) const
    {
        return std::format_to(ctx.out(), "{}ms", sw.ElapsedMilliseconds());
    }
};
