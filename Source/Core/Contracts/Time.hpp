// ============================================================================
// Lapwatch - Source/Core/Contracts/Time.hpp
// ----------------------------------------------------------------------------
// Purpose : Clock contract describing which time sources may drive interval
//           measurement, plus the capability flags each source reports.
// Contract: Header-only, no exceptions/RTTI, no allocations. A clock is a
//           std::chrono clock type (static now()) that is steady and exposes
//           a constexpr GetCaps(). Wall clocks are rejected at compile time.
// Notes   : Backends may be synthetic (NullClock) or platform-backed
//           (SteadyClock).
// ============================================================================

#pragma once

#include "Core/Types.hpp"

#include <chrono>
#include <concepts>
#include <type_traits>

namespace lap::time
{
    using Nanoseconds = std::chrono::nanoseconds;

    // ------------------------------------------------------------------------
    // Backend metadata and capabilities
    // ------------------------------------------------------------------------

    struct TimeCaps
    {
        bool monotonic = false;
        bool highRes   = false;
        lap::DeterminismMode  determinism  = lap::DeterminismMode::Unknown;
        lap::ThreadSafetyMode threadSafety = lap::ThreadSafetyMode::Unknown;
    };

    static_assert(std::is_trivially_copyable_v<TimeCaps>);

    // ------------------------------------------------------------------------
    // Static face
    // ------------------------------------------------------------------------

    template <typename Clock>
    concept MonotonicClock = std::chrono::is_clock_v<Clock> &&
        Clock::is_steady &&
        requires
        {
            { Clock::now() } noexcept -> std::same_as<typename Clock::time_point>;
            { Clock::GetCaps() } noexcept -> std::same_as<TimeCaps>;
        };

    template <MonotonicClock Clock>
    [[nodiscard]] constexpr TimeCaps QueryCaps() noexcept
    {
        return Clock::GetCaps();
    }

} // namespace lap::time
