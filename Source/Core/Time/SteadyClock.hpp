// ============================================================================
// Lapwatch - Source/Core/Time/SteadyClock.hpp
// ----------------------------------------------------------------------------
// Purpose : Platform clock backend forwarding to std::chrono::steady_clock.
// Contract: Header-only, noexcept, stateless. Immune to wall-clock changes.
// ============================================================================

#pragma once

#include "Core/Contracts/Time.hpp"

#include <chrono>

namespace lap::time
{
    struct SteadyClock
    {
        using rep        = std::chrono::steady_clock::rep;
        using period     = std::chrono::steady_clock::period;
        using duration   = std::chrono::steady_clock::duration;
        using time_point = std::chrono::steady_clock::time_point;

        static constexpr bool is_steady = true;

        [[nodiscard]] static time_point now() noexcept
        {
            return std::chrono::steady_clock::now();
        }

        [[nodiscard]] static constexpr TimeCaps GetCaps() noexcept
        {
            TimeCaps caps{};
            caps.monotonic    = true;
            caps.highRes      = std::ratio_less_equal_v<period, std::micro>;
            caps.determinism  = lap::DeterminismMode::Off;
            caps.threadSafety = lap::ThreadSafetyMode::ThreadSafe;
            return caps;
        }
    };

    static_assert(MonotonicClock<SteadyClock>, "SteadyClock must satisfy the clock contract.");

} // namespace lap::time
