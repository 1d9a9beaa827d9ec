// ============================================================================
// Lapwatch - Source/Core/Time/NullClock.hpp
// ----------------------------------------------------------------------------
// Purpose : Synthetic clock that satisfies the clock contract without reading
//           platform time. Useful for tests, tools, and CI.
// Contract: Header-only, no allocations, all members noexcept. now() is
//           thread-safe; SetStep/Reset are meant for single-threaded setup.
// Notes   : Every now() advances a process-wide counter by a fixed step, so
//           two consecutive readings always differ by exactly Step().
// ============================================================================

#pragma once

#include "Core/Contracts/Time.hpp"

#include <atomic>
#include <chrono>

namespace lap::time
{
    struct NullClock
    {
        using duration   = Nanoseconds;
        using rep        = duration::rep;
        using period     = duration::period;
        using time_point = std::chrono::time_point<NullClock, duration>;

        static constexpr bool is_steady = true;
        static constexpr duration kDefaultStep = std::chrono::milliseconds(16); // ~one 60 Hz frame.

        [[nodiscard]] static time_point now() noexcept
        {
            const rep step = sStepNs.load(std::memory_order_relaxed);
            const rep previous = sCurrentNs.fetch_add(step, std::memory_order_relaxed);
            return time_point(duration(previous + step));
        }

        [[nodiscard]] static constexpr TimeCaps GetCaps() noexcept
        {
            TimeCaps caps{};
            caps.monotonic    = true;
            caps.highRes      = false;
            caps.determinism  = lap::DeterminismMode::Replay;
            caps.threadSafety = lap::ThreadSafetyMode::ThreadSafe;
            return caps;
        }

        // Non-positive steps would break monotonicity and are clamped to 1ns.
        static void SetStep(duration step) noexcept
        {
            const rep ns = step.count() > 0 ? step.count() : rep{1};
            sStepNs.store(ns, std::memory_order_relaxed);
        }

        [[nodiscard]] static duration Step() noexcept
        {
            return duration(sStepNs.load(std::memory_order_relaxed));
        }

        // Rewinds the counter to zero and restores the default step.
        static void Reset() noexcept
        {
            sCurrentNs.store(0, std::memory_order_relaxed);
            sStepNs.store(kDefaultStep.count(), std::memory_order_relaxed);
        }

    private:
        static inline std::atomic<rep> sCurrentNs{ 0 };
        static inline std::atomic<rep> sStepNs{ kDefaultStep.count() };
    };

    static_assert(MonotonicClock<NullClock>, "NullClock must satisfy the clock contract.");

} // namespace lap::time
