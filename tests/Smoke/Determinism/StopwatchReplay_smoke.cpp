// ============================================================================
// Lapwatch - tests/Smoke/Determinism/StopwatchReplay_smoke.cpp
// ----------------------------------------------------------------------------
// Purpose : Exact-value Stopwatch checks driven by NullClock, so every
//           measured duration is a known multiple of the clock step.
// Contract: No exceptions/RTTI, no sleeps; returns 0 on pass.
// Notes   : Each Clock::now() advances NullClock by one step; Start, Split
//           and Stop read the clock exactly once each.
// ============================================================================

#include "Core/Time/NullClock.hpp"
#include "Core/Time/Stopwatch.hpp"

#include <chrono>
#include <format>
#include <string>

int RunStopwatchReplaySmoke()
{
    using namespace lap::time;
    using namespace std::chrono_literals;
    using ReplayStopwatch = BasicStopwatch<NullClock>;

    NullClock::Reset();
    NullClock::SetStep(1500ms);

    ReplayStopwatch sw = ReplayStopwatch::StartNew();
    if (ToString(sw) != "0ms")
    {
        return 1;
    }

    if (sw.Stop() != 1500ms || ToString(sw) != "1500ms" || std::format("{}", sw) != "1500ms")
    {
        return 2;
    }

    // Splits are cumulative from the start, not lap-to-lap.
    NullClock::SetStep(10ms);
    sw.Start();
    const auto s1 = sw.Split();
    const auto s2 = sw.Split();
    const auto s3 = sw.Split();
    if (!s1 || !s2 || !s3 || *s1 != 10ms || *s2 != 20ms || *s3 != 30ms)
    {
        return 3;
    }
    if (sw.LastSplit() != std::optional<NullClock::time_point>(*sw.StartTime() + 30ms))
    {
        return 4;
    }

    // The stored value is stale while running: rendering shows the last split.
    if (ToString(sw) != "30ms")
    {
        return 5;
    }
    if (sw.Stop() != 40ms || sw.LastSplit())
    {
        return 6;
    }

    // Restart measures only the post-restart interval.
    sw.Start();
    (void)sw.Split();
    ReplayStopwatch copy = sw;
    sw.Restart();
    if (sw.StartTime() == copy.StartTime() || sw.LastSplit() || sw.Elapsed() != Nanoseconds::zero())
    {
        return 7;
    }
    if (sw.Stop() != 10ms)
    {
        return 8;
    }

    // The copy kept its own start and split.
    if (!copy.IsRunning() || !copy.LastSplit() || copy.Elapsed() != 10ms)
    {
        return 9;
    }

    // Sub-millisecond remainders are truncated when rendered.
    NullClock::SetStep(2'999'999ns);
    ReplayStopwatch fine = ReplayStopwatch::StartNew();
    (void)fine.Stop();
    if (fine.Elapsed() != 2'999'999ns || ToString(fine) != "2ms")
    {
        return 10;
    }

    NullClock::Reset();
    return 0;
}
