// ============================================================================
// Lapwatch - tests/AllSmokes/AllSmokes_main.cpp
// ----------------------------------------------------------------------------
// Purpose : Aggregate executable that runs all smoke helpers.
// Contract: No exceptions/RTTI; deterministic ordering; returns 0 on success.
// Notes   : Run*Smoke helpers are linked from their respective TUs.
// ============================================================================

#include <cstdio>

int RunLoggerSmoke();
int RunTimeSmoke();
int RunStopwatchSmoke();
int RunStopwatchReplaySmoke();

namespace
{
    struct SmokeEntry
    {
        const char* name;
        int (*func)();
    };
}

int main()
{
    const SmokeEntry smokes[] = {
        {"Logger", &RunLoggerSmoke},
        {"Time", &RunTimeSmoke},
        {"Stopwatch", &RunStopwatchSmoke},
        {"StopwatchReplay", &RunStopwatchReplaySmoke},
    };

    int failures = 0;

    for (const SmokeEntry& entry : smokes)
    {
        const int code = entry.func();
        if (code != 0)
        {
            ++failures;
        }

        std::printf("%s: %s (code=%d)\n", entry.name, (code == 0) ? "OK" : "FAIL", code);
    }

    return (failures == 0) ? 0 : 1;
}
