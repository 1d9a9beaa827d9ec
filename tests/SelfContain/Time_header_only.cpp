#include "Core/Contracts/Time.hpp"
#include "Core/Time/NullClock.hpp"
#include "Core/Time/SteadyClock.hpp"

#include <chrono>

namespace
{
    using namespace lap::time;

    static_assert(MonotonicClock<SteadyClock>, "SteadyClock must satisfy the clock contract.");
    static_assert(MonotonicClock<NullClock>, "NullClock must satisfy the clock contract.");

    // Wall clocks may jump and are rejected.
    static_assert(!MonotonicClock<std::chrono::system_clock>);

    struct DummyClock
    {
        using duration   = Nanoseconds;
        using rep        = duration::rep;
        using period     = duration::period;
        using time_point = std::chrono::time_point<DummyClock, duration>;

        static constexpr bool is_steady = true;

        [[nodiscard]] static time_point now() noexcept { return time_point{}; }
        [[nodiscard]] static constexpr TimeCaps GetCaps() noexcept
        {
            TimeCaps caps{};
            caps.monotonic = true;
            caps.threadSafety = lap::ThreadSafetyMode::ExternalSync;
            return caps;
        }
    };

    static_assert(MonotonicClock<DummyClock>, "DummyClock must satisfy the clock contract.");
    static_assert(QueryCaps<DummyClock>().threadSafety == lap::ThreadSafetyMode::ExternalSync);
}
