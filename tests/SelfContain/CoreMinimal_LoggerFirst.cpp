// Compile-only include-order check: Logger.hpp included before the umbrella header
#include "Core/Logger.hpp"
#include "Core/CoreMinimal.h"

namespace {
    void TouchLoggerFirst() noexcept
    {
        LAP_LOG_INFO("Time", "logger-first include order {}", lap::time::ToString(lap::time::Stopwatch{}));
        LAP_LOG_WARNING("Time", "logger-first include order");
        LAP_CHECK(!lap::time::Stopwatch{}.IsRunning());
        LAP_VERIFY(lap::time::Stopwatch{}.Split() == std::nullopt);
        LAP_ASSERT(lap::time::Stopwatch{}.Elapsed().count() == 0);
    }
}
