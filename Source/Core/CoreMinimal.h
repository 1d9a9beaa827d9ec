// =============================
// CoreMinimal.h
// =============================
#pragma once

// Umbrella include for code that only wants to time something.
// Every header listed here is header-only and free of side effects.

#include "Core/Types.hpp"                 // Fixed-size aliases and capability enums
#include "Core/Logger.hpp"                // Logging and LAP_ASSERT
#include "Core/Diagnostics/Check.hpp"     // LAP_CHECK / LAP_VERIFY
#include "Core/Time/Stopwatch.hpp"        // Stopwatch over the steady clock
