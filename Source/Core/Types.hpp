#pragma once

#include <cstdint>  // int32_t, uint32_t...
#include <cstddef>  // size_t, ptrdiff_t

// =============================
// Types.hpp
// =============================
// Fixed-size aliases shared by every Lapwatch header, plus the small
// capability enums that describe clock backends.
// =============================

namespace lap
{
// ---- Integer types ----
using i8  = std::int8_t;
using i16 = std::int16_t;
using i32 = std::int32_t;
using i64 = std::int64_t;

using u8  = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

// ---- Size and pointer-related ----
using usize = std::size_t;
using isize = std::ptrdiff_t;

enum class DeterminismMode : u8
{
    Unknown = 0,
    Off,
    Replay,
    Strict
};

enum class ThreadSafetyMode : u8
{
    Unknown = 0,
    ExternalSync,
    ThreadSafe
};
} // namespace lap
