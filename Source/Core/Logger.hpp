#pragma once

// =============================
// Lapwatch - Logger.hpp (C++23, header-only)
// =============================
// Goals
//  - Safe to include from any header (no third-party deps)
//  - C++23 std::print/std::println backend
//  - Zero overhead when disabled (LAP_ENABLE_LOGGING=0)
//  - Runtime min-level filter and optional exact-category filter
//  - One coarse mutex around each emitted line
//
// Non-goals
//  - Async logging, files, colors, multiple sinks
//
// Notes
//  - Categories are plain string literals (const char*). Keep them short ("Time", "Core").

#include <atomic>
#include <cstdint>
#include <cstdio>       // std::FILE, stdout/stderr
#include <cstdlib>      // std::abort
#include <exception>
#include <format>       // std::format_string
#include <mutex>
#include <print>        // C++23 std::print / std::println
#include <string_view>

#ifndef LAP_ENABLE_LOGGING
#  define LAP_ENABLE_LOGGING 1
#endif
#ifndef LAP_ENABLE_LOG_ASSERT
#  define LAP_ENABLE_LOG_ASSERT 1
#endif

namespace lap::core {

    enum class LogLevel : std::uint8_t {
        Disabled = 0,
        Fatal = 1,
        Error = 2,
        Warn = 3,
        Info = 4,
        Verbose = 5,
        // A message is emitted if (level <= MinLevel).
    };

    struct LoggerConfig {
        std::atomic<LogLevel> MinLevel{ LogLevel::Info };
        // Non-null: only this exact category is printed. Must be a stable literal.
        std::atomic<const char*> CategoryEqualsFilter{ nullptr };
    };

    class Logger final {
    public:
        static Logger& Get() noexcept {
            static Logger g;
            return g;
        }

        static void SetMinLevel(LogLevel lvl) noexcept { Get().mCfg.MinLevel.store(lvl, std::memory_order_relaxed); }
        static LogLevel GetMinLevel() noexcept { return Get().mCfg.MinLevel.load(std::memory_order_relaxed); }
        static void SetCategoryEqualsFilter(const char* cat) noexcept {
            Get().mCfg.CategoryEqualsFilter.store(cat, std::memory_order_relaxed);
        }
        static const char* GetCategoryEqualsFilter() noexcept {
            return Get().mCfg.CategoryEqualsFilter.load(std::memory_order_relaxed);
        }

        // Lets macros skip argument evaluation for filtered messages.
        static bool IsEnabled(LogLevel lvl, const char* category) noexcept {
            Logger& self = Get();
            if (lvl == LogLevel::Disabled) return false;
            if (lvl > self.mCfg.MinLevel.load(std::memory_order_relaxed)) return false;
            const char* filter = self.mCfg.CategoryEqualsFilter.load(std::memory_order_relaxed);
            if (filter) {
                if (!category) return false;
                if (std::string_view(filter) != category) return false;
            }
            return true;
        }

        template <class... Args>
        static void Info(const char* category, std::format_string<Args...> fmt, Args&&... args) noexcept {
            Print(LogLevel::Info, category, stdout, fmt, static_cast<Args&&>(args)...);
        }
        template <class... Args>
        static void Warn(const char* category, std::format_string<Args...> fmt, Args&&... args) noexcept {
            Print(LogLevel::Warn, category, stderr, fmt, static_cast<Args&&>(args)...);
        }
        template <class... Args>
        static void Error(const char* category, std::format_string<Args...> fmt, Args&&... args) noexcept {
            Print(LogLevel::Error, category, stderr, fmt, static_cast<Args&&>(args)...);
        }
        template <class... Args>
        [[noreturn]] static void Fatal(const char* category, std::format_string<Args...> fmt, Args&&... args) noexcept {
            Print(LogLevel::Fatal, category, stderr, fmt, static_cast<Args&&>(args)...);
            std::fflush(stderr);
            std::abort();
        }
        template <class... Args>
        static void Verbose(const char* category, std::format_string<Args...> fmt, Args&&... args) noexcept {
            Print(LogLevel::Verbose, category, stdout, fmt, static_cast<Args&&>(args)...);
        }

        template <class... Args>
        static void Log(LogLevel lvl, const char* category, std::format_string<Args...> fmt, Args&&... args) noexcept {
            std::FILE* stream = (lvl <= LogLevel::Warn) ? stderr : stdout;
            Print(lvl, category, stream, fmt, static_cast<Args&&>(args)...);
        }

        static const char* ToShortLevel(LogLevel lvl) noexcept {
            switch (lvl) {
            case LogLevel::Fatal:   return "F";
            case LogLevel::Error:   return "E";
            case LogLevel::Warn:    return "W";
            case LogLevel::Info:    return "I";
            case LogLevel::Verbose: return "V";
            default:                return "-";
            }
        }

    private:
        Logger() = default;

        template <class... Args>
        static void Print(LogLevel lvl, const char* category, std::FILE* stream, std::format_string<Args...> fmt, Args&&... args) noexcept {
            if (!IsEnabled(lvl, category)) return;
            Logger& self = Get();
            const char* lvlStr = ToShortLevel(lvl);
            std::scoped_lock lock(self.mMutex);
            try {
                if (category) {
                    std::print(stream, "[{}][{}] ", lvlStr, category);
                }
                else {
                    std::print(stream, "[{}] ", lvlStr);
                }
                std::println(stream, fmt, static_cast<Args&&>(args)...);
            }
            catch (const std::exception& e) {
                // The line is lost; say so with plain stdio, which cannot throw.
                std::fputs("[E][Log] failed to emit message: ", stderr);
                std::fputs(e.what(), stderr);
                std::fputc('\n', stderr);
            }
        }

        std::mutex mMutex{};
        LoggerConfig mCfg{};
    };

} // namespace lap::core

// ----------------------
// Public log macros (single evaluation of Category)
// ----------------------
#if LAP_ENABLE_LOGGING
#define LAP_LOG_VERBOSE(Category, Fmt, ...) do { \
        const char* _cat = (Category); \
        if (::lap::core::Logger::IsEnabled(::lap::core::LogLevel::Verbose, _cat)) { \
            ::lap::core::Logger::Verbose(_cat, (Fmt) __VA_OPT__(,) __VA_ARGS__); \
        } \
    } while (0)

#define LAP_LOG_INFO(Category, Fmt, ...) do { \
        const char* _cat = (Category); \
        if (::lap::core::Logger::IsEnabled(::lap::core::LogLevel::Info, _cat)) { \
            ::lap::core::Logger::Info(_cat, (Fmt) __VA_OPT__(,) __VA_ARGS__); \
        } \
    } while (0)

#define LAP_LOG_WARNING(Category, Fmt, ...) do { \
        const char* _cat = (Category); \
        if (::lap::core::Logger::IsEnabled(::lap::core::LogLevel::Warn, _cat)) { \
            ::lap::core::Logger::Warn(_cat, (Fmt) __VA_OPT__(,) __VA_ARGS__); \
        } \
    } while (0)

#define LAP_LOG_ERROR(Category, Fmt, ...) do { \
        const char* _cat = (Category); \
        if (::lap::core::Logger::IsEnabled(::lap::core::LogLevel::Error, _cat)) { \
            ::lap::core::Logger::Error(_cat, (Fmt) __VA_OPT__(,) __VA_ARGS__); \
        } \
    } while (0)

#define LAP_LOG_FATAL(Category, Fmt, ...) do { \
        const char* _cat = (Category); \
        ::lap::core::Logger::Fatal(_cat, (Fmt) __VA_OPT__(,) __VA_ARGS__); \
    } while (0)
#else
#define LAP_LOG_VERBOSE(Category, Fmt, ...)  ((void)0)
#define LAP_LOG_INFO(Category, Fmt, ...)     ((void)0)
#define LAP_LOG_WARNING(Category, Fmt, ...)  ((void)0)
#define LAP_LOG_ERROR(Category, Fmt, ...)    ((void)0)
#define LAP_LOG_FATAL(Category, Fmt, ...)    ((void)0)
#endif

// ----------------------
// Assert macro: reports through the logger, never aborts
// ----------------------
#if LAP_ENABLE_LOG_ASSERT
#ifndef LAP_ASSERT
#include <source_location>

#define LAP_EXPAND(x) x
#define LAP_GET_MACRO(_1,_2,NAME,...) NAME

#define LAP_ASSERT_1(Expr) do { \
            if (!(Expr)) { \
                const auto loc = std::source_location::current(); \
                ::lap::core::Logger::Error("Assert", "{} ({}:{}): assertion failed: {}", \
                    loc.function_name(), loc.file_name(), loc.line(), #Expr); \
            } \
        } while(0)

#define LAP_ASSERT_2(Expr, Msg) do { \
            if (!(Expr)) { \
                const auto loc = std::source_location::current(); \
                ::lap::core::Logger::Error("Assert", "{} ({}:{}): {}", \
                    loc.function_name(), loc.file_name(), loc.line(), Msg); \
            } \
        } while(0)

#define LAP_ASSERT(...) \
            LAP_EXPAND(LAP_GET_MACRO(__VA_ARGS__, LAP_ASSERT_2, LAP_ASSERT_1)(__VA_ARGS__))

#endif
#else
#ifndef LAP_ASSERT
#define LAP_ASSERT(...) ((void)0)
#endif
#endif
