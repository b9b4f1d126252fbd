/**
 * @file debug_info.hpp
 * @brief Debugging utilities: stack trace printing, panic handling for programming errors,
 *        and debug messaging.
 *
 * All functions live in `shmmutex::debug`. They use `fmt` for compile-time format string checks
 * and `std::source_location` for automatic source code location reporting.
 */
#pragma once

#include <cstdio>  // for fflush
#include <cstdlib> // for abort
#include <fmt/format.h>
#include <source_location>
#include <string>
#include <string_view>

#include "shmmutex_utils_export.h"
#include "utils/format_tools.hpp" // for shmmutex::format_tools::filename_only

/**
 * @brief Renders a source location as "file:line:function".
 */
inline std::string SRCLOC_TO_STR(std::source_location loc)
{
    return fmt::format("{}:{}:{}", shmmutex::format_tools::filename_only(loc.file_name()),
                       loc.line(), loc.function_name());
}

namespace shmmutex::debug
{

/**
 * @brief Prints the current call stack to `stderr`.
 *
 * POSIX uses `backtrace`, `dladdr` and `abi::__cxa_demangle`; Windows prints raw frame
 * addresses from `CaptureStackBackTrace`.
 *
 * @warning Not async-signal-safe. Do not call from a signal handler.
 */
SHMMUTEX_UTILS_EXPORT void print_stack_trace() noexcept;

/**
 * @brief Halts program execution with a fatal error message and a stack trace.
 *
 * Reserved for programming errors (API misuse, broken internal state of the
 * lifecycle or logger). Runtime lock failures are reported with exceptions instead.
 *
 * @param loc Where `panic` was called; captured by `SMX_PANIC`.
 * @param fmt_str The `fmt`-style format string for the error message.
 * @param args The arguments to be formatted into `fmt_str`.
 */
template <typename... Args>
[[noreturn]] inline void panic(std::source_location loc, fmt::format_string<Args...> fmt_str,
                               Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[PANIC] {} -- {}\n", SRCLOC_TO_STR(loc), body);
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "[PANIC] FATAL ERROR WHILE FORMATTING PANIC MESSAGE: %s\n", e.what());
    }
    std::fflush(stderr);
    print_stack_trace();
    std::abort();
}

/**
 * @brief Prints a debug message to `stderr` with compile-time format string checking.
 */
template <typename... Args>
inline void debug_msg(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[DBG]  {}\n", body);
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "[DBG]  FORMAT ERROR DURING DEBUG_MSG: %s\n", e.what());
        std::fflush(stderr);
    }
}

} // namespace shmmutex::debug

// ---------------- thin macros for convenience --------------

#ifndef SMX_LOC_HERE_STR
#define SMX_LOC_HERE_STR (SRCLOC_TO_STR(std::source_location::current()))
#endif

/**
 * @brief Calls `shmmutex::debug::panic` with the current source location.
 * @see shmmutex::debug::panic
 */
#ifndef SMX_PANIC
#define SMX_PANIC(fmt, ...)                                                                        \
    ::shmmutex::debug::panic(std::source_location::current(),                                     \
                             FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#endif

/**
 * @brief Synchronous stderr trace, compiled in only with SHMMUTEX_ENABLE_DEBUG_MESSAGES.
 */
#ifndef SMX_DEBUG
#if defined(SHMMUTEX_ENABLE_DEBUG_MESSAGES)
#define SMX_DEBUG(fmt, ...) ::shmmutex::debug::debug_msg(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#else
#define SMX_DEBUG(fmt, ...)                                                                        \
    do                                                                                             \
    {                                                                                              \
    } while (0)
#endif
#endif
