#pragma once
/**
 * @file logger.hpp
 * @brief Asynchronous, process-wide logger.
 *
 * Callers format on their own thread into a `fmt::memory_buffer` and hand the record to a
 * worker thread that owns the active sink (console by default, or a file). Sink changes
 * and flushes ride the same queue, so they take effect in order with the records around
 * them.
 *
 * The logger is a lifecycle module (`Logger::GetLifecycleModule()`). Records logged while it
 * is not running are dropped; configuration calls made before it was ever started are a
 * programming error and panic.
 *
 * Use the macros, which check format strings at compile time:
 * @code
 *   LOGGER_INFO("acquired '{}' after {} ms", name, elapsed_ms);
 * @endcode
 */
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "shmmutex_utils_export.h"
#include "utils/module_def.hpp"

// Default initial reserve for fmt::memory_buffer used by Logger::log_fmt.
#ifndef LOGGER_FMT_BUFFER_RESERVE
#define LOGGER_FMT_BUFFER_RESERVE (256u)
#endif

// --- Compile-Time Log Level ---
#ifndef LOGGER_COMPILE_LEVEL
#define LOGGER_COMPILE_LEVEL 0 // 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=System
#endif

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace shmmutex::utils
{

class Sink;

class SHMMUTEX_UTILS_EXPORT Logger
{
  public:
    enum class Level : int
    {
        L_TRACE = 0,
        L_DEBUG = 1,
        L_INFO = 2,
        L_WARNING = 3,
        L_ERROR = 4,
        L_SYSTEM = 5,
    };

    static Logger &instance();

    /// The lifecycle module that starts and stops the worker thread.
    static ModuleDef GetLifecycleModule();

    /// True once the logger module has been started (even if it was shut down since).
    static bool lifecycle_initialized() noexcept;

    /**
     * @brief Parses "trace", "debug", "info", "warn"/"warning", "error" or "system"
     *        (case-insensitive, surrounding whitespace ignored).
     */
    static std::optional<Level> parse_level(std::string_view text) noexcept;

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;
    ~Logger();

    // --- Sinks ---
    // Each call waits until the worker has installed the sink.

    /// Switches to the stderr sink. Returns false if the logger is shutting down.
    bool set_console();

    /**
     * @brief Switches to a file sink appending to @p path.
     * @param use_flock Serialize each record with flock(); use when several processes
     *                  write the same file.
     * @return false if the file could not be opened (logged at ERROR through the current
     *         sink) or the logger is shutting down.
     */
    bool set_logfile(const std::filesystem::path &path, bool use_flock = true);

    /// Blocks until every record enqueued before this call has been written and flushed.
    void flush();

    // --- Configuration & Diagnostics ---
    void set_level(Level lvl);
    Level level() const;

    [[nodiscard]] bool should_log(Level lvl) const noexcept;

    bool enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept;

    // --- Formatting API ---
    template <Level lvl, typename... Args>
    void log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept;

    template <typename... Args>
    void trace_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_TRACE>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void debug_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_DEBUG>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void info_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_INFO>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void warn_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_WARNING>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void error_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_ERROR>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void system_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_SYSTEM>(fmt_str, std::forward<Args>(args)...);
    }

    struct Impl;

  private:
    Logger();
    void shutdown();
    bool switch_sink(std::unique_ptr<Sink> sink);

    friend void do_logger_startup(const char *arg);
    friend void do_logger_shutdown(const char *arg);

    std::unique_ptr<Impl> pImpl;
};

template <Logger::Level lvl, typename... Args>
void Logger::log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    if constexpr (static_cast<int>(lvl) >= LOGGER_COMPILE_LEVEL)
    {
        if (!should_log(lvl))
            return;

        try
        {
            fmt::memory_buffer mb;
            mb.reserve(LOGGER_FMT_BUFFER_RESERVE);
            fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
            enqueue_log(lvl, std::move(mb));
        }
        catch (const std::exception &ex)
        {
            fmt::memory_buffer err;
            fmt::format_to(std::back_inserter(err), "[FORMAT ERROR] {}", ex.what());
            enqueue_log(lvl, std::move(err));
        }
    }
}

} // namespace shmmutex::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

// --- Macro Implementation ---
#define LOGGER_TRACE(fmt, ...)                                                                     \
    ::shmmutex::utils::Logger::instance().trace_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_DEBUG(fmt, ...)                                                                     \
    ::shmmutex::utils::Logger::instance().debug_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO(fmt, ...)                                                                      \
    ::shmmutex::utils::Logger::instance().info_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN(fmt, ...)                                                                      \
    ::shmmutex::utils::Logger::instance().warn_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR(fmt, ...)                                                                     \
    ::shmmutex::utils::Logger::instance().error_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_SYSTEM(fmt, ...)                                                                    \
    ::shmmutex::utils::Logger::instance().system_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
