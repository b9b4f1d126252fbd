/*******************************************************************************
 * @file logger.cpp
 * @brief Implementation of the asynchronous logger.
 *
 * One worker thread drains a queue of records and sink commands. Commands carry a
 * promise that the worker settles exactly once, so callers of set_logfile() and
 * flush() observe the queue in order. Records beyond kMaxQueuedRecords are dropped
 * and counted; the count is reported through the sink once the queue drains.
 ******************************************************************************/
#include <algorithm>
#include <cctype>
#include <condition_variable>
#include <cstdlib>
#include <future>
#include <mutex>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

#include "smx_base.hpp"

#include "utils/logger.hpp"
#include "utils/logger_sinks/console_sink.hpp"
#include "utils/logger_sinks/file_sink.hpp"
#include "utils/logger_sinks/sink.hpp"

using shmmutex::format_tools::make_buffer;

namespace shmmutex::utils
{

enum class LoggerState
{
    Uninitialized,
    Initialized,
    ShuttingDown,
    Shutdown
};

static std::atomic<LoggerState> g_logger_state{LoggerState::Uninitialized};

// Configuration before the module was ever started is a programming error. After
// shutdown it is refused quietly.
static bool logger_accepts_configuration(const char *function_name)
{
    const auto state = g_logger_state.load(std::memory_order_acquire);
    if (state == LoggerState::Uninitialized)
    {
        SMX_PANIC("Logger method '{}' was called before the Logger module was "
                  "initialized via LifecycleManager. Aborting.",
                  function_name);
    }
    return state == LoggerState::Initialized;
}

namespace
{
constexpr std::size_t kMaxQueuedRecords = 10000;

LogMessage make_record(Logger::Level lvl, fmt::memory_buffer &&body)
{
    return LogMessage{.timestamp = std::chrono::system_clock::now(),
                      .process_id = shmmutex::platform::get_pid(),
                      .thread_id = shmmutex::platform::get_native_thread_id(),
                      .level = static_cast<int>(lvl),
                      .body = std::move(body)};
}

struct SwitchSink
{
    std::unique_ptr<Sink> sink;
    std::promise<bool> done;
};

struct FlushSink
{
    std::promise<bool> done;
};

using QueueItem = std::variant<LogMessage, SwitchSink, FlushSink>;

// A failing sink is reported on stderr; the worker keeps going.
template <typename Fn> bool guarded(const char *what, Fn &&fn)
{
    try
    {
        fn();
        return true;
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "[SMX] Logger {} failed: {}\n", what, e.what());
        return false;
    }
}
} // namespace

struct Logger::Impl
{
    void start();
    void stop();
    bool push(QueueItem &&item);
    void run();

    void handle(LogMessage &msg);
    void handle(SwitchSink &cmd);
    void handle(FlushSink &cmd);
    void write_system(fmt::memory_buffer &&body);

    std::mutex queue_mutex;
    std::condition_variable wake;
    std::vector<QueueItem> queue;
    std::size_t dropped = 0;
    bool stopping = false;

    std::mutex sink_mutex;
    std::unique_ptr<Sink> sink = std::make_unique<ConsoleSink>();
    std::atomic<Logger::Level> level{Logger::Level::L_INFO};
    std::thread worker;

    ~Impl() { stop(); }
};

void Logger::Impl::start()
{
    if (!worker.joinable())
    {
        worker = std::thread(&Logger::Impl::run, this);
    }
}

void Logger::Impl::stop()
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        if (stopping)
        {
            return;
        }
        stopping = true;
    }
    wake.notify_one();
    if (worker.joinable())
    {
        worker.join();
    }
}

bool Logger::Impl::push(QueueItem &&item)
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        const bool is_record = std::holds_alternative<LogMessage>(item);
        if (!stopping && (!is_record || queue.size() < kMaxQueuedRecords))
        {
            queue.push_back(std::move(item));
            wake.notify_one();
            return true;
        }
        if (is_record && !stopping)
        {
            ++dropped;
        }
    }
    // Refused: settle the caller's future.
    std::visit(
        [](auto &cmd)
        {
            if constexpr (!std::is_same_v<std::decay_t<decltype(cmd)>, LogMessage>)
            {
                cmd.done.set_value(false);
            }
        },
        item);
    return false;
}

void Logger::Impl::handle(LogMessage &msg)
{
    if (msg.level < static_cast<int>(level.load(std::memory_order_relaxed)))
    {
        return;
    }
    std::lock_guard<std::mutex> lock(sink_mutex);
    guarded("write", [&] { sink->write(msg); });
}

void Logger::Impl::handle(SwitchSink &cmd)
{
    {
        std::lock_guard<std::mutex> lock(sink_mutex);
        const std::string previous = sink->description();
        guarded("flush", [&] { sink->flush(); });
        sink = std::move(cmd.sink);
        guarded("write",
                [&]
                {
                    sink->write(make_record(Logger::Level::L_SYSTEM,
                                            make_buffer("Log sink switched from: {}", previous)));
                });
    }
    cmd.done.set_value(true);
}

void Logger::Impl::handle(FlushSink &cmd)
{
    bool ok = false;
    {
        std::lock_guard<std::mutex> lock(sink_mutex);
        ok = guarded("flush", [&] { sink->flush(); });
    }
    cmd.done.set_value(ok);
}

void Logger::Impl::write_system(fmt::memory_buffer &&body)
{
    std::lock_guard<std::mutex> lock(sink_mutex);
    guarded("write",
            [&] { sink->write(make_record(Logger::Level::L_SYSTEM, std::move(body))); });
}

void Logger::Impl::run()
{
    std::vector<QueueItem> batch;
    for (;;)
    {
        std::size_t lost = 0;
        bool last_batch = false;
        {
            std::unique_lock<std::mutex> lock(queue_mutex);
            wake.wait(lock, [this] { return stopping || !queue.empty(); });
            batch.swap(queue);
            lost = std::exchange(dropped, 0);
            // push() refuses everything once stopping is set, so this batch is the last.
            last_batch = stopping;
        }

        for (auto &item : batch)
        {
            std::visit([this](auto &entry) { handle(entry); }, item);
        }
        batch.clear();

        if (lost > 0)
        {
            write_system(make_buffer("Logger queue full: dropped {} record(s).", lost));
        }
        if (last_batch)
        {
            write_system(make_buffer("Logger is shutting down."));
            std::lock_guard<std::mutex> lock(sink_mutex);
            guarded("flush", [&] { sink->flush(); });
            return;
        }
    }
}

Logger::Logger() : pImpl(std::make_unique<Impl>()) {}
Logger::~Logger() = default;

Logger &Logger::instance()
{
    static Logger instance;
    return instance;
}

bool Logger::lifecycle_initialized() noexcept
{
    return g_logger_state.load(std::memory_order_acquire) != LoggerState::Uninitialized;
}

std::optional<Logger::Level> Logger::parse_level(std::string_view text) noexcept
{
    std::string lowered(format_tools::trim_whitespace(text));
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "trace")
        return Level::L_TRACE;
    if (lowered == "debug")
        return Level::L_DEBUG;
    if (lowered == "info")
        return Level::L_INFO;
    if (lowered == "warn" || lowered == "warning")
        return Level::L_WARNING;
    if (lowered == "error")
        return Level::L_ERROR;
    if (lowered == "system")
        return Level::L_SYSTEM;
    return std::nullopt;
}

bool Logger::switch_sink(std::unique_ptr<Sink> sink)
{
    std::promise<bool> done;
    auto installed = done.get_future();
    pImpl->push(SwitchSink{std::move(sink), std::move(done)});
    return installed.get();
}

bool Logger::set_console()
{
    if (!logger_accepts_configuration("Logger::set_console"))
        return false;
    return switch_sink(std::make_unique<ConsoleSink>());
}

bool Logger::set_logfile(const std::filesystem::path &path, bool use_flock)
{
    if (!logger_accepts_configuration("Logger::set_logfile"))
        return false;
    std::unique_ptr<Sink> sink;
    try
    {
        sink = std::make_unique<FileSink>(path, use_flock);
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("Logger: cannot open log file '{}': {}", path.string(), e.what());
        return false;
    }
    return switch_sink(std::move(sink));
}

void Logger::shutdown()
{
    pImpl->stop();
}

void Logger::flush()
{
    if (!logger_accepts_configuration("Logger::flush"))
        return;
    std::promise<bool> done;
    auto flushed = done.get_future();
    pImpl->push(FlushSink{std::move(done)});
    (void)flushed.get();
}

void Logger::set_level(Level lvl)
{
    if (!logger_accepts_configuration("Logger::set_level"))
        return;
    pImpl->level.store(lvl, std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    if (!logger_accepts_configuration("Logger::level"))
        return Level::L_INFO;
    return pImpl->level.load(std::memory_order_relaxed);
}

bool Logger::should_log(Level lvl) const noexcept
{
    return g_logger_state.load(std::memory_order_acquire) == LoggerState::Initialized &&
           static_cast<int>(lvl) >= static_cast<int>(pImpl->level.load(std::memory_order_relaxed));
}

bool Logger::enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept
{
    if (g_logger_state.load(std::memory_order_acquire) != LoggerState::Initialized)
        return false;
    try
    {
        return pImpl->push(make_record(lvl, std::move(body)));
    }
    catch (const std::exception &)
    {
        // Out of memory while queueing: lost like an overflowing record.
        return false;
    }
}

void do_logger_startup(const char * /*arg*/)
{
    auto &logger = Logger::instance();
    if (const char *env = std::getenv("SHMMUTEX_LOG_LEVEL"))
    {
        if (auto lvl = Logger::parse_level(env))
        {
            logger.pImpl->level.store(*lvl, std::memory_order_relaxed);
        }
        else
        {
            fmt::print(stderr, "[SMX] Ignoring unknown SHMMUTEX_LOG_LEVEL '{}'.\n", env);
        }
    }
    logger.pImpl->start();
    g_logger_state.store(LoggerState::Initialized, std::memory_order_release);
}

void do_logger_shutdown(const char * /*arg*/)
{
    LoggerState expected = LoggerState::Initialized;
    if (g_logger_state.compare_exchange_strong(expected, LoggerState::ShuttingDown,
                                               std::memory_order_acq_rel))
    {
        Logger::instance().shutdown();
        g_logger_state.store(LoggerState::Shutdown, std::memory_order_release);
    }
}

ModuleDef Logger::GetLifecycleModule()
{
    ModuleDef module("shmmutex::utils::Logger");
    module.set_startup(&do_logger_startup);
    module.set_shutdown(&do_logger_shutdown);
    return module;
}

} // namespace shmmutex::utils
