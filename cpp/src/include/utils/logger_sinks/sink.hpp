#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <fmt/format.h>

namespace shmmutex::utils
{

// One log record as it travels from the caller to the worker thread.
struct LogMessage
{
    std::chrono::system_clock::time_point timestamp;
    uint64_t process_id;
    uint64_t thread_id;
    int level; // int so sinks need not include logger.hpp for the enum.
    fmt::memory_buffer body;
};

// Abstract interface for a log message destination.
class Sink
{
  public:
    virtual ~Sink() = default;
    virtual void write(const LogMessage &msg) = 0;
    virtual void flush() = 0;
    virtual std::string description() const = 0;

    static const char *level_to_string_internal(int lvl);
    static std::string format_logmsg(const LogMessage &msg);
};

} // namespace shmmutex::utils
