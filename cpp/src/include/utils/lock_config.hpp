#pragma once
/**
 * @file lock_config.hpp
 * @brief Construction-time configuration of a SharedMemoryMutex.
 *
 * ## JSON form
 *
 * @code
 *   { "name": "instrument.bus", "poll_interval_ms": 20, "timeout_ms": 1500 }
 * @endcode
 *
 * `timeout_ms` is a non-negative number (fixed duration), `false` (single attempt), or
 * `null`/absent (unbounded). `poll_interval_ms` defaults to 50.
 */
#include "shmmutex_utils_export.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

#include <nlohmann/json_fwd.hpp>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace shmmutex::utils
{

/**
 * @class AcquireTimeout
 * @brief How long acquire() keeps retrying: forever, once, or for a fixed duration.
 *
 * A zero duration behaves like a single attempt.
 */
class SHMMUTEX_UTILS_EXPORT AcquireTimeout
{
  public:
    enum class Kind
    {
        Unbounded,
        SingleAttempt,
        Duration
    };

    static AcquireTimeout unbounded() noexcept { return AcquireTimeout(Kind::Unbounded, {}); }
    static AcquireTimeout single_attempt() noexcept
    {
        return AcquireTimeout(Kind::SingleAttempt, {});
    }
    /** @throws ConfigurationError if @p d is negative. */
    static AcquireTimeout after(std::chrono::nanoseconds d);

    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    [[nodiscard]] std::chrono::nanoseconds duration() const noexcept { return duration_; }
    [[nodiscard]] bool is_unbounded() const noexcept { return kind_ == Kind::Unbounded; }
    [[nodiscard]] bool is_single_attempt() const noexcept { return kind_ == Kind::SingleAttempt; }

    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const AcquireTimeout &, const AcquireTimeout &) = default;

  private:
    AcquireTimeout(Kind k, std::chrono::nanoseconds d) noexcept : kind_(k), duration_(d) {}

    Kind kind_;
    std::chrono::nanoseconds duration_;
};

struct SHMMUTEX_UTILS_EXPORT LockConfig
{
    static constexpr std::size_t kMaxNameLength = 250;
    static constexpr std::chrono::milliseconds kDefaultPollInterval{50};

    std::string name;
    std::chrono::milliseconds poll_interval{kDefaultPollInterval};
    /// Used by acquire() when called without an explicit timeout.
    AcquireTimeout default_timeout{AcquireTimeout::unbounded()};

    /**
     * @brief Rejects an empty name, a name with '/' or NUL, a name longer than
     *        kMaxNameLength, and a non-positive poll interval.
     * @throws ConfigurationError
     */
    void validate() const;

    /** @throws ConfigurationError on a missing name or a wrongly typed key. */
    static LockConfig from_json(const nlohmann::json &j);

    /** @throws ConfigurationError if the file cannot be read or parsed. */
    static LockConfig from_json_file(const std::filesystem::path &path);
};

} // namespace shmmutex::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
