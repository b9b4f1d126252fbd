#pragma once
/**
 * @file lock_errors.hpp
 * @brief Exception hierarchy for SharedMemoryMutex and its collaborators.
 *
 * Every runtime failure of the lock derives from ShmMutexError. Platform calls underneath
 * report through std::error_code; the two classes that wrap a failed system call carry it.
 */
#include "shmmutex_utils_export.h"

#include <stdexcept>
#include <string>
#include <system_error>

namespace shmmutex::utils
{

class SHMMUTEX_UTILS_EXPORT ShmMutexError : public std::runtime_error
{
  public:
    explicit ShmMutexError(const std::string &msg) : std::runtime_error(msg) {}
};

/// Invalid name, poll interval or timeout. Raised at construction, never deferred.
class SHMMUTEX_UTILS_EXPORT ConfigurationError : public ShmMutexError
{
  public:
    using ShmMutexError::ShmMutexError;
};

/// acquire() on a handle that already holds its lock.
class SHMMUTEX_UTILS_EXPORT DeadlockError : public ShmMutexError
{
  public:
    using ShmMutexError::ShmMutexError;
};

/// Raised only by ScopedLock with throw_on_timeout when acquisition fails.
class SHMMUTEX_UTILS_EXPORT TimeoutError : public ShmMutexError
{
  public:
    using ShmMutexError::ShmMutexError;
};

/// The segment exists but stayed unstamped; it needs manual or registry-driven cleanup.
class SHMMUTEX_UTILS_EXPORT DanglingResourceError : public ShmMutexError
{
  public:
    using ShmMutexError::ShmMutexError;
};

/// Unreachable-by-construction state, e.g. our own token on a segment we never recorded.
class SHMMUTEX_UTILS_EXPORT InternalConsistencyError : public ShmMutexError
{
  public:
    using ShmMutexError::ShmMutexError;
};

/// Malformed textual or binary token.
class SHMMUTEX_UTILS_EXPORT TokenFormatError : public ShmMutexError
{
  public:
    using ShmMutexError::ShmMutexError;
};

/// acquire() on a handle left Faulted by an earlier diagnostic or release failure.
class SHMMUTEX_UTILS_EXPORT FaultedHandleError : public ShmMutexError
{
  public:
    using ShmMutexError::ShmMutexError;
};

/**
 * @brief close/unlink failed for a reason other than "already gone".
 */
class SHMMUTEX_UTILS_EXPORT ReleaseError : public ShmMutexError
{
  public:
    ReleaseError(const std::string &msg, std::error_code ec)
        : ShmMutexError(msg + ": " + ec.message()), code_(ec)
    {
    }

    [[nodiscard]] std::error_code code() const noexcept { return code_; }

  private:
    std::error_code code_;
};

/**
 * @brief A segment that can be neither attached to nor created (e.g. a zero-length artifact).
 *        Needs operator intervention; nothing is unlinked automatically.
 */
class SHMMUTEX_UTILS_EXPORT UnrecoverableSegmentError : public ShmMutexError
{
  public:
    UnrecoverableSegmentError(const std::string &msg, std::error_code ec)
        : ShmMutexError(msg + ": " + ec.message()), code_(ec)
    {
    }

    [[nodiscard]] std::error_code code() const noexcept { return code_; }

  private:
    std::error_code code_;
};

} // namespace shmmutex::utils
