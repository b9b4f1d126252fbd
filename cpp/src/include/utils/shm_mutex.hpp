#pragma once
/**
 * @file shm_mutex.hpp
 * @brief Cross-process mutex over a named shared-memory segment.
 *
 * The exclusive create of a 16-byte segment named after the lock is the only
 * synchronization primitive: whichever handle creates it owns the lock, stamps its
 * LockToken into it, and records the name in the ProcessRegistry. Releasing unlinks the
 * segment. There is no fairness among waiters.
 *
 * A handle belongs to one thread of control and is not reentrant: acquire() on a handle
 * that already holds the lock throws DeadlockError. Use a std::mutex for exclusion between
 * threads of one process.
 *
 * @code
 *   SharedMemoryMutex mtx(LockConfig{.name = "instrument.bus"});
 *   if (mtx.acquire(AcquireTimeout::after(std::chrono::seconds(1))))
 *   {
 *       ... // exclusive across processes
 *       mtx.release();
 *   }
 * @endcode
 *
 * ## Interrupted acquisition
 *
 * If anything throws between the create and the registry record (see InterruptPoint),
 * the local mapping is closed without unlinking and diagnose_interrupted_acquire()
 * classifies what was left. A benign verdict rethrows the original exception unchanged. A
 * raising verdict throws the diagnostic error with the original nested inside
 * (std::rethrow_if_nested recovers it) and leaves the handle Faulted.
 */
#include "shmmutex_utils_export.h"
#include "utils/cancellation_signal.hpp"
#include "utils/dangling_diagnostic.hpp"
#include "utils/lock_config.hpp"
#include "utils/lock_token.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace shmmutex::utils
{

enum class LockState
{
    Idle,
    Acquiring,
    Held,
    Releasing,
    Faulted // terminal; needs external remediation
};

SHMMUTEX_UTILS_EXPORT const char *to_string(LockState s) noexcept;

/// Points inside the acquisition window where an interrupt hook runs.
enum class InterruptPoint
{
    AfterCreate, // segment created, not yet stamped
    AfterStamp   // token written, not yet recorded in the registry
};

SHMMUTEX_UTILS_EXPORT const char *to_string(InterruptPoint p) noexcept;

/// Exception type for hooks that simulate an abrupt abort of acquire().
class SHMMUTEX_UTILS_EXPORT AcquisitionInterrupted : public std::runtime_error
{
  public:
    explicit AcquisitionInterrupted(InterruptPoint point);
    [[nodiscard]] InterruptPoint point() const noexcept { return point_; }

  private:
    InterruptPoint point_;
};

using InterruptHook = std::function<void(InterruptPoint)>;

class SHMMUTEX_UTILS_EXPORT SharedMemoryMutex
{
  public:
    /**
     * @param cancel Shared cancellation signal; a private one is created when null.
     * @throws ConfigurationError if @p config fails LockConfig::validate().
     */
    explicit SharedMemoryMutex(LockConfig config,
                               std::shared_ptr<CancellationSignal> cancel = nullptr);

    /// Releases a held lock; a ReleaseError is logged, not thrown.
    ~SharedMemoryMutex();

    SharedMemoryMutex(const SharedMemoryMutex &) = delete;
    SharedMemoryMutex &operator=(const SharedMemoryMutex &) = delete;
    SharedMemoryMutex(SharedMemoryMutex &&) = delete;
    SharedMemoryMutex &operator=(SharedMemoryMutex &&) = delete;

    /// acquire() with the configured default timeout.
    bool acquire();

    /**
     * @brief Races for the lock until it is won, the timeout elapses, or the cancellation
     *        signal is set.
     *
     * At least one create attempt is made unless the signal is already set. Between
     * attempts the handle sleeps min(poll interval, remaining time) on the signal.
     *
     * @return true if the lock is now held, false on conflict, timeout or cancellation.
     * @throws DeadlockError      if this handle already holds the lock.
     * @throws FaultedHandleError if the handle is Faulted.
     * @throws UnrecoverableSegmentError if the create fails for a reason other than conflict.
     */
    bool acquire(AcquireTimeout timeout);

    /**
     * @brief Closes and unlinks the held segment and forgets it in the registry.
     * @return false if nothing was held. A segment already unlinked elsewhere counts as
     *         released.
     * @throws ReleaseError if close or unlink fails otherwise; the handle becomes Faulted.
     */
    bool release();

    /**
     * @brief Token currently stamped in the named segment, without creating it.
     * @return nullopt if no segment exists; the nil token if it exists unstamped.
     * @throws UnrecoverableSegmentError for any other attach failure.
     */
    [[nodiscard]] std::optional<LockToken> owner_token() const;

    /// Invoked at each InterruptPoint of every acquisition; pass nullptr to remove.
    void set_interrupt_hook(InterruptHook hook);
    void set_diagnostic_policy(const DiagnosticPolicy &policy);

    [[nodiscard]] const std::string &name() const noexcept;
    [[nodiscard]] const std::string &native_name() const noexcept;
    [[nodiscard]] std::chrono::milliseconds poll_interval() const noexcept;
    [[nodiscard]] bool is_held() const noexcept;
    [[nodiscard]] LockState state() const noexcept;
    [[nodiscard]] const LockToken &token() const noexcept;
    [[nodiscard]] const std::shared_ptr<CancellationSignal> &cancellation_signal() const noexcept;
    [[nodiscard]] const LockConfig &config() const noexcept;
    [[nodiscard]] std::string to_string() const;

  private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

/**
 * @class ScopedLock
 * @brief Acquires on construction, releases on every exit path.
 *
 * Without @p throw_on_timeout, check owns_lock() before touching the resource.
 */
class SHMMUTEX_UTILS_EXPORT ScopedLock
{
  public:
    /** @throws TimeoutError if @p throw_on_timeout and the lock was not acquired. */
    explicit ScopedLock(SharedMemoryMutex &mutex, bool throw_on_timeout = false);
    ScopedLock(SharedMemoryMutex &mutex, AcquireTimeout timeout, bool throw_on_timeout = false);
    ~ScopedLock();

    ScopedLock(const ScopedLock &) = delete;
    ScopedLock &operator=(const ScopedLock &) = delete;

    [[nodiscard]] bool owns_lock() const noexcept { return owns_; }
    explicit operator bool() const noexcept { return owns_; }

    /// Releases early so a ReleaseError reaches the caller instead of the log.
    void unlock();

  private:
    SharedMemoryMutex &mutex_;
    bool owns_{false};
};

} // namespace shmmutex::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
