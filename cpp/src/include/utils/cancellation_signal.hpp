#pragma once
/**
 * @file cancellation_signal.hpp
 * @brief Settable, clearable, waitable flag shared between lock handles.
 *
 * Setting the signal wakes every handle currently polling against this instance,
 * whatever its timeout. Handles share one instance through std::shared_ptr.
 */
#include "shmmutex_utils_export.h"

#include <chrono>
#include <condition_variable>
#include <mutex>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace shmmutex::utils
{

class SHMMUTEX_UTILS_EXPORT CancellationSignal
{
  public:
    CancellationSignal() = default;
    CancellationSignal(const CancellationSignal &) = delete;
    CancellationSignal &operator=(const CancellationSignal &) = delete;

    void set();
    void clear();
    [[nodiscard]] bool is_set() const;

    /**
     * @brief Sleeps up to @p timeout.
     * @return true as soon as the signal is (or already was) set, false on timeout.
     */
    bool wait_for(std::chrono::nanoseconds timeout);

  private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool set_{false};
};

} // namespace shmmutex::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
