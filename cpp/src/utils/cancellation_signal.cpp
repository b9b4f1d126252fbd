#include "utils/cancellation_signal.hpp"

namespace shmmutex::utils
{

void CancellationSignal::set()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        set_ = true;
    }
    cv_.notify_all();
}

void CancellationSignal::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    set_ = false;
}

bool CancellationSignal::is_set() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return set_;
}

bool CancellationSignal::wait_for(std::chrono::nanoseconds timeout)
{
    std::unique_lock<std::mutex> lock(mutex_);
    if (timeout <= std::chrono::nanoseconds::zero())
    {
        return set_;
    }
    return cv_.wait_for(lock, timeout, [this] { return set_; });
}

} // namespace shmmutex::utils
