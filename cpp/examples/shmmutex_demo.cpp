/**
 * @file shmmutex_demo.cpp
 * @brief Example: guarding a critical section shared by several processes.
 *
 * Run two or more copies at once with the same lock name; each one takes the lock,
 * holds it for a while and releases it. Copies that find the lock taken report the
 * owner's token and wait their turn.
 *
 *   shmmutex_demo [lock-name] [hold-ms] [timeout-ms]
 *   shmmutex_demo --config lock.json [hold-ms] [timeout-ms]
 *
 * Key concepts shown:
 *  - LifecycleGuard starting the Logger and the ProcessRegistry; Ctrl-C while holding
 *    the lock still removes the segment.
 *  - ScopedLock with a bounded AcquireTimeout.
 *  - owner_token() to identify who holds a contended lock.
 *  - TimeoutError when throw_on_timeout is requested.
 */
#include "smx_service.hpp"

#include <chrono>
#include <cstdlib>
#include <string>
#include <thread>

using namespace shmmutex::utils;
using namespace std::chrono_literals;

namespace
{

LockConfig config_from_args(int argc, char **argv, int &next_arg)
{
    if (argc > 2 && std::string(argv[1]) == "--config")
    {
        next_arg = 3;
        return LockConfig::from_json_file(argv[2]);
    }
    next_arg = 2;
    LockConfig cfg;
    cfg.name = argc > 1 ? argv[1] : "shmmutex_demo";
    return cfg;
}

void report_owner(const SharedMemoryMutex &mtx)
{
    const auto owner = mtx.owner_token();
    if (!owner)
        LOGGER_INFO("Lock '{}' is free again.", mtx.name());
    else if (owner->is_nil())
        LOGGER_INFO("Lock '{}' is being stamped by its new owner.", mtx.name());
    else
        LOGGER_INFO("Lock '{}' is held by {}.", mtx.name(), *owner);
}

} // namespace

int main(int argc, char **argv)
{
    LifecycleGuard app_lifecycle(
        MakeModDefList(Logger::GetLifecycleModule(), ProcessRegistry::GetLifecycleModule()));

    try
    {
        int next = 0;
        LockConfig cfg = config_from_args(argc, argv, next);
        const auto hold = std::chrono::milliseconds(argc > next ? std::stoi(argv[next]) : 2000);
        const auto wait =
            std::chrono::milliseconds(argc > next + 1 ? std::stoi(argv[next + 1]) : 10000);

        SharedMemoryMutex mtx(cfg);
        LOGGER_INFO("PID {} using {}", shmmutex::platform::get_pid(), mtx.to_string());

        if (mtx.owner_token())
            report_owner(mtx);

        ScopedLock lock(mtx, AcquireTimeout::after(wait), /*throw_on_timeout=*/true);
        LOGGER_INFO("Entered the critical section as {}; holding for {} ms.", mtx.token(),
                    hold.count());
        std::this_thread::sleep_for(hold);
        lock.unlock();
        LOGGER_INFO("Left the critical section.");
    }
    catch (const TimeoutError &e)
    {
        LOGGER_WARN("Gave up waiting: {}", e.what());
        return 2;
    }
    catch (const ShmMutexError &e)
    {
        LOGGER_ERROR("Lock failure: {}", e.what());
        return 1;
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("Bad arguments: {}", e.what());
        return 1;
    }
    return 0;
}
