/*******************************************************************************
 * @file process_registry.cpp
 * @brief Crash-cleanup bookkeeping for held lock segments.
 *
 * The table is guarded by its own std::mutex. The signal path only try_locks it:
 * a signal delivered while this process is inside add()/remove() skips cleanup
 * rather than deadlocking, and the default disposition still terminates the process.
 *
 * Native segment names are computed in add(), so the signal path neither allocates nor
 * modifies the table: it walks the entries and calls ::shm_unlink on each one.
 ******************************************************************************/
#include "smx_service.hpp"

#include <fmt/ranges.h>

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <map>
#include <mutex>

#if defined(SHMMUTEX_IS_POSIX)
#include <csignal>
#include <cstring>
#include <sys/mman.h> // shm_unlink
#include <unistd.h>
#endif

namespace shmmutex::utils
{

struct ProcessRegistry::Impl
{
    mutable std::mutex mutex;
    // pid -> (lock name -> native segment name)
    std::map<uint64_t, std::map<std::string, std::string>> held;
    bool initialized{false};
    bool handlers_installed{false};
    RegistryOptions options;

    std::map<std::string, std::string> &own_set() { return held[shmmutex::platform::get_pid()]; }
};

namespace
{

ProcessRegistry::Impl *g_registry_impl = nullptr;
std::atomic<bool> g_exit_hook_armed{false};
std::once_flag g_exit_hook_once;

// Caller holds Impl::mutex.
std::size_t unlink_tracked(ProcessRegistry::Impl &impl)
{
    using namespace shmmutex::platform;

    auto it = impl.held.find(get_pid());
    if (it == impl.held.end())
    {
        return 0;
    }

    std::size_t unlinked = 0;
    for (const auto &[name, native] : it->second)
    {
        std::error_code ec;
        ShmHandle h = shm_attach(native.c_str(), ec);
        if (h.valid())
        {
            std::error_code close_ec;
            if (!shm_close(&h, close_ec))
            {
                LOGGER_ERROR("ProcessRegistry: closing '{}' during cleanup failed: {}", name,
                             close_ec.message());
            }
        }
        else if (ec == std::errc::no_such_file_or_directory)
        {
            LOGGER_DEBUG("ProcessRegistry: '{}' already gone at cleanup.", name);
            continue;
        }
        else
        {
            LOGGER_ERROR("ProcessRegistry: attaching '{}' during cleanup failed: {}", name,
                         ec.message());
        }

        std::error_code unlink_ec;
        if (shm_unlink(native.c_str(), unlink_ec))
        {
            ++unlinked;
            LOGGER_WARN("ProcessRegistry: released leftover lock segment '{}'.", name);
        }
        else if (unlink_ec != std::errc::no_such_file_or_directory)
        {
            LOGGER_ERROR("ProcessRegistry: unlinking '{}' during cleanup failed: {}", name,
                         unlink_ec.message());
        }
    }
    impl.held.erase(it);
    return unlinked;
}

void registry_exit_hook()
{
    if (!g_exit_hook_armed.load(std::memory_order_acquire))
    {
        return;
    }
    try
    {
        ProcessRegistry::instance().cleanup();
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "[SMX] ProcessRegistry exit cleanup failed: %s\n", e.what());
    }
}

#if defined(SHMMUTEX_IS_POSIX)
struct sigaction g_prev_sigterm;
struct sigaction g_prev_sigint;

// Async-signal context: no allocation, no logging, no change to the table. Entries stay
// behind; a later cleanup() finds their segments gone and tolerates it.
void unlink_tracked_from_signal(const ProcessRegistry::Impl &impl) noexcept
{
    const auto it = impl.held.find(static_cast<uint64_t>(::getpid()));
    if (it == impl.held.end())
    {
        return;
    }
    for (const auto &entry : it->second)
    {
        (void)::shm_unlink(entry.second.c_str());
    }
}

void registry_signal_handler(int sig)
{
    if (g_registry_impl != nullptr && g_registry_impl->mutex.try_lock())
    {
        unlink_tracked_from_signal(*g_registry_impl);
        g_registry_impl->mutex.unlock();
    }
    // Hand the signal back to whoever handled it before us.
    ::sigaction(sig, sig == SIGTERM ? &g_prev_sigterm : &g_prev_sigint, nullptr);
    ::raise(sig);
}

void install_signal_handlers()
{
    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = registry_signal_handler;
    sigemptyset(&action.sa_mask);
    ::sigaction(SIGTERM, &action, &g_prev_sigterm);
    ::sigaction(SIGINT, &action, &g_prev_sigint);
}

void restore_signal_handlers()
{
    ::sigaction(SIGTERM, &g_prev_sigterm, nullptr);
    ::sigaction(SIGINT, &g_prev_sigint, nullptr);
}
#endif

std::vector<std::string> names_of(const std::map<std::string, std::string> &entries)
{
    std::vector<std::string> names;
    names.reserve(entries.size());
    for (const auto &entry : entries)
    {
        names.push_back(entry.first);
    }
    return names;
}

void do_registry_startup(const char * /*arg*/)
{
    ProcessRegistry::instance().initialize();
}

void do_registry_shutdown(const char * /*arg*/)
{
    ProcessRegistry::instance().teardown(true);
}

} // namespace

ProcessRegistry::ProcessRegistry() : pImpl(std::make_unique<Impl>()) {}
ProcessRegistry::~ProcessRegistry() = default;

ProcessRegistry &ProcessRegistry::instance()
{
    static ProcessRegistry instance;
    return instance;
}

void ProcessRegistry::initialize(const RegistryOptions &options)
{
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (pImpl->initialized)
    {
        return;
    }
    pImpl->options = options;
    g_registry_impl = pImpl.get();

#if defined(SHMMUTEX_IS_POSIX)
    if (options.install_signal_handlers)
    {
        install_signal_handlers();
        pImpl->handlers_installed = true;
    }
#endif
    if (options.install_exit_hook)
    {
        std::call_once(g_exit_hook_once, [] { std::atexit(&registry_exit_hook); });
        g_exit_hook_armed.store(true, std::memory_order_release);
    }
    pImpl->initialized = true;
    LOGGER_DEBUG("ProcessRegistry: initialized for pid {} (signal handlers: {}, exit hook: {}).",
                 shmmutex::platform::get_pid(), options.install_signal_handlers,
                 options.install_exit_hook);
}

void ProcessRegistry::teardown(bool run_cleanup)
{
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (!pImpl->initialized)
    {
        return;
    }

#if defined(SHMMUTEX_IS_POSIX)
    if (pImpl->handlers_installed)
    {
        restore_signal_handlers();
        pImpl->handlers_installed = false;
    }
#endif
    g_exit_hook_armed.store(false, std::memory_order_release);

    if (run_cleanup)
    {
        const std::size_t n = unlink_tracked(*pImpl);
        LOGGER_DEBUG("ProcessRegistry: teardown released {} segment(s).", n);
    }
    else
    {
        auto it = pImpl->held.find(shmmutex::platform::get_pid());
        if (it != pImpl->held.end() && !it->second.empty())
        {
            LOGGER_WARN("ProcessRegistry: teardown without cleanup leaves {} lock(s) tracked: {}",
                        it->second.size(), fmt::join(names_of(it->second), ", "));
        }
    }
    pImpl->held.clear();
    pImpl->initialized = false;
}

bool ProcessRegistry::is_initialized() const
{
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->initialized;
}

void ProcessRegistry::add(const std::string &name)
{
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (!pImpl->initialized)
    {
        return;
    }
    if (!pImpl->own_set().emplace(name, shmmutex::platform::shm_native_name(name)).second)
    {
        throw InternalConsistencyError(fmt::format(
            "ProcessRegistry: '{}' is already recorded as held by pid {}", name,
            shmmutex::platform::get_pid()));
    }
}

bool ProcessRegistry::remove(const std::string &name)
{
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (!pImpl->initialized)
    {
        return false;
    }
    if (pImpl->own_set().erase(name) == 0)
    {
        LOGGER_WARN("ProcessRegistry: remove('{}') for a name that is not tracked.", name);
        return false;
    }
    return true;
}

std::size_t ProcessRegistry::cleanup()
{
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return unlink_tracked(*pImpl);
}

std::vector<std::string> ProcessRegistry::held_names() const
{
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto it = pImpl->held.find(shmmutex::platform::get_pid());
    if (it == pImpl->held.end())
    {
        return {};
    }
    return names_of(it->second);
}

bool ProcessRegistry::contains(const std::string &name) const
{
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto it = pImpl->held.find(shmmutex::platform::get_pid());
    return it != pImpl->held.end() && it->second.count(name) != 0;
}

ModuleDef ProcessRegistry::GetLifecycleModule()
{
    ModuleDef module("shmmutex::utils::ProcessRegistry");
    module.add_dependency("shmmutex::utils::Logger");
    module.set_startup(&do_registry_startup);
    module.set_shutdown(&do_registry_shutdown);
    return module;
}

} // namespace shmmutex::utils
