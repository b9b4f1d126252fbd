/*******************************************************************************
 * @file lifecycle.cpp
 * @brief Ordered startup and shutdown of the library's process-wide services.
 *
 * @see include/utils/lifecycle.hpp
 * @see include/utils/module_def.hpp
 *
 * Modules start in the order they were registered; every dependency must already
 * have been registered by then, so cycles cannot be expressed. finalize() runs the
 * shutdown callbacks of the started modules in reverse, on the calling thread.
 ******************************************************************************/
#include "utils/lifecycle.hpp"
#include "utils/module_def.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <mutex>
#include <stdexcept>

namespace
{
void validate_module_name(std::string_view name, const char *param_name)
{
    if (name.empty())
    {
        throw std::invalid_argument(std::string("Lifecycle: ") + param_name +
                                    " must not be empty.");
    }
    if (name.size() > shmmutex::utils::ModuleDef::MAX_MODULE_NAME_LEN)
    {
        throw std::length_error(fmt::format("Lifecycle: {} exceeds maximum of {} characters.",
                                            param_name,
                                            shmmutex::utils::ModuleDef::MAX_MODULE_NAME_LEN));
    }
}

void validate_callback_arg(std::string_view arg)
{
    if (arg.size() > shmmutex::utils::ModuleDef::MAX_CALLBACK_PARAM_STRLEN)
    {
        throw std::length_error(
            fmt::format("Lifecycle: callback argument exceeds maximum of {} characters.",
                        shmmutex::utils::ModuleDef::MAX_CALLBACK_PARAM_STRLEN));
    }
}

std::function<void()> bind_callback(shmmutex::utils::LifecycleCallback func, std::string_view arg)
{
    return [func, a = std::string(arg)]() { func(a.c_str()); };
}

std::function<void()> bind_callback(shmmutex::utils::LifecycleCallback func)
{
    return [func]() { func(nullptr); };
}
} // namespace

namespace shmmutex::utils
{

class ModuleDefImpl
{
  public:
    std::string name;
    std::vector<std::string> dependencies;
    std::function<void()> startup;
    std::function<void()> shutdown;
};

ModuleDef::ModuleDef(std::string_view name) : pImpl(std::make_unique<ModuleDefImpl>())
{
    validate_module_name(name, "module name");
    pImpl->name = std::string(name);
}
ModuleDef::~ModuleDef() = default;
ModuleDef::ModuleDef(ModuleDef &&other) noexcept = default;
ModuleDef &ModuleDef::operator=(ModuleDef &&other) noexcept = default;

void ModuleDef::add_dependency(std::string_view dependency_name)
{
    if (dependency_name.empty())
    {
        return;
    }
    validate_module_name(dependency_name, "dependency name");
    pImpl->dependencies.emplace_back(dependency_name);
}

void ModuleDef::set_startup(LifecycleCallback startup_func)
{
    if (startup_func)
    {
        pImpl->startup = bind_callback(startup_func);
    }
}

void ModuleDef::set_startup(LifecycleCallback startup_func, std::string_view arg)
{
    validate_callback_arg(arg);
    if (startup_func)
    {
        pImpl->startup = bind_callback(startup_func, arg);
    }
}

void ModuleDef::set_shutdown(LifecycleCallback shutdown_func)
{
    if (shutdown_func)
    {
        pImpl->shutdown = bind_callback(shutdown_func);
    }
}

void ModuleDef::set_shutdown(LifecycleCallback shutdown_func, std::string_view arg)
{
    validate_callback_arg(arg);
    if (shutdown_func)
    {
        pImpl->shutdown = bind_callback(shutdown_func, arg);
    }
}

class LifecycleManagerImpl
{
  public:
    LifecycleManagerImpl()
        : m_pid(shmmutex::platform::get_pid()),
          m_app_name(shmmutex::platform::get_executable_name())
    {
    }

    void register_module(ModuleDefImpl def);
    void initialize(std::source_location loc);
    void finalize(std::source_location loc);

    std::atomic<bool> m_is_initialized{false};
    std::atomic<bool> m_is_finalized{false};

  private:
    void check_dependencies_registered_before(std::size_t index) const;
    [[noreturn]] void abort_with(const std::string &msg, const std::string &mod) const;

    const uint64_t m_pid;
    const std::string m_app_name;
    std::mutex m_mutex;
    std::vector<ModuleDefImpl> m_modules;
    std::size_t m_started = 0;
};

void LifecycleManagerImpl::register_module(ModuleDefImpl def)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_is_initialized.load(std::memory_order_acquire))
    {
        SMX_PANIC("[SMX_LifeCycle] EXEC[{}]:PID[{}] register_module('{}') called after "
                  "initialization.",
                  m_app_name, m_pid, def.name);
    }
    m_modules.push_back(std::move(def));
}

void LifecycleManagerImpl::check_dependencies_registered_before(std::size_t index) const
{
    const ModuleDefImpl &mod = m_modules[index];
    const auto earlier_end = m_modules.begin() + static_cast<std::ptrdiff_t>(index);
    for (std::size_t j = 0; j < index; ++j)
    {
        if (m_modules[j].name == mod.name)
        {
            abort_with("Duplicate module name: " + mod.name, mod.name);
        }
    }
    for (const auto &dep : mod.dependencies)
    {
        const bool earlier = std::any_of(m_modules.begin(), earlier_end,
                                         [&](const ModuleDefImpl &m) { return m.name == dep; });
        if (!earlier)
        {
            abort_with(fmt::format("Undefined dependency: {} (must be registered before '{}')",
                                   dep, mod.name),
                       mod.name);
        }
    }
}

void LifecycleManagerImpl::initialize(std::source_location loc)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_is_initialized.exchange(true, std::memory_order_acq_rel))
    {
        return;
    }
    SMX_DEBUG("[SMX_LifeCycle] [{}]:PID[{}] initialize() from {} ({}:{}), {} module(s).",
              m_app_name, m_pid, loc.function_name(),
              shmmutex::format_tools::filename_only(loc.file_name()), loc.line(),
              m_modules.size());

    for (std::size_t i = 0; i < m_modules.size(); ++i)
    {
        check_dependencies_registered_before(i);
        ModuleDefImpl &mod = m_modules[i];
        try
        {
            if (mod.startup)
            {
                mod.startup();
            }
        }
        catch (const std::exception &e)
        {
            abort_with("Exception during startup: " + std::string(e.what()), mod.name);
        }
        m_started = i + 1;
        SMX_DEBUG("[SMX_LifeCycle]   -> started '{}'", mod.name);
    }
}

void LifecycleManagerImpl::finalize(std::source_location loc)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_is_initialized.load(std::memory_order_acquire) ||
        m_is_finalized.exchange(true, std::memory_order_acq_rel))
    {
        return;
    }
    SMX_DEBUG("[SMX_LifeCycle] [{}]:PID[{}] finalize() from {} ({}:{}).", m_app_name, m_pid,
              loc.function_name(), shmmutex::format_tools::filename_only(loc.file_name()),
              loc.line());

    while (m_started > 0)
    {
        ModuleDefImpl &mod = m_modules[--m_started];
        if (!mod.shutdown)
        {
            continue;
        }
        try
        {
            mod.shutdown();
            SMX_DEBUG("[SMX_LifeCycle]   <- stopped '{}'", mod.name);
        }
        catch (const std::exception &e)
        {
            // The remaining modules still get their shutdown.
            fmt::print(stderr, "[SMX_LifeCycle] ERROR: module '{}' threw on shutdown: {}\n",
                       mod.name, e.what());
        }
    }
}

void LifecycleManagerImpl::abort_with(const std::string &msg, const std::string &mod) const
{
    fmt::print(stderr, "\n[SMX_LifeCycle] FATAL: {}. Aborting.\n", msg);
    fmt::print(stderr, "[SMX_LifeCycle] Module '{}' was point of failure.\n", mod);
    shmmutex::debug::print_stack_trace();
    std::fflush(stderr);
    std::abort();
}

LifecycleManager::LifecycleManager() : pImpl(std::make_unique<LifecycleManagerImpl>()) {}
LifecycleManager::~LifecycleManager() = default;

LifecycleManager &LifecycleManager::instance()
{
    static LifecycleManager instance;
    return instance;
}

void LifecycleManager::register_module(ModuleDef &&def)
{
    if (def.pImpl != nullptr)
    {
        pImpl->register_module(std::move(*def.pImpl));
    }
}

void LifecycleManager::initialize(std::source_location loc)
{
    pImpl->initialize(loc);
}

void LifecycleManager::finalize(std::source_location loc)
{
    pImpl->finalize(loc);
}

bool LifecycleManager::is_initialized()
{
    return pImpl->m_is_initialized.load(std::memory_order_acquire);
}

bool LifecycleManager::is_finalized()
{
    return pImpl->m_is_finalized.load(std::memory_order_acquire);
}

} // namespace shmmutex::utils
