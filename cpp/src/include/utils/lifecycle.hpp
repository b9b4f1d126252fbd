#pragma once
/**
 * @file lifecycle.hpp
 * @brief Dependency-ordered startup and shutdown of the library's process-wide services.
 *
 * Modules (Logger, ProcessRegistry, or application-defined ones) are described with
 * ModuleDef, registered before initialization, started in registration order and
 * shut down in reverse. A dependency must be registered before the module naming it.
 * A module whose startup throws, a duplicate name or a dependency not registered
 * earlier is a fatal programming error: the manager reports it and aborts.
 *
 * The usual entry point is LifecycleGuard at the top of main():
 * @code
 *   int main() {
 *       shmmutex::utils::LifecycleGuard guard(shmmutex::utils::MakeModDefList(
 *           shmmutex::utils::Logger::GetLifecycleModule(),
 *           shmmutex::utils::ProcessRegistry::GetLifecycleModule()));
 *       ...
 *   } // modules shut down here
 * @endcode
 */
#include "smx_base.hpp"

#include <atomic>
#include <memory>
#include <source_location>
#include <type_traits>
#include <utility>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace shmmutex::utils
{

class LifecycleManagerImpl;

/// @brief Builds a vector<ModuleDef> by moving the supplied definitions.
template <typename... Mods> inline std::vector<ModuleDef> MakeModDefList(Mods &&...mods)
{
    static_assert((std::is_same_v<std::decay_t<Mods>, ModuleDef> && ...),
                  "MakeModDefList: all arguments must be ModuleDef (rvalues or prvalues)");

    std::vector<ModuleDef> modules;
    modules.reserve(sizeof...(mods));
    (modules.emplace_back(std::forward<Mods>(mods)), ...);
    return modules;
}

/**
 * @class LifecycleManager
 * @brief Process-wide singleton owning the registered modules.
 *
 * initialize() and finalize() are idempotent. Registration after initialize() panics.
 */
class SHMMUTEX_UTILS_EXPORT LifecycleManager
{
  public:
    static LifecycleManager &instance();

    void register_module(ModuleDef &&module_def);
    void initialize(std::source_location loc);
    void finalize(std::source_location loc);

    [[nodiscard]] bool is_initialized();
    [[nodiscard]] bool is_finalized();

    LifecycleManager(const LifecycleManager &) = delete;
    LifecycleManager &operator=(const LifecycleManager &) = delete;

  private:
    LifecycleManager();
    ~LifecycleManager();

    std::unique_ptr<LifecycleManagerImpl> pImpl;
};

inline void RegisterModule(ModuleDef &&module_def)
{
    LifecycleManager::instance().register_module(std::move(module_def));
}

inline bool IsAppInitialized()
{
    return LifecycleManager::instance().is_initialized();
}

inline bool IsAppFinalized()
{
    return LifecycleManager::instance().is_finalized();
}

inline void InitializeApp(std::source_location loc = std::source_location::current())
{
    LifecycleManager::instance().initialize(loc);
}

inline void FinalizeApp(std::source_location loc = std::source_location::current())
{
    LifecycleManager::instance().finalize(loc);
}

/**
 * @class LifecycleGuard
 * @brief RAII owner of the application lifecycle.
 *
 * The first guard constructed in a process registers its modules and initializes the
 * application; its destructor finalizes. Later guards are no-ops and their modules are
 * ignored.
 */
class LifecycleGuard
{
  private:
    std::source_location m_loc;

  public:
    LifecycleGuard(std::source_location loc = std::source_location::current()) : m_loc(loc)
    {
        init_owner_if_first({});
    }

    explicit LifecycleGuard(ModuleDef &&module,
                            std::source_location loc = std::source_location::current())
        : m_loc(loc)
    {
        std::vector<ModuleDef> modules;
        modules.emplace_back(std::move(module));
        init_owner_if_first(std::move(modules));
    }

    explicit LifecycleGuard(std::vector<ModuleDef> &&modules,
                            std::source_location loc = std::source_location::current())
        : m_loc(loc)
    {
        init_owner_if_first(std::move(modules));
    }

    LifecycleGuard(const LifecycleGuard &) = delete;
    LifecycleGuard &operator=(const LifecycleGuard &) = delete;
    LifecycleGuard(LifecycleGuard &&) = delete;
    LifecycleGuard &operator=(LifecycleGuard &&) = delete;

    ~LifecycleGuard() noexcept
    {
        if (m_is_owner)
        {
            SMX_DEBUG("[SMX_LifeCycle] LifecycleGuard from {} ({}:{}) finalizing.",
                      m_loc.function_name(),
                      shmmutex::format_tools::filename_only(m_loc.file_name()), m_loc.line());
            shmmutex::utils::FinalizeApp(m_loc);
        }
    }

    [[nodiscard]] bool is_owner() const noexcept { return m_is_owner; }

  private:
    static std::atomic_bool &owner_flag()
    {
        static std::atomic_bool flag{false};
        return flag;
    }

    void init_owner_if_first(std::vector<ModuleDef> &&modules)
    {
        bool expected = false;
        if (owner_flag().compare_exchange_strong(expected, true, std::memory_order_acq_rel))
        {
            m_is_owner = true;
            for (auto &m : modules)
            {
                shmmutex::utils::RegisterModule(std::move(m));
            }
            // Always initialize, even with no modules, so the lifecycle starts with the first guard.
            shmmutex::utils::InitializeApp(m_loc);
        }
        else
        {
            m_is_owner = false;
            SMX_DEBUG("[SMX_LifeCycle] [{}:{}] WARNING: LifecycleGuard in {} ({}:{}) is not the "
                      "owner; its modules were ignored.",
                      shmmutex::platform::get_executable_name(), shmmutex::platform::get_pid(),
                      m_loc.function_name(),
                      shmmutex::format_tools::filename_only(m_loc.file_name()), m_loc.line());
        }
    }

    bool m_is_owner{false};
};

} // namespace shmmutex::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
