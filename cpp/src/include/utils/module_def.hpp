#pragma once
/**
 * @file module_def.hpp
 * @brief ABI-safe module definition for LifecycleManager registration.
 */
#include "shmmutex_utils_export.h"

#include <cstddef>
#include <memory>
#include <string_view>

// C4251: exported class with a std::unique_ptr to an incomplete Pimpl type.
#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace shmmutex::utils
{

class ModuleDefImpl;
class LifecycleManager;

/**
 * @brief Startup/shutdown callback. A plain function pointer so it can cross shared
 *        library boundaries. `arg` is the string given to set_startup()/set_shutdown(),
 *        or nullptr when none was given.
 */
using LifecycleCallback = void (*)(const char *arg);

/**
 * @class ModuleDef
 * @brief Builder for one lifecycle module: a unique name, its dependencies, and
 *        startup/shutdown callbacks.
 *
 * Movable, not copyable. Ownership moves into the LifecycleManager on registration.
 * Names longer than MAX_MODULE_NAME_LEN are rejected with std::length_error.
 */
class SHMMUTEX_UTILS_EXPORT ModuleDef
{
  public:
    static constexpr size_t MAX_MODULE_NAME_LEN = 256;
    static constexpr size_t MAX_CALLBACK_PARAM_STRLEN = 1024;

    /**
     * @throws std::invalid_argument if `name` is empty.
     * @throws std::length_error     if `name.size() > MAX_MODULE_NAME_LEN`.
     */
    explicit ModuleDef(std::string_view name);
    ~ModuleDef();

    ModuleDef(ModuleDef &&other) noexcept;
    ModuleDef &operator=(ModuleDef &&other) noexcept;
    ModuleDef(const ModuleDef &) = delete;
    ModuleDef &operator=(const ModuleDef &) = delete;

    /**
     * @brief The named module is started before this one and shut down after it.
     * @details An empty name is ignored.
     */
    void add_dependency(std::string_view dependency_name);

    void set_startup(LifecycleCallback startup_func);
    /** @throws std::length_error if `arg.size() > MAX_CALLBACK_PARAM_STRLEN`. */
    void set_startup(LifecycleCallback startup_func, std::string_view arg);

    /** Runs on the thread calling finalize(). A throw is reported and does not stop the
     *  shutdown of the remaining modules. */
    void set_shutdown(LifecycleCallback shutdown_func);
    /** @throws std::length_error if `arg.size() > MAX_CALLBACK_PARAM_STRLEN`. */
    void set_shutdown(LifecycleCallback shutdown_func, std::string_view arg);

  private:
    friend class LifecycleManager;
    std::unique_ptr<ModuleDefImpl> pImpl;
};

} // namespace shmmutex::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
