#pragma once
/**
 * @file process_registry.hpp
 * @brief Process-wide record of held lock names, drained when the process terminates.
 *
 * SharedMemoryMutex adds a name on successful acquire and removes it on release. If the
 * process dies while holding a lock, cleanup() unlinks every segment still recorded so
 * other processes can acquire the name again.
 *
 * Entries are keyed by process id: a child created with fork() starts with an empty set
 * and never unlinks segments its parent holds.
 *
 * ## Activation
 *
 * The registry is inert until initialize() runs; add() and remove() are no-ops before
 * that. Usually it is started as a lifecycle module:
 * @code
 *   LifecycleGuard guard(MakeModDefList(Logger::GetLifecycleModule(),
 *                                       ProcessRegistry::GetLifecycleModule()));
 * @endcode
 * With the default options, SIGTERM and SIGINT run cleanup() and are then re-raised with
 * the previous disposition, and an atexit hook runs cleanup() on normal exit.
 */
#include "shmmutex_utils_export.h"
#include "utils/module_def.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace shmmutex::utils
{

struct RegistryOptions
{
    /// SIGTERM/SIGINT run cleanup() and then re-raise (POSIX only).
    bool install_signal_handlers{true};
    /// An atexit hook runs cleanup() on normal process exit.
    bool install_exit_hook{true};
};

class SHMMUTEX_UTILS_EXPORT ProcessRegistry
{
  public:
    static ProcessRegistry &instance();

    /// Module "shmmutex::utils::ProcessRegistry"; depends on the Logger module.
    static ModuleDef GetLifecycleModule();

    /// Idempotent. A second call keeps the options of the first.
    void initialize(const RegistryOptions &options = {});

    /**
     * @brief Restores signal dispositions and disarms the exit hook.
     * @param run_cleanup Unlink every tracked segment first. Without it, tracked names
     *                    are dropped with a warning.
     */
    void teardown(bool run_cleanup);

    [[nodiscard]] bool is_initialized() const;

    /** @throws InternalConsistencyError if @p name is already tracked for this process. */
    void add(const std::string &name);

    /// @return false (with a warning) if @p name was not tracked.
    bool remove(const std::string &name);

    /**
     * @brief Best-effort attach, close and unlink of every tracked name, tolerating
     *        segments that are already gone. Failures are logged, not thrown.
     * @return Number of segments actually unlinked.
     */
    std::size_t cleanup();

    [[nodiscard]] std::vector<std::string> held_names() const;
    [[nodiscard]] bool contains(const std::string &name) const;

    ProcessRegistry(const ProcessRegistry &) = delete;
    ProcessRegistry &operator=(const ProcessRegistry &) = delete;

    struct Impl;

  private:
    ProcessRegistry();
    ~ProcessRegistry();

    std::unique_ptr<Impl> pImpl;
};

} // namespace shmmutex::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
