// tests/test_layer2_service/workers/lifecycle_workers.h
#pragma once
#include <string>

/**
 * @file lifecycle_workers.h
 * @brief Worker processes for LifecycleManager tests.
 *
 * Every scenario drives the process-wide lifecycle itself, so each one needs a fresh
 * process. Scenarios expected to abort do so from inside the lifecycle.
 */
namespace shmmutex::tests::worker
{
namespace lifecycle
{
int startup_and_shutdown_order();
int init_and_finalize_idempotent();
int second_guard_is_not_owner();
int register_after_init_aborts();
int unresolved_dependency_aborts();
int dependency_registered_later_aborts();
int duplicate_module_aborts();
int shutdown_exception_does_not_stop_the_rest();
int startup_exception_aborts();
int registry_requires_logger();

/// Starts Logger and ProcessRegistry, leaks a held lock, finalizes, checks the segment is gone.
int finalize_releases_held_locks(const std::string &lock_name);
} // namespace lifecycle
} // namespace shmmutex::tests::worker
