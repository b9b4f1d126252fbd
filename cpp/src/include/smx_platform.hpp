#pragma once
/**
 * @file smx_platform.hpp
 * @brief Layer 0: Platform detection and the named shared-memory segment primitive.
 *
 * Every file that needs platform macros (SHMMUTEX_PLATFORM_LINUX, SHMMUTEX_IS_POSIX, etc.) or the
 * raw segment calls should include this. It is self-contained and can be included at any point.
 *
 * Prefer build-system macros (PLATFORM_LINUX, etc.); fall back to compiler predefined macros.
 */
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

#if defined(PLATFORM_WIN64)
#define SHMMUTEX_PLATFORM_WIN64 1
#elif defined(PLATFORM_APPLE)
#define SHMMUTEX_PLATFORM_APPLE 1
#elif defined(PLATFORM_FREEBSD)
#define SHMMUTEX_PLATFORM_FREEBSD 1
#elif defined(PLATFORM_LINUX)
#define SHMMUTEX_PLATFORM_LINUX 1
#elif defined(PLATFORM_UNKNOWN)
#define SHMMUTEX_PLATFORM_UNKNOWN 1
#else
// Fallback detection
#if defined(_WIN64)
#define SHMMUTEX_PLATFORM_WIN64 1
#elif defined(__APPLE__) && defined(__MACH__)
#define SHMMUTEX_PLATFORM_APPLE 1
#elif defined(__FreeBSD__)
#define SHMMUTEX_PLATFORM_FREEBSD 1
#elif defined(__linux__)
#define SHMMUTEX_PLATFORM_LINUX 1
#else
#define SHMMUTEX_PLATFORM_UNKNOWN 1
#endif
#endif

#if defined(SHMMUTEX_PLATFORM_WIN64)
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

// Convenience booleans for source code usage:
#if defined(SHMMUTEX_PLATFORM_WIN64)
#define SHMMUTEX_IS_WINDOWS 1
#elif defined(SHMMUTEX_PLATFORM_APPLE) || defined(SHMMUTEX_PLATFORM_FREEBSD) ||                   \
    defined(SHMMUTEX_PLATFORM_LINUX)
#define SHMMUTEX_IS_POSIX 1
#endif

// --- Require C++20 or later --------------------------------------------------
// For GCC/Clang use __cplusplus; for MSVC use _MSVC_LANG (MSVC sets __cplusplus only when
// /Zc:__cplusplus is enabled).
#if defined(_MSC_VER)
#if !defined(_MSVC_LANG) || (_MSVC_LANG < 202002L)
#error "This project requires C++20 or later. Please compile with /std:c++20 or newer (MSVC)."
#endif
#else
#if __cplusplus < 202002L
#error "This project requires C++20 or later. Please compile with -std=c++20 or newer."
#endif
#endif

#include "shmmutex_utils_export.h"

namespace shmmutex::platform
{

// ============================================================================
// Shared Memory (cross-platform abstraction)
// ============================================================================

/**
 * @brief Opaque handle for a mapped shared memory segment.
 * @details Use shm_create() or shm_attach() to obtain; shm_close() to release.
 *          base is the mapped address; size is the segment size in bytes;
 *          opaque holds platform-specific data (do not use directly).
 */
struct ShmHandle
{
    void *base = nullptr;   ///< Mapped address (nullptr if invalid)
    size_t size = 0;        ///< Segment size in bytes
    void *opaque = nullptr; ///< Platform handle (HANDLE on Windows, fd + 1 on POSIX)

    [[nodiscard]] bool valid() const noexcept { return base != nullptr; }
};

/** Flags for shm_create(). Combine with bitwise OR. */
enum ShmCreateFlags : unsigned
{
    SHM_CREATE_NONE = 0,
    /** Create only if segment does not exist; fail with errc::file_exists otherwise. */
    SHM_CREATE_EXCLUSIVE = 1,
};

/**
 * @brief Maps a user-facing segment name to the name the OS expects.
 * @details POSIX requires a single leading slash; Windows uses the name as given.
 */
SHMMUTEX_UTILS_EXPORT std::string shm_native_name(std::string_view name);

/**
 * @brief Creates a new shared memory segment, sizes it and maps it.
 * @param name Native segment name (see shm_native_name()).
 * @param size Size in bytes. The new segment reads as all zero bytes.
 * @param flags SHM_CREATE_EXCLUSIVE to fail when the name already exists.
 * @param ec Cleared on success. On failure holds the errno-style reason, notably
 *           std::errc::file_exists when an exclusive create loses the race.
 * @return ShmHandle with valid() on success.
 * @note If sizing or mapping fails after the name was created, the name is removed again.
 */
SHMMUTEX_UTILS_EXPORT ShmHandle shm_create(const char *name, size_t size, unsigned flags,
                                           std::error_code &ec) noexcept;

/**
 * @brief Attaches to an existing shared memory segment.
 * @param name Native segment name (must match the name used by the creator).
 * @param ec std::errc::no_such_file_or_directory when the name does not exist,
 *           std::errc::invalid_argument when the segment exists but has zero length.
 * @return ShmHandle with valid() on success. Size is populated from the segment.
 */
SHMMUTEX_UTILS_EXPORT ShmHandle shm_attach(const char *name, std::error_code &ec) noexcept;

/**
 * @brief Unmaps and closes a shared memory handle without destroying the segment.
 * @param h Handle to close. After return, h is reset to the empty state.
 * @return false if unmapping or closing reported an error (the handle is still reset).
 */
SHMMUTEX_UTILS_EXPORT bool shm_close(ShmHandle *h, std::error_code &ec) noexcept;

/**
 * @brief Removes the shared memory name (POSIX: shm_unlink; Windows: no-op).
 * @details Existing mappings stay valid until unmapped. A second unlink of the same
 *          name fails with std::errc::no_such_file_or_directory.
 * @return true if the name was removed.
 */
SHMMUTEX_UTILS_EXPORT bool shm_unlink(const char *name, std::error_code &ec) noexcept;

/** @brief Copies @p len bytes from the segment at @p offset; false if out of range. */
SHMMUTEX_UTILS_EXPORT bool shm_read(const ShmHandle &h, size_t offset, void *dst,
                                    size_t len) noexcept;

/** @brief Copies @p len bytes into the segment at @p offset; false if out of range. */
SHMMUTEX_UTILS_EXPORT bool shm_write(ShmHandle &h, size_t offset, const void *src,
                                     size_t len) noexcept;

/**
 * @brief Gets the native thread ID for the calling thread.
 * @return A 64-bit unsigned integer representing the thread ID.
 */
SHMMUTEX_UTILS_EXPORT uint64_t get_native_thread_id() noexcept;
/**
 * @brief Gets the process ID (PID) for the current process.
 */
SHMMUTEX_UTILS_EXPORT uint64_t get_pid() noexcept;
/**
 * @brief Gets the name of the current executable.
 * @param include_path If `true`, returns the full absolute path to the executable.
 *                     If `false` (default), returns only the filename.
 * @return The executable name, or "unknown" on failure.
 */
SHMMUTEX_UTILS_EXPORT std::string get_executable_name(bool include_path = false) noexcept;

SHMMUTEX_UTILS_EXPORT int get_version_major() noexcept;
SHMMUTEX_UTILS_EXPORT int get_version_minor() noexcept;
SHMMUTEX_UTILS_EXPORT int get_version_rolling() noexcept;
/** @brief Full version string, e.g. "0.1.0". */
SHMMUTEX_UTILS_EXPORT const char *get_version_string() noexcept;

/**
 * @brief Checks if a process with the given PID is currently alive.
 * @note PID 0 always returns false. On POSIX, EPERM is treated as "alive".
 */
SHMMUTEX_UTILS_EXPORT bool is_process_alive(uint64_t pid) noexcept;

/**
 * @brief Gets a monotonic timestamp in nanoseconds.
 * @note The absolute value is meaningless; use for computing time deltas only.
 */
SHMMUTEX_UTILS_EXPORT uint64_t monotonic_time_ns() noexcept;

/**
 * @brief Computes elapsed time in nanoseconds since a start timestamp.
 * @param start_ns A previous timestamp from monotonic_time_ns().
 * @note If start_ns is in the future, returns 0.
 */
SHMMUTEX_UTILS_EXPORT uint64_t elapsed_time_ns(uint64_t start_ns) noexcept;

} // namespace shmmutex::platform
