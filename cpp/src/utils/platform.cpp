/**
 * @file platform.cpp
 * @brief Cross-platform implementations for the OS-specific utilities of layer 0.
 *
 * This file contains the platform-specific logic for functions declared in the
 * `shmmutex::platform` namespace: the named shared-memory segment primitive used by the
 * lock, process and thread ids, the executable path, and package version information.
 * Preprocessor directives select the implementation for Windows, macOS, Linux, and other
 * POSIX-compliant systems.
 */
#include "smx_base.hpp"
#include "shmmutex_version.h"

#include <chrono>
#include <cstring>
#include <filesystem>
#include <thread>
#include <vector>

#if defined(SHMMUTEX_IS_POSIX)
#include <cerrno>
#include <fcntl.h>    // For O_CREAT, O_RDWR, O_EXCL
#include <limits.h>   // PATH_MAX
#include <signal.h>   // For kill
#include <sys/mman.h> // For shm_open, mmap, munmap
#include <sys/stat.h> // For fstat
#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>
#endif

#ifdef SHMMUTEX_PLATFORM_FREEBSD
#include <sys/sysctl.h>
#endif

#if defined(SHMMUTEX_PLATFORM_APPLE)
#include <libproc.h>     // proc_pidpath
#include <mach-o/dyld.h> // _NSGetExecutablePath
#endif

#include <fmt/core.h>
#include <fmt/format.h>

namespace shmmutex::platform
{

uint64_t get_pid() noexcept
{
#if defined(SHMMUTEX_PLATFORM_WIN64)
    return static_cast<uint64_t>(GetCurrentProcessId());
#else
    return static_cast<uint64_t>(getpid());
#endif
}

/**
 * @brief Gets a platform-native thread ID.
 * @details Uses the most efficient OS-specific API available (`GetCurrentThreadId`,
 *          `pthread_threadid_np`, `syscall(SYS_gettid)`).
 */
uint64_t get_native_thread_id() noexcept
{
#if defined(SHMMUTEX_PLATFORM_WIN64)
    return static_cast<uint64_t>(::GetCurrentThreadId());
#elif defined(__APPLE__)
    uint64_t tid;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#elif defined(__linux__)
    return static_cast<uint64_t>(syscall(SYS_gettid));
#else
    return std::hash<std::thread::id>()(std::this_thread::get_id());
#endif
}

std::string get_executable_name(bool include_path) noexcept
{
    try
    {
        std::string full_path;
#if defined(SHMMUTEX_PLATFORM_WIN64)
        std::vector<wchar_t> buf(MAX_PATH);
        DWORD len = 0;
        for (;;)
        {
            len = GetModuleFileNameW(nullptr, buf.data(), static_cast<DWORD>(buf.size()));
            if (len == 0)
            {
                return "unknown_win";
            }
            if (len < buf.size() - 1)
            {
                break;
            }
            buf.resize(buf.size() * 2);
        }
        full_path = std::filesystem::path(std::wstring(buf.data(), len)).string();

#elif defined(SHMMUTEX_PLATFORM_LINUX)
        std::vector<char> buf(PATH_MAX);
        ssize_t count = readlink("/proc/self/exe", buf.data(), buf.size());
        if (count == -1)
        {
            return "unknown_linux";
        }
        full_path.assign(buf.data(), static_cast<size_t>(count));

#elif defined(SHMMUTEX_PLATFORM_APPLE)
        uint32_t size = 0;
        if (_NSGetExecutablePath(nullptr, &size) == -1 && size > 0)
        {
            std::vector<char> buf(size);
            if (_NSGetExecutablePath(buf.data(), &size) == 0)
            {
                char resolved[PATH_MAX];
                full_path = realpath(buf.data(), resolved) != nullptr ? resolved : buf.data();
            }
        }
        if (full_path.empty())
        {
            char procbuf[PROC_PIDPATHINFO_MAXSIZE];
            if (proc_pidpath(getpid(), procbuf, sizeof(procbuf)) > 0)
            {
                full_path = procbuf;
            }
        }
        if (full_path.empty())
        {
            return "unknown_macos";
        }
#elif defined(SHMMUTEX_PLATFORM_FREEBSD)
        int mib[4] = {CTL_KERN, KERN_PROC, KERN_PROC_PATHNAME, -1};
        size_t buffer_size = 0;
        if (sysctl(mib, 4, nullptr, &buffer_size, nullptr, 0) == -1)
        {
            return "unknown_freebsd";
        }
        std::vector<char> buf(buffer_size);
        if (sysctl(mib, 4, buf.data(), &buffer_size, nullptr, 0) == -1)
        {
            return "unknown_freebsd";
        }
        full_path.assign(buf.data(), buffer_size - 1);
#else
        (void)include_path;
        return "unknown";
#endif

        if (include_path)
        {
            return full_path;
        }
        return std::filesystem::path(full_path).filename().string();
    }
    catch (const std::exception &e)
    {
        // std::filesystem operations can throw on invalid paths.
        fmt::print(stderr, "Warning: get_executable_name failed: {}.\n", e.what());
    }
    return "unknown";
}

// --- Version information (from shmmutex_version.h, generated at configure time) ---

int get_version_major() noexcept
{
    return SHMMUTEX_VERSION_MAJOR;
}

int get_version_minor() noexcept
{
    return SHMMUTEX_VERSION_MINOR;
}

int get_version_rolling() noexcept
{
    return SHMMUTEX_VERSION_ROLLING;
}

const char *get_version_string() noexcept
{
    return SHMMUTEX_VERSION_STRING;
}

/**
 * @brief Checks if a process with the given PID is currently alive.
 * @details POSIX: kill(pid, 0). ESRCH means dead; EPERM means alive but not ours.
 *          Windows: OpenProcess() + GetExitCodeProcess() == STILL_ACTIVE.
 */
bool is_process_alive(uint64_t pid) noexcept
{
    if (pid == 0)
    {
        return false;
    }

#if defined(SHMMUTEX_PLATFORM_WIN64)
    HANDLE process = OpenProcess(PROCESS_QUERY_INFORMATION, FALSE, static_cast<DWORD>(pid));
    if (process == NULL)
    {
        return GetLastError() != ERROR_INVALID_PARAMETER;
    }
    DWORD exitCode = 0;
    BOOL result = GetExitCodeProcess(process, &exitCode);
    CloseHandle(process);
    return result && exitCode == STILL_ACTIVE;
#else
    if (kill(static_cast<pid_t>(pid), 0) == 0)
    {
        return true;
    }
    return errno != ESRCH;
#endif
}

uint64_t monotonic_time_ns() noexcept
{
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
                                     std::chrono::steady_clock::now().time_since_epoch())
                                     .count());
}

uint64_t elapsed_time_ns(uint64_t start_ns) noexcept
{
    uint64_t now = monotonic_time_ns();
    if (now < start_ns)
    {
        return 0;
    }
    return now - start_ns;
}

// ============================================================================
// Shared Memory
// ============================================================================

namespace
{
inline std::error_code last_error() noexcept
{
#if defined(SHMMUTEX_PLATFORM_WIN64)
    return std::error_code(static_cast<int>(GetLastError()), std::system_category());
#else
    return std::error_code(errno, std::generic_category());
#endif
}
} // namespace

bool shm_read(const ShmHandle &h, size_t offset, void *dst, size_t len) noexcept
{
    if (!h.valid() || dst == nullptr || offset > h.size || len > h.size - offset)
    {
        return false;
    }
    std::memcpy(dst, static_cast<const char *>(h.base) + offset, len);
    return true;
}

bool shm_write(ShmHandle &h, size_t offset, const void *src, size_t len) noexcept
{
    if (!h.valid() || src == nullptr || offset > h.size || len > h.size - offset)
    {
        return false;
    }
    std::memcpy(static_cast<char *>(h.base) + offset, src, len);
    return true;
}

#if defined(SHMMUTEX_PLATFORM_WIN64)

std::string shm_native_name(std::string_view name)
{
    return std::string(name);
}

ShmHandle shm_create(const char *name, size_t size, unsigned flags, std::error_code &ec) noexcept
{
    ec.clear();
    ShmHandle h{};
    if (!name || size == 0)
    {
        ec = std::make_error_code(std::errc::invalid_argument);
        return h;
    }
    HANDLE mapping = CreateFileMappingA(INVALID_HANDLE_VALUE, NULL, PAGE_READWRITE, 0,
                                        static_cast<DWORD>(size), name);
    if (mapping == NULL)
    {
        ec = last_error();
        return h;
    }
    if ((flags & SHM_CREATE_EXCLUSIVE) != 0 && GetLastError() == ERROR_ALREADY_EXISTS)
    {
        CloseHandle(mapping);
        ec = std::make_error_code(std::errc::file_exists);
        return h;
    }
    void *base = MapViewOfFile(mapping, FILE_MAP_ALL_ACCESS, 0, 0, size);
    if (base == NULL)
    {
        ec = last_error();
        CloseHandle(mapping);
        return h;
    }
    h.base = base;
    h.size = size;
    h.opaque = mapping;
    return h;
}

ShmHandle shm_attach(const char *name, std::error_code &ec) noexcept
{
    ec.clear();
    ShmHandle h{};
    if (!name)
    {
        ec = std::make_error_code(std::errc::invalid_argument);
        return h;
    }
    HANDLE mapping = OpenFileMappingA(FILE_MAP_READ | FILE_MAP_WRITE, FALSE, name);
    if (mapping == NULL)
    {
        ec = GetLastError() == ERROR_FILE_NOT_FOUND
                 ? std::make_error_code(std::errc::no_such_file_or_directory)
                 : last_error();
        return h;
    }
    void *base = MapViewOfFile(mapping, FILE_MAP_READ | FILE_MAP_WRITE, 0, 0, 0);
    if (base == NULL)
    {
        ec = last_error();
        CloseHandle(mapping);
        return h;
    }
    MEMORY_BASIC_INFORMATION mbi;
    if (VirtualQuery(base, &mbi, sizeof(mbi)) == 0)
    {
        ec = last_error();
        UnmapViewOfFile(base);
        CloseHandle(mapping);
        return h;
    }
    h.base = base;
    h.size = mbi.RegionSize;
    h.opaque = mapping;
    return h;
}

bool shm_close(ShmHandle *handle, std::error_code &ec) noexcept
{
    ec.clear();
    if (!handle)
    {
        return true;
    }
    if (handle->base && !UnmapViewOfFile(handle->base))
    {
        ec = last_error();
    }
    if (handle->opaque && !CloseHandle(static_cast<HANDLE>(handle->opaque)) && !ec)
    {
        ec = last_error();
    }
    *handle = ShmHandle{};
    return !ec;
}

bool shm_unlink(const char * /*name*/, std::error_code &ec) noexcept
{
    // Windows: no explicit unlink; name is released when last handle closes.
    ec.clear();
    return true;
}

#else // POSIX

namespace
{
// The descriptor is stored off by one so that fd 0 is distinguishable from "no handle".
inline void *fd_to_opaque(int fd) noexcept
{
    return reinterpret_cast<void *>(static_cast<intptr_t>(fd) + 1);
}

inline int opaque_to_fd(void *opaque) noexcept
{
    return static_cast<int>(reinterpret_cast<intptr_t>(opaque) - 1);
}
} // namespace

std::string shm_native_name(std::string_view name)
{
    if (!name.empty() && name.front() == '/')
    {
        return std::string(name);
    }
    std::string native;
    native.reserve(name.size() + 1);
    native.push_back('/');
    native.append(name);
    return native;
}

ShmHandle shm_create(const char *name, size_t size, unsigned flags, std::error_code &ec) noexcept
{
    ec.clear();
    ShmHandle h{};
    if (!name || size == 0)
    {
        ec = std::make_error_code(std::errc::invalid_argument);
        return h;
    }
    int open_flags = O_CREAT | O_RDWR;
    if ((flags & SHM_CREATE_EXCLUSIVE) != 0)
    {
        open_flags |= O_EXCL;
    }
    int fd = ::shm_open(name, open_flags, 0666);
    if (fd == -1)
    {
        ec = last_error();
        return h;
    }
    if (ftruncate(fd, static_cast<off_t>(size)) == -1)
    {
        ec = last_error();
        ::close(fd);
        ::shm_unlink(name);
        return h;
    }
    void *base = mmap(NULL, size, PROT_READ | PROT_WRITE, MAP_SHARED, fd, 0);
    if (base == MAP_FAILED)
    {
        ec = last_error();
        ::close(fd);
        ::shm_unlink(name);
        return h;
    }
    h.base = base;
    h.size = size;
    h.opaque = fd_to_opaque(fd);
    return h;
}

ShmHandle shm_attach(const char *name, std::error_code &ec) noexcept
{
    ec.clear();
    ShmHandle h{};
    if (!name)
    {
        ec = std::make_error_code(std::errc::invalid_argument);
        return h;
    }
    int fd = ::shm_open(name, O_RDWR, 0666);
    if (fd == -1)
    {
        ec = last_error();
        return h;
    }
    struct stat st;
    if (fstat(fd, &st) == -1)
    {
        ec = last_error();
        ::close(fd);
        return h;
    }
    const auto size = static_cast<size_t>(st.st_size);
    if (size == 0)
    {
        // Created but never sized: nothing can be mapped.
        ec = std::make_error_code(std::errc::invalid_argument);
        ::close(fd);
        return h;
    }
    void *base = mmap(NULL, size, PROT_READ | PROT_WRITE, MAP_SHARED, fd, 0);
    if (base == MAP_FAILED)
    {
        ec = last_error();
        ::close(fd);
        return h;
    }
    h.base = base;
    h.size = size;
    h.opaque = fd_to_opaque(fd);
    return h;
}

bool shm_close(ShmHandle *handle, std::error_code &ec) noexcept
{
    ec.clear();
    if (!handle)
    {
        return true;
    }
    if (handle->base && handle->size > 0 && munmap(handle->base, handle->size) == -1)
    {
        ec = last_error();
    }
    if (handle->opaque && ::close(opaque_to_fd(handle->opaque)) == -1 && !ec)
    {
        ec = last_error();
    }
    *handle = ShmHandle{};
    return !ec;
}

bool shm_unlink(const char *name, std::error_code &ec) noexcept
{
    ec.clear();
    if (!name)
    {
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }
    if (::shm_unlink(name) == -1)
    {
        ec = last_error();
        return false;
    }
    return true;
}

#endif

} // namespace shmmutex::platform
