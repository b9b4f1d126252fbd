/**
 * @file debug_info.cpp
 * @brief Stack trace printing for panic().
 *
 * POSIX: backtrace() for the frames, dladdr() + abi::__cxa_demangle for readable symbols.
 * Windows: CaptureStackBackTrace() addresses only.
 */
#include "smx_base.hpp"

#if defined(SHMMUTEX_IS_POSIX)
#include <cxxabi.h>   // __cxa_demangle
#include <dlfcn.h>    // dladdr
#include <execinfo.h> // backtrace
#endif

#include <memory>

namespace shmmutex::debug
{

namespace
{
template <typename... Args>
void safe_format_to_stderr(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        fmt::print(stderr, fmt_str, std::forward<Args>(args)...);
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "[stack trace formatting failed: %s]\n", e.what());
    }
}

#if defined(SHMMUTEX_IS_POSIX)
struct FreeDeleter
{
    void operator()(void *p) const noexcept { std::free(p); }
};

std::string demangle(const char *mangled)
{
    int status = 0;
    std::unique_ptr<char, FreeDeleter> dem(
        abi::__cxa_demangle(mangled, nullptr, nullptr, &status));
    if (status == 0 && dem)
    {
        return dem.get();
    }
    return mangled;
}
#endif
} // namespace

void print_stack_trace() noexcept
{
    safe_format_to_stderr("Stack Trace (most recent call first):\n");
#if defined(SHMMUTEX_PLATFORM_WIN64)
    constexpr int kMaxFrames = 62;
    void *frames[kMaxFrames] = {nullptr};
    USHORT captured = CaptureStackBackTrace(0, kMaxFrames, frames, nullptr);
    for (USHORT i = 0; i < captured; ++i)
    {
        safe_format_to_stderr("  #{:02}  {:#018x}\n", i,
                              reinterpret_cast<uintptr_t>(frames[i]));
    }
#elif defined(SHMMUTEX_IS_POSIX)
    constexpr int kMaxFrames = 128;
    void *callstack[kMaxFrames];
    int nframes = backtrace(callstack, kMaxFrames);
    if (nframes <= 0)
    {
        safe_format_to_stderr("  [No stack frames available]\n");
        return;
    }
    // Skip frame 0: this function.
    for (int i = 1; i < nframes; ++i)
    {
        const auto addr = reinterpret_cast<uintptr_t>(callstack[i]);
        Dl_info info;
        if (dladdr(callstack[i], &info) && info.dli_sname)
        {
            std::string name;
            try
            {
                name = demangle(info.dli_sname);
            }
            catch (const std::exception &)
            {
                name = info.dli_sname;
            }
            safe_format_to_stderr("  #{:02}  {:#018x}  {} + {:#x}\n", i - 1, addr, name,
                                  addr - reinterpret_cast<uintptr_t>(info.dli_saddr));
        }
        else if (dladdr(callstack[i], &info) && info.dli_fname)
        {
            safe_format_to_stderr("  #{:02}  {:#018x}  ({} + {:#x})\n", i - 1, addr,
                                  format_tools::filename_only(info.dli_fname),
                                  addr - reinterpret_cast<uintptr_t>(info.dli_fbase));
        }
        else
        {
            safe_format_to_stderr("  #{:02}  {:#018x}  [symbol unknown]\n", i - 1, addr);
        }
    }
#else
    safe_format_to_stderr("  [Stack trace not supported on this platform]\n");
#endif
    std::fflush(stderr);
}

} // namespace shmmutex::debug
