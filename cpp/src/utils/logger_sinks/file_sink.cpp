#include "smx_base.hpp"
#include "utils/logger_sinks/file_sink.hpp"

#include <stdexcept>
#include <system_error>

#ifdef SHMMUTEX_PLATFORM_WIN64
#include <windows.h>
#else
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#endif

namespace shmmutex::utils
{

FileSink::FileSink(const std::filesystem::path &path, bool use_flock)
    : m_path(path), m_use_flock(use_flock)
{
#ifdef SHMMUTEX_PLATFORM_WIN64
    (void)m_use_flock;
    m_file_handle = CreateFileW(m_path.wstring().c_str(), FILE_APPEND_DATA,
                                FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE, nullptr,
                                OPEN_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (m_file_handle == INVALID_HANDLE_VALUE)
    {
        m_file_handle = nullptr;
        throw std::runtime_error(fmt::format("Failed to open log file '{}': error {}",
                                             m_path.string(), GetLastError()));
    }
#else
    m_fd = ::open(m_path.c_str(), O_WRONLY | O_APPEND | O_CREAT, 0644);
    if (m_fd == -1)
    {
        const std::error_code ec(errno, std::generic_category());
        throw std::runtime_error(
            fmt::format("Failed to open log file '{}': {}", m_path.string(), ec.message()));
    }
#endif
}

FileSink::~FileSink()
{
    close();
}

void FileSink::close() noexcept
{
#ifdef SHMMUTEX_PLATFORM_WIN64
    if (m_file_handle != nullptr)
    {
        CloseHandle(m_file_handle);
        m_file_handle = nullptr;
    }
#else
    if (m_fd != -1)
    {
        ::close(m_fd);
        m_fd = -1;
    }
#endif
}

void FileSink::write(const LogMessage &msg)
{
    const std::string content = format_logmsg(msg);
#ifdef SHMMUTEX_PLATFORM_WIN64
    DWORD bytes_written = 0;
    if (!WriteFile(m_file_handle, content.data(), static_cast<DWORD>(content.size()),
                   &bytes_written, nullptr) ||
        bytes_written != content.size())
    {
        throw std::system_error(static_cast<int>(GetLastError()), std::system_category(),
                                "Failed to write complete log message to file");
    }
#else
    if (m_use_flock)
    {
        // Advisory only, but serializes writers that also use the flag.
        ::flock(m_fd, LOCK_EX);
    }
    const ssize_t bytes_written = ::write(m_fd, content.data(), content.size());
    const int saved_errno = errno;
    if (m_use_flock)
    {
        ::flock(m_fd, LOCK_UN);
    }
    if (bytes_written < 0 || static_cast<size_t>(bytes_written) != content.size())
    {
        throw std::system_error(saved_errno, std::generic_category(),
                                "Failed to write complete log message to file");
    }
#endif
}

void FileSink::flush()
{
#ifdef SHMMUTEX_PLATFORM_WIN64
    FlushFileBuffers(m_file_handle);
#else
    ::fsync(m_fd);
#endif
}

std::string FileSink::description() const
{
    return "File: " + m_path.string();
}

} // namespace shmmutex::utils
