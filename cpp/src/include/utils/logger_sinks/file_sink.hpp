#pragma once

#include "smx_platform.hpp"
#include "utils/logger_sinks/sink.hpp"
#include <filesystem>
#include <string>

namespace shmmutex::utils
{

/**
 * @class FileSink
 * @brief Appends formatted records to a file.
 *
 * The file is opened with O_APPEND so several processes can share it. With
 * `use_flock`, each record is written under an exclusive advisory flock() to keep
 * records from interleaving. Write failures throw std::system_error; the logger worker
 * reports them on stderr and carries on.
 */
class FileSink : public Sink
{
  public:
    /** @throws std::runtime_error if the file cannot be opened. */
    FileSink(const std::filesystem::path &path, bool use_flock);
    ~FileSink() override;

    FileSink(const FileSink &) = delete;
    FileSink &operator=(const FileSink &) = delete;

    void write(const LogMessage &msg) override;
    void flush() override;
    std::string description() const override;

  private:
    void close() noexcept;

    std::filesystem::path m_path;
    bool m_use_flock = false;
#ifdef SHMMUTEX_PLATFORM_WIN64
    void *m_file_handle = nullptr; // HANDLE, kept opaque to avoid <windows.h> here
#else
    int m_fd = -1;
#endif
};

} // namespace shmmutex::utils
