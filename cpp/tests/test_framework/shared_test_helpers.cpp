// tests/test_framework/shared_test_helpers.cpp
/**
 * @file shared_test_helpers.cpp
 * @brief Implements common helper functions and utilities for test cases.
 */
#include "shared_test_helpers.h"
#include "test_process_utils.h"

#include <cstdlib>
#include <fstream>
#include <sstream>

#include <unistd.h>

namespace shmmutex::tests::helper
{

bool read_file_contents(const std::string &path, std::string &out)
{
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
        return false;
    std::ostringstream ss;
    ss << ifs.rdbuf();
    out = ss.str();
    return true;
}

size_t count_lines(std::string_view text, std::optional<std::string_view> must_include,
                   std::optional<std::string_view> must_exclude)
{
    size_t count = 0;
    size_t pos = 0;

    while (pos < text.size())
    {
        auto end = text.find('\n', pos);
        auto line = text.substr(pos, end - pos);

        if ((!must_include || line.find(*must_include) != std::string_view::npos) &&
            (!must_exclude || line.find(*must_exclude) == std::string_view::npos))
        {
            ++count;
        }

        if (end == std::string_view::npos)
            break;
        pos = end + 1;
    }

    return count;
}

bool wait_for_string_in_file(const fs::path &path, const std::string &expected,
                             std::chrono::milliseconds timeout)
{
    auto start = std::chrono::steady_clock::now();
    while (std::chrono::steady_clock::now() - start < timeout)
    {
        std::string contents;
        if (read_file_contents(path.string(), contents))
        {
            if (contents.find(expected) != std::string::npos)
                return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return false;
}

std::string test_scale()
{
    const char *v = std::getenv("SMX_TEST_SCALE");
    return v ? std::string(v) : std::string();
}

int scaled_value(int original, int small_value)
{
    if (test_scale() == "small")
        return small_value;
    return original;
}

void signal_test_ready()
{
    const char *fd_str = std::getenv(kReadyFdEnv);
    if (fd_str == nullptr)
        return;
    const int fd = std::atoi(fd_str);
    if (fd <= 2)
        return;
    const char byte = 'R';
    (void)!::write(fd, &byte, 1);
    ::close(fd);
    unsetenv(kReadyFdEnv);
}

std::string make_test_lock_name(const char *test_name)
{
    auto now = std::chrono::steady_clock::now();
    auto timestamp =
        std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch()).count();

    return fmt::format("smx_test_{}_{}_{}", test_name, shmmutex::platform::get_pid(), timestamp);
}

bool cleanup_test_segment(const std::string &lock_name)
{
    const std::string native = shmmutex::platform::shm_native_name(lock_name);
    std::error_code ec;
    if (shmmutex::platform::shm_unlink(native.c_str(), ec))
    {
        return true;
    }
    if (ec == std::errc::no_such_file_or_directory)
    {
        return true;
    }
    fmt::print(stderr, "[TestCleanup] Failed to unlink shared memory '{}': {}\n", native,
               ec.message());
    return false;
}

bool test_segment_exists(const std::string &lock_name)
{
    const std::string native = shmmutex::platform::shm_native_name(lock_name);
    std::error_code ec;
    auto h = shmmutex::platform::shm_attach(native.c_str(), ec);
    if (!h.valid())
    {
        // A zero-length artifact exists too, it just cannot be mapped.
        return ec != std::errc::no_such_file_or_directory;
    }
    std::error_code close_ec;
    shmmutex::platform::shm_close(&h, close_ec);
    return true;
}

} // namespace shmmutex::tests::helper
