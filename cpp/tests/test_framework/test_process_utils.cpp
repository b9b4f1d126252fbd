// tests/test_framework/test_process_utils.cpp
/**
 * @file test_process_utils.cpp
 * @brief Implements spawning and supervision of worker processes (POSIX fork/execv).
 */
#include "test_process_utils.h"
#include "shared_test_helpers.h" // For read_file_contents

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <fcntl.h> // For open, O_WRONLY
#include <poll.h>
#include <sys/wait.h>
#include <thread>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <fmt/core.h>

namespace shmmutex::tests::helper
{

// Reaps the process; fills exit code or terminating signal.
static void wait_for_worker(ProcessHandle handle, int &exit_code, int &term_signal)
{
    exit_code = -1;
    term_signal = 0;
    if (handle == NULL_PROC_HANDLE)
        return;

    int status = 0;
    pid_t r;
    do
    {
        r = waitpid(handle, &status, 0);
    } while (r == -1 && errno == EINTR);
    if (r == -1)
        return;

    if (WIFEXITED(status))
    {
        exit_code = WEXITSTATUS(status);
    }
    else if (WIFSIGNALED(status))
    {
        term_signal = WTERMSIG(status);
    }
}

static ProcessHandle spawn_worker_process(const std::string &exe_path, const std::string &mode,
                                          const std::vector<std::string> &args,
                                          const fs::path &stdout_path,
                                          const fs::path &stderr_path,
                                          bool redirect_stderr_to_console, int ready_write_fd)
{
    // Build argv before fork; the child only execs.
    std::vector<char *> argv;
    argv.push_back(const_cast<char *>(exe_path.c_str()));
    argv.push_back(const_cast<char *>(mode.c_str()));
    for (const auto &arg : args)
    {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);
    const std::string ready_fd_str = std::to_string(ready_write_fd);

    pid_t pid = fork();
    if (pid == 0)
    {
        int stdout_fd = open(stdout_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
        if (stdout_fd != -1)
        {
            dup2(stdout_fd, 1);
            close(stdout_fd);
        }
        if (!redirect_stderr_to_console)
        {
            int stderr_fd = open(stderr_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
            if (stderr_fd != -1)
            {
                dup2(stderr_fd, 2);
                close(stderr_fd);
            }
        }
        if (ready_write_fd != -1)
        {
            // The pipe is O_CLOEXEC so siblings never inherit it; keep this end across exec.
            fcntl(ready_write_fd, F_SETFD, 0);
            setenv(kReadyFdEnv, ready_fd_str.c_str(), 1);
        }
        else
        {
            unsetenv(kReadyFdEnv);
        }

        execv(exe_path.c_str(), argv.data());
        _exit(127);
    }
    return pid == -1 ? NULL_PROC_HANDLE : pid;
}

WorkerProcess::WorkerProcess(const std::string &exe_path, const std::string &mode,
                             const std::vector<std::string> &args,
                             bool redirect_stderr_to_console, bool with_ready_signal)
    : redirect_stderr_to_console_(redirect_stderr_to_console)
{
    auto base_name = fs::path(exe_path).filename().string() + "_" + mode;
    std::replace(base_name.begin(), base_name.end(), '.', '_');
    auto ts = std::chrono::high_resolution_clock::now().time_since_epoch().count();

    stdout_path_ = fs::temp_directory_path() / fmt::format("{}_{}_stdout.log", base_name, ts);
    stderr_path_ = fs::temp_directory_path() / fmt::format("{}_{}_stderr.log", base_name, ts);

    int pipe_fds[2] = {-1, -1};
    if (with_ready_signal && pipe2(pipe_fds, O_CLOEXEC) != 0)
    {
        pipe_fds[0] = pipe_fds[1] = -1;
    }

    handle_ = spawn_worker_process(exe_path, mode, args, stdout_path_, stderr_path_,
                                   redirect_stderr_to_console, pipe_fds[1]);
    if (pipe_fds[1] != -1)
    {
        close(pipe_fds[1]);
    }
    ready_fd_ = pipe_fds[0];
}

WorkerProcess::~WorkerProcess()
{
    if (handle_ != NULL_PROC_HANDLE && !waited_)
    {
        if (ready_fd_ != -1)
        {
            // A holder worker may be blocked forever; do not hang the test run on it.
            kill(handle_, SIGKILL);
        }
        wait_for_exit();
    }
    if (ready_fd_ != -1)
    {
        close(ready_fd_);
    }
    std::error_code ec;
    fs::remove(stdout_path_, ec);
    fs::remove(stderr_path_, ec);
}

bool WorkerProcess::wait_for_ready(std::chrono::milliseconds timeout)
{
    if (ready_fd_ == -1)
        return false;

    pollfd pfd{};
    pfd.fd = ready_fd_;
    pfd.events = POLLIN;
    int rc;
    do
    {
        rc = poll(&pfd, 1, static_cast<int>(timeout.count()));
    } while (rc == -1 && errno == EINTR);
    if (rc <= 0)
        return false;

    char byte = 0;
    // EOF (0) means the worker exited without signalling.
    return read(ready_fd_, &byte, 1) == 1;
}

bool WorkerProcess::send_signal(int sig)
{
    if (handle_ == NULL_PROC_HANDLE || waited_)
        return false;
    return kill(handle_, sig) == 0;
}

int WorkerProcess::wait_for_exit()
{
    if (waited_)
        return exit_code_;

    wait_for_worker(handle_, exit_code_, term_signal_);
    waited_ = true;
    handle_ = NULL_PROC_HANDLE;

    read_file_contents(stdout_path_.string(), stdout_content_);
    if (!redirect_stderr_to_console_)
        read_file_contents(stderr_path_.string(), stderr_content_);
    return exit_code_;
}

bool WorkerProcess::wait_for_exit_within(std::chrono::milliseconds timeout)
{
    if (waited_)
        return true;

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline)
    {
        int status = 0;
        const pid_t r = waitpid(handle_, &status, WNOHANG);
        if (r == handle_)
        {
            exit_code_ = -1;
            term_signal_ = 0;
            if (WIFEXITED(status))
                exit_code_ = WEXITSTATUS(status);
            else if (WIFSIGNALED(status))
                term_signal_ = WTERMSIG(status);
            waited_ = true;
            handle_ = NULL_PROC_HANDLE;
            read_file_contents(stdout_path_.string(), stdout_content_);
            if (!redirect_stderr_to_console_)
                read_file_contents(stderr_path_.string(), stderr_content_);
            return true;
        }
        if (r == -1 && errno != EINTR)
            break;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    kill(handle_, SIGKILL);
    wait_for_exit();
    return false;
}

const std::string &WorkerProcess::get_stdout() const
{
    if (!waited_)
        read_file_contents(stdout_path_.string(), stdout_content_);
    return stdout_content_;
}

const std::string &WorkerProcess::get_stderr() const
{
    if (!waited_ && !redirect_stderr_to_console_)
        read_file_contents(stderr_path_.string(), stderr_content_);
    return stderr_content_;
}

void expect_worker_ok(const WorkerProcess &proc,
                      const std::vector<std::string> &expected_stderr_substrings,
                      bool allow_expected_logger_errors)
{
    using ::testing::HasSubstr;
    using ::testing::Not;

    ASSERT_TRUE(proc.valid()) << "WorkerProcess was not successfully spawned.";
    ASSERT_EQ(proc.term_signal(), 0) << "Worker killed by signal. Stderr:\n" << proc.get_stderr();
    ASSERT_EQ(proc.exit_code(), 0) << "Worker failed. Stderr:\n" << proc.get_stderr();

    const auto &stderr_out = proc.get_stderr();
    if (!allow_expected_logger_errors)
    {
        EXPECT_THAT(stderr_out, Not(HasSubstr("[ERROR ]")));
    }
    EXPECT_THAT(stderr_out, Not(HasSubstr("FATAL")));
    EXPECT_THAT(stderr_out, Not(HasSubstr("[PANIC]")));
    EXPECT_THAT(stderr_out, Not(HasSubstr("[WORKER FAILURE]")));
    for (const auto &s : expected_stderr_substrings)
    {
        EXPECT_THAT(stderr_out, HasSubstr(s));
    }
}

} // namespace shmmutex::tests::helper
