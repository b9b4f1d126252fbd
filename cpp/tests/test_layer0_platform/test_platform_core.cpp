/**
 * @file test_platform_core.cpp
 * @brief Layer 0 tests for core platform APIs (PID, thread ID, time, process detection,
 *        version).
 */
#include "smx_platform.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstring>
#include <thread>

#if defined(SHMMUTEX_IS_POSIX)
#include <sys/wait.h>
#include <unistd.h>
#endif

using namespace shmmutex::platform;
using namespace ::testing;
using namespace std::chrono_literals;

// ============================================================================
// Identification
// ============================================================================

TEST(PlatformCoreTest, GetPID_ReturnsStableNonZeroID)
{
    uint64_t pid1 = get_pid();
    uint64_t pid2 = get_pid();
    EXPECT_GT(pid1, 0u);
    EXPECT_EQ(pid1, pid2) << "PID should be stable within the same process";
}

TEST(PlatformCoreTest, GetThreadID_DifferentForDifferentThreads)
{
    uint64_t main_tid = get_native_thread_id();
    EXPECT_GT(main_tid, 0u);

    std::atomic<uint64_t> worker_tid{0};
    std::thread worker([&worker_tid]() { worker_tid.store(get_native_thread_id()); });
    worker.join();

    EXPECT_GT(worker_tid.load(), 0u);
    EXPECT_NE(main_tid, worker_tid.load()) << "Different threads should have different thread IDs";
}

TEST(PlatformCoreTest, GetExecutableName_FilenameIsSuffixOfFullPath)
{
    std::string full_path = get_executable_name(true);
    std::string filename = get_executable_name(false);

    EXPECT_FALSE(filename.empty());
    EXPECT_THAT(full_path, EndsWith(filename));
    EXPECT_THAT(filename, HasSubstr("shmmutex_tests"));
}

// ============================================================================
// Time
// ============================================================================

TEST(PlatformCoreTest, MonotonicTime_IsIncreasing)
{
    uint64_t t1 = monotonic_time_ns();
    std::this_thread::sleep_for(1ms);
    uint64_t t2 = monotonic_time_ns();
    EXPECT_GT(t2, t1);
}

TEST(PlatformCoreTest, ElapsedTime_CalculatesDelta)
{
    uint64_t start = monotonic_time_ns();
    std::this_thread::sleep_for(10ms);
    uint64_t elapsed = elapsed_time_ns(start);

    EXPECT_GE(elapsed, 10'000'000u);
    EXPECT_LT(elapsed, 500'000'000u);
}

TEST(PlatformCoreTest, ElapsedTime_FutureStartYieldsZero)
{
    uint64_t future = monotonic_time_ns() + 1'000'000'000u;
    EXPECT_EQ(elapsed_time_ns(future), 0u);
}

// ============================================================================
// Process liveness
// ============================================================================

TEST(PlatformCoreTest, IsProcessAlive_CurrentAndInvalid)
{
    EXPECT_TRUE(is_process_alive(get_pid()));
    EXPECT_FALSE(is_process_alive(0));
}

#if defined(SHMMUTEX_IS_POSIX)
TEST(PlatformCoreTest, IsProcessAlive_DetectsAliveThenDeadProcess)
{
    int pipefd[2];
    ASSERT_EQ(pipe(pipefd), 0);

    pid_t child_pid = fork();
    ASSERT_GE(child_pid, 0) << "fork() failed";

    if (child_pid == 0)
    {
        close(pipefd[1]);
        char c;
        (void)!read(pipefd[0], &c, 1);
        close(pipefd[0]);
        _exit(0);
    }

    close(pipefd[0]);
    uint64_t pid = static_cast<uint64_t>(child_pid);
    EXPECT_TRUE(is_process_alive(pid)) << "Child blocks on read, so it must be alive";

    close(pipefd[1]);
    int status = 0;
    ASSERT_EQ(waitpid(child_pid, &status, 0), child_pid);
    ASSERT_TRUE(WIFEXITED(status));

    EXPECT_FALSE(is_process_alive(pid)) << "Reaped child should be detected as dead";
}
#endif

// ============================================================================
// Version
// ============================================================================

TEST(PlatformCoreTest, VersionAPI_StringMatchesComponents)
{
    std::string expected = std::to_string(get_version_major()) + "." +
                           std::to_string(get_version_minor()) + "." +
                           std::to_string(get_version_rolling());

    ASSERT_NE(get_version_string(), nullptr);
    EXPECT_EQ(get_version_string(), expected);
    EXPECT_THAT(get_version_string(), MatchesRegex(R"(^[0-9]+\.[0-9]+\.[0-9]+$)"));
}
