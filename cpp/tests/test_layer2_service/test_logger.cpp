/**
 * @file test_logger.cpp
 * @brief Logger tests. Each scenario runs in its own worker process because the logger
 *        is a process-wide lifecycle module.
 */
#include "smx_service.hpp"
#include "shared_test_helpers.h"
#include "test_patterns.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <cstdlib>
#include <filesystem>

using namespace shmmutex::tests::helper;
using ::testing::HasSubstr;
namespace fs = std::filesystem;

class LoggerTest : public shmmutex::tests::IsolatedProcessTest
{
  protected:
    void SetUp() override
    {
        IsolatedProcessTest::SetUp();
        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        log_path_ = fs::temp_directory_path() /
                    fmt::format("smx_logger_{}_{}.log", info->name(),
                                shmmutex::platform::get_pid());
        std::error_code ec;
        fs::remove(log_path_, ec);
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove(log_path_, ec);
    }

    std::string log_path() const { return log_path_.string(); }

    fs::path log_path_;
};

TEST_F(LoggerTest, WritesFormattedRecordsToFile)
{
    auto proc = SpawnWorker("logger.basic_logging", {log_path()});
    ExpectWorkerOk(proc);
}

TEST_F(LoggerTest, LevelFilteringDropsLowerLevels)
{
    auto proc = SpawnWorker("logger.level_filtering", {log_path()});
    ExpectWorkerOk(proc);
}

TEST_F(LoggerTest, InitialLevelComesFromEnvironment)
{
    // The worker inherits the parent's environment at spawn.
    ASSERT_EQ(::setenv("SHMMUTEX_LOG_LEVEL", "warning", 1), 0);
    auto proc = SpawnWorker("logger.level_from_environment", {log_path()});
    ::unsetenv("SHMMUTEX_LOG_LEVEL");
    ExpectWorkerOk(proc);
}

TEST_F(LoggerTest, BadFormatStringIsReportedNotThrown)
{
    auto proc = SpawnWorker("logger.bad_format_string", {log_path()});
    ExpectWorkerOk(proc);
}

TEST_F(LoggerTest, FlushWaitsForQueuedRecords)
{
    auto proc = SpawnWorker("logger.flush_waits_for_queue",
                            {log_path(), std::to_string(scaled_value(500, 100))});
    ExpectWorkerOk(proc);
}

TEST_F(LoggerTest, ConcurrentThreadsLoseNoRecords)
{
    auto proc = SpawnWorker("logger.multithread_logging",
                            {log_path(), "8", std::to_string(scaled_value(100, 20))});
    ExpectWorkerOk(proc);
}

TEST_F(LoggerTest, ProcessesShareOneLogFile)
{
    const int n_procs = 4;
    const int per_proc = scaled_value(100, 20);
    std::vector<std::pair<std::string, std::vector<std::string>>> scenarios;
    for (int i = 0; i < n_procs; ++i)
        scenarios.push_back({"logger.multiprocess_writer", {log_path(), std::to_string(per_proc)}});

    auto workers = SpawnWorkers(scenarios);
    ExpectAllWorkersOk(workers);

    std::string contents;
    ASSERT_TRUE(read_file_contents(log_path(), contents));
    // flock keeps lines whole: every record is counted exactly once.
    EXPECT_EQ(count_lines(contents, "child-msg"), static_cast<size_t>(n_procs * per_proc));
}

TEST_F(LoggerTest, UnopenableLogFileIsLoggedAndKeepsCurrentSink)
{
    const std::string bad_path =
        (fs::temp_directory_path() / "smx_no_such_dir" / "nested" / "x.log").string();
    auto proc = SpawnWorker("logger.unopenable_logfile_is_logged", {log_path(), bad_path});
    ExpectWorkerOk(proc);
}

TEST_F(LoggerTest, ShutdownIsIdempotentAndDropsLateRecords)
{
    auto proc = SpawnWorker("logger.shutdown_idempotent", {log_path()});
    ExpectWorkerOk(proc);
}

TEST_F(LoggerTest, ConfigurationBeforeInitPanics)
{
    auto proc = SpawnWorker("logger.config_before_init_panics");
    proc.wait_for_exit();
    EXPECT_TRUE(proc.exit_code() != 0 || proc.term_signal() != 0);
    EXPECT_THAT(proc.get_stderr(), HasSubstr("[PANIC]"));
    EXPECT_THAT(proc.get_stderr(), HasSubstr("Logger::set_level"));
}

TEST_F(LoggerTest, LockOperationsAreLogged)
{
    LockNameGuard lock("LockOperationsAreLogged");
    auto proc = SpawnWorker("logger.lock_events_are_logged", {log_path(), lock.name()});
    ExpectWorkerOk(proc);
    EXPECT_FALSE(test_segment_exists(lock.name()));
}
