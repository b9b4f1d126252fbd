// tests/test_layer2_service/workers/logger_workers.cpp
/**
 * @file logger_workers.cpp
 * @brief Worker functions for the Logger tests.
 */
#include "logger_workers.h"
#include "smx_service.hpp"
#include "shared_test_helpers.h"
#include "test_entrypoint.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <string_view>
#include <thread>

using namespace shmmutex::tests::helper;
using namespace shmmutex::utils;
using ::testing::HasSubstr;
using ::testing::Not;

namespace shmmutex::tests::worker
{
namespace logger
{

int basic_logging(const std::string &log_path)
{
    return run_gtest_worker(
        [&]()
        {
            ASSERT_TRUE(Logger::instance().set_logfile(log_path));
            LOGGER_INFO("Hello from pid {}", shmmutex::platform::get_pid());
            Logger::instance().flush();

            std::string contents;
            ASSERT_TRUE(read_file_contents(log_path, contents));
            EXPECT_THAT(contents, HasSubstr("Hello from pid"));
            EXPECT_THAT(contents, HasSubstr("[SMX] [INFO  ]"));
            EXPECT_THAT(contents, HasSubstr("Log sink switched from"));
        },
        "logger::basic_logging", Logger::GetLifecycleModule());
}

int level_filtering(const std::string &log_path)
{
    return run_gtest_worker(
        [&]()
        {
            ASSERT_TRUE(Logger::instance().set_logfile(log_path));
            Logger::instance().set_level(Logger::Level::L_WARNING);
            EXPECT_EQ(Logger::instance().level(), Logger::Level::L_WARNING);
            EXPECT_FALSE(Logger::instance().should_log(Logger::Level::L_INFO));

            LOGGER_INFO("This should be filtered.");
            LOGGER_WARN("This should appear.");
            Logger::instance().flush();

            std::string contents;
            ASSERT_TRUE(read_file_contents(log_path, contents));
            EXPECT_THAT(contents, Not(HasSubstr("This should be filtered.")));
            EXPECT_THAT(contents, HasSubstr("This should appear."));
        },
        "logger::level_filtering", Logger::GetLifecycleModule());
}

int level_from_environment(const std::string &log_path)
{
    return run_gtest_worker(
        [&]()
        {
            EXPECT_EQ(Logger::instance().level(), Logger::Level::L_WARNING);
            ASSERT_TRUE(Logger::instance().set_logfile(log_path));
            LOGGER_INFO("info is below the environment level");
            LOGGER_WARN("warning passes");
            Logger::instance().flush();

            std::string contents;
            ASSERT_TRUE(read_file_contents(log_path, contents));
            EXPECT_THAT(contents, Not(HasSubstr("info is below")));
            EXPECT_THAT(contents, HasSubstr("warning passes"));
        },
        "logger::level_from_environment", Logger::GetLifecycleModule());
}

int bad_format_string(const std::string &log_path)
{
    return run_gtest_worker(
        [&]()
        {
            ASSERT_TRUE(Logger::instance().set_logfile(log_path));
            // Too few arguments for the runtime format string.
            Logger::instance().info_fmt(fmt::runtime("Bad format: {} {}"), "one");
            Logger::instance().flush();

            std::string contents;
            ASSERT_TRUE(read_file_contents(log_path, contents));
            EXPECT_THAT(contents, HasSubstr("[FORMAT ERROR]"));
        },
        "logger::bad_format_string", Logger::GetLifecycleModule());
}

int flush_waits_for_queue(const std::string &log_path, int msg_count)
{
    return run_gtest_worker(
        [&]()
        {
            ASSERT_TRUE(Logger::instance().set_logfile(log_path, false));
            for (int i = 0; i < msg_count; ++i)
                LOGGER_INFO("queued-msg {}", i);
            Logger::instance().flush();

            std::string contents;
            ASSERT_TRUE(read_file_contents(log_path, contents));
            EXPECT_EQ(count_lines(contents, "queued-msg"), static_cast<size_t>(msg_count));
        },
        "logger::flush_waits_for_queue", Logger::GetLifecycleModule());
}

int multithread_logging(const std::string &log_path, int threads, int per_thread)
{
    return run_gtest_worker(
        [&]()
        {
            ASSERT_TRUE(Logger::instance().set_logfile(log_path));
            ThreadRacer racer(threads);
            ASSERT_TRUE(racer.race(
                [per_thread](int t)
                {
                    for (int i = 0; i < per_thread; ++i)
                        LOGGER_INFO("thread-msg t={} i={}", t, i);
                }));
            Logger::instance().flush();

            std::string contents;
            ASSERT_TRUE(read_file_contents(log_path, contents));
            EXPECT_EQ(count_lines(contents, "thread-msg"),
                      static_cast<size_t>(threads * per_thread));
        },
        "logger::multithread_logging", Logger::GetLifecycleModule());
}

int multiprocess_writer(const std::string &log_path, int msg_count)
{
    return run_gtest_worker(
        [&]()
        {
            ASSERT_TRUE(Logger::instance().set_logfile(log_path, true));
            for (int i = 0; i < msg_count; ++i)
                LOGGER_INFO("child-msg pid={} idx={}", shmmutex::platform::get_pid(), i);
            Logger::instance().flush();
        },
        "logger::multiprocess_writer", Logger::GetLifecycleModule());
}

int unopenable_logfile_is_logged(const std::string &log_path, const std::string &bad_path)
{
    return run_gtest_worker(
        [&]()
        {
            ASSERT_TRUE(Logger::instance().set_logfile(log_path));
            EXPECT_FALSE(Logger::instance().set_logfile(bad_path));

            // The previous sink stays in place and received the report.
            LOGGER_INFO("still logging after a failed sink switch");
            Logger::instance().flush();

            std::string contents;
            ASSERT_TRUE(read_file_contents(log_path, contents));
            EXPECT_THAT(contents, HasSubstr("[ERROR ]"));
            EXPECT_THAT(contents, HasSubstr(fmt::format("cannot open log file '{}'", bad_path)));
            EXPECT_THAT(contents, HasSubstr("still logging after a failed sink switch"));
        },
        "logger::unopenable_logfile_is_logged", Logger::GetLifecycleModule());
}

int shutdown_idempotent(const std::string &log_path)
{
    return run_gtest_worker(
        [&]()
        {
            ASSERT_TRUE(Logger::instance().set_logfile(log_path));
            LOGGER_INFO("before shutdown");
            FinalizeApp();
            FinalizeApp();
            EXPECT_TRUE(Logger::lifecycle_initialized());

            // Records after shutdown are dropped without blocking or crashing.
            LOGGER_INFO("after shutdown");
            EXPECT_FALSE(Logger::instance().set_console());

            std::string contents;
            ASSERT_TRUE(read_file_contents(log_path, contents));
            EXPECT_THAT(contents, HasSubstr("before shutdown"));
            EXPECT_THAT(contents, HasSubstr("Logger is shutting down."));
            EXPECT_THAT(contents, Not(HasSubstr("after shutdown")));
        },
        "logger::shutdown_idempotent", Logger::GetLifecycleModule());
}

int config_before_init_panics()
{
    return run_worker_bare(
        []()
        {
            EXPECT_FALSE(Logger::lifecycle_initialized());
            // Plain records are silently dropped before initialization...
            LOGGER_INFO("dropped");
            // ...but configuration is a programming error.
            Logger::instance().set_level(Logger::Level::L_DEBUG);
        },
        "logger::config_before_init_panics");
}

int lock_events_are_logged(const std::string &log_path, const std::string &lock_name)
{
    return run_gtest_worker(
        [&]()
        {
            ASSERT_TRUE(Logger::instance().set_logfile(log_path));
            Logger::instance().set_level(Logger::Level::L_DEBUG);

            {
                SharedMemoryMutex mtx(LockConfig{.name = lock_name});
                ASSERT_TRUE(mtx.acquire(AcquireTimeout::single_attempt()));
                ASSERT_TRUE(mtx.release());
                // Releasing twice through the registry is reported, not thrown.
                EXPECT_FALSE(ProcessRegistry::instance().remove(lock_name));
            }
            Logger::instance().flush();

            std::string contents;
            ASSERT_TRUE(read_file_contents(log_path, contents));
            EXPECT_THAT(contents, HasSubstr(fmt::format("ShmMutex '{}': acquired by", lock_name)));
            EXPECT_THAT(contents, HasSubstr(fmt::format("ShmMutex '{}': released by", lock_name)));
            EXPECT_THAT(contents, HasSubstr("[WARN  ]"));
            EXPECT_THAT(contents, HasSubstr("not tracked"));
        },
        "logger::lock_events_are_logged", Logger::GetLifecycleModule(),
        ProcessRegistry::GetLifecycleModule());
}

} // namespace logger
} // namespace shmmutex::tests::worker

namespace
{
struct LoggerWorkerRegistrar
{
    LoggerWorkerRegistrar()
    {
        register_worker_dispatcher(
            [](int argc, char **argv) -> int
            {
                if (argc < 2)
                    return -1;
                std::string_view mode = argv[1];
                auto dot = mode.find('.');
                if (dot == std::string_view::npos || mode.substr(0, dot) != "logger")
                    return -1;
                std::string scenario(mode.substr(dot + 1));
                using namespace shmmutex::tests::worker::logger;
                if (scenario == "basic_logging" && argc > 2)
                    return basic_logging(argv[2]);
                if (scenario == "level_filtering" && argc > 2)
                    return level_filtering(argv[2]);
                if (scenario == "level_from_environment" && argc > 2)
                    return level_from_environment(argv[2]);
                if (scenario == "bad_format_string" && argc > 2)
                    return bad_format_string(argv[2]);
                if (scenario == "flush_waits_for_queue" && argc > 3)
                    return flush_waits_for_queue(argv[2], std::stoi(argv[3]));
                if (scenario == "multithread_logging" && argc > 4)
                    return multithread_logging(argv[2], std::stoi(argv[3]), std::stoi(argv[4]));
                if (scenario == "multiprocess_writer" && argc > 3)
                    return multiprocess_writer(argv[2], std::stoi(argv[3]));
                if (scenario == "unopenable_logfile_is_logged" && argc > 3)
                    return unopenable_logfile_is_logged(argv[2], argv[3]);
                if (scenario == "shutdown_idempotent" && argc > 2)
                    return shutdown_idempotent(argv[2]);
                if (scenario == "config_before_init_panics")
                    return config_before_init_panics();
                if (scenario == "lock_events_are_logged" && argc > 3)
                    return lock_events_are_logged(argv[2], argv[3]);
                fmt::print(stderr, "ERROR: Unknown logger scenario '{}'\n", scenario);
                return 1;
            });
    }
};
static LoggerWorkerRegistrar g_logger_registrar;
} // namespace
