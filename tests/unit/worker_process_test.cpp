/**
 * worker_process_test.cpp - WorkerProcess unit tests
 *
 * Tests:
 * - Spawn with missing executable / empty command (error path)
 * - Spawn with a shell helper (success path) and pipe round trip
 * - is_running() before spawn, while alive, after exit
 * - Working directory and argument passing
 * - Clean and forced shutdown, double shutdown safety
 */

#include "transport/worker_process.hpp"

#include <gtest/gtest.h>
#include <sys/wait.h>
#include <unistd.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>

using namespace mlld::transport;

class WorkerProcessTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() /
                    ("mlld_worker_process_test_" + std::to_string(::getpid()));
        std::filesystem::create_directories(temp_dir_);
        helper_path_ = temp_dir_ / "helper.sh";
    }

    void TearDown() override {
        if (std::filesystem::exists(temp_dir_)) {
            std::filesystem::remove_all(temp_dir_);
        }
    }

    void WriteHelper(const std::string &body) {
        std::ofstream helper(helper_path_.string());
        helper << "#!/bin/sh\n" << body;
        helper.close();
        std::filesystem::permissions(helper_path_,
                                     std::filesystem::perms::owner_exec | std::filesystem::perms::owner_read |
                                         std::filesystem::perms::owner_write,
                                     std::filesystem::perm_options::add);
    }

    // Echoes stdin lines back until EOF
    void CreateEchoHelper() { WriteHelper("while IFS= read -r line; do echo \"$line\"; done\n"); }

    std::filesystem::path temp_dir_;
    std::filesystem::path helper_path_;
};

/******************************************************************************
 * Spawn Error Handling Tests
 ******************************************************************************/

TEST_F(WorkerProcessTest, SpawnFailsWithNonexistentExecutable) {
    WorkerProcess proc("/nonexistent_path/fake_mlld");

    EXPECT_FALSE(proc.spawn());
    EXPECT_NE(proc.last_error().find("Failed to start worker '/nonexistent_path/fake_mlld'"), std::string::npos);
    EXPECT_NE(proc.last_error().find("No such file or directory"), std::string::npos);
    EXPECT_FALSE(proc.is_running());
}

TEST_F(WorkerProcessTest, SpawnFailsWithEmptyCommand) {
    WorkerProcess proc("");

    EXPECT_FALSE(proc.spawn());
    EXPECT_EQ(proc.last_error(), "Worker command is empty");
}

TEST_F(WorkerProcessTest, SpawnFailsWithMissingWorkingDirectory) {
    CreateEchoHelper();
    WorkerProcess proc(helper_path_.string(), {}, (temp_dir_ / "missing").string());

    EXPECT_FALSE(proc.spawn());
    EXPECT_NE(proc.last_error().find(" in '"), std::string::npos);
}

/******************************************************************************
 * Process Lifecycle Tests
 ******************************************************************************/

TEST_F(WorkerProcessTest, IsRunningReturnsFalseForUnspawnedProcess) {
    WorkerProcess proc(helper_path_.string());

    EXPECT_FALSE(proc.is_running());
    EXPECT_EQ(proc.pid(), -1);
}

TEST_F(WorkerProcessTest, ShutdownSafeOnUnspawnedProcess) {
    WorkerProcess proc(helper_path_.string());

    EXPECT_NO_THROW(proc.shutdown());
}

TEST_F(WorkerProcessTest, PipesRoundTripLines) {
    CreateEchoHelper();
    WorkerProcess proc(helper_path_.string());
    ASSERT_TRUE(proc.spawn()) << proc.last_error();
    EXPECT_TRUE(proc.last_error().empty());
    EXPECT_GT(proc.pid(), 0);

    ASSERT_TRUE(proc.stdin_writer().write_line("{\"hello\":1}"));
    std::string line;
    ASSERT_TRUE(proc.stdout_reader().read_line(line));
    EXPECT_EQ(line, "{\"hello\":1}");

    proc.shutdown();
}

TEST_F(WorkerProcessTest, ArgumentsAndWorkingDirectoryAreApplied) {
    WriteHelper("echo \"$1 $2\"\npwd\n");
    WorkerProcess proc(helper_path_.string(), {"live", "--stdio"}, temp_dir_.string());
    ASSERT_TRUE(proc.spawn()) << proc.last_error();

    std::string args_line;
    std::string cwd_line;
    ASSERT_TRUE(proc.stdout_reader().read_line(args_line));
    ASSERT_TRUE(proc.stdout_reader().read_line(cwd_line));

    EXPECT_EQ(args_line, "live --stdio");
    EXPECT_EQ(std::filesystem::canonical(cwd_line), std::filesystem::canonical(temp_dir_));
    proc.shutdown();
}

TEST_F(WorkerProcessTest, StderrIsCapturedSeparately) {
    WriteHelper("echo 'diagnostic' >&2\n");
    WorkerProcess proc(helper_path_.string());
    ASSERT_TRUE(proc.spawn());

    std::string line;
    ASSERT_TRUE(proc.stderr_reader().read_line(line));
    EXPECT_EQ(line, "diagnostic");

    // stdout closes with the process
    EXPECT_FALSE(proc.stdout_reader().read_line(line));
    EXPECT_TRUE(proc.stdout_reader().last_error().empty());
}

TEST_F(WorkerProcessTest, IsRunningRecordsExitStatus) {
    WriteHelper("exit 3\n");
    WorkerProcess proc(helper_path_.string());
    ASSERT_TRUE(proc.spawn());

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (proc.is_running() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    EXPECT_FALSE(proc.is_running());
    ASSERT_TRUE(proc.exit_status().has_value());
    EXPECT_TRUE(WIFEXITED(*proc.exit_status()));
    EXPECT_EQ(WEXITSTATUS(*proc.exit_status()), 3);
}

TEST_F(WorkerProcessTest, LongRunningProcessStaysAlive) {
    CreateEchoHelper();
    WorkerProcess proc(helper_path_.string());
    ASSERT_TRUE(proc.spawn());

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_TRUE(proc.is_running());

    proc.shutdown();
}

TEST_F(WorkerProcessTest, ShutdownStopsRunningProcess) {
    WriteHelper("trap '' TERM\nwhile true; do sleep 1; done\n");
    WorkerProcess proc(helper_path_.string());
    ASSERT_TRUE(proc.spawn());

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    ASSERT_TRUE(proc.is_running());

    auto start = std::chrono::steady_clock::now();
    proc.shutdown();
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(proc.is_running());
    EXPECT_LT(elapsed, std::chrono::seconds(2));
    ASSERT_TRUE(proc.exit_status().has_value());
    EXPECT_TRUE(WIFSIGNALED(*proc.exit_status()));
}

TEST_F(WorkerProcessTest, GracefulShutdownLetsWorkerExitOnEof) {
    CreateEchoHelper();
    WorkerProcess proc(helper_path_.string());
    ASSERT_TRUE(proc.spawn());

    proc.shutdown(2000);

    EXPECT_FALSE(proc.is_running());
    ASSERT_TRUE(proc.exit_status().has_value());
    EXPECT_TRUE(WIFEXITED(*proc.exit_status()));
}

TEST_F(WorkerProcessTest, DoubleShutdownIsSafe) {
    CreateEchoHelper();
    WorkerProcess proc(helper_path_.string());
    ASSERT_TRUE(proc.spawn());

    proc.shutdown();
    EXPECT_NO_THROW(proc.shutdown());
}

TEST_F(WorkerProcessTest, WriteAfterExitReportsBrokenPipe) {
    WriteHelper("exit 0\n");
    WorkerProcess proc(helper_path_.string());
    ASSERT_TRUE(proc.spawn());

    std::string line;
    EXPECT_FALSE(proc.stdout_reader().read_line(line));

    bool ok = true;
    for (int i = 0; i < 100 && ok; ++i) {
        ok = proc.stdin_writer().write_line("ping");
    }
    EXPECT_FALSE(ok);
    EXPECT_NE(proc.stdin_writer().last_error().find("Broken pipe"), std::string::npos);
}
