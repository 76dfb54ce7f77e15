/**
 * @file test_child_process.cpp
 * @brief Unit tests for ChildProcess spawn, signalling and reaping.
 */

#include "supervisor/child_process.hpp"

#include <gtest/gtest.h>
#include <signal.h>
#include <sys/wait.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

using namespace edge_sentinel;
using namespace std::chrono_literals;

class ChildProcessTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        const auto* test = ::testing::UnitTest::GetInstance()->current_test_info();
        temp_dir_ = std::filesystem::temp_directory_path() / ("es_test_child_" + std::string(test->name()));
        std::filesystem::remove_all(temp_dir_);
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }

    static std::string read_all(const std::filesystem::path& path) {
        std::ifstream ifs(path);
        std::stringstream ss;
        ss << ifs.rdbuf();
        return ss.str();
    }
};

TEST_F(ChildProcessTest, SpawnAndTerminate) {
    auto child = ChildProcess::spawn({.argv = {"sleep", "30"}});
    ASSERT_TRUE(child.has_value()) << child.error().message;
    auto& process = *child;

    EXPECT_GT(process->pid(), 0);
    EXPECT_TRUE(process->running());

    EXPECT_TRUE(process->terminate(2000ms, 1000ms));
    EXPECT_FALSE(process->running());
    ASSERT_TRUE(process->wait_status().has_value());
    EXPECT_TRUE(WIFSIGNALED(*process->wait_status()));
    EXPECT_EQ(WTERMSIG(*process->wait_status()), SIGTERM);
}

TEST_F(ChildProcessTest, ExitStatusIsCaptured) {
    auto child = ChildProcess::spawn({.argv = {"sh", "-c", "exit 3"}});
    ASSERT_TRUE(child.has_value());
    ASSERT_TRUE((*child)->wait_for(5000ms));

    ASSERT_TRUE((*child)->wait_status().has_value());
    EXPECT_EQ(describe_wait_status(*(*child)->wait_status()), "exited with 3");
}

TEST_F(ChildProcessTest, UnknownProgramIsSpawnError) {
    auto child = ChildProcess::spawn({.argv = {"/nonexistent/edge-sentinel-worker"}});
    ASSERT_FALSE(child.has_value());
    EXPECT_EQ(child.error().code, ErrorCode::Spawn);
    EXPECT_NE(child.error().message.find("/nonexistent/edge-sentinel-worker"), std::string::npos);
}

TEST_F(ChildProcessTest, EmptyArgvIsSpawnError) {
    auto child = ChildProcess::spawn(SpawnOptions{});
    ASSERT_FALSE(child.has_value());
    EXPECT_EQ(child.error().code, ErrorCode::Spawn);
}

TEST_F(ChildProcessTest, BadWorkingDirIsSpawnError) {
    auto child = ChildProcess::spawn({.argv = {"true"}, .working_dir = temp_dir_ / "missing"});
    ASSERT_FALSE(child.has_value());
    EXPECT_EQ(child.error().code, ErrorCode::Spawn);
}

TEST_F(ChildProcessTest, ArgumentsAreNotShellInterpreted) {
    auto out = temp_dir_ / "out.txt";
    auto child = ChildProcess::spawn({
        .argv = {"echo", "a;", "$HOME", "|", "b"},
        .stdout_path = out,
    });
    ASSERT_TRUE(child.has_value());
    ASSERT_TRUE((*child)->wait_for(5000ms));
    EXPECT_EQ(read_all(out), "a; $HOME | b\n");
}

TEST_F(ChildProcessTest, ExtraEnvironmentAndWorkingDir) {
    auto out = temp_dir_ / "env.txt";
    auto child = ChildProcess::spawn({
        .argv = {"sh", "-c", "echo \"$ES_TEST_VALUE\"; pwd"},
        .extra_env = {{"ES_TEST_VALUE", "hello-worker"}},
        .stdout_path = out,
        .working_dir = temp_dir_,
    });
    ASSERT_TRUE(child.has_value());
    ASSERT_TRUE((*child)->wait_for(5000ms));

    auto text = read_all(out);
    EXPECT_NE(text.find("hello-worker\n"), std::string::npos);
    EXPECT_NE(text.find(std::filesystem::canonical(temp_dir_).string()), std::string::npos);
}

TEST_F(ChildProcessTest, StderrCapturedSeparately) {
    auto out = temp_dir_ / "out.txt";
    auto err = temp_dir_ / "err.txt";
    auto child = ChildProcess::spawn({
        .argv = {"sh", "-c", "echo to-out; echo to-err >&2"},
        .stdout_path = out,
        .stderr_path = err,
    });
    ASSERT_TRUE(child.has_value());
    ASSERT_TRUE((*child)->wait_for(5000ms));
    EXPECT_EQ(read_all(out), "to-out\n");
    EXPECT_EQ(read_all(err), "to-err\n");
}

TEST_F(ChildProcessTest, SignalAfterExitIsInvalidState) {
    auto child = ChildProcess::spawn({.argv = {"true"}});
    ASSERT_TRUE(child.has_value());
    ASSERT_TRUE((*child)->wait_for(5000ms));

    auto result = (*child)->send_signal(SIGTERM);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidState);
}

TEST_F(ChildProcessTest, StopAndContinue) {
    auto child = ChildProcess::spawn({.argv = {"sleep", "30"}});
    ASSERT_TRUE(child.has_value());
    auto& process = *child;

    ASSERT_TRUE(process->send_signal(SIGSTOP).has_value());
    EXPECT_TRUE(process->running());
    ASSERT_TRUE(process->send_signal(SIGCONT).has_value());
    EXPECT_TRUE(process->running());
}

TEST_F(ChildProcessTest, TerminateEscalatesToKill) {
    auto child = ChildProcess::spawn({.argv = {"sh", "-c", "trap '' TERM; sleep 30"}});
    ASSERT_TRUE(child.has_value());
    // Give the shell time to install the trap.
    std::this_thread::sleep_for(200ms);

    EXPECT_TRUE((*child)->terminate(200ms, 2000ms));
    ASSERT_TRUE((*child)->wait_status().has_value());
    EXPECT_EQ(WTERMSIG(*(*child)->wait_status()), SIGKILL);
}

TEST_F(ChildProcessTest, DestructorKillsChild) {
    pid_t pid = 0;
    {
        auto child = ChildProcess::spawn({.argv = {"sleep", "30"}});
        ASSERT_TRUE(child.has_value());
        pid = (*child)->pid();
    }
    EXPECT_EQ(::kill(pid, 0), -1);
}

TEST(DescribeWaitStatusTest, Formats) {
    EXPECT_EQ(describe_wait_status(0), "exited with 0");
    EXPECT_EQ(describe_wait_status(SIGKILL), "killed by signal 9");
}
