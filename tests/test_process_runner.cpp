// EN: Tests for the PosixCommandRunner against real /bin/sh processes
// FR: Tests du PosixCommandRunner avec de vrais processus /bin/sh

#include <gtest/gtest.h>
#include "../include/infrastructure/system/process_runner.hpp"
#include "../include/infrastructure/logging/logger.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <thread>

using namespace DRX;
using namespace std::chrono_literals;

class PosixCommandRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
    }

    static CommandSpec shell(const std::string& script) {
        CommandSpec spec;
        spec.argv = {"/bin/sh", "-c", script};
        return spec;
    }

    PosixCommandRunner runner_;
};

TEST_F(PosixCommandRunnerTest, CapturesStdoutAndStderr) {
    ProcessResult result = runner_.run(shell("echo out; echo err >&2"), {});

    EXPECT_TRUE(result.started);
    EXPECT_TRUE(result.exited);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_data, "out\n");
    EXPECT_EQ(result.stderr_data, "err\n");
    EXPECT_TRUE(result.error.empty());
}

TEST_F(PosixCommandRunnerTest, FeedsStdin) {
    CommandSpec spec = shell("cat");
    spec.stdin_data = "{\"files\":[\"a\",\"b\"]}";

    ProcessResult result = runner_.run(spec, {});

    EXPECT_EQ(result.stdout_data, spec.stdin_data);
}

TEST_F(PosixCommandRunnerTest, LargeStdinDoesNotDeadlock) {
    CommandSpec spec = shell("cat");
    spec.stdin_data.assign(1 << 20, 'x');

    ProcessResult result = runner_.run(spec, {});

    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_data.size(), spec.stdin_data.size());
}

TEST_F(PosixCommandRunnerTest, ChildIgnoringStdinStillCompletes) {
    CommandSpec spec = shell("exit 0");
    spec.stdin_data.assign(1 << 20, 'x');

    ProcessResult result = runner_.run(spec, {});

    EXPECT_TRUE(result.exited);
    EXPECT_EQ(result.exit_code, 0);
}

TEST_F(PosixCommandRunnerTest, ReportsExitCode) {
    ProcessResult result = runner_.run(shell("exit 3"), {});

    EXPECT_TRUE(result.started);
    EXPECT_TRUE(result.exited);
    EXPECT_EQ(result.exit_code, 3);
}

TEST_F(PosixCommandRunnerTest, UsesWorkingDirectory) {
    CommandSpec spec = shell("pwd");
    spec.working_directory = "/";

    ProcessResult result = runner_.run(spec, {});

    EXPECT_EQ(result.stdout_data, "/\n");
}

TEST_F(PosixCommandRunnerTest, MissingBinaryDoesNotStart) {
    CommandSpec spec;
    spec.argv = {"drx-binary-that-does-not-exist"};

    ProcessResult result = runner_.run(spec, {});

    EXPECT_FALSE(result.started);
    EXPECT_NE(result.error.find("exec: \"drx-binary-that-does-not-exist\""), std::string::npos);
}

TEST_F(PosixCommandRunnerTest, MissingDirectoryDoesNotStart) {
    CommandSpec spec = shell("true");
    spec.working_directory = "/nonexistent/drx";

    ProcessResult result = runner_.run(spec, {});

    EXPECT_FALSE(result.started);
    EXPECT_NE(result.error.find("chdir /nonexistent/drx"), std::string::npos);
}

TEST_F(PosixCommandRunnerTest, EmptyCommandDoesNotStart) {
    ProcessResult result = runner_.run(CommandSpec{}, {});
    EXPECT_FALSE(result.started);
    EXPECT_EQ(result.error, "empty command");
}

TEST_F(PosixCommandRunnerTest, TimeoutKillsProcessGroup) {
    ExecutionOptions options;
    options.timeout = 200ms;

    auto start = std::chrono::steady_clock::now();
    ProcessResult result = runner_.run(shell("sleep 30 & sleep 30; echo never"), options);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(result.started);
    EXPECT_TRUE(result.timed_out);
    EXPECT_FALSE(result.exited);
    EXPECT_TRUE(result.signaled);
    EXPECT_EQ(result.stdout_data.find("never"), std::string::npos);
    EXPECT_LT(elapsed, 10s);
}

TEST_F(PosixCommandRunnerTest, CancellationStopsRunningCommand) {
    CancellationToken token;
    ExecutionOptions options;
    options.cancellation = &token;

    std::thread canceller([&token]() {
        std::this_thread::sleep_for(200ms);
        token.cancel();
    });
    ProcessResult result = runner_.run(shell("sleep 30"), options);
    canceller.join();

    EXPECT_TRUE(result.started);
    EXPECT_TRUE(result.cancelled);
    EXPECT_FALSE(result.exited);
}

TEST_F(PosixCommandRunnerTest, CancelledTokenPreventsStart) {
    CancellationToken token;
    token.cancel();
    ExecutionOptions options;
    options.cancellation = &token;

    ProcessResult result = runner_.run(shell("echo hi"), options);

    EXPECT_FALSE(result.started);
    EXPECT_TRUE(result.cancelled);
}

TEST(ProcessRunnerHelpersTest, JoinCommandLine) {
    EXPECT_EQ(joinCommandLine({"docker", "build", "-t", "coletor", "."}), "docker build -t coletor .");
    EXPECT_EQ(joinCommandLine({}), "");
}

TEST(ProcessRunnerHelpersTest, EnvironmentSnapshotSeesProcessEnvironment) {
    ::setenv("DRX_SNAPSHOT_PROBE", "42", 1);
    auto snapshot = environmentSnapshot();
    ::unsetenv("DRX_SNAPSHOT_PROBE");

    EXPECT_NE(std::find(snapshot.begin(), snapshot.end(), "DRX_SNAPSHOT_PROBE=42"), snapshot.end());
}
