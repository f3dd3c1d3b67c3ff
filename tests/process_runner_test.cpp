#include "runner/process_runner.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>
#include <vector>

using coderun::runner::ExecutionOutcome;
using coderun::runner::ProcessRunner;
using coderun::runner::RunnerOptions;
using coderun::runner::RunStatus;

namespace {

// /bin/sh takes "-c <code>" just like python, so these tests need no Python.
RunnerOptions ShellOptions() {
    RunnerOptions options{};
    options.interpreter = "sh";
    options.poll_interval = std::chrono::milliseconds(10);
    options.kill_grace = std::chrono::milliseconds(200);
    return options;
}

}  // namespace

TEST(ProcessRunnerTest, CapturesStdout) {
    ProcessRunner runner(ShellOptions());
    const auto outcome = runner.Run("echo hello", "", std::chrono::seconds(5));
    EXPECT_EQ(outcome.status, RunStatus::kExited);
    EXPECT_EQ(outcome.exit_code, 0);
    EXPECT_TRUE(outcome.Succeeded());
    EXPECT_EQ(outcome.output, "hello\n");
    EXPECT_TRUE(outcome.error.empty());
    EXPECT_GE(outcome.duration_seconds, 0.0);
}

TEST(ProcessRunnerTest, CapturesStderrAndExitCode) {
    ProcessRunner runner(ShellOptions());
    const auto outcome = runner.Run("echo oops >&2; exit 3", "", std::chrono::seconds(5));
    EXPECT_EQ(outcome.status, RunStatus::kExited);
    EXPECT_EQ(outcome.exit_code, 3);
    EXPECT_FALSE(outcome.Succeeded());
    EXPECT_EQ(outcome.error, "oops\n");
}

TEST(ProcessRunnerTest, StderrDoesNotMakeExitZeroAFailure) {
    ProcessRunner runner(ShellOptions());
    const auto outcome = runner.Run("echo warning >&2; echo done", "", std::chrono::seconds(5));
    EXPECT_TRUE(outcome.Succeeded());
    EXPECT_EQ(outcome.error, "warning\n");
}

TEST(ProcessRunnerTest, FeedsSuppliedInput) {
    ProcessRunner runner(ShellOptions());
    const auto outcome = runner.Run("read a; read b; echo \"$b $a\"", "first\nsecond\n", std::chrono::seconds(5));
    EXPECT_TRUE(outcome.Succeeded());
    EXPECT_EQ(outcome.output, "second first\n");
}

TEST(ProcessRunnerTest, SuppliedInputEndsWithEof) {
    ProcessRunner runner(ShellOptions());
    const auto outcome = runner.Run("cat", "abc", std::chrono::seconds(5));
    EXPECT_TRUE(outcome.Succeeded());
    EXPECT_EQ(outcome.output, "abc");
}

// The prompt check is lexical, so a shell comment is enough to trigger it.
TEST(ProcessRunnerTest, EmptyInputBlocksPromptingReader) {
    ProcessRunner runner(ShellOptions());
    const auto outcome = runner.Run("read line  # input(\necho got", "", std::chrono::seconds(1));
    EXPECT_EQ(outcome.status, RunStatus::kTimedOut);
    EXPECT_TRUE(outcome.output.empty());
}

TEST(ProcessRunnerTest, EmptyInputIsEofForOtherReaders) {
    ProcessRunner runner(ShellOptions());
    const auto started = std::chrono::steady_clock::now();
    const auto outcome = runner.Run("cat; echo done", "", std::chrono::seconds(5));
    const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    EXPECT_EQ(outcome.status, RunStatus::kExited);
    EXPECT_TRUE(outcome.Succeeded());
    EXPECT_EQ(outcome.output, "done\n");
    EXPECT_LT(elapsed, 2.0);
}

TEST(ProcessRunnerTest, TimesOutAndKillsChild) {
    ProcessRunner runner(ShellOptions());
    const auto started = std::chrono::steady_clock::now();
    const auto outcome = runner.Run("while :; do :; done", "", std::chrono::seconds(1));
    const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    EXPECT_EQ(outcome.status, RunStatus::kTimedOut);
    EXPECT_FALSE(outcome.Succeeded());
    EXPECT_GE(outcome.duration_seconds, 1.0);
    EXPECT_LT(elapsed, 4.0);
}

TEST(ProcessRunnerTest, KeepsOutputFlushedBeforeTimeout) {
    ProcessRunner runner(ShellOptions());
    const auto outcome = runner.Run("echo before; sleep 3", "", std::chrono::seconds(1));
    EXPECT_EQ(outcome.status, RunStatus::kTimedOut);
    EXPECT_EQ(outcome.output, "before\n");
}

TEST(ProcessRunnerTest, SignalledChildReportsSignalExitCode) {
    ProcessRunner runner(ShellOptions());
    const auto outcome = runner.Run("kill -9 $$", "", std::chrono::seconds(5));
    EXPECT_EQ(outcome.status, RunStatus::kExited);
    EXPECT_EQ(outcome.exit_code, 128 + 9);
}

TEST(ProcessRunnerTest, MissingInterpreterIsDispatchFailure) {
    auto options = ShellOptions();
    options.interpreter = "coderun-no-such-interpreter";
    ProcessRunner runner(options);
    const auto outcome = runner.Run("print(1)", "", std::chrono::seconds(1));
    EXPECT_EQ(outcome.status, RunStatus::kDispatchFailed);
    EXPECT_FALSE(outcome.failure.empty());
    EXPECT_FALSE(outcome.Succeeded());
}

TEST(ProcessRunnerTest, MissingInterpreterPathIsDispatchFailure) {
    auto options = ShellOptions();
    options.interpreter = "/nonexistent/bin/python3";
    ProcessRunner runner(options);
    const auto outcome = runner.Run("print(1)", "", std::chrono::seconds(1));
    EXPECT_EQ(outcome.status, RunStatus::kDispatchFailed);
    EXPECT_FALSE(outcome.failure.empty());
}

TEST(ProcessRunnerTest, ConcurrentRunsWaitIndependently) {
    ProcessRunner runner(ShellOptions());
    std::vector<ExecutionOutcome> outcomes(4);
    std::vector<std::thread> threads;
    const auto started = std::chrono::steady_clock::now();
    for (std::size_t i = 0; i < outcomes.size(); ++i) {
        threads.emplace_back([&runner, &outcomes, i] {
            outcomes[i] = runner.Run("sleep 1; echo " + std::to_string(i), "", std::chrono::seconds(10));
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();

    for (std::size_t i = 0; i < outcomes.size(); ++i) {
        EXPECT_TRUE(outcomes[i].Succeeded());
        EXPECT_EQ(outcomes[i].output, std::to_string(i) + "\n");
    }
    EXPECT_LT(elapsed, 3.0);
}

TEST(ProcessRunnerTest, UsesWorkingDirectory) {
    auto options = ShellOptions();
    options.working_dir = "/";
    ProcessRunner runner(options);
    const auto outcome = runner.Run("pwd", "", std::chrono::seconds(5));
    EXPECT_TRUE(outcome.Succeeded());
    EXPECT_EQ(outcome.output, "/\n");
}
