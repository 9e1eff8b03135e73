#include "privgate/process/command_runner.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <csignal>

using namespace privgate::process;

TEST(CommandRunnerTest, CapturesStdoutAndStderr) {
    CommandRunner runner;
    auto result = runner.run(CommandSpec::capture({"/bin/sh", "-c", "printf out; printf err >&2"}));

    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_data, "out");
    EXPECT_EQ(result.stderr_data, "err");
}

TEST(CommandRunnerTest, NonZeroExitThrowsWithCapturedStreams) {
    CommandRunner runner;
    try {
        runner.run(CommandSpec::capture({"/bin/sh", "-c", "echo partial; echo broken >&2; exit 3"}));
        FAIL() << "expected CommandFailedError";
    } catch (const CommandFailedError& e) {
        EXPECT_EQ(e.exitCode(), 3);
        EXPECT_EQ(e.stdoutData(), "partial\n");
        EXPECT_EQ(e.stderrData(), "broken\n");
        EXPECT_EQ(e.code(), privgate::common::ErrorCode::COMMAND_FAILED);
    }
}

TEST(CommandRunnerTest, IgnoreFailureReturnsResult) {
    CommandRunner runner;
    auto spec = CommandSpec::capture({"/bin/sh", "-c", "exit 7"});
    spec.ignore_failure = true;

    auto result = runner.run(spec);
    EXPECT_EQ(result.exit_code, 7);
    EXPECT_FALSE(result.succeeded());
}

TEST(CommandRunnerTest, PipesInputToStdin) {
    CommandRunner runner;
    auto spec = CommandSpec::capture({"cat"});
    spec.stdin_mode = StdinMode::PIPE;
    spec.input = std::string(200000, 'x') + "end";

    auto result = runner.run(spec);
    EXPECT_EQ(result.stdout_data.size(), 200003u);
    EXPECT_EQ(result.stdout_data.substr(200000), "end");
}

TEST(CommandRunnerTest, ChildIgnoringStdinDoesNotFail) {
    CommandRunner runner;
    auto spec = CommandSpec::capture({"/bin/sh", "-c", "exec 0<&-; echo done"});
    spec.stdin_mode = StdinMode::PIPE;
    spec.input = std::string(1 << 20, 'p');

    auto result = runner.run(spec);
    EXPECT_EQ(result.stdout_data, "done\n");
}

TEST(CommandRunnerTest, CapturedOutputIsBounded) {
    RunnerLimits limits;
    limits.max_capture_bytes = 1024;
    CommandRunner runner(limits);

    auto result = runner.run(CommandSpec::capture({"/bin/sh", "-c", "head -c 100000 /dev/zero"}));

    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_data.size(), 1024u);
    EXPECT_TRUE(result.stdout_truncated);
    EXPECT_FALSE(result.stderr_truncated);
}

TEST(CommandRunnerTest, EnvironmentReplacesParentEnvironment) {
    CommandRunner runner;
    auto spec = CommandSpec::capture({"/bin/sh", "-c", "printf '%s' \"$PRIVGATE_TEST_VALUE\""});
    spec.environment = std::map<std::string, std::string>{
        {"PATH", "/usr/bin:/bin"},
        {"PRIVGATE_TEST_VALUE", "from-command"}
    };

    EXPECT_EQ(runner.run(spec).stdout_data, "from-command");
}

TEST(CommandRunnerTest, MissingProgramIsSpawnError) {
    CommandRunner runner;
    try {
        runner.run(CommandSpec::capture({"/nonexistent/privgate-no-such-binary"}));
        FAIL() << "expected SpawnError";
    } catch (const SpawnError& e) {
        EXPECT_EQ(e.errorNumber(), ENOENT);
    }
}

TEST(CommandRunnerTest, TimeoutKillsChild) {
    CommandRunner runner;
    auto spec = CommandSpec::capture({"/bin/sh", "-c", "sleep 30"});
    spec.timeout = std::chrono::milliseconds(200);

    auto started = std::chrono::steady_clock::now();
    try {
        runner.run(spec);
        FAIL() << "expected CommandCancelledError";
    } catch (const CommandCancelledError& e) {
        EXPECT_TRUE(e.timedOut());
    }
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(10));
}

TEST(CommandRunnerTest, CancelledTokenStopsBeforeSpawn) {
    CancellationToken token;
    token.cancel();
    CommandRunner runner(RunnerLimits{}, &token);

    try {
        runner.run(CommandSpec::capture({"/bin/sh", "-c", "echo never"}));
        FAIL() << "expected CommandCancelledError";
    } catch (const CommandCancelledError& e) {
        EXPECT_FALSE(e.timedOut());
    }
}

TEST(CommandRunnerTest, CleanupCommandRunsAfterCancellation) {
    CancellationToken token;
    token.cancel();
    CommandRunner runner(RunnerLimits{}, &token);

    auto spec = CommandSpec::capture({"/bin/sh", "-c", "printf done"});
    spec.ignore_cancellation = true;

    EXPECT_EQ(runner.run(spec).stdout_data, "done");
}

TEST(CommandRunnerTest, CleanupCommandRunsAfterInterrupt) {
    CancellationToken::installSignalHandlers();
    std::raise(SIGINT);
    ASSERT_TRUE(CancellationToken::interruptRequested());

    CommandRunner runner;
    EXPECT_THROW(runner.run(CommandSpec::capture({"/bin/true"})), CommandCancelledError);

    auto spec = CommandSpec::capture({"/bin/sh", "-c", "printf done"});
    spec.ignore_cancellation = true;
    EXPECT_EQ(runner.run(spec).stdout_data, "done");

    CancellationToken::resetInterrupt();
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
}

TEST(CommandRunnerTest, CleanupCommandStillHonoursItsTimeout) {
    CancellationToken token;
    token.cancel();
    CommandRunner runner(RunnerLimits{}, &token);

    auto spec = CommandSpec::capture({"/bin/sh", "-c", "exec sleep 10"});
    spec.ignore_cancellation = true;
    spec.timeout = std::chrono::milliseconds(200);

    try {
        runner.run(spec);
        FAIL() << "expected CommandCancelledError";
    } catch (const CommandCancelledError& e) {
        EXPECT_TRUE(e.timedOut());
    }
}

TEST(CommandRunnerTest, FindExecutableSearchesPath) {
    auto sh = findExecutable("sh", "/nonexistent:/bin:/usr/bin");
    ASSERT_TRUE(sh.has_value());
    EXPECT_EQ(sh->front(), '/');

    EXPECT_FALSE(findExecutable("privgate-no-such-binary", "/bin:/usr/bin").has_value());
}

TEST(CommandRunnerTest, FormatCommandQuotesWhereNeeded) {
    EXPECT_EQ(formatCommand({"sudo", "-n", "true"}), "sudo -n true");
    EXPECT_EQ(formatCommand({"echo", "two words", ""}), "echo \"two words\" \"\"");
}
